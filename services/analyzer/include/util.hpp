#pragma once
#include <filesystem>
#include <string>

std::string getenv_or(const char* key, const std::string& def);
std::string read_text_file(const std::filesystem::path& p);
// YYYY-MM-DD in UTC, the key of the daily usage counter.
std::string utc_day();
