#pragma once
#include <string>

// "[tag] message" lines on stdout/stderr, serialized across worker threads.
void log_info(const std::string& tag, const std::string& msg);
void log_error(const std::string& tag, const std::string& msg);
