#pragma once
#include "../../../shared/cpp/security/include/prompt_security.hpp"
#include <vector>

constexpr const char* kTemplateVersion = "2.0";

// Canonical templates compiled into the binary. Last resort when both the
// deployed file and the registry snapshot fail the integrity check.
PromptTemplate builtin_template(int tier);
std::vector<PromptTemplate> builtin_templates();
