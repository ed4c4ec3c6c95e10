#pragma once
#include "detection.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Checks that a parsed response echoes the session token at its top level.
class RoundTripTokenValidator {
public:
    static constexpr const char* kTokenField = "security_token";

    // On mismatch appends one high severity detection and returns false.
    bool validate(const nlohmann::json& response, const std::string& expected,
                  const std::string& job_id, int tier,
                  std::vector<SecurityDetection>& detections) const;

    static bool tokens_equal(const std::string& a, const std::string& b);
};
