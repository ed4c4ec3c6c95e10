#include "../include/token_validator.hpp"
#include "../include/prompt_security.hpp"
#include <openssl/crypto.h>

bool RoundTripTokenValidator::tokens_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool RoundTripTokenValidator::validate(const nlohmann::json& response, const std::string& expected,
                                       const std::string& job_id, int tier,
                                       std::vector<SecurityDetection>& detections) const {
    std::string received;
    const char* pattern = "token.missing";
    if (response.is_object() && response.contains(kTokenField)) {
        const auto& v = response.at(kTokenField);
        if (v.is_string()) {
            received = v.get<std::string>();
            pattern = "token.mismatch";
        } else {
            pattern = "token.wrong_type";
        }
    }
    if (!expected.empty() && tokens_equal(received, expected)) return true;

    // only prefixes are ever recorded
    std::string sample = "expected " + token_prefix(expected) + " received " +
                         (received.empty() ? std::string("(none)") : token_prefix(received));
    detections.push_back(make_detection(job_id, tier, kTokenField, DetectionCategory::TokenMismatch,
                                        Severity::High, pattern, sample));
    return false;
}
