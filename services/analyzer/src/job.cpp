#include "../include/job.hpp"

const char* to_string(Outcome o) {
    switch (o) {
        case Outcome::Pending: return "pending";
        case Outcome::Success: return "success";
        case Outcome::Failed: return "failed";
        case Outcome::Fallback: return "fallback";
        case Outcome::Skipped: return "skipped";
        case Outcome::Suppressed: return "suppressed";
    }
    return "pending";
}
