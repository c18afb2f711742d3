// =============================================================================
// InvariantCheck.hpp - RESULT OF ONE GOVERNANCE INVARIANT
// =============================================================================
// A check that could not run is FAIL, never PASS.
// SKIP is reserved for "nothing to check" (e.g. no plans declared).
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <boost/json.hpp>

namespace warden {

enum class InvariantStatus : uint8_t {
    PASS = 0,
    FAIL = 1,
    WARN = 2,
    SKIP = 3
};

inline const char* invariantStatusToString(InvariantStatus s) {
    switch (s) {
        case InvariantStatus::PASS: return "PASS";
        case InvariantStatus::FAIL: return "FAIL";
        case InvariantStatus::WARN: return "WARN";
        case InvariantStatus::SKIP: return "SKIP";
        default:                    return "UNKNOWN";
    }
}

struct InvariantCheck {
    std::string name;
    InvariantStatus status = InvariantStatus::FAIL;
    std::string message;
    boost::json::object details;

    InvariantCheck() = default;

    InvariantCheck(
        std::string n,
        InvariantStatus s,
        std::string msg,
        boost::json::object d = {}
    ) : name(std::move(n)), status(s), message(std::move(msg)), details(std::move(d)) {}

    bool passed() const { return status == InvariantStatus::PASS; }

    boost::json::object toJson() const {
        boost::json::object o;
        o["name"] = name;
        o["status"] = invariantStatusToString(status);
        o["message"] = message;
        o["details"] = details;
        return o;
    }
};

}
