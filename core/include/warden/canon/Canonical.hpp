#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/json.hpp>

namespace warden {

// Raised when a value has no canonical byte form (non-finite numbers,
// invalid UTF-8, YAML collections without a total order).
class NotSerializable : public std::runtime_error {
public:
    explicit NotSerializable(
        const std::string& msg
    ) : std::runtime_error(msg) {}
};

// Two canonical forms exist and must not be mixed:
//   ASCII_ESCAPED      - provenance hashing, portable across encodings
//   UNICODE_PRESERVING - secrecy fingerprinting, raw UTF-8 kept
enum class CanonicalPolicy : uint8_t {
    ASCII_ESCAPED = 0,
    UNICODE_PRESERVING = 1
};

inline const char* canonicalPolicyToString(CanonicalPolicy p) {
    switch (p) {
        case CanonicalPolicy::ASCII_ESCAPED:      return "ascii-escaped";
        case CanonicalPolicy::UNICODE_PRESERVING: return "unicode-preserving";
        default:                                  return "unknown";
    }
}

// Sorted keys, no insignificant whitespace, documented escaping.
std::string canonicalBytes(
    const boost::json::value& value,
    CanonicalPolicy policy = CanonicalPolicy::ASCII_ESCAPED
);

// Shortest round-trip rendering of a finite double ("1.0", "1e-05").
std::string formatCanonicalDouble(double d);

// Drops every byte that is not part of a well-formed UTF-8 sequence.
std::string sanitizeUtf8(std::string_view text);

bool isValidUtf8(std::string_view text);

}
