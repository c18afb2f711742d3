#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <boost/json.hpp>

namespace warden {

// Malformed scheme or registry, or an HMAC key that cannot be resolved.
// An audit that raises this has not run; it is never a clean result.
class FingerprintError : public std::runtime_error {
public:
    explicit FingerprintError(
        const std::string& msg
    ) : std::runtime_error(msg) {}
};

struct HashingScheme {
    std::string scheme_id;
    std::string normalization_id;
    std::string digest_prefix;
    std::optional<std::string> key_id;

    // Requires scheme_id, normalization_id (or "normalization"), digest_prefix.
    static HashingScheme fromJson(const boost::json::value& raw);

    bool usesHmac() const;

    // "vault:NAME" looks up NAME; a bare key_id is the name itself.
    std::string keyLookupName(const std::string& default_name) const;

    boost::json::object toJson() const;
};

}
