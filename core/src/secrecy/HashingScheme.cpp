#include "warden/secrecy/HashingScheme.hpp"
#include "warden/canon/DataFile.hpp"

#include <set>
#include <sstream>

namespace json = boost::json;

namespace warden {

namespace {

bool startsWith(
    const std::string& s,
    const char* prefix
) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

HashingScheme HashingScheme::fromJson(const json::value& raw) {
    if (!raw.is_object()) {
        throw FingerprintError("hashing_scheme must be an object");
    }
    const json::object& obj = raw.get_object();

    const json::value* normalization = obj.if_contains("normalization_id");
    if (normalization == nullptr) {
        normalization = obj.if_contains("normalization");
    }

    std::set<std::string> missing;
    if (!obj.contains("scheme_id")) missing.insert("scheme_id");
    if (normalization == nullptr) missing.insert("normalization_id");
    if (!obj.contains("digest_prefix")) missing.insert("digest_prefix");
    if (!missing.empty()) {
        std::ostringstream oss;
        oss << "hashing_scheme missing fields:";
        for (const auto& f : missing) oss << " " << f;
        throw FingerprintError(oss.str());
    }

    HashingScheme scheme;
    scheme.scheme_id = scalarText(obj.at("scheme_id"));
    scheme.normalization_id = scalarText(*normalization);
    scheme.digest_prefix = scalarText(obj.at("digest_prefix"));

    if (const json::value* key = obj.if_contains("key_id")) {
        const std::string text = scalarText(*key);
        if (!text.empty()) scheme.key_id = text;
    }
    return scheme;
}

bool HashingScheme::usesHmac() const {
    return startsWith(scheme_id, "hmac") || startsWith(digest_prefix, "hmacsha256:");
}

std::string HashingScheme::keyLookupName(const std::string& default_name) const {
    const std::string id = key_id.value_or(default_name);
    const size_t colon = id.find(':');
    return colon == std::string::npos ? id : id.substr(colon + 1);
}

json::object HashingScheme::toJson() const {
    json::object out;
    out["scheme_id"] = scheme_id;
    out["normalization_id"] = normalization_id;
    out["digest_prefix"] = digest_prefix;
    if (key_id) out["key_id"] = *key_id;
    return out;
}

}
