#include "warden/config/AuditConfig.hpp"
#include "warden/canon/DataFile.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

namespace {

std::string requireString(
    const json::value& v,
    const char* key
) {
    if (!v.is_string()) {
        throw ConfigError(std::string("Config field '") + key + "' must be a string");
    }
    return std::string(v.get_string());
}

std::vector<std::string> requireStringList(
    const json::value& v,
    const char* key
) {
    if (!v.is_array()) {
        throw ConfigError(std::string("Config field '") + key + "' must be a list of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : v.get_array()) {
        out.push_back(requireString(item, key));
    }
    return out;
}

size_t requireWorkers(
    const json::value& v,
    const char* key
) {
    if (v.is_int64() && v.get_int64() >= 1) {
        return static_cast<size_t>(v.get_int64());
    }
    if (v.is_uint64() && v.get_uint64() >= 1) {
        return static_cast<size_t>(v.get_uint64());
    }
    throw ConfigError(std::string("Config field '") + key + "' must be a positive integer");
}

} // namespace

AuditConfig AuditConfig::load(const fs::path& path) {
    json::value doc;
    try {
        doc = loadDataFile(path);
    } catch (const DataFileError& e) {
        throw ConfigError(std::string("Cannot load config: ") + e.what());
    }
    AuditConfig cfg = fromJson(doc);
    std::cout << "[AuditConfig] Loaded " << path.filename().string()
              << " (" << cfg.protected_paths.size() << " protected paths, "
              << cfg.scan_workers << " worker(s))\n";
    return cfg;
}

AuditConfig AuditConfig::fromJson(const json::value& doc) {
    AuditConfig cfg;
    if (doc.is_null()) return cfg;
    if (!doc.is_object()) {
        throw ConfigError("Config document must be an object");
    }
    const json::object& obj = doc.get_object();

    if (const json::value* v = obj.if_contains("protected_paths")) {
        cfg.protected_paths = requireStringList(*v, "protected_paths");
    }
    if (const json::value* v = obj.if_contains("scan_workers")) {
        cfg.scan_workers = requireWorkers(*v, "scan_workers");
    }
    if (const json::value* v = obj.if_contains("default_hmac_key_name")) {
        cfg.default_hmac_key_name = requireString(*v, "default_hmac_key_name");
    }
    if (const json::value* v = obj.if_contains("lattice_schema_path")) {
        cfg.lattice_schema_path = requireString(*v, "lattice_schema_path");
    }
    if (const json::value* v = obj.if_contains("supported_schemes")) {
        cfg.supported_schemes = requireStringList(*v, "supported_schemes");
    }
    return cfg;
}

void AuditConfig::applyEnvironment() {
    if (const char* workers = std::getenv("WARDEN_SCAN_WORKERS"); workers && *workers) {
        size_t n = 0;
        const char* last = workers + std::strlen(workers);
        auto res = std::from_chars(workers, last, n);
        if (res.ec != std::errc() || res.ptr != last || n == 0) {
            throw ConfigError(std::string("WARDEN_SCAN_WORKERS must be a positive integer, got '") +
                              workers + "'");
        }
        scan_workers = n;
    }
    if (const char* name = std::getenv("WARDEN_HMAC_KEY_NAME"); name && *name) {
        default_hmac_key_name = name;
    }
}

bool AuditConfig::supportsScheme(const std::string& scheme_id) const {
    return std::find(supported_schemes.begin(), supported_schemes.end(), scheme_id) !=
           supported_schemes.end();
}

json::object AuditConfig::toJson() const {
    json::object o;
    json::array paths;
    for (const auto& p : protected_paths) paths.emplace_back(json::string(p));
    o["protected_paths"] = std::move(paths);
    o["scan_workers"] = static_cast<uint64_t>(scan_workers);
    o["default_hmac_key_name"] = default_hmac_key_name;
    o["lattice_schema_path"] = lattice_schema_path;
    json::array schemes;
    for (const auto& s : supported_schemes) schemes.emplace_back(json::string(s));
    o["supported_schemes"] = std::move(schemes);
    return o;
}

}
