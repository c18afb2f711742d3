#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/json.hpp>

namespace warden {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(
        const std::string& msg
    ) : std::runtime_error(msg) {}
};

// Audit run settings. Defaults are compiled in; a YAML or JSON file may
// override any subset, and the environment overrides both.
struct AuditConfig {
    std::vector<std::string> protected_paths = {
        "training/data/",
        "training/corpora/",
        "culture/chronicle/training_data/",
        "prompts/",
        "prompt_libraries/"
    };
    size_t scan_workers = 1;
    std::string default_hmac_key_name = "WARDEN_SECRECY_HMAC_KEY";
    std::string lattice_schema_path;
    std::vector<std::string> supported_schemes = {"sha256-v1", "hmac-sha256-v1"};

    // Unknown keys are ignored; wrong types raise ConfigError.
    static AuditConfig load(const std::filesystem::path& path);
    static AuditConfig fromJson(const boost::json::value& doc);

    // WARDEN_SCAN_WORKERS, WARDEN_HMAC_KEY_NAME
    void applyEnvironment();

    bool supportsScheme(const std::string& scheme_id) const;

    boost::json::object toJson() const;
};

}
