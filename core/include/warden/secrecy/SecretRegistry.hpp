#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <boost/json.hpp>

#include "warden/config/AuditConfig.hpp"
#include "warden/governance/InvariantCheck.hpp"
#include "warden/secrecy/HashingScheme.hpp"

namespace warden {

struct SecretSuite {
    std::string suite_id;
    std::vector<std::string> test_case_fingerprints;
    std::string suite_fingerprint_root;
    boost::json::value n_test_cases;    // null when not declared
};

struct FingerprintIndex {
    std::set<std::string> fingerprints;
    std::map<std::string, std::set<std::string>> suites_by_fingerprint;
};

// "sha256:" + SHA256 of the sorted fingerprints joined by "\n".
std::string suiteFingerprintRoot(std::vector<std::string> fingerprints);

// suite_id of every suite whose secrecy_level is "secret".
std::set<std::string> secretSuiteIds(const boost::json::value& suite_registry);

// ---------------------------------------------------------------------------
// SecretRegistry
//
// Declared fingerprints of secret evaluation suites. Holds only opaque
// digests, never suite content.
// ---------------------------------------------------------------------------
class SecretRegistry {
public:
    static SecretRegistry load(const std::filesystem::path& path);
    static SecretRegistry fromJson(const boost::json::value& doc);

    const std::string& registryVersion() const { return registry_version_; }
    const std::string& generatedAt() const { return generated_at_; }
    const HashingScheme& scheme() const { return scheme_; }
    const std::string& suiteRegistryHash() const { return suite_registry_hash_; }
    const std::vector<SecretSuite>& suites() const { return suites_; }

    // Content hash of the registry document itself.
    const std::string& documentHash() const { return document_hash_; }

    const SecretSuite* findSuite(const std::string& suite_id) const;
    FingerprintIndex fingerprintIndex() const;

private:
    std::string registry_version_;
    std::string generated_at_;
    HashingScheme scheme_;
    std::string suite_registry_hash_;
    std::vector<SecretSuite> suites_;
    std::string document_hash_;
};

// SECRET_REGISTRY_INTEGRITY: scheme support, suite registry hash,
// secret suite coverage, per-suite duplicate, count and root checks.
InvariantCheck checkRegistryIntegrity(
    const SecretRegistry& registry,
    const std::string& expected_suite_registry_hash,
    const std::set<std::string>& secret_suite_ids,
    const std::vector<std::string>& supported_schemes
);

// Same check with the supported schemes taken from the audit config.
InvariantCheck checkRegistryIntegrity(
    const SecretRegistry& registry,
    const std::string& expected_suite_registry_hash,
    const std::set<std::string>& secret_suite_ids,
    const AuditConfig& config
);

}
