#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include <boost/json.hpp>

#include "warden/config/AuditConfig.hpp"
#include "warden/governance/InvariantCheck.hpp"
#include "warden/secrecy/CorpusScanner.hpp"
#include "warden/secrecy/KeyProvider.hpp"
#include "warden/secrecy/SecretRegistry.hpp"

namespace warden {

struct LeakEntry {
    std::string fingerprint;
    std::vector<std::string> suite_ids;     // sorted
    std::vector<std::string> files;         // sorted

    boost::json::object toJson() const;
};

// declared ∩ scanned, sorted by fingerprint.
std::vector<LeakEntry> detectLeaks(
    const FingerprintIndex& secrets,
    const ScanResult& scan
);

struct SecrecyAuditReport {
    InvariantStatus status = InvariantStatus::FAIL;
    std::string message;

    std::string suite_registry_hash;
    std::string secret_registry_hash;
    std::string scheme_id;
    std::string digest_prefix;

    std::vector<std::string> secret_suite_ids;
    std::vector<std::string> missing_secret_suites;

    size_t secret_fingerprint_count = 0;
    size_t scanned_fingerprint_count = 0;
    size_t scanned_files_count = 0;

    std::vector<LeakEntry> leaks;
    std::vector<std::string> errors;

    // Only PASS certifies: no leaks, no scan errors, no missing suites.
    bool certifiedClean() const { return status == InvariantStatus::PASS; }

    boost::json::object toJson() const;

    // SECRECY invariant result.
    InvariantCheck toCheck() const;
};

// ---------------------------------------------------------------------------
// SecrecyAuditor
//
// Scans the configured protected paths for fingerprints declared by the
// secret registry. Anything that prevents the audit from running
// (missing HMAC key, unusable scheme) is a FAIL report, never a pass.
// ---------------------------------------------------------------------------
// Holds keys by reference; the provider must outlive the auditor.
class SecrecyAuditor {
public:
    SecrecyAuditor(
        const KeyProvider& keys,
        AuditConfig config
    );
    SecrecyAuditor(const KeyProvider&& keys, AuditConfig config) = delete;

    // expected_suite_registry_hash is checked against the registry when
    // non-empty. No secret suites means SKIP.
    SecrecyAuditReport run(
        const std::filesystem::path& root,
        const SecretRegistry& registry,
        const std::set<std::string>& secret_suite_ids,
        const std::string& expected_suite_registry_hash = ""
    ) const;

    const AuditConfig& config() const { return config_; }

private:
    const KeyProvider& keys_;
    AuditConfig config_;
};

}
