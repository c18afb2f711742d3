#include "warden/secrecy/SecrecyAudit.hpp"
#include "warden/canon/ContentHash.hpp"

#include <iostream>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

namespace {

json::array toArray(const std::vector<std::string>& items) {
    json::array arr;
    for (const auto& s : items) arr.emplace_back(json::string(s));
    return arr;
}

} // namespace

json::object LeakEntry::toJson() const {
    json::object o;
    o["fingerprint"] = fingerprint;
    o["suite_ids"] = toArray(suite_ids);
    o["files"] = toArray(files);
    return o;
}

std::vector<LeakEntry> detectLeaks(
    const FingerprintIndex& secrets,
    const ScanResult& scan
) {
    std::vector<LeakEntry> leaks;
    // std::set iteration is already sorted by fingerprint.
    for (const auto& fp : secrets.fingerprints) {
        if (!scan.fingerprints.count(fp)) continue;

        LeakEntry leak;
        leak.fingerprint = fp;
        if (auto it = secrets.suites_by_fingerprint.find(fp); it != secrets.suites_by_fingerprint.end()) {
            leak.suite_ids.assign(it->second.begin(), it->second.end());
        }
        if (auto it = scan.fingerprint_sources.find(fp); it != scan.fingerprint_sources.end()) {
            leak.files.assign(it->second.begin(), it->second.end());
        }
        leaks.push_back(std::move(leak));
    }
    return leaks;
}

json::object SecrecyAuditReport::toJson() const {
    json::object o;
    o["status"] = invariantStatusToString(status);
    o["message"] = message;
    o["suite_registry_hash"] = suite_registry_hash;
    o["secret_registry_hash"] = secret_registry_hash;

    json::object scheme;
    scheme["scheme_id"] = scheme_id;
    scheme["digest_prefix"] = digest_prefix;
    o["hashing_scheme"] = std::move(scheme);

    o["secret_suite_ids"] = toArray(secret_suite_ids);
    o["missing_secret_suites"] = toArray(missing_secret_suites);
    o["secret_fingerprint_count"] = static_cast<uint64_t>(secret_fingerprint_count);
    o["scanned_fingerprint_count"] = static_cast<uint64_t>(scanned_fingerprint_count);
    o["scanned_files_count"] = static_cast<uint64_t>(scanned_files_count);

    json::array leakArr;
    for (const auto& l : leaks) leakArr.push_back(l.toJson());
    o["leaks"] = std::move(leakArr);
    o["errors"] = toArray(errors);
    return o;
}

InvariantCheck SecrecyAuditReport::toCheck() const {
    std::string msg = message;
    if (status == InvariantStatus::PASS) {
        msg = "Secret suite fingerprints not found in protected artifacts";
    }
    return InvariantCheck("SECRECY", status, msg, toJson());
}

SecrecyAuditor::SecrecyAuditor(
    const KeyProvider& keys,
    AuditConfig config
) : keys_(keys), config_(std::move(config)) {}

SecrecyAuditReport SecrecyAuditor::run(
    const fs::path& root,
    const SecretRegistry& registry,
    const std::set<std::string>& secret_suite_ids,
    const std::string& expected_suite_registry_hash
) const {
    SecrecyAuditReport report;
    report.suite_registry_hash = expected_suite_registry_hash;
    report.secret_registry_hash = registry.documentHash();
    report.scheme_id = registry.scheme().scheme_id;
    report.digest_prefix = registry.scheme().digest_prefix;
    report.secret_suite_ids.assign(secret_suite_ids.begin(), secret_suite_ids.end());

    if (secret_suite_ids.empty()) {
        report.status = InvariantStatus::SKIP;
        report.message = "No secret suites defined";
        return report;
    }

    if (!config_.supportsScheme(report.scheme_id)) {
        report.status = InvariantStatus::FAIL;
        report.message = "Unsupported hashing scheme '" + report.scheme_id + "'";
        report.errors.push_back(report.message);
        std::cerr << "[SecrecyAuditor] " << report.message << "\n";
        return report;
    }

    for (const auto& id : secret_suite_ids) {
        if (registry.findSuite(id) == nullptr) {
            report.missing_secret_suites.push_back(id);
        }
    }

    if (!expected_suite_registry_hash.empty() &&
        !verifyHash(registry.suiteRegistryHash(), expected_suite_registry_hash)) {
        report.errors.push_back("suite_registry_hash mismatch");
    }

    const FingerprintIndex index = registry.fingerprintIndex();
    report.secret_fingerprint_count = index.fingerprints.size();

    ScanResult scan;
    try {
        const Fingerprinter fingerprinter(registry.scheme(), keys_, config_.default_hmac_key_name);
        CorpusScanner scanner(fingerprinter, config_.scan_workers);
        scan = scanner.scan(root, config_.protected_paths);
    } catch (const FingerprintError& e) {
        report.status = InvariantStatus::FAIL;
        report.message = e.what();
        report.errors.push_back(e.what());
        std::cerr << "[SecrecyAuditor] Audit could not run: " << e.what() << "\n";
        return report;
    } catch (const fs::filesystem_error& e) {
        report.status = InvariantStatus::FAIL;
        report.message = std::string("Corpus walk failed: ") + e.what();
        report.errors.push_back(report.message);
        std::cerr << "[SecrecyAuditor] " << report.message << "\n";
        return report;
    }

    report.errors.insert(report.errors.end(), scan.errors.begin(), scan.errors.end());
    report.scanned_fingerprint_count = scan.fingerprints.size();
    report.scanned_files_count = scan.scanned_files.size();
    report.leaks = detectLeaks(index, scan);

    if (!report.leaks.empty() || !report.errors.empty() || !report.missing_secret_suites.empty()) {
        report.status = InvariantStatus::FAIL;
        report.message = "Secrecy hash check failed";
        std::cerr << "[SecrecyAuditor] FAIL: " << report.leaks.size() << " leak(s), "
                  << report.errors.size() << " error(s), "
                  << report.missing_secret_suites.size() << " missing suite(s)\n";
    } else {
        report.status = InvariantStatus::PASS;
        report.message = "Secrecy hash check passed";
        std::cout << "[SecrecyAuditor] PASS: " << report.scanned_files_count
                  << " file(s) clean\n";
    }
    return report;
}

}
