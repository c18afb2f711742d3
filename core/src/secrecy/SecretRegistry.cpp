#include "warden/secrecy/SecretRegistry.hpp"
#include "warden/canon/ContentHash.hpp"
#include "warden/canon/DataFile.hpp"
#include "warden/canon/Digest.hpp"

#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

namespace {

const char* const kIntegrityCheck = "SECRET_REGISTRY_INTEGRITY";

SecretSuite parseSuite(const json::object& raw) {
    SecretSuite suite;
    if (const json::value* id = raw.if_contains("suite_id")) {
        suite.suite_id = scalarText(*id);
    }
    if (const json::value* fps = raw.if_contains("test_case_fingerprints"); fps && !fps->is_null()) {
        if (!fps->is_array()) {
            throw FingerprintError("Suite '" + suite.suite_id +
                                   "' test_case_fingerprints must be a list");
        }
        for (const auto& fp : fps->get_array()) {
            if (!fp.is_string()) {
                throw FingerprintError("Suite '" + suite.suite_id +
                                       "' has a non-string fingerprint");
            }
            suite.test_case_fingerprints.emplace_back(fp.get_string());
        }
    }
    if (const json::value* root = raw.if_contains("suite_fingerprint_root")) {
        suite.suite_fingerprint_root = scalarText(*root);
    }
    if (const json::value* n = raw.if_contains("n_test_cases")) {
        suite.n_test_cases = *n;
    }
    return suite;
}

bool countMatches(
    const json::value& declared,
    size_t actual
) {
    if (declared.is_int64()) {
        return declared.get_int64() >= 0 &&
               static_cast<uint64_t>(declared.get_int64()) == actual;
    }
    if (declared.is_uint64()) return declared.get_uint64() == actual;
    if (declared.is_double()) return declared.get_double() == static_cast<double>(actual);
    return false;
}

json::object failure(
    const std::string& suite_id,
    const std::string& reason
) {
    json::object f;
    if (!suite_id.empty()) f["suite_id"] = suite_id;
    f["reason"] = reason;
    return f;
}

} // namespace

std::string suiteFingerprintRoot(std::vector<std::string> fingerprints) {
    std::sort(fingerprints.begin(), fingerprints.end());
    std::string payload;
    for (size_t i = 0; i < fingerprints.size(); ++i) {
        if (i > 0) payload += '\n';
        payload += fingerprints[i];
    }
    return std::string(kSha256Prefix) + sha256Hex(payload);
}

std::set<std::string> secretSuiteIds(const json::value& suite_registry) {
    std::set<std::string> ids;
    const json::value* suites = findMember(suite_registry, "suites");
    if (suites == nullptr || !suites->is_array()) return ids;

    for (const auto& suite : suites->get_array()) {
        if (stringMember(suite, "secrecy_level") != "secret") continue;
        const std::string id = stringMember(suite, "suite_id");
        if (!id.empty()) ids.insert(id);
    }
    return ids;
}

SecretRegistry SecretRegistry::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw FingerprintError("Secret hash registry not found: " + path.string());
    }
    json::value doc;
    try {
        doc = loadDataFile(path);
    } catch (const DataFileError& e) {
        throw FingerprintError(std::string("Secret hash registry unreadable: ") + e.what());
    }

    SecretRegistry registry = fromJson(doc);
    std::cout << "[SecretRegistry] Loaded " << registry.suites().size()
              << " suite(s), scheme " << registry.scheme().scheme_id << "\n";
    return registry;
}

SecretRegistry SecretRegistry::fromJson(const json::value& doc) {
    if (!doc.is_object()) {
        throw FingerprintError("Secret hash registry must be an object");
    }
    const json::object& obj = doc.get_object();
    for (const char* field : {"registry_version", "hashing_scheme", "suite_registry_hash", "suites"}) {
        if (!obj.contains(field)) {
            throw FingerprintError(std::string("Secret hash registry missing '") + field + "'");
        }
    }

    SecretRegistry registry;
    registry.registry_version_ = scalarText(obj.at("registry_version"));
    registry.scheme_ = HashingScheme::fromJson(obj.at("hashing_scheme"));
    registry.suite_registry_hash_ = scalarText(obj.at("suite_registry_hash"));
    if (const json::value* at = obj.if_contains("generated_at")) {
        registry.generated_at_ = scalarText(*at);
    }

    const json::value& suites = obj.at("suites");
    if (!suites.is_array()) {
        throw FingerprintError("Secret hash registry 'suites' must be a list");
    }
    for (const auto& s : suites.get_array()) {
        if (!s.is_object()) continue;
        registry.suites_.push_back(parseSuite(s.get_object()));
    }

    registry.document_hash_ = contentHash(doc);
    return registry;
}

const SecretSuite* SecretRegistry::findSuite(const std::string& suite_id) const {
    for (const auto& s : suites_) {
        if (s.suite_id == suite_id) return &s;
    }
    return nullptr;
}

FingerprintIndex SecretRegistry::fingerprintIndex() const {
    FingerprintIndex index;
    for (const auto& suite : suites_) {
        for (const auto& fp : suite.test_case_fingerprints) {
            index.fingerprints.insert(fp);
            if (!suite.suite_id.empty()) {
                index.suites_by_fingerprint[fp].insert(suite.suite_id);
            }
        }
    }
    return index;
}

InvariantCheck checkRegistryIntegrity(
    const SecretRegistry& registry,
    const std::string& expected_suite_registry_hash,
    const std::set<std::string>& secret_suite_ids,
    const std::vector<std::string>& supported_schemes
) {
    if (secret_suite_ids.empty()) {
        return InvariantCheck(kIntegrityCheck, InvariantStatus::SKIP, "No secret suites defined");
    }

    json::array failures;

    const std::string& scheme_id = registry.scheme().scheme_id;
    if (std::find(supported_schemes.begin(), supported_schemes.end(), scheme_id) ==
        supported_schemes.end()) {
        failures.push_back(failure("", "Unsupported hashing scheme '" + scheme_id + "'"));
    }

    if (!verifyHash(registry.suiteRegistryHash(), expected_suite_registry_hash)) {
        json::object f = failure("", "suite_registry_hash mismatch");
        f["expected"] = expected_suite_registry_hash;
        f["found"] = registry.suiteRegistryHash();
        failures.push_back(std::move(f));
    }

    for (const auto& id : secret_suite_ids) {
        if (registry.findSuite(id) == nullptr) {
            failures.push_back(failure(id, "Secret suite missing from hash registry"));
        }
    }

    for (const auto& suite : registry.suites()) {
        const auto& fps = suite.test_case_fingerprints;
        const std::set<std::string> unique(fps.begin(), fps.end());
        if (unique.size() != fps.size()) {
            failures.push_back(failure(suite.suite_id, "Duplicate fingerprints in registry entry"));
        }
        if (!suite.n_test_cases.is_null() && !countMatches(suite.n_test_cases, fps.size())) {
            failures.push_back(failure(suite.suite_id, "n_test_cases does not match fingerprint count"));
        }
        if (suite.suite_fingerprint_root != suiteFingerprintRoot(fps)) {
            failures.push_back(failure(suite.suite_id, "suite_fingerprint_root mismatch"));
        }
    }

    if (!failures.empty()) {
        json::object details;
        const size_t n = failures.size();
        details["failures"] = std::move(failures);
        std::cerr << "[SecretRegistry] " << n << " integrity issue(s) detected\n";
        return InvariantCheck(kIntegrityCheck, InvariantStatus::FAIL,
                              std::to_string(n) + " registry integrity issue(s) detected",
                              std::move(details));
    }
    return InvariantCheck(kIntegrityCheck, InvariantStatus::PASS,
                          "Secret hash registry integrity verified");
}

InvariantCheck checkRegistryIntegrity(
    const SecretRegistry& registry,
    const std::string& expected_suite_registry_hash,
    const std::set<std::string>& secret_suite_ids,
    const AuditConfig& config
) {
    return checkRegistryIntegrity(registry, expected_suite_registry_hash,
                                  secret_suite_ids, config.supported_schemes);
}

}
