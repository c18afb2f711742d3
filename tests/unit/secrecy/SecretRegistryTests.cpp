#include <gtest/gtest.h>

#include "warden/secrecy/SecretRegistry.hpp"
#include "warden/canon/ContentHash.hpp"
#include "warden/canon/Digest.hpp"
#include "unit/TestSupport.hpp"

using namespace warden;
namespace json = boost::json;

namespace {

const std::vector<std::string> kSupported{"sha256-v1", "hmac-sha256-v1"};
const char* kSuiteRegistryHash = "sha256:5d41402abc4b2a76b9719d911017c592";

std::string fp(const char* content) {
    return "sha256:" + sha256Hex(content);
}

json::object suiteEntry(
    const std::string& suite_id,
    const std::vector<std::string>& fingerprints
) {
    json::array fps;
    for (const auto& f : fingerprints) fps.emplace_back(f);
    json::object s;
    s["suite_id"] = suite_id;
    s["test_case_fingerprints"] = std::move(fps);
    s["suite_fingerprint_root"] = suiteFingerprintRoot(fingerprints);
    s["n_test_cases"] = fingerprints.size();
    return s;
}

json::object registryDoc() {
    json::object doc;
    doc["registry_version"] = "1.0.0";
    doc["generated_at"] = "2024-05-01T00:00:00Z";
    doc["hashing_scheme"] = json::object{
        {"scheme_id", "sha256-v1"},
        {"normalization_id", "json-canonical-v1"},
        {"digest_prefix", "sha256:"}
    };
    doc["suite_registry_hash"] = kSuiteRegistryHash;
    json::array suites;
    suites.push_back(suiteEntry("heldout-a", {fp("a1"), fp("a2")}));
    suites.push_back(suiteEntry("heldout-b", {fp("b1")}));
    doc["suites"] = std::move(suites);
    return doc;
}

const json::array& failuresOf(const InvariantCheck& check) {
    return check.details.at("failures").get_array();
}

}

// ============================================================================
// PARSING
// ============================================================================
TEST(SecretRegistryTest, FromJson_ReadsAllFields) {
    const json::value doc = registryDoc();
    const SecretRegistry registry = SecretRegistry::fromJson(doc);

    EXPECT_EQ(registry.registryVersion(), "1.0.0");
    EXPECT_EQ(registry.generatedAt(), "2024-05-01T00:00:00Z");
    EXPECT_EQ(registry.scheme().scheme_id, "sha256-v1");
    EXPECT_EQ(registry.suiteRegistryHash(), kSuiteRegistryHash);
    ASSERT_EQ(registry.suites().size(), 2u);
    EXPECT_EQ(registry.documentHash(), contentHash(doc));
    ASSERT_NE(registry.findSuite("heldout-b"), nullptr);
    EXPECT_EQ(registry.findSuite("heldout-b")->test_case_fingerprints.size(), 1u);
    EXPECT_EQ(registry.findSuite("nope"), nullptr);
}

TEST(SecretRegistryTest, FromJson_GeneratedAtOptional) {
    json::object doc = registryDoc();
    doc.erase("generated_at");
    EXPECT_EQ(SecretRegistry::fromJson(doc).generatedAt(), "");
}

TEST(SecretRegistryTest, FromJson_MissingRequiredField_Throws) {
    for (const char* field : {"registry_version", "hashing_scheme", "suite_registry_hash", "suites"}) {
        json::object doc = registryDoc();
        doc.erase(field);
        EXPECT_THROW(SecretRegistry::fromJson(doc), FingerprintError) << field;
    }
}

TEST(SecretRegistryTest, FromJson_MalformedSuites_Throw) {
    json::object doc = registryDoc();
    doc["suites"] = "not-a-list";
    EXPECT_THROW(SecretRegistry::fromJson(doc), FingerprintError);

    doc = registryDoc();
    json::object numeric;
    numeric["suite_id"] = "s";
    numeric["test_case_fingerprints"] = json::array{1};
    json::array suites;
    suites.push_back(std::move(numeric));
    doc["suites"] = std::move(suites);
    EXPECT_THROW(SecretRegistry::fromJson(doc), FingerprintError);
}

TEST(SecretRegistryTest, FromJson_NonObjectSuitesSkipped) {
    json::object doc = registryDoc();
    doc["suites"].get_array().push_back("junk");
    EXPECT_EQ(SecretRegistry::fromJson(doc).suites().size(), 2u);
}

TEST(SecretRegistryTest, FingerprintIndex_MapsFingerprintToSuites) {
    json::object doc = registryDoc();
    doc["suites"].get_array().push_back(suiteEntry("heldout-c", {fp("a1")}));
    const FingerprintIndex index = SecretRegistry::fromJson(doc).fingerprintIndex();

    EXPECT_EQ(index.fingerprints.size(), 3u);
    EXPECT_EQ(index.suites_by_fingerprint.at(fp("a1")),
              (std::set<std::string>{"heldout-a", "heldout-c"}));
}

class SecretRegistryFileTest : public ::testing::Test {
protected:
    warden::testing::TempDir dir;
};

TEST_F(SecretRegistryFileTest, Load_FileAndFailures) {
    const auto p = dir.write("registry.json", json::serialize(registryDoc()));
    EXPECT_EQ(SecretRegistry::load(p).suites().size(), 2u);
    EXPECT_THROW(SecretRegistry::load(dir.path() / "absent.yaml"), FingerprintError);

    const auto bad = dir.write("bad.yaml", "suites: [\n");
    EXPECT_THROW(SecretRegistry::load(bad), FingerprintError);
}

// ============================================================================
// HELPERS
// ============================================================================
TEST(SuiteRootTest, SortedNewlineJoined) {
    EXPECT_EQ(suiteFingerprintRoot({"b", "a"}), "sha256:" + sha256Hex("a\nb"));
    EXPECT_EQ(suiteFingerprintRoot({"a", "b"}), suiteFingerprintRoot({"b", "a"}));
    EXPECT_EQ(suiteFingerprintRoot({}), "sha256:" + sha256Hex(""));
}

TEST(SecretSuiteIdsTest, OnlySecretLevel) {
    const json::value reg = json::parse(R"({"suites":[
        {"suite_id":"a","secrecy_level":"secret"},
        {"suite_id":"b","secrecy_level":"public"},
        {"suite_id":"c"},
        {"secrecy_level":"secret"},
        {"suite_id":"d","secrecy_level":"secret"}
    ]})");
    EXPECT_EQ(secretSuiteIds(reg), (std::set<std::string>{"a", "d"}));
    EXPECT_TRUE(secretSuiteIds(json::parse("{}")).empty());
}

// ============================================================================
// INTEGRITY
// ============================================================================
TEST(RegistryIntegrityTest, ConsistentRegistry_Passes) {
    const SecretRegistry registry = SecretRegistry::fromJson(registryDoc());
    const InvariantCheck check = checkRegistryIntegrity(
        registry, "5d41402abc4b2a76b9719d911017c592", {"heldout-a", "heldout-b"}, kSupported);
    EXPECT_EQ(check.name, "SECRET_REGISTRY_INTEGRITY");
    EXPECT_EQ(check.status, InvariantStatus::PASS) << check.message;
}

TEST(RegistryIntegrityTest, NoSecretSuites_Skips) {
    const SecretRegistry registry = SecretRegistry::fromJson(registryDoc());
    EXPECT_EQ(checkRegistryIntegrity(registry, "other", {}, kSupported).status,
              InvariantStatus::SKIP);
}

TEST(RegistryIntegrityTest, HashMismatch_ReportsExpectedAndFound) {
    const SecretRegistry registry = SecretRegistry::fromJson(registryDoc());
    const InvariantCheck check = checkRegistryIntegrity(
        registry, "sha256:ffff", {"heldout-a"}, kSupported);
    ASSERT_EQ(check.status, InvariantStatus::FAIL);
    ASSERT_EQ(failuresOf(check).size(), 1u);
    const json::object& f = failuresOf(check)[0].get_object();
    EXPECT_EQ(f.at("expected"), json::value("sha256:ffff"));
    EXPECT_EQ(f.at("found"), json::value(kSuiteRegistryHash));
}

TEST(RegistryIntegrityTest, UnsupportedSchemeAndMissingSuite_Fail) {
    json::object doc = registryDoc();
    doc["hashing_scheme"].get_object()["scheme_id"] = "md5-v0";
    const SecretRegistry registry = SecretRegistry::fromJson(doc);
    const InvariantCheck check = checkRegistryIntegrity(
        registry, kSuiteRegistryHash, {"heldout-a", "heldout-z"}, kSupported);
    ASSERT_EQ(check.status, InvariantStatus::FAIL);
    EXPECT_EQ(failuresOf(check).size(), 2u);
    EXPECT_EQ(check.message, "2 registry integrity issue(s) detected");
}

TEST(RegistryIntegrityTest, TamperedSuiteEntries_Fail) {
    json::object doc = registryDoc();
    json::array& suites = doc["suites"].get_array();

    json::object dup = suiteEntry("dup", {fp("x"), fp("x")});
    suites.push_back(dup);

    json::object miscounted = suiteEntry("miscounted", {fp("y")});
    miscounted["n_test_cases"] = 4;
    suites.push_back(miscounted);

    json::object reroot = suiteEntry("reroot", {fp("z")});
    reroot["suite_fingerprint_root"] = "sha256:00";
    suites.push_back(reroot);

    const InvariantCheck check = checkRegistryIntegrity(
        SecretRegistry::fromJson(doc), kSuiteRegistryHash, {"heldout-a"}, kSupported);
    ASSERT_EQ(check.status, InvariantStatus::FAIL);

    std::set<std::string> flagged;
    for (const auto& f : failuresOf(check)) {
        flagged.insert(std::string(f.get_object().at("suite_id").get_string()));
    }
    EXPECT_EQ(flagged, (std::set<std::string>{"dup", "miscounted", "reroot"}));
}

TEST(RegistryIntegrityTest, ConfigSupportedSchemes_Applied) {
    const SecretRegistry registry = SecretRegistry::fromJson(registryDoc());
    AuditConfig config;
    EXPECT_EQ(checkRegistryIntegrity(registry, kSuiteRegistryHash, {"heldout-a"}, config).status,
              InvariantStatus::PASS);

    config.supported_schemes = {"hmac-sha256-v1"};
    const InvariantCheck check =
        checkRegistryIntegrity(registry, kSuiteRegistryHash, {"heldout-a"}, config);
    ASSERT_EQ(check.status, InvariantStatus::FAIL);
    ASSERT_EQ(failuresOf(check).size(), 1u);
    EXPECT_EQ(failuresOf(check)[0].get_object().at("reason"),
              json::value("Unsupported hashing scheme 'sha256-v1'"));
}
