#include <gtest/gtest.h>

#include "warden/config/AuditConfig.hpp"
#include "unit/TestSupport.hpp"

#include <cstdlib>

using namespace warden;
namespace json = boost::json;

// ============================================================================
// DEFAULTS AND DOCUMENTS
// ============================================================================
TEST(AuditConfigTest, Defaults) {
    const AuditConfig cfg;
    EXPECT_EQ(cfg.protected_paths.size(), 5u);
    EXPECT_EQ(cfg.protected_paths.front(), "training/data/");
    EXPECT_EQ(cfg.scan_workers, 1u);
    EXPECT_EQ(cfg.default_hmac_key_name, "WARDEN_SECRECY_HMAC_KEY");
    EXPECT_TRUE(cfg.supportsScheme("sha256-v1"));
    EXPECT_TRUE(cfg.supportsScheme("hmac-sha256-v1"));
    EXPECT_FALSE(cfg.supportsScheme("md5-v0"));
}

TEST(AuditConfigTest, FromJson_OverridesSubset) {
    const AuditConfig cfg = AuditConfig::fromJson(json::parse(R"({
        "protected_paths": ["corpus/"],
        "scan_workers": 6,
        "lattice_schema_path": "schemas/lattice.json",
        "unknown_key": true
    })"));
    EXPECT_EQ(cfg.protected_paths, std::vector<std::string>{"corpus/"});
    EXPECT_EQ(cfg.scan_workers, 6u);
    EXPECT_EQ(cfg.lattice_schema_path, "schemas/lattice.json");
    EXPECT_EQ(cfg.default_hmac_key_name, "WARDEN_SECRECY_HMAC_KEY");
}

TEST(AuditConfigTest, FromJson_NullIsDefaults) {
    EXPECT_EQ(AuditConfig::fromJson(json::value(nullptr)).scan_workers, 1u);
}

TEST(AuditConfigTest, FromJson_WrongTypes_Throw) {
    EXPECT_THROW(AuditConfig::fromJson(json::parse("[1]")), ConfigError);
    EXPECT_THROW(AuditConfig::fromJson(json::parse(R"({"protected_paths": "corpus/"})")), ConfigError);
    EXPECT_THROW(AuditConfig::fromJson(json::parse(R"({"protected_paths": [1]})")), ConfigError);
    EXPECT_THROW(AuditConfig::fromJson(json::parse(R"({"scan_workers": 0})")), ConfigError);
    EXPECT_THROW(AuditConfig::fromJson(json::parse(R"({"scan_workers": 2.5})")), ConfigError);
    EXPECT_THROW(AuditConfig::fromJson(json::parse(R"({"default_hmac_key_name": 3})")), ConfigError);
}

TEST(AuditConfigTest, ToJson_ReflectsFields) {
    AuditConfig cfg;
    cfg.scan_workers = 3;
    const json::object o = cfg.toJson();
    EXPECT_EQ(o.at("scan_workers"), json::value(3u));
    EXPECT_EQ(o.at("supported_schemes").get_array().size(), 2u);
}

// ============================================================================
// FILES
// ============================================================================
class AuditConfigFileTest : public ::testing::Test {
protected:
    warden::testing::TempDir dir;
};

TEST_F(AuditConfigFileTest, Load_Yaml) {
    const auto p = dir.write("warden.yaml",
        "protected_paths:\n"
        "  - data/\n"
        "  - prompts/\n"
        "scan_workers: 4\n"
        "default_hmac_key_name: EVAL_KEY\n");
    const AuditConfig cfg = AuditConfig::load(p);
    EXPECT_EQ(cfg.protected_paths, (std::vector<std::string>{"data/", "prompts/"}));
    EXPECT_EQ(cfg.scan_workers, 4u);
    EXPECT_EQ(cfg.default_hmac_key_name, "EVAL_KEY");
}

TEST_F(AuditConfigFileTest, Load_MissingOrMalformed_Throws) {
    EXPECT_THROW(AuditConfig::load(dir.path() / "absent.yaml"), ConfigError);
    const auto bad = dir.write("bad.json", "{\"scan_workers\": ");
    EXPECT_THROW(AuditConfig::load(bad), ConfigError);
}

// ============================================================================
// ENVIRONMENT
// ============================================================================
class AuditConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        ::unsetenv("WARDEN_SCAN_WORKERS");
        ::unsetenv("WARDEN_HMAC_KEY_NAME");
    }
};

TEST_F(AuditConfigEnvTest, ApplyEnvironment_Overrides) {
    ::setenv("WARDEN_SCAN_WORKERS", "8", 1);
    ::setenv("WARDEN_HMAC_KEY_NAME", "CI_KEY", 1);
    AuditConfig cfg;
    cfg.applyEnvironment();
    EXPECT_EQ(cfg.scan_workers, 8u);
    EXPECT_EQ(cfg.default_hmac_key_name, "CI_KEY");
}

TEST_F(AuditConfigEnvTest, ApplyEnvironment_UnsetLeavesValues) {
    AuditConfig cfg;
    cfg.scan_workers = 2;
    cfg.applyEnvironment();
    EXPECT_EQ(cfg.scan_workers, 2u);
}

TEST_F(AuditConfigEnvTest, ApplyEnvironment_InvalidWorkers_Throws) {
    AuditConfig cfg;
    for (const char* bad : {"0", "four", "3x", "-1"}) {
        ::setenv("WARDEN_SCAN_WORKERS", bad, 1);
        EXPECT_THROW(cfg.applyEnvironment(), ConfigError) << bad;
    }
}
