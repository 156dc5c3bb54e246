/**
 * @file test_config.cpp
 * @brief Unit tests for ConfigManager and PassiveAuthenticationConfig
 */

#include <gtest/gtest.h>
#include "common/config/config_manager.h"
#include "passiveauthentication/infrastructure/config/PassiveAuthenticationConfig.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/util/X509Util.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using epassport::common::ConfigManager;
using epassport::pa::infrastructure::config::PassiveAuthenticationConfig;
using epassport::shared::exception::DomainException;
using epassport::shared::exception::InfrastructureException;
using epassport::shared::util::X509Util;

class ConfigTest : public ::testing::Test {
protected:
    ConfigManager& config = ConfigManager::getInstance();
    std::string tempFile;

    void SetUp() override {
        config.clear();
    }

    void TearDown() override {
        config.clear();
        unsetenv("EPASSPORT_TEST_ENV_ONLY");
        if (!tempFile.empty()) {
            std::remove(tempFile.c_str());
        }
    }

    std::string writeFile(const std::string& content) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempFile = ::testing::TempDir() + "epassport_config_" + info->name() + ".json";
        std::ofstream out(tempFile);
        out << content;
        return tempFile;
    }
};

// ============================================================================
// ConfigManager
// ============================================================================

TEST_F(ConfigTest, TypedGetters_ParseValues) {
    config.set("EPASSPORT_TEST_INT", "42");
    config.set("EPASSPORT_TEST_BOOL", "Yes");
    config.set("EPASSPORT_TEST_DOUBLE", "2.5");

    EXPECT_EQ(config.getInt("EPASSPORT_TEST_INT"), 42);
    EXPECT_TRUE(config.getBool("EPASSPORT_TEST_BOOL"));
    EXPECT_DOUBLE_EQ(config.getDouble("EPASSPORT_TEST_DOUBLE"), 2.5);
    EXPECT_EQ(config.getString("EPASSPORT_TEST_MISSING", "fallback"), "fallback");
}

TEST_F(ConfigTest, TypedGetters_BadValuesUseDefault) {
    config.set("EPASSPORT_TEST_INT", "12abc");
    config.set("EPASSPORT_TEST_BOOL", "maybe");

    EXPECT_EQ(config.getInt("EPASSPORT_TEST_INT", 7), 7);
    EXPECT_TRUE(config.getBool("EPASSPORT_TEST_BOOL", true));
    EXPECT_FALSE(config.getBool("EPASSPORT_TEST_BOOL", false));
}

TEST_F(ConfigTest, Environment_IsFallback) {
    setenv("EPASSPORT_TEST_ENV_ONLY", "from-env", 1);
    EXPECT_EQ(config.getString("EPASSPORT_TEST_ENV_ONLY"), "from-env");
    EXPECT_TRUE(config.has("EPASSPORT_TEST_ENV_ONLY"));

    config.set("EPASSPORT_TEST_ENV_ONLY", "from-set");
    EXPECT_EQ(config.getString("EPASSPORT_TEST_ENV_ONLY"), "from-set");

    config.remove("EPASSPORT_TEST_ENV_ONLY");
    EXPECT_EQ(config.getString("EPASSPORT_TEST_ENV_ONLY"), "from-env");
}

TEST_F(ConfigTest, LoadFromFile_FlatJsonObject) {
    auto path = writeFile(R"({
        "EPASSPORT_LOG_LEVEL": "debug",
        "EPASSPORT_DIRECTORY_MAX_ATTEMPTS": 5,
        "EPASSPORT_CRL_CACHE_ENABLED": false
    })");

    EXPECT_EQ(config.loadFromFile(path), 3u);
    EXPECT_EQ(config.getString("EPASSPORT_LOG_LEVEL"), "debug");
    EXPECT_EQ(config.getInt("EPASSPORT_DIRECTORY_MAX_ATTEMPTS"), 5);
    EXPECT_FALSE(config.getBool("EPASSPORT_CRL_CACHE_ENABLED", true));
}

TEST_F(ConfigTest, LoadFromFile_RejectsNestedValues) {
    auto path = writeFile(R"({"EPASSPORT_LDAP": {"uri": "ldap://x"}})");
    EXPECT_THROW(config.loadFromFile(path), InfrastructureException);
    EXPECT_FALSE(config.has("EPASSPORT_LDAP"));
}

TEST_F(ConfigTest, LoadFromFile_ErrorsAreConfigLoadError) {
    auto path = writeFile("not json at all");
    try {
        config.loadFromFile(path);
        FAIL() << "Expected InfrastructureException";
    } catch (const InfrastructureException& e) {
        EXPECT_EQ(e.getCode(), "CONFIG_LOAD_ERROR");
    }
    EXPECT_THROW(config.loadFromFile(::testing::TempDir() + "epassport_missing.json"), InfrastructureException);
}

// ============================================================================
// PassiveAuthenticationConfig
// ============================================================================

TEST_F(ConfigTest, PaConfig_Defaults) {
    auto pa = PassiveAuthenticationConfig::fromConfigManager();

    EXPECT_EQ(pa.directoryTimeout.count(), 5000);
    EXPECT_EQ(pa.directoryMaxAttempts, 3);
    EXPECT_EQ(pa.directoryInitialBackoff.count(), 200);
    EXPECT_TRUE(pa.crlCacheEnabled);
    EXPECT_EQ(pa.crlCacheTtl.count(), 86400);
    EXPECT_TRUE(pa.parallelDataGroupHashing);
    EXPECT_FALSE(pa.checkTime.has_value());
    EXPECT_FALSE(pa.validationClock().isReferenceTime());
    EXPECT_NO_THROW(pa.validate());
}

TEST_F(ConfigTest, PaConfig_Overrides) {
    config.set("EPASSPORT_DIRECTORY_TIMEOUT_MS", "1500");
    config.set("EPASSPORT_DIRECTORY_MAX_ATTEMPTS", "1");
    config.set("EPASSPORT_CRL_CACHE_ENABLED", "off");
    config.set("EPASSPORT_PARALLEL_DG_HASHING", "0");
    config.set("EPASSPORT_DB_CONNINFO", "host=localhost dbname=epassport");

    auto pa = PassiveAuthenticationConfig::fromConfigManager();
    EXPECT_EQ(pa.directoryTimeout.count(), 1500);
    EXPECT_EQ(pa.directoryMaxAttempts, 1);
    EXPECT_FALSE(pa.crlCacheEnabled);
    EXPECT_FALSE(pa.parallelDataGroupHashing);
    EXPECT_TRUE(pa.hasDatabase());
}

TEST_F(ConfigTest, PaConfig_CheckTimeIsReferenceClock) {
    config.set("EPASSPORT_CHECK_TIME", "2024-01-15T10:30:00Z");

    auto pa = PassiveAuthenticationConfig::fromConfigManager();
    ASSERT_TRUE(pa.checkTime.has_value());
    auto clock = pa.validationClock();
    EXPECT_TRUE(clock.isReferenceTime());
    EXPECT_EQ(X509Util::toIso8601(clock.now()), "2024-01-15T10:30:00Z");
}

TEST_F(ConfigTest, PaConfig_InvalidCheckTimeThrows) {
    config.set("EPASSPORT_CHECK_TIME", "yesterday");
    try {
        PassiveAuthenticationConfig::fromConfigManager();
        FAIL() << "Expected DomainException";
    } catch (const DomainException& e) {
        EXPECT_EQ(e.getCode(), "INVALID_CONFIGURATION");
    }
}

TEST_F(ConfigTest, PaConfig_ValidateRejectsNonPositiveValues) {
    PassiveAuthenticationConfig pa;
    pa.directoryMaxAttempts = 0;
    EXPECT_THROW(pa.validate(), DomainException);

    pa = PassiveAuthenticationConfig();
    pa.crlCacheTtl = std::chrono::seconds(0);
    EXPECT_THROW(pa.validate(), DomainException);

    pa.crlCacheEnabled = false;
    EXPECT_NO_THROW(pa.validate());
}
