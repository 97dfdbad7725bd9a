// DOGEPROV - Configuration File Parser Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>

#include "dogeprov/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace dogeprov {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/dogeprov_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    auto result = config_.ParseString("# comment\n; also a comment\n\n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    ASSERT_TRUE(config_.ParseString("feerate = 1000").success);
    EXPECT_EQ(config_.GetString("feerate", ""), "1000");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    ASSERT_TRUE(config_.ParseString("path = \"/var/lib/doge prov\"").success);
    EXPECT_EQ(config_.GetString("path", ""), "/var/lib/doge prov");
}

TEST_F(ConfigTest, ParseBareFlagIsTrue) {
    ASSERT_TRUE(config_.ParseString("[fees]\nroundtokb").success);
    EXPECT_TRUE(config_.GetBool("roundtokb", false, "fees"));
}

TEST_F(ConfigTest, ParseSection) {
    ASSERT_TRUE(config_.ParseString(
        "level = debug\n"
        "[fees]\n"
        "feerate = 200\n"
        "[selection]\n"
        "maxinputs = 50\n").success);

    EXPECT_EQ(config_.GetString("level", ""), "debug");
    EXPECT_EQ(config_.GetInt("feerate", 0, "fees"), 200);
    EXPECT_EQ(config_.GetInt("maxinputs", 0, "selection"), 50);
    EXPECT_FALSE(config_.HasKey("feerate"));
}

TEST_F(ConfigTest, MissingSectionBracketFails) {
    auto result = config_.ParseString("ok = 1\n[fees\nfeerate = 1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKeyCharacterFails) {
    auto result = config_.ParseString("fee rate = 1");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid character"), std::string::npos);
}

TEST_F(ConfigTest, LineTooLongFails) {
    std::string line = "key = " + std::string(MAX_LINE_LENGTH, 'x');
    EXPECT_FALSE(config_.ParseString(line).success);
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, GetInt) {
    ASSERT_TRUE(config_.ParseString("a = 42\nb = -7\nc = 12abc\nd =").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("missing", 99), 99);
}

TEST_F(ConfigTest, GetBool) {
    ASSERT_TRUE(config_.ParseString(
        "a = yes\nb = OFF\nc = 1\nd = maybe").success);
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_EQ(config_.TryGetBool("c"), true);
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
}

// ============================================================================
// Environment Expansion
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVarsBraced) {
    setenv("DOGEPROV_TEST_VAR", "wow", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("such_${DOGEPROV_TEST_VAR}_much"), "such_wow_much");
    unsetenv("DOGEPROV_TEST_VAR");
}

TEST_F(ConfigTest, ExpandEnvVarsUnbraced) {
    setenv("DOGEPROVHOME", "/home/shibe", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$DOGEPROVHOME/grants"), "/home/shibe/grants");
    unsetenv("DOGEPROVHOME");
}

TEST_F(ConfigTest, ExpandEnvVarsInValues) {
    setenv("DOGEPROV_DB", "/tmp/grants", 1);
    ASSERT_TRUE(config_.ParseString("[permissions]\ndbpath = ${DOGEPROV_DB}").success);
    EXPECT_EQ(config_.GetString("dbpath", "", "permissions"), "/tmp/grants");
    unsetenv("DOGEPROV_DB");
}

// ============================================================================
// Files and Validation
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[approval]\ntimeout = 120\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_EQ(config_.GetInt("timeout", 0, "approval"), 120);
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/dogeprov.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRequiredAndUnknownKeys) {
    config_.RequireKey("devfeeaddress", "fees");
    config_.AllowKey("feerate", "fees");
    ASSERT_TRUE(config_.ParseString("[fees]\nfeerate = 1\nfeerat = 2\n").success);

    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(errors[0].find("fees.devfeeaddress"), std::string::npos);
    EXPECT_NE(errors[1].find("fees.feerat"), std::string::npos);
}

TEST_F(ConfigTest, SetOverridesParsedValue) {
    ASSERT_TRUE(config_.ParseString("[log]\nlevel = info").success);
    config_.Set("level", "debug", "log");
    EXPECT_EQ(config_.GetString("level", "", "log"), "debug");
}

} // namespace test
} // namespace util
} // namespace dogeprov
