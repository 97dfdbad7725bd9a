// DOGEPROV - Provider Configuration Tests
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include <gtest/gtest.h>
#include "dogeprov/provider/config.h"
#include "provider/fakes.h"

namespace dogeprov {
namespace provider {
namespace test {

using dogeprov::test::MakeAddress;

class ProviderConfigTest : public ::testing::Test {
protected:
    util::ConfigManager config_;
    std::string devAddress_ = MakeAddress(0xdd);

    void SetUp() override {
        ProviderConfig::RegisterKeys(config_);
    }

    util::ConfigParseResult Load(const std::string& text, ProviderConfig& out) {
        auto parsed = config_.ParseString(text);
        EXPECT_TRUE(parsed.success) << parsed.errorMessage;
        return ProviderConfig::Load(config_, out);
    }
};

TEST_F(ProviderConfigTest, Defaults) {
    ProviderConfig cfg;
    auto result = Load("[fees]\ndevfeeaddress = " + devAddress_ + "\n", cfg);
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(cfg.devFeeAddress, devAddress_);
    EXPECT_EQ(cfg.fees.feeRate, 1000);
    EXPECT_TRUE(cfg.fees.roundToKB);
    EXPECT_EQ(cfg.fees.devFee, 1000000);
    EXPECT_EQ(cfg.fees.doginalFee, 10000000);
    EXPECT_EQ(cfg.approvalTimeout, DEFAULT_APPROVAL_TIMEOUT);
    EXPECT_TRUE(cfg.permissionsPath.empty());
    EXPECT_EQ(cfg.logLevel, util::LogLevel::Info);
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ProviderConfigTest, AllKeys) {
    ProviderConfig cfg;
    auto result = Load(
        "[fees]\n"
        "devfeeaddress = " + devAddress_ + "\n"
        "feerate = 200\n"
        "roundtokb = false\n"
        "devfee = 0\n"
        "doginalfee = 5000000\n"
        "[selection]\n"
        "protectthreshold = 2000000\n"
        "dustthreshold = 500000\n"
        "maxinputs = 50\n"
        "[approval]\n"
        "timeout = 60\n"
        "[permissions]\n"
        "dbpath = /var/lib/dogeprov/permissions\n"
        "[log]\n"
        "level = DEBUG\n"
        "file = /tmp/dogeprov.log\n",
        cfg);
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(cfg.fees.feeRate, 200);
    EXPECT_FALSE(cfg.fees.roundToKB);
    EXPECT_EQ(cfg.fees.devFee, 0);
    EXPECT_EQ(cfg.fees.doginalFee, 5000000);
    EXPECT_EQ(cfg.fees.protectThreshold, 2000000);
    EXPECT_EQ(cfg.fees.dustThreshold, 500000);
    EXPECT_EQ(cfg.fees.maxInputs, 50u);
    EXPECT_EQ(cfg.approvalTimeout, 60);
    EXPECT_EQ(cfg.permissionsPath, "/var/lib/dogeprov/permissions");
    EXPECT_EQ(cfg.logLevel, util::LogLevel::Debug);
    EXPECT_EQ(cfg.logFile, "/tmp/dogeprov.log");
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ProviderConfigTest, MissingDevFeeAddress) {
    ProviderConfig cfg;
    cfg.approvalTimeout = 7;
    auto result = Load("[approval]\ntimeout = 60\n", cfg);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Required key missing: fees.devfeeaddress");
    EXPECT_EQ(cfg.approvalTimeout, 7);

    auto problems = config_.Validate();
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_EQ(problems[0], "Required key missing: fees.devfeeaddress");
}

TEST_F(ProviderConfigTest, RejectsBadValues) {
    ProviderConfig cfg;
    EXPECT_FALSE(Load("[fees]\ndevfeeaddress = Dnope\n", cfg).success);

    config_.Clear();
    ProviderConfig::RegisterKeys(config_);
    auto negative = Load("[fees]\ndevfeeaddress = " + devAddress_ + "\nfeerate = -1\n", cfg);
    EXPECT_FALSE(negative.success);
    EXPECT_EQ(negative.errorMessage, "Invalid value for fees.feerate");

    config_.Clear();
    ProviderConfig::RegisterKeys(config_);
    auto zeroTimeout = Load("[fees]\ndevfeeaddress = " + devAddress_ +
                            "\n[approval]\ntimeout = 0\n", cfg);
    EXPECT_FALSE(zeroTimeout.success);

    config_.Clear();
    ProviderConfig::RegisterKeys(config_);
    auto level = Load("[fees]\ndevfeeaddress = " + devAddress_ + "\n[log]\nlevel = loud\n", cfg);
    EXPECT_FALSE(level.success);
    EXPECT_EQ(level.errorMessage, "Invalid value for log.level: loud");
}

TEST_F(ProviderConfigTest, ValidateFlagsTypos) {
    ProviderConfig cfg;
    ASSERT_TRUE(Load("[fees]\ndevfeeaddress = " + devAddress_ + "\nfeerat = 5\n", cfg).success);
    auto problems = config_.Validate();
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("fees.feerat"), std::string::npos);
}

} // namespace test
} // namespace provider
} // namespace dogeprov
