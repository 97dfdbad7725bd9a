// DOGEPROV - Provider Configuration Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/provider/config.h"
#include "dogeprov/wallet/address.h"

#include <algorithm>
#include <cctype>
#include <optional>

namespace dogeprov {
namespace provider {

using util::ConfigManager;
using util::ConfigParseResult;

namespace {

/// Missing keys keep `value`; present ones must parse and be >= minimum
bool ReadInt(const ConfigManager& config, const std::string& section, const std::string& key,
             int64_t minimum, int64_t& value, std::string& error) {
    if (!config.HasKey(key, section)) {
        return true;
    }
    auto parsed = config.TryGetInt(key, section);
    if (!parsed || *parsed < minimum) {
        error = "Invalid value for " + section + "." + key;
        return false;
    }
    value = *parsed;
    return true;
}

} // namespace

void ProviderConfig::RegisterKeys(ConfigManager& config) {
    config.RequireKey("devfeeaddress", "fees");
    for (const char* key : {"feerate", "roundtokb", "devfee", "doginalfee"}) {
        config.AllowKey(key, "fees");
    }
    for (const char* key : {"protectthreshold", "dustthreshold", "maxinputs"}) {
        config.AllowKey(key, "selection");
    }
    config.AllowKey("timeout", "approval");
    config.AllowKey("dbpath", "permissions");
    config.AllowKey("level", "log");
    config.AllowKey("file", "log");
}

ConfigParseResult ProviderConfig::Load(const ConfigManager& config, ProviderConfig& out) {
    ProviderConfig result;
    std::string error;

    auto address = config.TryGetString("devfeeaddress", "fees");
    if (!address || address->empty()) {
        return ConfigParseResult::Error("Required key missing: fees.devfeeaddress");
    }
    if (!wallet::IsValidAddress(*address)) {
        return ConfigParseResult::Error("Invalid dev fee address: " + *address);
    }
    result.devFeeAddress = *address;

    auto& fees = result.fees;
    int64_t maxInputs = static_cast<int64_t>(fees.maxInputs);
    if (!ReadInt(config, "fees", "feerate", 0, fees.feeRate, error) ||
        !ReadInt(config, "fees", "devfee", 0, fees.devFee, error) ||
        !ReadInt(config, "fees", "doginalfee", 0, fees.doginalFee, error) ||
        !ReadInt(config, "selection", "protectthreshold", 0, fees.protectThreshold, error) ||
        !ReadInt(config, "selection", "dustthreshold", 0, fees.dustThreshold, error) ||
        !ReadInt(config, "selection", "maxinputs", 1, maxInputs, error) ||
        !ReadInt(config, "approval", "timeout", 1, result.approvalTimeout, error)) {
        return ConfigParseResult::Error(error);
    }
    fees.maxInputs = static_cast<size_t>(maxInputs);

    if (config.HasKey("roundtokb", "fees")) {
        auto round = config.TryGetBool("roundtokb", "fees");
        if (!round) {
            return ConfigParseResult::Error("Invalid value for fees.roundtokb");
        }
        fees.roundToKB = *round;
    }

    result.permissionsPath = config.GetString("dbpath", "", "permissions");

    std::string level = config.GetString("level", "info", "log");
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    result.logLevel = util::LogLevelFromString(level);
    if (result.logLevel == util::LogLevel::Info && level != "info") {
        return ConfigParseResult::Error("Invalid value for log.level: " + level);
    }
    result.logFile = config.GetString("file", "", "log");

    out = std::move(result);
    return ConfigParseResult::Success();
}

} // namespace provider
} // namespace dogeprov
