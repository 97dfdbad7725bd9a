// DOGEPROV - Provider Configuration
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Example:
//
//   [fees]
//   feerate = 1000
//   devfeeaddress = DH5yaieqoZN36fDVciNyRueRGvGLR3mr7L
//
//   [approval]
//   timeout = 300
//
//   [permissions]
//   dbpath = ${HOME}/.dogeprov/permissions

#ifndef DOGEPROV_PROVIDER_CONFIG_H
#define DOGEPROV_PROVIDER_CONFIG_H

#include "dogeprov/util/config.h"
#include "dogeprov/util/logging.h"
#include "dogeprov/wallet/coinselection.h"

#include <cstdint>
#include <string>

namespace dogeprov {
namespace provider {

constexpr int64_t DEFAULT_APPROVAL_TIMEOUT = 300;

struct ProviderConfig {
    wallet::FeePolicy fees;

    /// Dev fee recipient; must be a valid mainnet address
    std::string devFeeAddress;

    /// Seconds an approval may wait for the user
    int64_t approvalTimeout{DEFAULT_APPROVAL_TIMEOUT};

    /// Empty keeps grants in memory only
    std::string permissionsPath;

    util::LogLevel logLevel{util::LogLevel::Info};
    std::string logFile;

    /// Declare required and allowed keys so Validate() catches typos
    static void RegisterKeys(util::ConfigManager& config);

    /// Read and check every key. `out` is untouched on error.
    static util::ConfigParseResult Load(const util::ConfigManager& config, ProviderConfig& out);
};

} // namespace provider
} // namespace dogeprov

#endif // DOGEPROV_PROVIDER_CONFIG_H
