// DOGEPROV - Dogecoin Addresses
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Base58Check encoding of Dogecoin mainnet P2PKH ("D...") and
// P2SH ("9..." / "A...") addresses.

#ifndef DOGEPROV_WALLET_ADDRESS_H
#define DOGEPROV_WALLET_ADDRESS_H

#include "dogeprov/core/script.h"
#include "dogeprov/core/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace dogeprov {
namespace wallet {

/// Mainnet version bytes
constexpr uint8_t PUBKEY_ADDRESS_VERSION = 0x1e;
constexpr uint8_t SCRIPT_ADDRESS_VERSION = 0x16;

enum class AddressType {
    P2PKH,
    P2SH
};

struct Address {
    AddressType type{AddressType::P2PKH};
    Hash160 hash;

    bool operator==(const Address& other) const {
        return type == other.type && hash == other.hash;
    }
};

/// nullopt for bad checksums, wrong lengths and unknown version bytes
std::optional<Address> DecodeAddress(const std::string& str);

std::string EncodeAddress(const Address& address);

bool IsValidAddress(const std::string& str);

/// Output script paying to the address
Script ScriptForAddress(const Address& address);

/// Decode and build the output script in one step
std::optional<Script> ScriptForAddress(const std::string& str);

} // namespace wallet
} // namespace dogeprov

#endif // DOGEPROV_WALLET_ADDRESS_H
