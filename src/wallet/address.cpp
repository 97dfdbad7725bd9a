// DOGEPROV - Dogecoin Addresses Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/wallet/address.h"
#include "dogeprov/crypto/base58.h"

#include <vector>

namespace dogeprov {
namespace wallet {

std::optional<Address> DecodeAddress(const std::string& str) {
    auto payload = DecodeBase58Check(str);
    if (!payload || payload->size() != 1 + Hash160::SIZE) {
        return std::nullopt;
    }

    Address address;
    switch ((*payload)[0]) {
        case PUBKEY_ADDRESS_VERSION:
            address.type = AddressType::P2PKH;
            break;
        case SCRIPT_ADDRESS_VERSION:
            address.type = AddressType::P2SH;
            break;
        default:
            return std::nullopt;
    }
    address.hash = Hash160(payload->data() + 1, Hash160::SIZE);
    return address;
}

std::string EncodeAddress(const Address& address) {
    std::vector<uint8_t> payload;
    payload.reserve(1 + Hash160::SIZE);
    payload.push_back(address.type == AddressType::P2SH ? SCRIPT_ADDRESS_VERSION
                                                        : PUBKEY_ADDRESS_VERSION);
    payload.insert(payload.end(), address.hash.begin(), address.hash.end());
    return EncodeBase58Check(payload);
}

bool IsValidAddress(const std::string& str) {
    return DecodeAddress(str).has_value();
}

Script ScriptForAddress(const Address& address) {
    if (address.type == AddressType::P2SH) {
        return Script::CreateP2SH(address.hash);
    }
    return Script::CreateP2PKH(address.hash);
}

std::optional<Script> ScriptForAddress(const std::string& str) {
    auto address = DecodeAddress(str);
    if (!address) return std::nullopt;
    return ScriptForAddress(*address);
}

} // namespace wallet
} // namespace dogeprov
