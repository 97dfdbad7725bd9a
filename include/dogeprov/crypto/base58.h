// DOGEPROV - Base58 / Base58Check
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#ifndef DOGEPROV_CRYPTO_BASE58_H
#define DOGEPROV_CRYPTO_BASE58_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dogeprov {

std::string EncodeBase58(const std::vector<uint8_t>& data);

/// nullopt if the string contains characters outside the alphabet
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

/// Append the 4-byte DoubleSHA256 checksum and encode
std::string EncodeBase58Check(const std::vector<uint8_t>& payload);

/// Decode and verify the checksum; returns the payload without it
std::optional<std::vector<uint8_t>> DecodeBase58Check(const std::string& str);

} // namespace dogeprov

#endif // DOGEPROV_CRYPTO_BASE58_H
