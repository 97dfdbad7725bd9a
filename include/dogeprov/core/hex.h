// DOGEPROV - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#ifndef DOGEPROV_CORE_HEX_H
#define DOGEPROV_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dogeprov {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes; nullopt on odd length or bad characters
std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex);

/// Check if string is valid, non-empty hex
bool IsValidHex(const std::string& str);

} // namespace dogeprov

#endif // DOGEPROV_CORE_HEX_H
