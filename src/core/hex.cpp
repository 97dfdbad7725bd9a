// DOGEPROV - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/core/hex.h"

namespace dogeprov {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace dogeprov
