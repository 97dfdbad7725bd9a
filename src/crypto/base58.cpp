// DOGEPROV - Base58 / Base58Check Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/crypto/base58.h"
#include "dogeprov/crypto/hash.h"

#include <cstring>

namespace dogeprov {

namespace {

const char* const BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int Base58Digit(char c) {
    const char* pos = std::strchr(BASE58_ALPHABET, c);
    if (c == '\0' || pos == nullptr) {
        return -1;
    }
    return static_cast<int>(pos - BASE58_ALPHABET);
}

} // namespace

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    size_t zeroes = 0;
    while (zeroes < data.size() && data[zeroes] == 0) {
        ++zeroes;
    }

    // Big-endian base58 digits, log(256)/log(58) ~ 1.38
    std::vector<uint8_t> digits((data.size() - zeroes) * 138 / 100 + 1);
    size_t length = 0;

    for (size_t i = zeroes; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string out(zeroes, '1');
    for (; it != digits.end(); ++it) {
        out.push_back(BASE58_ALPHABET[*it]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
    size_t ones = 0;
    while (ones < str.size() && str[ones] == '1') {
        ++ones;
    }

    // log(58)/log(256) ~ 0.733
    std::vector<uint8_t> bytes((str.size() - ones) * 733 / 1000 + 1);
    size_t length = 0;

    for (size_t i = ones; i < str.size(); ++i) {
        int carry = Base58Digit(str[i]);
        if (carry < 0) {
            return std::nullopt;
        }
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> out(ones, 0x00);
    out.insert(out.end(), it, bytes.end());
    return out;
}

std::string EncodeBase58Check(const std::vector<uint8_t>& payload) {
    Hash256 checksum = DoubleSHA256(payload);
    std::vector<uint8_t> data = payload;
    data.insert(data.end(), checksum.begin(), checksum.begin() + 4);
    return EncodeBase58(data);
}

std::optional<std::vector<uint8_t>> DecodeBase58Check(const std::string& str) {
    auto data = DecodeBase58(str);
    if (!data || data->size() < 4) {
        return std::nullopt;
    }

    std::vector<uint8_t> payload(data->begin(), data->end() - 4);
    Hash256 checksum = DoubleSHA256(payload);
    if (std::memcmp(checksum.data(), data->data() + payload.size(), 4) != 0) {
        return std::nullopt;
    }
    return payload;
}

} // namespace dogeprov
