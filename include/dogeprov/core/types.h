// DOGEPROV - Core Types Header
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// This file defines fundamental types used throughout DOGEPROV.

#ifndef DOGEPROV_CORE_TYPES_H
#define DOGEPROV_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <optional>
#include <cstring>

namespace dogeprov {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in koinu (1 DOGE = 100,000,000 koinu)
using Amount = int64_t;

/// Constants
constexpr Amount COIN = 100000000LL;
constexpr Amount CENT = 1000000LL;

/// Dogecoin has no hard supply cap; this bounds arithmetic on page input
constexpr Amount MAX_MONEY = 10000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

/// Parse a decimal DOGE string ("1.5", "0.00000001") into koinu
std::optional<Amount> ParseAmount(const std::string& str);

/// Format koinu as a decimal DOGE string with 8 fractional digits
std::string FormatAmount(Amount amount);

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic hash template
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        // Most significant byte is stored last
        for (int i = SIZE - 1; i >= 0; --i) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }

    /// Convert to hex string (displayed in reverse byte order, like txids)
    std::string ToHex() const;

    /// Create from display-order hex string; nullopt on malformed input
    static std::optional<BaseHash> FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}
};

/// 160-bit hash (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}
};

/// Transaction hash (256-bit)
class TxHash : public Hash256 {
public:
    using Hash256::Hash256;
    TxHash() = default;
    explicit TxHash(const Hash256& h) : Hash256(h) {}

    static std::optional<TxHash> FromHex(const std::string& hex) {
        auto base = BaseHash<256>::FromHex(hex);
        if (!base) return std::nullopt;
        return TxHash(Hash256(*base));
    }
};

} // namespace dogeprov

#endif // DOGEPROV_CORE_TYPES_H
