// DOGEPROV - Core Types Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/core/types.h"
#include "dogeprov/core/hex.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace dogeprov {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    // Display in reverse byte order
    std::string result;
    result.reserve(SIZE * 2);

    static const char hexChars[] = "0123456789abcdef";

    for (int i = SIZE - 1; i >= 0; --i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }

    return result;
}

template<size_t BITS>
std::optional<BaseHash<BITS>> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        return std::nullopt;
    }
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        return std::nullopt;
    }

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        result.data_[i] = (*bytes)[SIZE - 1 - i];
    }
    return result;
}

template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Amount Formatting
// ============================================================================

std::string FormatAmount(Amount amount) {
    bool negative = amount < 0;
    if (negative) amount = -amount;

    std::ostringstream oss;
    oss << (negative ? "-" : "") << (amount / COIN) << "."
        << std::setfill('0') << std::setw(8) << (amount % COIN);
    return oss.str();
}

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    size_t dotPos = str.find('.');
    std::string wholePart = (dotPos != std::string::npos) ? str.substr(0, dotPos) : str;
    std::string fracPart = (dotPos != std::string::npos) ? str.substr(dotPos + 1) : "";

    if (wholePart.empty() && fracPart.empty()) {
        return std::nullopt;
    }
    // More precision than one koinu cannot be represented
    if (fracPart.size() > 8) {
        return std::nullopt;
    }
    for (char c : wholePart) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    for (char c : fracPart) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    // 11 digits of whole DOGE already exceeds MAX_MONEY
    if (wholePart.size() > 11) {
        return std::nullopt;
    }
    while (fracPart.size() < 8) {
        fracPart += '0';
    }

    Amount whole = wholePart.empty() ? 0 : std::stoll(wholePart);
    Amount frac = std::stoll(fracPart);
    Amount amount = whole * COIN + frac;
    if (!MoneyRange(amount)) {
        return std::nullopt;
    }
    return amount;
}

} // namespace dogeprov
