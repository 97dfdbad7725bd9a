// DOGEPROV - Transaction Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/core/transaction.h"
#include "dogeprov/crypto/hash.h"

#include <cctype>

namespace dogeprov {

const uint32_t TxIn::SEQUENCE_FINAL;
const int32_t MutableTransaction::CURRENT_VERSION;

// ============================================================================
// OutPoint Implementation
// ============================================================================

std::string OutPoint::ToString() const {
    return hash.ToHex() + ":" + std::to_string(n);
}

std::optional<OutPoint> OutPoint::FromString(const std::string& str) {
    size_t colon = str.find(':');
    if (colon == std::string::npos || colon + 1 >= str.size()) {
        return std::nullopt;
    }

    auto hash = TxHash::FromHex(str.substr(0, colon));
    if (!hash) {
        return std::nullopt;
    }

    std::string index = str.substr(colon + 1);
    if (index.size() > 10) {
        return std::nullopt;
    }
    uint64_t n = 0;
    for (char c : index) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        n = n * 10 + static_cast<uint64_t>(c - '0');
    }
    if (n >= NULL_INDEX) {
        return std::nullopt;
    }
    return OutPoint(*hash, static_cast<uint32_t>(n));
}

// ============================================================================
// MutableTransaction Implementation
// ============================================================================

TxHash MutableTransaction::GetHash() const {
    DataStream ss;
    ss << *this;
    return ComputeTxid(ss.Data());
}

TxHash ComputeTxid(const std::vector<uint8_t>& rawTx) {
    // Internal byte order; ToHex() produces the familiar reversed display
    return TxHash(DoubleSHA256(rawTx));
}

} // namespace dogeprov
