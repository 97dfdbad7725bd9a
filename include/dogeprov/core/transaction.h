// DOGEPROV - Transaction Header
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Legacy (non-segwit) Dogecoin transaction structures. The provider only
// assembles unsigned transactions; scriptSigs are filled in by the signer.

#ifndef DOGEPROV_CORE_TRANSACTION_H
#define DOGEPROV_CORE_TRANSACTION_H

#include "dogeprov/core/types.h"
#include "dogeprov/core/script.h"
#include "dogeprov/core/serialize.h"
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace dogeprov {

// ============================================================================
// OutPoint
// ============================================================================

/// Reference to an output of a prior transaction
class OutPoint {
public:
    TxHash hash;
    uint32_t n;

    static constexpr uint32_t NULL_INDEX = std::numeric_limits<uint32_t>::max();

    OutPoint() : hash(), n(NULL_INDEX) {}
    OutPoint(const TxHash& hashIn, uint32_t nIn) : hash(hashIn), n(nIn) {}

    bool IsNull() const {
        return hash.IsNull() && n == NULL_INDEX;
    }

    friend bool operator<(const OutPoint& a, const OutPoint& b) {
        if (a.hash != b.hash) return a.hash < b.hash;
        return a.n < b.n;
    }

    friend bool operator==(const OutPoint& a, const OutPoint& b) {
        return a.hash == b.hash && a.n == b.n;
    }

    friend bool operator!=(const OutPoint& a, const OutPoint& b) {
        return !(a == b);
    }

    /// "txid:vout", the form indexers use for inscription locations
    std::string ToString() const;

    /// Parse "txid:vout" (an "i0"-style inscription suffix is not accepted)
    static std::optional<OutPoint> FromString(const std::string& str);
};

template<typename Stream>
void Serialize(Stream& s, const OutPoint& outpoint) {
    Serialize(s, outpoint.hash);
    Serialize(s, outpoint.n);
}

template<typename Stream>
void Unserialize(Stream& s, OutPoint& outpoint) {
    Unserialize(s, outpoint.hash);
    Unserialize(s, outpoint.n);
}

/// Hasher so outpoints can key unordered containers
struct OutPointHasher {
    size_t operator()(const OutPoint& op) const noexcept {
        size_t h = 0;
        for (size_t i = 0; i < sizeof(size_t) && i < Hash256::SIZE; ++i) {
            h = (h << 8) | op.hash[i];
        }
        return h ^ std::hash<uint32_t>()(op.n);
    }
};

// ============================================================================
// TxIn / TxOut
// ============================================================================

class TxIn {
public:
    OutPoint prevout;
    Script scriptSig;
    uint32_t nSequence;

    static const uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;

    TxIn() : nSequence(SEQUENCE_FINAL) {}
    explicit TxIn(const OutPoint& prevoutIn, uint32_t nSequenceIn = SEQUENCE_FINAL)
        : prevout(prevoutIn), nSequence(nSequenceIn) {}

    friend bool operator==(const TxIn& a, const TxIn& b) {
        return a.prevout == b.prevout &&
               a.scriptSig == b.scriptSig &&
               a.nSequence == b.nSequence;
    }
};

template<typename Stream>
void Serialize(Stream& s, const TxIn& txin) {
    Serialize(s, txin.prevout);
    Serialize(s, txin.scriptSig);
    Serialize(s, txin.nSequence);
}

template<typename Stream>
void Unserialize(Stream& s, TxIn& txin) {
    Unserialize(s, txin.prevout);
    Unserialize(s, txin.scriptSig);
    Unserialize(s, txin.nSequence);
}

class TxOut {
public:
    Amount nValue;
    Script scriptPubKey;

    TxOut() : nValue(-1) {}
    TxOut(Amount nValueIn, Script scriptPubKeyIn)
        : nValue(nValueIn), scriptPubKey(std::move(scriptPubKeyIn)) {}

    bool IsNull() const { return nValue == -1; }

    friend bool operator==(const TxOut& a, const TxOut& b) {
        return a.nValue == b.nValue && a.scriptPubKey == b.scriptPubKey;
    }
};

template<typename Stream>
void Serialize(Stream& s, const TxOut& txout) {
    Serialize(s, static_cast<int64_t>(txout.nValue));
    Serialize(s, txout.scriptPubKey);
}

template<typename Stream>
void Unserialize(Stream& s, TxOut& txout) {
    int64_t value;
    Unserialize(s, value);
    txout.nValue = value;
    Unserialize(s, txout.scriptPubKey);
}

// ============================================================================
// MutableTransaction
// ============================================================================

class MutableTransaction {
public:
    std::vector<TxIn> vin;
    std::vector<TxOut> vout;
    int32_t version;
    uint32_t nLockTime;

    /// Dogecoin Core still creates version 1 transactions
    static const int32_t CURRENT_VERSION = 1;

    MutableTransaction() : version(CURRENT_VERSION), nLockTime(0) {}

    /// Reversed double SHA-256 of the serialization
    TxHash GetHash() const;
};

template<typename Stream>
void Serialize(Stream& s, const MutableTransaction& tx) {
    Serialize(s, tx.version);
    Serialize(s, tx.vin);
    Serialize(s, tx.vout);
    Serialize(s, tx.nLockTime);
}

template<typename Stream>
void Unserialize(Stream& s, MutableTransaction& tx) {
    Unserialize(s, tx.version);
    Unserialize(s, tx.vin);
    Unserialize(s, tx.vout);
    Unserialize(s, tx.nLockTime);
}

/// txid of an already serialized (typically signed) transaction
TxHash ComputeTxid(const std::vector<uint8_t>& rawTx);

} // namespace dogeprov

#endif // DOGEPROV_CORE_TRANSACTION_H
