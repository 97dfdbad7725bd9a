// DOGEPROV - Wallet Collaborators
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Narrow interfaces to the signing capability and the network/indexer
// layer. Both live outside the provider core.

#ifndef DOGEPROV_WALLET_INTERFACES_H
#define DOGEPROV_WALLET_INTERFACES_H

#include "dogeprov/core/transaction.h"
#include "dogeprov/core/types.h"
#include "dogeprov/wallet/coinselection.h"

#include <optional>
#include <string>
#include <vector>

namespace dogeprov {
namespace wallet {

/// Size of a compact recoverable signature
constexpr size_t COMPACT_SIGNATURE_SIZE = 65;

struct SignResult {
    bool success{false};
    std::vector<uint8_t> signedTx;
    std::string error;
};

/**
 * Signing capability. Holds the keys; the core never sees them.
 */
class ISigner {
public:
    virtual ~ISigner() = default;

    /// Sign every input of `unsignedTx`. `inputs` lists the spent outputs
    /// in input order.
    virtual SignResult SignTransaction(const MutableTransaction& unsignedTx,
                                       const std::vector<UTXO>& inputs,
                                       const std::string& address) = 0;

    /// 65-byte compact recoverable signature over `messageHash`
    virtual std::optional<std::vector<uint8_t>> SignCompact(const Hash256& messageHash,
                                                            const std::string& address) = 0;
};

struct BroadcastResult {
    bool success{false};

    /// Null if the network did not report one
    TxHash txid;

    std::string error;
};

/**
 * Network/indexer capability. A nullopt return means the fetch failed.
 */
class INetwork {
public:
    virtual ~INetwork() = default;

    virtual std::optional<std::vector<UTXO>> FetchUtxos(const std::string& address) = 0;
    virtual std::optional<Amount> FetchBalance(const std::string& address) = 0;
    virtual std::optional<std::vector<Doginal>> FetchDoginals(const std::string& address) = 0;

    /// Koinu per byte
    virtual std::optional<FeeRate> FetchFeeRate() = 0;

    virtual BroadcastResult Broadcast(const std::vector<uint8_t>& signedTx) = 0;
};

} // namespace wallet
} // namespace dogeprov

#endif // DOGEPROV_WALLET_INTERFACES_H
