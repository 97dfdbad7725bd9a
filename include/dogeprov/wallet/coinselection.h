// DOGEPROV - Coin Selection and Fees
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Coin selection for plain sends and doginal transfers:
// - Inscription protection: low-value and inscribed outputs are never
//   spent by a plain send
// - Largest-first selection that fills the last slot with the smallest
//   output still covering the remainder
// - Size-based network fee iterated with selection to a fixed point
// - Flat per-doginal network fee and a flat dev fee output

#ifndef DOGEPROV_WALLET_COINSELECTION_H
#define DOGEPROV_WALLET_COINSELECTION_H

#include "dogeprov/core/transaction.h"
#include "dogeprov/core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dogeprov {
namespace wallet {

// ============================================================================
// Types
// ============================================================================

/// Fee rate in koinu per byte
using FeeRate = int64_t;

/// A spendable output owned by the active account
struct UTXO {
    OutPoint outpoint;
    Amount value{0};

    /// Known to carry an inscription
    bool inscribed{false};

    UTXO() = default;
    UTXO(const OutPoint& op, Amount v, bool hasInscription = false)
        : outpoint(op), value(v), inscribed(hasInscription) {}

    /// Excluded from plain sends
    bool IsProtected(Amount protectThreshold) const {
        return inscribed || value < protectThreshold;
    }

    bool operator==(const UTXO& other) const {
        return outpoint == other.outpoint && value == other.value &&
               inscribed == other.inscribed;
    }
};

/// An inscription bound to a single backing output
struct Doginal {
    std::string inscriptionId;
    OutPoint outpoint;
    std::string contentType;
    std::string content;
    std::optional<Amount> displayValue;

    bool operator==(const Doginal& other) const {
        return inscriptionId == other.inscriptionId && outpoint == other.outpoint &&
               contentType == other.contentType && content == other.content &&
               displayValue == other.displayValue;
    }
};

// ============================================================================
// Fee Policy
// ============================================================================

/// Transaction size model, legacy P2PKH
constexpr size_t TX_OVERHEAD_SIZE = 10;
constexpr size_t P2PKH_INPUT_SIZE = 148;
constexpr size_t OUTPUT_SIZE = 34;

struct FeePolicy {
    /// Network fee rate (koinu per byte)
    FeeRate feeRate{1000};

    /// Round the size up to whole kilobytes before applying the rate
    bool roundToKB{true};

    /// Flat dev fee added to every send
    Amount devFee{1000000};

    /// Flat network fee per transferred doginal
    Amount doginalFee{10000000};

    /// Outputs below this (or inscribed) are never spent by plain sends
    Amount protectThreshold{10000000};

    /// Change at or below this is absorbed into the fee
    Amount dustThreshold{1000000};

    size_t maxInputs{500};
};

size_t EstimateTxSize(size_t numInputs, size_t numOutputs);

/// Network fee for a transaction of the given shape
Amount CalculateFee(size_t numInputs, size_t numOutputs, const FeePolicy& policy);

// ============================================================================
// Selection Results
// ============================================================================

enum class SelectionFailure {
    None,
    InsufficientFunds,
    InscriptionNotFound,
    OutputReserved,
    InvalidTarget
};

const char* SelectionFailureToString(SelectionFailure failure);

/// Inputs and amounts of a planned send. The caller turns it into outputs.
struct SelectionResult {
    bool success{false};
    SelectionFailure failure{SelectionFailure::None};
    std::string error;

    /// Backing outputs of transferred doginals first, in request order
    std::vector<UTXO> selected;

    /// Value delivered to the recipient(s)
    Amount target{0};
    Amount devFee{0};
    Amount networkFee{0};

    /// Zero when absorbed into the network fee
    Amount change{0};

    Amount TotalIn() const;

    /// Everything leaving the wallet: target, dev fee and network fee
    Amount TotalCost() const { return target + devFee + networkFee; }

    bool HasChange() const { return change > 0; }

    static SelectionResult Failure(SelectionFailure kind, const std::string& msg);
};

// ============================================================================
// Coin Selector
// ============================================================================

class CoinSelector {
public:
    explicit CoinSelector(const FeePolicy& policy) : policy_(policy) {}

    /**
     * Select inputs for a plain send of `target` koinu.
     *
     * Protected outputs and those in `reserved` are never considered.
     * The network fee assumes a change output and is recomputed each time
     * the input count grows, until selection and fee agree.
     */
    SelectionResult SelectForPayment(const std::vector<UTXO>& available,
                                     Amount target,
                                     const std::set<OutPoint>& reserved = {}) const;

    /**
     * Select inputs for transferring the doginals backed by `backing`.
     *
     * Each backing output is spent to the recipient at its own value.
     * Dev fee and the per-doginal network fee come from additional
     * unprotected outputs.
     */
    SelectionResult SelectForDoginals(const std::vector<UTXO>& available,
                                      const std::vector<OutPoint>& backing,
                                      const std::set<OutPoint>& reserved = {}) const;

    /// Spendable by a plain send, largest first
    std::vector<UTXO> FilterCandidates(const std::vector<UTXO>& available,
                                       const std::set<OutPoint>& reserved) const;

    const FeePolicy& Policy() const { return policy_; }

private:
    FeePolicy policy_;

    /// Largest first, with the smallest covering output in the last slot.
    /// Empty if the candidates cannot reach `need`.
    std::vector<UTXO> PickInputs(const std::vector<UTXO>& candidates, Amount need,
                                 size_t maxInputs) const;

    void SettleChange(SelectionResult& result) const;
};

} // namespace wallet
} // namespace dogeprov

#endif // DOGEPROV_WALLET_COINSELECTION_H
