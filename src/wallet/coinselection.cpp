// DOGEPROV - Coin Selection and Fees Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/wallet/coinselection.h"
#include "dogeprov/util/logging.h"

#include <algorithm>

namespace dogeprov {
namespace wallet {

using util::LogCategory::SELECTION;

// ============================================================================
// Fee Policy
// ============================================================================

size_t EstimateTxSize(size_t numInputs, size_t numOutputs) {
    return TX_OVERHEAD_SIZE + numInputs * P2PKH_INPUT_SIZE + numOutputs * OUTPUT_SIZE;
}

Amount CalculateFee(size_t numInputs, size_t numOutputs, const FeePolicy& policy) {
    size_t size = EstimateTxSize(numInputs, numOutputs);
    if (policy.roundToKB) {
        size = ((size + 999) / 1000) * 1000;
    }
    return static_cast<Amount>(size) * policy.feeRate;
}

// ============================================================================
// SelectionResult
// ============================================================================

const char* SelectionFailureToString(SelectionFailure failure) {
    switch (failure) {
        case SelectionFailure::None: return "none";
        case SelectionFailure::InsufficientFunds: return "insufficient funds";
        case SelectionFailure::InscriptionNotFound: return "inscription not found";
        case SelectionFailure::OutputReserved: return "output reserved";
        case SelectionFailure::InvalidTarget: return "invalid target";
    }
    return "unknown";
}

Amount SelectionResult::TotalIn() const {
    Amount total = 0;
    for (const auto& utxo : selected) {
        total += utxo.value;
    }
    return total;
}

SelectionResult SelectionResult::Failure(SelectionFailure kind, const std::string& msg) {
    SelectionResult result;
    result.success = false;
    result.failure = kind;
    result.error = msg;
    return result;
}

// ============================================================================
// CoinSelector
// ============================================================================

std::vector<UTXO> CoinSelector::FilterCandidates(const std::vector<UTXO>& available,
                                                 const std::set<OutPoint>& reserved) const {
    std::vector<UTXO> candidates;
    candidates.reserve(available.size());

    for (const auto& utxo : available) {
        if (utxo.IsProtected(policy_.protectThreshold)) {
            continue;
        }
        if (reserved.count(utxo.outpoint)) {
            continue;
        }
        candidates.push_back(utxo);
    }

    // Ties broken by outpoint so selection is deterministic
    std::sort(candidates.begin(), candidates.end(),
              [](const UTXO& a, const UTXO& b) {
                  if (a.value != b.value) return a.value > b.value;
                  return a.outpoint < b.outpoint;
              });
    return candidates;
}

std::vector<UTXO> CoinSelector::PickInputs(const std::vector<UTXO>& candidates,
                                           Amount need, size_t maxInputs) const {
    std::vector<UTXO> picked;
    Amount accumulated = 0;

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (picked.size() >= maxInputs) {
            break;
        }

        Amount remaining = need - accumulated;

        // Candidates are sorted descending, so those covering the remainder
        // form a prefix of [i, end). Its last element is the smallest one.
        auto covering = std::partition_point(
            candidates.begin() + static_cast<std::ptrdiff_t>(i), candidates.end(),
            [remaining](const UTXO& u) { return u.value >= remaining; });

        if (covering != candidates.begin() + static_cast<std::ptrdiff_t>(i)) {
            picked.push_back(*(covering - 1));
            return picked;
        }

        picked.push_back(candidates[i]);
        accumulated += candidates[i].value;
    }

    return {};
}

void CoinSelector::SettleChange(SelectionResult& result) const {
    if (result.change <= policy_.dustThreshold) {
        result.networkFee += result.change;
        result.change = 0;
    }
}

SelectionResult CoinSelector::SelectForPayment(const std::vector<UTXO>& available,
                                               Amount target,
                                               const std::set<OutPoint>& reserved) const {
    if (target <= 0 || !MoneyRange(target)) {
        return SelectionResult::Failure(SelectionFailure::InvalidTarget,
                                        "Amount must be positive");
    }

    auto candidates = FilterCandidates(available, reserved);

    // Recipient, dev fee and change
    size_t numOutputs = 1 + (policy_.devFee > 0 ? 1 : 0) + 1;

    size_t numInputs = 1;
    Amount fee = 0;
    std::vector<UTXO> picked;

    // The fee only grows with the input count, and a larger fee never needs
    // fewer inputs, so this terminates once the count stops growing.
    while (true) {
        fee = CalculateFee(numInputs, numOutputs, policy_);
        Amount need = target + policy_.devFee + fee;

        picked = PickInputs(candidates, need, policy_.maxInputs);
        if (picked.empty()) {
            Amount spendable = 0;
            for (const auto& c : candidates) spendable += c.value;
            LOG_DEBUG(SELECTION) << "Cannot cover " << FormatAmount(need)
                                 << " from " << candidates.size() << " candidates ("
                                 << FormatAmount(spendable) << " spendable)";
            return SelectionResult::Failure(SelectionFailure::InsufficientFunds,
                                            "Insufficient funds");
        }

        if (picked.size() <= numInputs) {
            break;
        }
        numInputs = picked.size();
    }

    SelectionResult result;
    result.success = true;
    result.selected = std::move(picked);
    result.target = target;
    result.devFee = policy_.devFee;
    result.networkFee = fee;
    result.change = result.TotalIn() - target - policy_.devFee - fee;
    SettleChange(result);

    LOG_DEBUG(SELECTION) << "Payment of " << FormatAmount(target) << " uses "
                         << result.selected.size() << " inputs, fee "
                         << FormatAmount(result.networkFee) << ", change "
                         << FormatAmount(result.change);
    return result;
}

SelectionResult CoinSelector::SelectForDoginals(const std::vector<UTXO>& available,
                                                const std::vector<OutPoint>& backing,
                                                const std::set<OutPoint>& reserved) const {
    if (backing.empty()) {
        return SelectionResult::Failure(SelectionFailure::InvalidTarget,
                                        "No inscriptions to transfer");
    }

    std::set<OutPoint> backingSet(backing.begin(), backing.end());
    if (backingSet.size() != backing.size()) {
        return SelectionResult::Failure(SelectionFailure::InvalidTarget,
                                        "Duplicate inscription in transfer");
    }
    if (backing.size() >= policy_.maxInputs) {
        return SelectionResult::Failure(SelectionFailure::InvalidTarget,
                                        "Too many inscriptions in one transfer");
    }

    SelectionResult result;
    for (const auto& outpoint : backing) {
        auto it = std::find_if(available.begin(), available.end(),
                               [&outpoint](const UTXO& u) { return u.outpoint == outpoint; });
        if (it == available.end()) {
            return SelectionResult::Failure(SelectionFailure::InscriptionNotFound,
                                            "Inscription not found");
        }
        if (reserved.count(outpoint)) {
            return SelectionResult::Failure(SelectionFailure::OutputReserved,
                                            "Inscription is part of a pending request");
        }
        result.selected.push_back(*it);
        result.target += it->value;
    }

    result.devFee = policy_.devFee;
    result.networkFee = policy_.doginalFee * static_cast<Amount>(backing.size());

    Amount need = result.devFee + result.networkFee;
    if (need > 0) {
        // Backing outputs are inscribed, hence never candidates here
        auto candidates = FilterCandidates(available, reserved);
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&backingSet](const UTXO& u) {
                                            return backingSet.count(u.outpoint) > 0;
                                        }),
                         candidates.end());

        auto extra = PickInputs(candidates, need, policy_.maxInputs - backing.size());
        if (extra.empty()) {
            LOG_DEBUG(SELECTION) << "Cannot cover doginal fees of " << FormatAmount(need);
            return SelectionResult::Failure(SelectionFailure::InsufficientFunds,
                                            "Insufficient funds");
        }

        Amount extraValue = 0;
        for (const auto& u : extra) {
            extraValue += u.value;
            result.selected.push_back(u);
        }
        result.change = extraValue - need;
    }

    result.success = true;
    SettleChange(result);

    LOG_DEBUG(SELECTION) << "Transfer of " << backing.size() << " doginal(s) uses "
                         << result.selected.size() << " inputs, change "
                         << FormatAmount(result.change);
    return result;
}

} // namespace wallet
} // namespace dogeprov
