// DOGEPROV - Transaction Builder
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Turns an approved send into a broadcast transaction:
// plan (select inputs, lay out outputs) -> sign all inputs -> broadcast ->
// optimistic spend marking. Nothing changes locally unless every step
// succeeds.

#ifndef DOGEPROV_WALLET_TXBUILDER_H
#define DOGEPROV_WALLET_TXBUILDER_H

#include "dogeprov/core/script.h"
#include "dogeprov/core/transaction.h"
#include "dogeprov/core/types.h"
#include "dogeprov/wallet/account.h"
#include "dogeprov/wallet/coinselection.h"
#include "dogeprov/wallet/interfaces.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace dogeprov {
namespace wallet {

enum class BuildFailure {
    None,
    InvalidRecipient,
    InvalidAmount,
    InsufficientFunds,
    InscriptionNotFound,
    InputsUnavailable,
    SigningFailed,
    BroadcastFailed
};

const char* BuildFailureToString(BuildFailure failure);

/// A priced, unsigned transaction. Shown to the user before approval.
struct TransactionPlan {
    /// Spending address
    std::string from;
    std::string recipient;

    /// Empty for a plain send
    std::vector<std::string> inscriptionIds;

    SelectionResult selection;
    MutableTransaction unsignedTx;

    /// -1 without change
    int32_t changeIndex{-1};

    bool IsDoginalTransfer() const { return !inscriptionIds.empty(); }

    std::vector<OutPoint> Inputs() const;
};

struct PlanResult {
    bool success{false};
    BuildFailure failure{BuildFailure::None};
    std::string error;
    TransactionPlan plan;
};

/// Result of executing a plan
struct BuildTxResult {
    bool success{false};
    BuildFailure failure{BuildFailure::None};
    std::string error;

    TxHash txid;
    Amount fee{0};
    Amount change{0};
};

class TransactionBuilder {
public:
    TransactionBuilder(AccountState& account, ISigner& signer, INetwork& network,
                       const FeePolicy& policy, const Script& devFeeScript);

    /// Plain send of `amount` koinu. Reserved outputs are skipped.
    PlanResult PlanPayment(const std::string& recipient, Amount amount) const;

    /// Transfer of one or more doginals to a single recipient
    PlanResult PlanDoginals(const std::string& recipient,
                            const std::vector<std::string>& inscriptionIds) const;

    /**
     * Sign and broadcast. The signer gets the complete input list.
     * On acceptance the inputs are marked spent and any change is added
     * back to the account as a new output.
     */
    BuildTxResult Execute(const TransactionPlan& plan);

    /// Network fee rate override (koinu per byte)
    void SetFeeRate(FeeRate rate);
    FeePolicy Policy() const;

private:
    AccountState& account_;
    ISigner& signer_;
    INetwork& network_;
    Script devFeeScript_;

    mutable std::mutex policyMutex_;
    FeePolicy policy_;

    /// One broadcast at a time
    std::mutex executeMutex_;

    PlanResult Assemble(const std::string& from, const std::string& recipient,
                        const Script& recipientScript, SelectionResult selection,
                        std::vector<std::string> inscriptionIds) const;
};

} // namespace wallet
} // namespace dogeprov

#endif // DOGEPROV_WALLET_TXBUILDER_H
