// DOGEPROV - Transaction Builder Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/wallet/txbuilder.h"
#include "dogeprov/util/logging.h"
#include "dogeprov/wallet/address.h"

#include <algorithm>
#include <set>

namespace dogeprov {
namespace wallet {

using util::LogCategory::TXBUILDER;

namespace {

BuildFailure FromSelection(SelectionFailure failure) {
    switch (failure) {
        case SelectionFailure::InsufficientFunds: return BuildFailure::InsufficientFunds;
        case SelectionFailure::InscriptionNotFound: return BuildFailure::InscriptionNotFound;
        case SelectionFailure::OutputReserved: return BuildFailure::InputsUnavailable;
        case SelectionFailure::InvalidTarget: return BuildFailure::InvalidAmount;
        case SelectionFailure::None: break;
    }
    return BuildFailure::None;
}

PlanResult PlanFailure(BuildFailure failure, const std::string& error) {
    PlanResult result;
    result.failure = failure;
    result.error = error;
    return result;
}

BuildTxResult BuildFailed(BuildFailure failure, const std::string& error) {
    BuildTxResult result;
    result.failure = failure;
    result.error = error;
    return result;
}

} // namespace

const char* BuildFailureToString(BuildFailure failure) {
    switch (failure) {
        case BuildFailure::None: return "none";
        case BuildFailure::InvalidRecipient: return "invalid recipient";
        case BuildFailure::InvalidAmount: return "invalid amount";
        case BuildFailure::InsufficientFunds: return "insufficient funds";
        case BuildFailure::InscriptionNotFound: return "inscription not found";
        case BuildFailure::InputsUnavailable: return "inputs unavailable";
        case BuildFailure::SigningFailed: return "signing failed";
        case BuildFailure::BroadcastFailed: return "broadcast failed";
    }
    return "unknown";
}

std::vector<OutPoint> TransactionPlan::Inputs() const {
    std::vector<OutPoint> inputs;
    inputs.reserve(selection.selected.size());
    for (const auto& utxo : selection.selected) {
        inputs.push_back(utxo.outpoint);
    }
    return inputs;
}

// ============================================================================
// TransactionBuilder
// ============================================================================

TransactionBuilder::TransactionBuilder(AccountState& account, ISigner& signer,
                                       INetwork& network, const FeePolicy& policy,
                                       const Script& devFeeScript)
    : account_(account)
    , signer_(signer)
    , network_(network)
    , devFeeScript_(devFeeScript)
    , policy_(policy) {}

void TransactionBuilder::SetFeeRate(FeeRate rate) {
    std::lock_guard<std::mutex> lock(policyMutex_);
    policy_.feeRate = rate;
}

FeePolicy TransactionBuilder::Policy() const {
    std::lock_guard<std::mutex> lock(policyMutex_);
    return policy_;
}

PlanResult TransactionBuilder::PlanPayment(const std::string& recipient, Amount amount) const {
    auto recipientScript = ScriptForAddress(recipient);
    if (!recipientScript) {
        return PlanFailure(BuildFailure::InvalidRecipient, "Invalid recipient address");
    }
    if (amount <= 0 || !MoneyRange(amount)) {
        return PlanFailure(BuildFailure::InvalidAmount, "Amount must be positive");
    }

    auto snapshot = account_.Snapshot();
    CoinSelector selector(Policy());
    auto selection = selector.SelectForPayment(snapshot->utxos, amount, account_.Reserved());
    if (!selection.success) {
        return PlanFailure(FromSelection(selection.failure), selection.error);
    }

    return Assemble(snapshot->address, recipient, *recipientScript, std::move(selection), {});
}

PlanResult TransactionBuilder::PlanDoginals(const std::string& recipient,
                                            const std::vector<std::string>& inscriptionIds) const {
    auto recipientScript = ScriptForAddress(recipient);
    if (!recipientScript) {
        return PlanFailure(BuildFailure::InvalidRecipient, "Invalid recipient address");
    }
    if (inscriptionIds.empty()) {
        return PlanFailure(BuildFailure::InvalidAmount, "No inscriptions to transfer");
    }

    auto snapshot = account_.Snapshot();
    std::vector<OutPoint> backing;
    backing.reserve(inscriptionIds.size());
    for (const auto& id : inscriptionIds) {
        const Doginal* doginal = snapshot->FindDoginal(id);
        if (!doginal) {
            LOG_DEBUG(TXBUILDER) << "Inscription " << id << " not held by " << snapshot->address;
            return PlanFailure(BuildFailure::InscriptionNotFound, "Inscription not found");
        }
        backing.push_back(doginal->outpoint);
    }

    CoinSelector selector(Policy());
    auto selection = selector.SelectForDoginals(snapshot->utxos, backing, account_.Reserved());
    if (!selection.success) {
        return PlanFailure(FromSelection(selection.failure), selection.error);
    }

    return Assemble(snapshot->address, recipient, *recipientScript, std::move(selection),
                    inscriptionIds);
}

PlanResult TransactionBuilder::Assemble(const std::string& from, const std::string& recipient,
                                        const Script& recipientScript,
                                        SelectionResult selection,
                                        std::vector<std::string> inscriptionIds) const {
    auto changeScript = ScriptForAddress(from);
    if (!changeScript) {
        return PlanFailure(BuildFailure::InputsUnavailable, "No valid active account");
    }

    PlanResult result;
    TransactionPlan& plan = result.plan;
    plan.from = from;
    plan.recipient = recipient;

    for (const auto& utxo : selection.selected) {
        plan.unsignedTx.vin.emplace_back(utxo.outpoint);
    }

    if (inscriptionIds.empty()) {
        plan.unsignedTx.vout.emplace_back(selection.target, recipientScript);
    } else {
        // Each backing output goes to the recipient at its own value
        for (size_t i = 0; i < inscriptionIds.size(); ++i) {
            plan.unsignedTx.vout.emplace_back(selection.selected[i].value, recipientScript);
        }
    }

    if (selection.devFee > 0) {
        plan.unsignedTx.vout.emplace_back(selection.devFee, devFeeScript_);
    }

    if (selection.change > 0) {
        plan.unsignedTx.vout.emplace_back(selection.change, *changeScript);
        plan.changeIndex = static_cast<int32_t>(plan.unsignedTx.vout.size() - 1);
    }

    plan.inscriptionIds = std::move(inscriptionIds);
    plan.selection = std::move(selection);
    result.success = true;
    return result;
}

BuildTxResult TransactionBuilder::Execute(const TransactionPlan& plan) {
    std::lock_guard<std::mutex> lock(executeMutex_);

    // A refresh since planning may have removed inputs
    auto snapshot = account_.Snapshot();
    if (snapshot->address != plan.from) {
        return BuildFailed(BuildFailure::InputsUnavailable, "Active account changed");
    }
    std::set<OutPoint> present;
    for (const auto& utxo : snapshot->utxos) {
        present.insert(utxo.outpoint);
    }
    for (const auto& utxo : plan.selection.selected) {
        if (!present.count(utxo.outpoint)) {
            LOG_WARN(TXBUILDER) << "Input " << utxo.outpoint.ToString() << " no longer available";
            return BuildFailed(BuildFailure::InputsUnavailable,
                               "Selected inputs are no longer available");
        }
    }

    auto signResult = signer_.SignTransaction(plan.unsignedTx, plan.selection.selected, plan.from);
    if (!signResult.success || signResult.signedTx.empty()) {
        LOG_WARN(TXBUILDER) << "Signing failed: "
                            << (signResult.error.empty() ? "empty result" : signResult.error);
        return BuildFailed(BuildFailure::SigningFailed, signResult.error);
    }

    auto broadcast = network_.Broadcast(signResult.signedTx);
    if (!broadcast.success) {
        LOG_WARN(TXBUILDER) << "Broadcast failed: " << broadcast.error;
        return BuildFailed(BuildFailure::BroadcastFailed, broadcast.error);
    }

    TxHash txid = ComputeTxid(signResult.signedTx);
    if (!broadcast.txid.IsNull() && broadcast.txid != txid) {
        LOG_WARN(TXBUILDER) << "Network reported txid " << broadcast.txid.ToHex()
                            << ", computed " << txid.ToHex();
        txid = broadcast.txid;
    }

    std::vector<UTXO> created;
    if (plan.changeIndex >= 0) {
        created.emplace_back(OutPoint(txid, static_cast<uint32_t>(plan.changeIndex)),
                             plan.selection.change);
    }
    account_.MarkSpent(plan.Inputs(), created);

    BuildTxResult result;
    result.success = true;
    result.txid = txid;
    result.fee = plan.selection.networkFee;
    result.change = plan.selection.change;

    LOG_INFO(TXBUILDER) << "Broadcast " << txid.ToHex() << " spending "
                        << plan.selection.selected.size() << " inputs, fee "
                        << FormatAmount(result.fee);
    return result;
}

} // namespace wallet
} // namespace dogeprov
