// DOGEPROV - Account State
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Cached view of the active account: address, balance, UTXO set and
// doginal inventory. Readers always get a complete snapshot; a refresh
// builds a new one off to the side and swaps it in.

#ifndef DOGEPROV_WALLET_ACCOUNT_H
#define DOGEPROV_WALLET_ACCOUNT_H

#include "dogeprov/core/transaction.h"
#include "dogeprov/core/types.h"
#include "dogeprov/wallet/coinselection.h"
#include "dogeprov/wallet/interfaces.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dogeprov {
namespace wallet {

/// Immutable once published
struct AccountSnapshot {
    std::string address;
    Amount balance{0};
    std::vector<UTXO> utxos;
    std::vector<Doginal> doginals;

    /// False until the first successful refresh for this account
    bool loaded{false};
    int64_t refreshedAt{0};

    const Doginal* FindDoginal(const std::string& inscriptionId) const;
};

class AccountState {
public:
    /// Called with the new active address after a switch
    using AccountsChangedHandler = std::function<void(const std::string& address)>;

    AccountState(INetwork& network, Amount protectThreshold);

    AccountState(const AccountState&) = delete;
    AccountState& operator=(const AccountState&) = delete;

    // === Accounts ===

    /// Append a derived address. The first one added becomes active.
    size_t AddAccount(const std::string& address);

    /// Invalidates every cache and drops reservations
    bool SwitchAccount(size_t index);

    size_t ActiveIndex() const;
    size_t AccountCount() const;
    std::vector<std::string> Accounts() const;

    void SetAccountsChangedHandler(AccountsChangedHandler handler);

    // === Cached reads ===

    std::shared_ptr<const AccountSnapshot> Snapshot() const;

    std::string CurrentAddress() const;
    Amount Balance() const;
    std::vector<UTXO> UtxoSet() const;
    std::vector<Doginal> Doginals() const;
    bool IsLoaded() const;

    // === Updates ===

    /// Pull from the network. On failure the previous snapshot stays.
    bool Refresh();

    /// Push from the network layer. Ignored if `address` is not active.
    bool ApplyUpdate(const std::string& address, std::optional<Amount> balance,
                     std::vector<UTXO> utxos, std::vector<Doginal> doginals);

    /// Optimistic update after a broadcast: drop spent outputs (and the
    /// doginals they carried), add outputs the transaction paid back to us.
    void MarkSpent(const std::vector<OutPoint>& spent, const std::vector<UTXO>& created);

    // === Reservations ===

    /// All or nothing; false if any output is already reserved
    bool Reserve(const std::vector<OutPoint>& outpoints);
    void Release(const std::vector<OutPoint>& outpoints);
    std::set<OutPoint> Reserved() const;

private:
    INetwork& network_;
    Amount protectThreshold_;

    mutable std::mutex mutex_;
    std::vector<std::string> accounts_;
    size_t activeIndex_{0};

    /// Bumped on every switch; a refresh started before a switch is dropped
    uint64_t generation_{0};

    std::shared_ptr<const AccountSnapshot> snapshot_;
    std::set<OutPoint> reserved_;

    /// Spent locally but possibly still reported by a lagging indexer
    std::set<OutPoint> pendingSpent_;

    AccountsChangedHandler accountsChanged_;

    /// Serializes network refreshes
    std::mutex refreshMutex_;

    /// Requires mutex_
    std::shared_ptr<const AccountSnapshot> BuildSnapshot(const std::string& address,
                                                         std::optional<Amount> balance,
                                                         std::vector<UTXO> utxos,
                                                         std::vector<Doginal> doginals);
};

} // namespace wallet
} // namespace dogeprov

#endif // DOGEPROV_WALLET_ACCOUNT_H
