// DOGEPROV - Account State Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/wallet/account.h"
#include "dogeprov/util/logging.h"
#include "dogeprov/util/time.h"

#include <algorithm>

namespace dogeprov {
namespace wallet {

using util::LogCategory::ACCOUNT;

namespace {

std::shared_ptr<const AccountSnapshot> EmptySnapshot(const std::string& address) {
    auto snapshot = std::make_shared<AccountSnapshot>();
    snapshot->address = address;
    return snapshot;
}

} // namespace

// ============================================================================
// AccountSnapshot
// ============================================================================

const Doginal* AccountSnapshot::FindDoginal(const std::string& inscriptionId) const {
    for (const auto& doginal : doginals) {
        if (doginal.inscriptionId == inscriptionId) {
            return &doginal;
        }
    }
    return nullptr;
}

// ============================================================================
// AccountState
// ============================================================================

AccountState::AccountState(INetwork& network, Amount protectThreshold)
    : network_(network)
    , protectThreshold_(protectThreshold)
    , snapshot_(EmptySnapshot("")) {}

size_t AccountState::AddAccount(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    accounts_.push_back(address);
    if (accounts_.size() == 1) {
        activeIndex_ = 0;
        ++generation_;
        snapshot_ = EmptySnapshot(address);
    }
    LOG_DEBUG(ACCOUNT) << "Added account #" << (accounts_.size() - 1) << " " << address;
    return accounts_.size() - 1;
}

bool AccountState::SwitchAccount(size_t index) {
    AccountsChangedHandler handler;
    std::string address;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= accounts_.size()) {
            return false;
        }
        if (index == activeIndex_ && !accounts_.empty()) {
            return true;
        }

        activeIndex_ = index;
        address = accounts_[index];
        ++generation_;
        snapshot_ = EmptySnapshot(address);
        reserved_.clear();
        pendingSpent_.clear();
        handler = accountsChanged_;
    }

    LOG_INFO(ACCOUNT) << "Switched to account #" << index << " " << address;
    if (handler) {
        handler(address);
    }
    return true;
}

size_t AccountState::ActiveIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeIndex_;
}

size_t AccountState::AccountCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

std::vector<std::string> AccountState::Accounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_;
}

void AccountState::SetAccountsChangedHandler(AccountsChangedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    accountsChanged_ = std::move(handler);
}

std::shared_ptr<const AccountSnapshot> AccountState::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

std::string AccountState::CurrentAddress() const {
    return Snapshot()->address;
}

Amount AccountState::Balance() const {
    return Snapshot()->balance;
}

std::vector<UTXO> AccountState::UtxoSet() const {
    return Snapshot()->utxos;
}

std::vector<Doginal> AccountState::Doginals() const {
    return Snapshot()->doginals;
}

bool AccountState::IsLoaded() const {
    return Snapshot()->loaded;
}

// ============================================================================
// Updates
// ============================================================================

std::shared_ptr<const AccountSnapshot> AccountState::BuildSnapshot(
    const std::string& address, std::optional<Amount> balance,
    std::vector<UTXO> utxos, std::vector<Doginal> doginals) {

    // Outputs spent locally that the network no longer reports are settled
    std::set<OutPoint> reported;
    for (const auto& utxo : utxos) {
        reported.insert(utxo.outpoint);
    }
    for (auto it = pendingSpent_.begin(); it != pendingSpent_.end();) {
        if (reported.count(*it)) {
            ++it;
        } else {
            it = pendingSpent_.erase(it);
        }
    }

    bool filtered = false;
    if (!pendingSpent_.empty()) {
        auto spent = [this](const OutPoint& op) { return pendingSpent_.count(op) > 0; };
        utxos.erase(std::remove_if(utxos.begin(), utxos.end(),
                                   [&](const UTXO& u) { return spent(u.outpoint); }),
                    utxos.end());
        doginals.erase(std::remove_if(doginals.begin(), doginals.end(),
                                      [&](const Doginal& d) { return spent(d.outpoint); }),
                       doginals.end());
        filtered = true;
    }

    std::set<OutPoint> carriers;
    for (const auto& doginal : doginals) {
        carriers.insert(doginal.outpoint);
    }

    auto snapshot = std::make_shared<AccountSnapshot>();
    snapshot->address = address;
    Amount sum = 0;
    for (auto& utxo : utxos) {
        if (carriers.count(utxo.outpoint)) {
            utxo.inscribed = true;
        }
        sum += utxo.value;
    }
    snapshot->balance = (balance && !filtered) ? *balance : sum;
    snapshot->utxos = std::move(utxos);
    snapshot->doginals = std::move(doginals);
    snapshot->loaded = true;
    snapshot->refreshedAt = util::GetTime();

    auto protectedCount = std::count_if(
        snapshot->utxos.begin(), snapshot->utxos.end(),
        [this](const UTXO& u) { return u.IsProtected(protectThreshold_); });
    LOG_DEBUG(ACCOUNT) << address << ": " << snapshot->utxos.size() << " outputs ("
                       << protectedCount << " protected), " << snapshot->doginals.size()
                       << " doginals, balance " << FormatAmount(snapshot->balance);
    return snapshot;
}

bool AccountState::Refresh() {
    std::lock_guard<std::mutex> refreshLock(refreshMutex_);

    std::string address;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accounts_.empty()) {
            return false;
        }
        address = accounts_[activeIndex_];
        generation = generation_;
    }

    auto utxos = network_.FetchUtxos(address);
    if (!utxos) {
        LOG_WARN(ACCOUNT) << "UTXO refresh failed for " << address;
        return false;
    }
    auto doginals = network_.FetchDoginals(address);
    if (!doginals) {
        LOG_WARN(ACCOUNT) << "Doginal refresh failed for " << address;
        return false;
    }
    auto balance = network_.FetchBalance(address);
    if (!balance) {
        LOG_DEBUG(ACCOUNT) << "Balance unavailable for " << address
                           << ", summing outputs instead";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        LOG_DEBUG(ACCOUNT) << "Dropping refresh for " << address << " after account switch";
        return false;
    }
    snapshot_ = BuildSnapshot(address, balance, std::move(*utxos), std::move(*doginals));
    return true;
}

bool AccountState::ApplyUpdate(const std::string& address, std::optional<Amount> balance,
                               std::vector<UTXO> utxos, std::vector<Doginal> doginals) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accounts_.empty() || accounts_[activeIndex_] != address) {
        LOG_DEBUG(ACCOUNT) << "Ignoring update for inactive address " << address;
        return false;
    }
    snapshot_ = BuildSnapshot(address, balance, std::move(utxos), std::move(doginals));
    return true;
}

void AccountState::MarkSpent(const std::vector<OutPoint>& spent,
                             const std::vector<UTXO>& created) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<OutPoint> spentSet(spent.begin(), spent.end());
    auto next = std::make_shared<AccountSnapshot>(*snapshot_);

    Amount removed = 0;
    next->utxos.erase(std::remove_if(next->utxos.begin(), next->utxos.end(),
                                     [&](const UTXO& u) {
                                         if (!spentSet.count(u.outpoint)) return false;
                                         removed += u.value;
                                         return true;
                                     }),
                      next->utxos.end());
    next->doginals.erase(std::remove_if(next->doginals.begin(), next->doginals.end(),
                                        [&](const Doginal& d) {
                                            return spentSet.count(d.outpoint) > 0;
                                        }),
                         next->doginals.end());

    Amount added = 0;
    for (const auto& utxo : created) {
        next->utxos.push_back(utxo);
        added += utxo.value;
    }
    next->balance = next->balance - removed + added;

    for (const auto& op : spent) {
        pendingSpent_.insert(op);
        reserved_.erase(op);
    }
    snapshot_ = std::move(next);

    LOG_DEBUG(ACCOUNT) << "Marked " << spent.size() << " outputs spent, balance now "
                       << FormatAmount(snapshot_->balance);
}

// ============================================================================
// Reservations
// ============================================================================

bool AccountState::Reserve(const std::vector<OutPoint>& outpoints) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& op : outpoints) {
        if (reserved_.count(op)) {
            return false;
        }
    }
    reserved_.insert(outpoints.begin(), outpoints.end());
    return true;
}

void AccountState::Release(const std::vector<OutPoint>& outpoints) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& op : outpoints) {
        reserved_.erase(op);
    }
}

std::set<OutPoint> AccountState::Reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

} // namespace wallet
} // namespace dogeprov
