// DOGEPROV - Approval Workflow Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/provider/approval.h"
#include "dogeprov/util/logging.h"
#include "dogeprov/util/time.h"

#include <algorithm>

namespace dogeprov {
namespace provider {

using util::LogCategory::APPROVAL;

const char* ApprovalKindToString(ApprovalKind kind) {
    switch (kind) {
        case ApprovalKind::Connect: return "connect";
        case ApprovalKind::SendTransaction: return "sendTransaction";
        case ApprovalKind::SendDoginal: return "sendDoginal";
        case ApprovalKind::SignMessage: return "signMessage";
    }
    return "unknown";
}

const char* ApprovalStateToString(ApprovalState state) {
    switch (state) {
        case ApprovalState::Created: return "Created";
        case ApprovalState::AwaitingUserDecision: return "AwaitingUserDecision";
        case ApprovalState::Approved: return "Approved";
        case ApprovalState::Rejected: return "Rejected";
        case ApprovalState::TimedOut: return "TimedOut";
        case ApprovalState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

ErrorKind RejectionFor(ApprovalKind kind) {
    switch (kind) {
        case ApprovalKind::Connect: return ErrorKind::RejectedConnect;
        case ApprovalKind::SendTransaction: return ErrorKind::RejectedTransaction;
        case ApprovalKind::SendDoginal: return ErrorKind::RejectedDoginalTransfer;
        case ApprovalKind::SignMessage: return ErrorKind::RejectedSigning;
    }
    return ErrorKind::RejectedTransaction;
}

// ============================================================================
// ApprovalWorkflow
// ============================================================================

ApprovalWorkflow::ApprovalWorkflow(IApprovalPresenter& presenter, int64_t timeoutSeconds)
    : presenter_(presenter), timeoutSeconds_(timeoutSeconds) {}

void ApprovalWorkflow::SetTimeout(int64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeoutSeconds_ = seconds;
}

ApprovalId ApprovalWorkflow::Submit(ApprovalKind kind, const std::string& origin,
                                    const std::string& contextId,
                                    const rpc::JSONValue& params,
                                    ApprovalHandlers handlers) {
    std::lock_guard<std::recursive_mutex> decision(decisionMutex_);

    ApprovalId id;
    std::optional<PendingApproval> presentNow;
    std::optional<PendingApproval> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextId_++;

        Entry entry;
        entry.approval.id = id;
        entry.approval.kind = kind;
        entry.approval.origin = origin;
        entry.approval.contextId = contextId;
        entry.approval.params = params;
        entry.approval.createdAt = util::GetTime();

        if (kind == ApprovalKind::Connect) {
            // Same intent as the pending one: take over its waiters
            auto prev = connectByOrigin_.find(origin);
            if (prev != connectByOrigin_.end()) {
                auto old = entries_.find(prev->second);
                if (old != entries_.end()) {
                    entry.waiters = std::move(old->second.waiters);
                    LOG_DEBUG(APPROVAL) << "Connect #" << id << " from " << origin
                                        << " replaces #" << old->first;
                    replaced = old->second.approval;
                    replaced->state = ApprovalState::Cancelled;
                    entries_.erase(old);
                }
            }
            entry.waiters.push_back(Waiter{contextId, std::move(handlers)});
            entry.approval.state = ApprovalState::AwaitingUserDecision;
            entry.approval.deadline = entry.approval.createdAt + timeoutSeconds_;
            connectByOrigin_[origin] = id;
            presentNow = entry.approval;
        } else {
            entry.waiters.push_back(Waiter{contextId, std::move(handlers)});
            queue_.push_back(id);
        }
        entries_.emplace(id, std::move(entry));
    }

    LOG_INFO(APPROVAL) << "Request #" << id << " (" << ApprovalKindToString(kind)
                       << ") from " << origin;

    if (replaced) {
        presenter_.Withdraw(*replaced);
    }
    if (presentNow) {
        presenter_.Present(*presentNow);
    } else {
        AdvanceQueue();
    }
    return id;
}

void ApprovalWorkflow::AdvanceQueue() {
    while (true) {
        PendingApproval pending;
        ApprovalHandlers head;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return;
            }
            const Entry& entry = entries_.at(queue_.front());
            if (entry.approval.state != ApprovalState::Created) {
                return;
            }
            pending = entry.approval;
            head = entry.waiters.front().handlers;
        }

        std::optional<ProviderError> error;
        if (head.onPresent) {
            error = head.onPresent(pending);
        }

        std::vector<Waiter> failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(pending.id);
            if (it == entries_.end()) {
                continue;
            }
            if (error) {
                failed = Finish(pending.id, ApprovalState::Cancelled, pending);
            } else {
                pending.state = ApprovalState::AwaitingUserDecision;
                pending.deadline = util::GetTime() + timeoutSeconds_;
                it->second.approval = pending;
            }
        }

        if (error) {
            LOG_WARN(APPROVAL) << "Request #" << pending.id << " cancelled: " << error->what();
            NotifyFailed(failed, pending, *error);
            continue;
        }

        LOG_DEBUG(APPROVAL) << "Presenting #" << pending.id << " ("
                            << ApprovalKindToString(pending.kind) << ")";
        presenter_.Present(pending);
        return;
    }
}

std::vector<ApprovalWorkflow::Waiter> ApprovalWorkflow::Finish(ApprovalId id,
                                                               ApprovalState state,
                                                               PendingApproval& out) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return {};
    }

    out = it->second.approval;
    out.state = state;
    std::vector<Waiter> waiters = std::move(it->second.waiters);

    if (out.kind == ApprovalKind::Connect) {
        auto byOrigin = connectByOrigin_.find(out.origin);
        if (byOrigin != connectByOrigin_.end() && byOrigin->second == id) {
            connectByOrigin_.erase(byOrigin);
        }
    } else {
        queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
    }
    entries_.erase(it);
    return waiters;
}

ApprovalWorkflow::Settled ApprovalWorkflow::Drop(ApprovalId id, ApprovalState state) {
    Settled settled;
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        settled.wasPresented =
            it->second.approval.state == ApprovalState::AwaitingUserDecision;
    }
    settled.waiters = Finish(id, state, settled.approval);
    return settled;
}

void ApprovalWorkflow::Withdraw(const Settled& settled) {
    if (settled.wasPresented) {
        presenter_.Withdraw(settled.approval);
    }
}

void ApprovalWorkflow::NotifyFailed(const std::vector<Waiter>& waiters,
                                    const PendingApproval& approval,
                                    const ProviderError& error) {
    for (const auto& waiter : waiters) {
        if (waiter.handlers.onFailed) {
            waiter.handlers.onFailed(approval, error);
        }
    }
}

bool ApprovalWorkflow::Approve(ApprovalId id) {
    std::lock_guard<std::recursive_mutex> decision(decisionMutex_);

    PendingApproval approval;
    std::vector<Waiter> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() ||
            it->second.approval.state != ApprovalState::AwaitingUserDecision) {
            return false;
        }
        waiters = Finish(id, ApprovalState::Approved, approval);
    }

    LOG_INFO(APPROVAL) << "Approved #" << id << " (" << ApprovalKindToString(approval.kind)
                       << ") from " << approval.origin;
    for (const auto& waiter : waiters) {
        if (waiter.handlers.onApproved) {
            waiter.handlers.onApproved(approval);
        }
    }

    AdvanceQueue();
    return true;
}

bool ApprovalWorkflow::Reject(ApprovalId id) {
    std::lock_guard<std::recursive_mutex> decision(decisionMutex_);

    PendingApproval approval;
    std::vector<Waiter> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() ||
            it->second.approval.state != ApprovalState::AwaitingUserDecision) {
            return false;
        }
        waiters = Finish(id, ApprovalState::Rejected, approval);
    }

    LOG_INFO(APPROVAL) << "Rejected #" << id << " (" << ApprovalKindToString(approval.kind)
                       << ") from " << approval.origin;
    NotifyFailed(waiters, approval, ProviderError::Rejected(RejectionFor(approval.kind)));

    AdvanceQueue();
    return true;
}

size_t ApprovalWorkflow::ExpireTimedOut() {
    std::lock_guard<std::recursive_mutex> decision(decisionMutex_);

    std::vector<Settled> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = util::GetTime();

        std::vector<ApprovalId> ids;
        for (const auto& [id, entry] : entries_) {
            if (entry.approval.state == ApprovalState::AwaitingUserDecision &&
                entry.approval.deadline <= now) {
                ids.push_back(id);
            }
        }
        for (ApprovalId id : ids) {
            expired.push_back(Drop(id, ApprovalState::TimedOut));
        }
    }

    for (const auto& settled : expired) {
        LOG_INFO(APPROVAL) << "Request #" << settled.approval.id << " ("
                           << ApprovalKindToString(settled.approval.kind) << ") timed out";
        Withdraw(settled);
        NotifyFailed(settled.waiters, settled.approval, ProviderError::Timeout());
    }

    if (!expired.empty()) {
        AdvanceQueue();
    }
    return expired.size();
}

size_t ApprovalWorkflow::CancelContext(const std::string& contextId) {
    std::lock_guard<std::recursive_mutex> decision(decisionMutex_);

    std::vector<std::pair<PendingApproval, std::vector<Waiter>>> dropped;
    std::vector<Settled> emptiedEntries;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<ApprovalId> emptied;
        for (auto& [id, entry] : entries_) {
            auto& waiters = entry.waiters;
            auto split = std::stable_partition(waiters.begin(), waiters.end(),
                                               [&contextId](const Waiter& w) {
                                                   return w.contextId != contextId;
                                               });
            if (split == waiters.end()) {
                continue;
            }

            std::vector<Waiter> gone(std::make_move_iterator(split),
                                     std::make_move_iterator(waiters.end()));
            waiters.erase(split, waiters.end());

            PendingApproval snapshot = entry.approval;
            snapshot.state = ApprovalState::Cancelled;
            dropped.emplace_back(std::move(snapshot), std::move(gone));

            if (waiters.empty()) {
                emptied.push_back(id);
            } else if (entry.approval.contextId == contextId) {
                entry.approval.contextId = waiters.back().contextId;
            }
        }

        for (ApprovalId id : emptied) {
            emptiedEntries.push_back(Drop(id, ApprovalState::Cancelled));
        }
    }

    for (const auto& settled : emptiedEntries) {
        Withdraw(settled);
    }

    // Callers in the torn-down context still get their futures resolved
    for (const auto& [approval, waiters] : dropped) {
        LOG_INFO(APPROVAL) << "Request #" << approval.id << " cancelled, context "
                           << contextId << " closed";
        NotifyFailed(waiters, approval, ProviderError::Rejected(RejectionFor(approval.kind)));
    }

    if (!emptiedEntries.empty()) {
        AdvanceQueue();
    }
    return emptiedEntries.size();
}

size_t ApprovalWorkflow::CancelOrigin(const std::string& origin, const ProviderError& error) {
    std::lock_guard<std::recursive_mutex> decision(decisionMutex_);

    std::vector<Settled> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ApprovalId> ids;
        for (const auto& [id, entry] : entries_) {
            if (entry.approval.origin == origin) {
                ids.push_back(id);
            }
        }
        for (ApprovalId id : ids) {
            cancelled.push_back(Drop(id, ApprovalState::Cancelled));
        }
    }

    for (const auto& settled : cancelled) {
        LOG_INFO(APPROVAL) << "Request #" << settled.approval.id << " ("
                           << ApprovalKindToString(settled.approval.kind)
                           << ") cancelled, " << origin << " revoked";
        Withdraw(settled);
        NotifyFailed(settled.waiters, settled.approval, error);
    }

    if (!cancelled.empty()) {
        AdvanceQueue();
    }
    return cancelled.size();
}

size_t ApprovalWorkflow::RejectAll(const ProviderError& error) {
    std::lock_guard<std::recursive_mutex> decision(decisionMutex_);

    std::vector<Settled> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ApprovalId> ids;
        for (const auto& [id, entry] : entries_) {
            ids.push_back(id);
        }
        for (ApprovalId id : ids) {
            rejected.push_back(Drop(id, ApprovalState::Rejected));
        }
    }

    for (const auto& settled : rejected) {
        Withdraw(settled);
        NotifyFailed(settled.waiters, settled.approval, error);
    }
    if (!rejected.empty()) {
        LOG_INFO(APPROVAL) << "Rejected all " << rejected.size() << " requests: " << error.what();
    }
    return rejected.size();
}

std::optional<PendingApproval> ApprovalWorkflow::Get(ApprovalId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.approval;
}

std::vector<PendingApproval> ApprovalWorkflow::Awaiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingApproval> result;
    for (const auto& [id, entry] : entries_) {
        if (entry.approval.state == ApprovalState::AwaitingUserDecision) {
            result.push_back(entry.approval);
        }
    }
    return result;
}

size_t ApprovalWorkflow::QueueLength() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ApprovalWorkflow::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace provider
} // namespace dogeprov
