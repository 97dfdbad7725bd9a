// DOGEPROV - Approval Workflow
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// State machine gating privileged requests:
//
//   Created -> AwaitingUserDecision -> Approved | Rejected | TimedOut | Cancelled
//
// Connect requests are presented at once; a repeat connect from the same
// origin replaces the pending one and inherits its waiters. Fund-moving and
// signing requests wait in a single FIFO queue and only its head is shown
// to the user.

#ifndef DOGEPROV_PROVIDER_APPROVAL_H
#define DOGEPROV_PROVIDER_APPROVAL_H

#include "dogeprov/provider/errors.h"
#include "dogeprov/rpc/json.h"
#include "dogeprov/wallet/txbuilder.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dogeprov {
namespace provider {

enum class ApprovalKind {
    Connect,
    SendTransaction,
    SendDoginal,
    SignMessage
};

enum class ApprovalState {
    Created,
    AwaitingUserDecision,
    Approved,
    Rejected,
    TimedOut,
    Cancelled
};

const char* ApprovalKindToString(ApprovalKind kind);
const char* ApprovalStateToString(ApprovalState state);

/// Rejection kind reported to the caller for a request kind
ErrorKind RejectionFor(ApprovalKind kind);

using ApprovalId = uint64_t;

struct PendingApproval {
    ApprovalId id{0};
    ApprovalKind kind{ApprovalKind::Connect};
    std::string origin;
    std::string contextId;
    rpc::JSONValue params;
    int64_t createdAt{0};

    /// Set when presented
    int64_t deadline{0};

    ApprovalState state{ApprovalState::Created};

    /// Priced transaction for send requests, filled in when presented
    std::optional<wallet::TransactionPlan> quote;

    bool IsTerminal() const {
        return state != ApprovalState::Created &&
               state != ApprovalState::AwaitingUserDecision;
    }
};

/**
 * UI capability. Present() must not block on the user; the decision comes
 * back through Approve() or Reject().
 */
class IApprovalPresenter {
public:
    virtual ~IApprovalPresenter() = default;
    virtual void Present(const PendingApproval& approval) = 0;

    /// A presented request ended without a user decision (replaced, timed
    /// out, cancelled or failed by a lock). Its dialog should close.
    virtual void Withdraw(const PendingApproval& approval) = 0;
};

/// Callbacks of one waiting caller. All run without workflow locks held.
struct ApprovalHandlers {
    /// Prepare the request for display (quote and reserve inputs). An error
    /// cancels the request and is passed to onFailed.
    std::function<std::optional<ProviderError>(PendingApproval&)> onPresent;

    std::function<void(const PendingApproval&)> onApproved;
    std::function<void(const PendingApproval&, const ProviderError&)> onFailed;
};

class ApprovalWorkflow {
public:
    ApprovalWorkflow(IApprovalPresenter& presenter, int64_t timeoutSeconds);

    ApprovalWorkflow(const ApprovalWorkflow&) = delete;
    ApprovalWorkflow& operator=(const ApprovalWorkflow&) = delete;

    ApprovalId Submit(ApprovalKind kind, const std::string& origin,
                      const std::string& contextId, const rpc::JSONValue& params,
                      ApprovalHandlers handlers);

    /// False unless the request is awaiting a decision
    bool Approve(ApprovalId id);
    bool Reject(ApprovalId id);

    /// Time out every awaiting request past its deadline
    size_t ExpireTimedOut();

    /// Page context torn down
    size_t CancelContext(const std::string& contextId);

    /// Cancel every request of an origin whose grant was revoked. All of
    /// its callers receive `error`.
    size_t CancelOrigin(const std::string& origin, const ProviderError& error);

    /// Fail everything outstanding with `error` (wallet lock)
    size_t RejectAll(const ProviderError& error);

    std::optional<PendingApproval> Get(ApprovalId id) const;

    /// Presented requests, oldest first
    std::vector<PendingApproval> Awaiting() const;

    /// Fund-moving and signing requests, including the presented head
    size_t QueueLength() const;

    /// Outstanding requests of any kind
    size_t Size() const;

    void SetTimeout(int64_t seconds);

private:
    struct Waiter {
        std::string contextId;
        ApprovalHandlers handlers;
    };

    struct Entry {
        PendingApproval approval;
        std::vector<Waiter> waiters;
    };

    /// A finished request and the callers still waiting on it
    struct Settled {
        PendingApproval approval;
        std::vector<Waiter> waiters;
        bool wasPresented{false};
    };

    IApprovalPresenter& presenter_;

    /// Held across a whole decision, including handler calls. Recursive so
    /// a presenter or handler may re-enter.
    std::recursive_mutex decisionMutex_;

    /// Guards the fields below
    mutable std::mutex mutex_;
    int64_t timeoutSeconds_;
    ApprovalId nextId_{1};
    std::map<ApprovalId, Entry> entries_;
    std::deque<ApprovalId> queue_;
    std::map<std::string, ApprovalId> connectByOrigin_;

    /// Present the queue head if nothing is awaiting a decision
    void AdvanceQueue();

    /// Remove a request in a terminal state and hand back its waiters.
    /// Requires mutex_.
    std::vector<Waiter> Finish(ApprovalId id, ApprovalState state, PendingApproval& out);

    /// Finish a request that ends without a user decision. Requires mutex_.
    Settled Drop(ApprovalId id, ApprovalState state);

    static void NotifyFailed(const std::vector<Waiter>& waiters, const PendingApproval& approval,
                             const ProviderError& error);

    void Withdraw(const Settled& settled);
};

} // namespace provider
} // namespace dogeprov

#endif // DOGEPROV_PROVIDER_APPROVAL_H
