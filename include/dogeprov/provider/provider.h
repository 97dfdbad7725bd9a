// DOGEPROV - Provider
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// The in-page provider core. Pages talk to it through the direct methods
// or through Request(); the hosting wallet drives approvals, locking and
// account switches through the wallet-side methods.
//
// Flow of a send:
//   page -> router/permission check -> approval queue -> quote + reserve
//   -> user approves -> sign -> broadcast -> optimistic spend marking

#ifndef DOGEPROV_PROVIDER_PROVIDER_H
#define DOGEPROV_PROVIDER_PROVIDER_H

#include "dogeprov/provider/approval.h"
#include "dogeprov/provider/config.h"
#include "dogeprov/provider/errors.h"
#include "dogeprov/provider/events.h"
#include "dogeprov/provider/permissions.h"
#include "dogeprov/provider/router.h"
#include "dogeprov/rpc/json.h"
#include "dogeprov/wallet/account.h"
#include "dogeprov/wallet/interfaces.h"
#include "dogeprov/wallet/txbuilder.h"

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace dogeprov {
namespace provider {

/// Chain identifier exposed to pages
constexpr const char* CHAIN_ID = "dogecoin:mainnet";

constexpr size_t DEFAULT_DOGINAL_PAGE_SIZE = 20;
constexpr size_t MAX_DOGINAL_PAGE_SIZE = 100;

struct DoginalPage {
    std::vector<wallet::Doginal> list;
    size_t total{0};
};

class Provider {
public:
    /// Throws std::invalid_argument for an unusable dev fee address
    Provider(const ProviderConfig& config, wallet::ISigner& signer, wallet::INetwork& network,
             IApprovalPresenter& presenter, std::unique_ptr<PermissionStore> permissions);

    /// Applies the logging settings and opens the permission database.
    /// Throws std::runtime_error if the database cannot be opened.
    static std::unique_ptr<Provider> Create(const ProviderConfig& config,
                                            wallet::ISigner& signer,
                                            wallet::INetwork& network,
                                            IApprovalPresenter& presenter);

    Provider(const Provider&) = delete;
    Provider& operator=(const Provider&) = delete;

    // === Page surface ===
    //
    // Synchronous methods throw ProviderError. Futures carry it instead.

    /// Resolves to the granted addresses
    std::future<std::vector<std::string>> Connect(const RequestContext& context);

    /// Same as RevokeOrigin() for the calling page's origin
    bool Disconnect(const RequestContext& context);

    bool IsConnected(const std::string& origin) const;
    std::string GetAddress(const std::string& origin);
    Amount GetBalance(const std::string& origin);
    DoginalPage GetDoginals(const std::string& origin, size_t offset = 0,
                            size_t limit = DEFAULT_DOGINAL_PAGE_SIZE);

    /// Resolve to the txid
    std::future<std::string> SendTransaction(const RequestContext& context,
                                             const std::string& recipient, Amount amount);
    std::future<std::string> SendDoginal(const RequestContext& context,
                                         const std::string& recipient,
                                         const std::string& inscriptionId);
    std::future<std::string> SendDoginals(const RequestContext& context,
                                          const std::string& recipient,
                                          const std::vector<std::string>& inscriptionIds);

    /// Resolves to a base64 compact signature
    std::future<std::string> SignMessage(const RequestContext& context,
                                         const std::string& message);

    static std::string GetChain() { return CHAIN_ID; }

    /// Generic request({method, params}) surface
    std::future<rpc::JSONValue> Request(const RequestContext& context, const std::string& method,
                                        const rpc::JSONValue& params = rpc::JSONValue());

    SubscriptionId On(const RequestContext& context, const std::string& event,
                      EventCallback callback);
    bool Off(SubscriptionId id);

    // === Wallet side ===

    /// Fails every pending request and revokes every grant
    void Lock();

    /// Drop one origin's grant and fail its pending requests with
    /// NotConnected. False if the origin was not connected.
    bool RevokeOrigin(const std::string& origin);
    void Unlock();
    bool IsLocked() const { return locked_.load(); }

    size_t AddAccount(const std::string& address);
    bool SwitchAccount(size_t index);

    /// Account snapshot and network fee rate
    bool Refresh();

    /// Cancel the context's approvals and drop its subscriptions
    size_t TeardownContext(const std::string& contextId);

    bool ApproveRequest(ApprovalId id);
    bool RejectRequest(ApprovalId id);
    size_t ExpireTimedOut();

    wallet::AccountState& Accounts() { return *accounts_; }
    ApprovalWorkflow& Approvals() { return *approvals_; }
    PermissionStore& Permissions() { return *permissions_; }
    EventBus& Events() { return events_; }
    wallet::TransactionBuilder& Builder() { return *builder_; }
    RequestRouter& Router() { return *router_; }

private:
    struct SendIntent {
        ApprovalKind kind{ApprovalKind::SendTransaction};
        std::string recipient;
        Amount amount{0};
        std::vector<std::string> inscriptionIds;
    };

    ProviderConfig config_;
    wallet::ISigner& signer_;
    wallet::INetwork& network_;

    std::unique_ptr<PermissionStore> permissions_;
    EventBus events_;
    std::unique_ptr<wallet::AccountState> accounts_;
    std::unique_ptr<wallet::TransactionBuilder> builder_;
    std::unique_ptr<ApprovalWorkflow> approvals_;
    std::unique_ptr<RequestRouter> router_;

    std::atomic<bool> locked_{false};

    /// Throws WalletLocked or NotConnected
    void CheckAccess(const std::string& origin, bool requireConnection) const;

    /// Refresh once if nothing has been loaded yet
    bool EnsureLoaded();

    // Operations shared by both surfaces
    void RunConnect(const RequestContext& context, Completion done);
    void RunSend(const RequestContext& context, SendIntent intent, Completion done);
    void RunSignMessage(const RequestContext& context, const std::string& message,
                        Completion done);

    rpc::JSONValue ConnectResult();
    void OnAccountSwitched(const std::string& address);
    void RegisterMethods();
};

} // namespace provider
} // namespace dogeprov

#endif // DOGEPROV_PROVIDER_PROVIDER_H
