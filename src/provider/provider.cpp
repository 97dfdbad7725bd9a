// DOGEPROV - Provider Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/provider/provider.h"
#include "dogeprov/util/logging.h"
#include "dogeprov/wallet/address.h"
#include "dogeprov/wallet/message.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace dogeprov {
namespace provider {

using rpc::JSONValue;
using util::LogCategory::PROVIDER;

namespace {

/// Completion that settles a std::promise<T> through `extract`
template<typename T, typename Extract>
Completion MakeCompletion(std::shared_ptr<std::promise<T>> promise, Extract extract) {
    auto settled = std::make_shared<std::atomic<bool>>(false);
    Completion done;
    done.resolve = [promise, settled, extract](JSONValue result) {
        if (!settled->exchange(true)) {
            promise->set_value(extract(result));
        }
    };
    done.reject = [promise, settled](const ProviderError& error) {
        if (!settled->exchange(true)) {
            promise->set_exception(std::make_exception_ptr(error));
        }
    };
    return done;
}

ProviderError ToProviderError(wallet::BuildFailure failure, const std::string& detail) {
    using wallet::BuildFailure;
    switch (failure) {
        case BuildFailure::InvalidRecipient:
        case BuildFailure::InvalidAmount:
            return ProviderError::InvalidParams(detail);
        case BuildFailure::InscriptionNotFound:
            return ProviderError::InscriptionNotFound();
        case BuildFailure::SigningFailed:
            return ProviderError::TransactionSigningFailed();
        case BuildFailure::BroadcastFailed:
            return ProviderError::BroadcastFailed();
        case BuildFailure::InsufficientFunds:
        case BuildFailure::InputsUnavailable:
        case BuildFailure::None:
            break;
    }
    return ProviderError::InsufficientFunds();
}

JSONValue DoginalToJSON(const wallet::Doginal& doginal) {
    JSONValue obj = JSONValue::MakeObject();
    obj["inscriptionId"] = doginal.inscriptionId;
    obj["output"] = doginal.outpoint.ToString();
    obj["contentType"] = doginal.contentType;
    obj["content"] = doginal.content;
    if (doginal.displayValue) {
        obj["value"] = *doginal.displayValue;
    }
    return obj;
}

JSONValue StringArray(const std::vector<std::string>& items) {
    JSONValue arr = JSONValue::MakeArray();
    for (const auto& item : items) {
        arr.Push(item);
    }
    return arr;
}

// ============================================================================
// Parameter parsing
// ============================================================================

std::string RequireString(const JSONValue& params, const char* key) {
    const JSONValue& value = params[key];
    if (!value.IsString()) {
        throw ProviderError::InvalidParams(std::string(key) + " is required");
    }
    return value.GetString();
}

/// `amount` in koinu, or `dogeAmount` in DOGE as a decimal string or number
Amount RequireAmount(const JSONValue& params) {
    Amount amount = 0;
    const JSONValue& koinu = params["amount"];
    const JSONValue& doge = params["dogeAmount"];

    if (koinu.IsInt()) {
        amount = koinu.GetInt();
    } else if (!koinu.IsNull()) {
        throw ProviderError::InvalidParams("amount must be an integer");
    } else if (doge.IsString()) {
        auto parsed = ParseAmount(doge.GetString());
        if (!parsed) {
            throw ProviderError::InvalidParams("dogeAmount is not a valid amount");
        }
        amount = *parsed;
    } else if (doge.IsInt()) {
        int64_t whole = doge.GetInt();
        if (whole < 0 || whole > MAX_MONEY / COIN) {
            throw ProviderError::InvalidParams("dogeAmount out of range");
        }
        amount = whole * COIN;
    } else if (doge.IsDouble()) {
        double value = doge.GetDouble();
        if (!(value >= 0.0) || value > static_cast<double>(MAX_MONEY / COIN)) {
            throw ProviderError::InvalidParams("dogeAmount out of range");
        }
        amount = static_cast<Amount>(std::llround(value * static_cast<double>(COIN)));
    } else {
        throw ProviderError::InvalidParams("amount is required");
    }

    if (amount <= 0 || !MoneyRange(amount)) {
        throw ProviderError::InvalidParams("amount must be positive");
    }
    return amount;
}

size_t OptionalIndex(const JSONValue& params, const char* key, size_t fallback) {
    const JSONValue& value = params[key];
    if (value.IsNull()) {
        return fallback;
    }
    if (!value.IsInt() || value.GetInt() < 0) {
        throw ProviderError::InvalidParams(std::string(key) + " must be a non-negative integer");
    }
    return static_cast<size_t>(value.GetInt());
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Provider::Provider(const ProviderConfig& config, wallet::ISigner& signer,
                   wallet::INetwork& network, IApprovalPresenter& presenter,
                   std::unique_ptr<PermissionStore> permissions)
    : config_(config)
    , signer_(signer)
    , network_(network)
    , permissions_(std::move(permissions)) {

    auto devFeeScript = wallet::ScriptForAddress(config_.devFeeAddress);
    if (!devFeeScript) {
        throw std::invalid_argument("Invalid dev fee address: " + config_.devFeeAddress);
    }
    if (!permissions_) {
        permissions_ = PermissionStore::Open("");
    }

    accounts_ = std::make_unique<wallet::AccountState>(network_, config_.fees.protectThreshold);
    builder_ = std::make_unique<wallet::TransactionBuilder>(*accounts_, signer_, network_,
                                                            config_.fees, *devFeeScript);
    approvals_ = std::make_unique<ApprovalWorkflow>(presenter, config_.approvalTimeout);
    router_ = std::make_unique<RequestRouter>(*permissions_);

    accounts_->SetAccountsChangedHandler(
        [this](const std::string& address) { OnAccountSwitched(address); });

    RegisterMethods();
}

std::unique_ptr<Provider> Provider::Create(const ProviderConfig& config,
                                           wallet::ISigner& signer,
                                           wallet::INetwork& network,
                                           IApprovalPresenter& presenter) {
    if (!util::ConfigureLogging(config.logLevel, config.logFile)) {
        LOG_WARN(PROVIDER) << "Cannot open log file " << config.logFile;
    }

    auto permissions = PermissionStore::Open(config.permissionsPath);
    if (!permissions) {
        throw std::runtime_error("Cannot open permission database at " + config.permissionsPath);
    }

    LOG_INFO(PROVIDER) << "Provider starting, fee rate " << config.fees.feeRate
                       << " koinu/byte, approval timeout " << config.approvalTimeout << "s";
    return std::make_unique<Provider>(config, signer, network, presenter, std::move(permissions));
}

// ============================================================================
// Helpers
// ============================================================================

void Provider::CheckAccess(const std::string& origin, bool requireConnection) const {
    if (locked_.load()) {
        throw ProviderError::WalletLocked();
    }
    if (requireConnection && !permissions_->IsConnected(origin)) {
        throw ProviderError::NotConnected();
    }
}

bool Provider::EnsureLoaded() {
    if (accounts_->IsLoaded()) {
        return true;
    }
    return accounts_->Refresh();
}

JSONValue Provider::ConnectResult() {
    auto snapshot = accounts_->Snapshot();
    JSONValue result = JSONValue::MakeObject();
    result["approved"] = true;
    result["address"] = snapshot->address;
    result["addresses"] = StringArray({snapshot->address});
    result["balance"] = snapshot->balance;
    return result;
}

void Provider::OnAccountSwitched(const std::string& address) {
    auto status = permissions_->RebindAll({address});
    if (!status.ok()) {
        LOG_WARN(PROVIDER) << "Grants rebound in memory only: " << status.ToString();
    }
    for (const auto& origin : permissions_->ConnectedOrigins()) {
        events_.EmitTo(origin, Event::ACCOUNTS_CHANGED, StringArray({address}));
    }
}

// ============================================================================
// Shared operations
// ============================================================================

void Provider::RunConnect(const RequestContext& context, Completion done) {
    CheckAccess(context.origin, false);

    if (permissions_->IsConnected(context.origin)) {
        done.resolve(ConnectResult());
        return;
    }

    ApprovalHandlers handlers;
    handlers.onApproved = [this, origin = context.origin, done](const PendingApproval&) {
        if (!permissions_->IsConnected(origin)) {
            std::string address = accounts_->CurrentAddress();
            auto status = permissions_->Grant(origin, {address});
            if (!status.ok()) {
                LOG_WARN(PROVIDER) << "Grant for " << origin << " held in memory only";
            }

            JSONValue data = JSONValue::MakeObject();
            data["chain"] = CHAIN_ID;
            data["address"] = address;
            events_.EmitTo(origin, Event::CONNECT, data);
        }
        if (!EnsureLoaded()) {
            LOG_DEBUG(PROVIDER) << "Connected " << origin << " before first refresh";
        }
        done.resolve(ConnectResult());
    };
    handlers.onFailed = [done](const PendingApproval&, const ProviderError& error) {
        done.reject(error);
    };

    approvals_->Submit(ApprovalKind::Connect, context.origin, context.contextId,
                       JSONValue::MakeObject(), std::move(handlers));
}

void Provider::RunSend(const RequestContext& context, SendIntent intent, Completion done) {
    CheckAccess(context.origin, true);

    if (!wallet::IsValidAddress(intent.recipient)) {
        throw ProviderError::InvalidParams("invalid recipient address");
    }

    JSONValue params = JSONValue::MakeObject();
    params["recipientAddress"] = intent.recipient;
    if (intent.kind == ApprovalKind::SendTransaction) {
        if (intent.amount <= 0 || !MoneyRange(intent.amount)) {
            throw ProviderError::InvalidParams("amount must be positive");
        }
        params["amount"] = intent.amount;
    } else {
        if (intent.inscriptionIds.empty()) {
            throw ProviderError::InvalidParams("inscriptionId is required");
        }
        params["inscriptionIds"] = StringArray(intent.inscriptionIds);
    }

    ApprovalHandlers handlers;
    handlers.onPresent = [this, intent](PendingApproval& pending) -> std::optional<ProviderError> {
        if (!EnsureLoaded()) {
            LOG_WARN(PROVIDER) << "Cannot quote #" << pending.id << ": account refresh failed";
            return ProviderError::BroadcastFailed();
        }

        auto planned = intent.kind == ApprovalKind::SendTransaction
                           ? builder_->PlanPayment(intent.recipient, intent.amount)
                           : builder_->PlanDoginals(intent.recipient, intent.inscriptionIds);
        if (!planned.success) {
            LOG_INFO(PROVIDER) << "Cannot quote #" << pending.id << ": " << planned.error;
            return ToProviderError(planned.failure, planned.error);
        }
        if (!accounts_->Reserve(planned.plan.Inputs())) {
            return ProviderError::InsufficientFunds();
        }
        pending.quote = std::move(planned.plan);
        return std::nullopt;
    };
    handlers.onApproved = [this, done](const PendingApproval& pending) {
        if (!pending.quote) {
            done.reject(ProviderError::InsufficientFunds());
            return;
        }
        if (!permissions_->IsConnected(pending.origin)) {
            LOG_WARN(PROVIDER) << "Request #" << pending.id << " dropped: " << pending.origin
                               << " no longer connected";
            accounts_->Release(pending.quote->Inputs());
            done.reject(ProviderError::NotConnected());
            return;
        }
        auto result = builder_->Execute(*pending.quote);
        accounts_->Release(pending.quote->Inputs());
        if (!result.success) {
            LOG_WARN(PROVIDER) << "Request #" << pending.id << " failed: "
                               << wallet::BuildFailureToString(result.failure);
            done.reject(ToProviderError(result.failure, result.error));
            return;
        }

        JSONValue response = JSONValue::MakeObject();
        response["txId"] = result.txid.ToHex();
        done.resolve(response);
    };
    handlers.onFailed = [this, done](const PendingApproval& pending, const ProviderError& error) {
        if (pending.quote) {
            accounts_->Release(pending.quote->Inputs());
        }
        done.reject(error);
    };

    approvals_->Submit(intent.kind, context.origin, context.contextId, params,
                       std::move(handlers));
}

void Provider::RunSignMessage(const RequestContext& context, const std::string& message,
                              Completion done) {
    CheckAccess(context.origin, true);

    JSONValue params = JSONValue::MakeObject();
    params["message"] = message;

    ApprovalHandlers handlers;
    handlers.onApproved = [this, message, done](const PendingApproval& pending) {
        if (!permissions_->IsConnected(pending.origin)) {
            done.reject(ProviderError::NotConnected());
            return;
        }
        std::string address = accounts_->CurrentAddress();
        auto signature = wallet::SignMessage(signer_, message, address);
        if (!signature) {
            LOG_WARN(PROVIDER) << "Request #" << pending.id << " failed: message not signed";
            done.reject(ProviderError::MessageSigningFailed());
            return;
        }
        LOG_INFO(PROVIDER) << "Signed message for " << pending.origin;

        JSONValue response = JSONValue::MakeObject();
        response["signedMessage"] = *signature;
        done.resolve(response);
    };
    handlers.onFailed = [done](const PendingApproval&, const ProviderError& error) {
        done.reject(error);
    };

    approvals_->Submit(ApprovalKind::SignMessage, context.origin, context.contextId, params,
                       std::move(handlers));
}

// ============================================================================
// Page surface
// ============================================================================

std::future<std::vector<std::string>> Provider::Connect(const RequestContext& context) {
    auto promise = std::make_shared<std::promise<std::vector<std::string>>>();
    auto future = promise->get_future();
    auto done = MakeCompletion(promise, [](const JSONValue& result) {
        std::vector<std::string> addresses;
        for (const auto& item : result["addresses"].GetArray()) {
            addresses.push_back(item.GetString());
        }
        return addresses;
    });

    try {
        RunConnect(context, done);
    } catch (const ProviderError& error) {
        done.reject(error);
    }
    return future;
}

bool Provider::Disconnect(const RequestContext& context) {
    return RevokeOrigin(context.origin);
}

bool Provider::IsConnected(const std::string& origin) const {
    return !locked_.load() && permissions_->IsConnected(origin);
}

std::string Provider::GetAddress(const std::string& origin) {
    CheckAccess(origin, true);
    return accounts_->CurrentAddress();
}

Amount Provider::GetBalance(const std::string& origin) {
    CheckAccess(origin, true);
    if (!EnsureLoaded()) {
        LOG_DEBUG(PROVIDER) << "Serving unloaded balance to " << origin;
    }
    return accounts_->Balance();
}

DoginalPage Provider::GetDoginals(const std::string& origin, size_t offset, size_t limit) {
    CheckAccess(origin, true);
    if (!EnsureLoaded()) {
        LOG_DEBUG(PROVIDER) << "Serving unloaded doginals to " << origin;
    }

    if (limit == 0) {
        limit = DEFAULT_DOGINAL_PAGE_SIZE;
    }
    limit = std::min(limit, MAX_DOGINAL_PAGE_SIZE);

    auto snapshot = accounts_->Snapshot();
    DoginalPage page;
    page.total = snapshot->doginals.size();
    if (offset < page.total) {
        size_t end = std::min(page.total, offset + limit);
        page.list.assign(snapshot->doginals.begin() + static_cast<std::ptrdiff_t>(offset),
                         snapshot->doginals.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return page;
}

std::future<std::string> Provider::SendTransaction(const RequestContext& context,
                                                   const std::string& recipient,
                                                   Amount amount) {
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();
    auto done = MakeCompletion(promise, [](const JSONValue& r) { return r["txId"].GetString(); });

    SendIntent intent;
    intent.kind = ApprovalKind::SendTransaction;
    intent.recipient = recipient;
    intent.amount = amount;
    try {
        RunSend(context, std::move(intent), done);
    } catch (const ProviderError& error) {
        done.reject(error);
    }
    return future;
}

std::future<std::string> Provider::SendDoginal(const RequestContext& context,
                                               const std::string& recipient,
                                               const std::string& inscriptionId) {
    return SendDoginals(context, recipient, {inscriptionId});
}

std::future<std::string> Provider::SendDoginals(const RequestContext& context,
                                                const std::string& recipient,
                                                const std::vector<std::string>& inscriptionIds) {
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();
    auto done = MakeCompletion(promise, [](const JSONValue& r) { return r["txId"].GetString(); });

    SendIntent intent;
    intent.kind = ApprovalKind::SendDoginal;
    intent.recipient = recipient;
    intent.inscriptionIds = inscriptionIds;
    try {
        RunSend(context, std::move(intent), done);
    } catch (const ProviderError& error) {
        done.reject(error);
    }
    return future;
}

std::future<std::string> Provider::SignMessage(const RequestContext& context,
                                               const std::string& message) {
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();
    auto done = MakeCompletion(promise,
                               [](const JSONValue& r) { return r["signedMessage"].GetString(); });
    try {
        RunSignMessage(context, message, done);
    } catch (const ProviderError& error) {
        done.reject(error);
    }
    return future;
}

std::future<JSONValue> Provider::Request(const RequestContext& context, const std::string& method,
                                         const JSONValue& params) {
    return router_->Dispatch(context, method, params);
}

SubscriptionId Provider::On(const RequestContext& context, const std::string& event,
                            EventCallback callback) {
    if (event != Event::CONNECT && event != Event::DISCONNECT &&
        event != Event::ACCOUNTS_CHANGED) {
        throw ProviderError::InvalidParams("unknown event " + event);
    }
    return events_.Subscribe(context.origin, context.contextId, event, std::move(callback));
}

bool Provider::Off(SubscriptionId id) {
    return events_.Unsubscribe(id);
}

// ============================================================================
// Wallet side
// ============================================================================

void Provider::Lock() {
    locked_ = true;
    size_t failed = approvals_->RejectAll(ProviderError::WalletLocked());
    auto origins = permissions_->RevokeAll();

    JSONValue reason = JSONValue::MakeObject();
    reason["reason"] = "locked";
    for (const auto& origin : origins) {
        events_.EmitTo(origin, Event::ACCOUNTS_CHANGED, JSONValue::MakeArray());
        events_.EmitTo(origin, Event::DISCONNECT, reason);
    }
    LOG_INFO(PROVIDER) << "Wallet locked: " << failed << " requests failed, "
                       << origins.size() << " origins disconnected";
}

bool Provider::RevokeOrigin(const std::string& origin) {
    bool revoked = permissions_->Revoke(origin);
    size_t cancelled = approvals_->CancelOrigin(origin, ProviderError::NotConnected());
    if (!revoked) {
        return false;
    }

    JSONValue reason = JSONValue::MakeObject();
    reason["reason"] = "revoked";
    events_.EmitTo(origin, Event::ACCOUNTS_CHANGED, JSONValue::MakeArray());
    events_.EmitTo(origin, Event::DISCONNECT, reason);
    LOG_INFO(PROVIDER) << "Revoked " << origin << ", " << cancelled << " requests cancelled";
    return true;
}

void Provider::Unlock() {
    locked_ = false;
    LOG_INFO(PROVIDER) << "Wallet unlocked";
}

size_t Provider::AddAccount(const std::string& address) {
    if (!wallet::IsValidAddress(address)) {
        throw std::invalid_argument("Invalid account address: " + address);
    }
    return accounts_->AddAccount(address);
}

bool Provider::SwitchAccount(size_t index) {
    return accounts_->SwitchAccount(index);
}

bool Provider::Refresh() {
    bool ok = accounts_->Refresh();

    auto feeRate = network_.FetchFeeRate();
    if (feeRate && *feeRate > 0) {
        builder_->SetFeeRate(*feeRate);
        LOG_DEBUG(PROVIDER) << "Fee rate now " << *feeRate << " koinu/byte";
    }
    return ok;
}

size_t Provider::TeardownContext(const std::string& contextId) {
    size_t cancelled = approvals_->CancelContext(contextId);
    size_t removed = events_.RemoveContext(contextId);
    LOG_DEBUG(PROVIDER) << "Context " << contextId << " closed: " << cancelled
                        << " requests cancelled, " << removed << " subscriptions removed";
    return cancelled;
}

bool Provider::ApproveRequest(ApprovalId id) {
    return approvals_->Approve(id);
}

bool Provider::RejectRequest(ApprovalId id) {
    return approvals_->Reject(id);
}

size_t Provider::ExpireTimedOut() {
    return approvals_->ExpireTimedOut();
}

// ============================================================================
// Method table
// ============================================================================

void Provider::RegisterMethods() {
    RequestRouter& router = *router_;

    router.RegisterMethod({"connect", "Ask the user to connect this site",
        [this](const RequestContext& ctx, const JSONValue&, Completion done) {
            RunConnect(ctx, std::move(done));
        },
        false, {"requestAccounts"}});

    router.RegisterMethod({"disconnect", "Revoke this site's connection",
        [this](const RequestContext& ctx, const JSONValue&, Completion done) {
            JSONValue result = JSONValue::MakeObject();
            result["disconnected"] = Disconnect(ctx);
            done.resolve(result);
        },
        false, {}});

    router.RegisterMethod({"isConnected", "Connection status of this site",
        [this](const RequestContext& ctx, const JSONValue&, Completion done) {
            JSONValue result = JSONValue::MakeObject();
            result["connected"] = IsConnected(ctx.origin);
            done.resolve(result);
        },
        false, {"getConnectionStatus"}});

    router.RegisterMethod({"getAddress", "Active account address",
        [this](const RequestContext& ctx, const JSONValue&, Completion done) {
            JSONValue result = JSONValue::MakeObject();
            result["address"] = GetAddress(ctx.origin);
            done.resolve(result);
        },
        true, {"getAccounts"}});

    router.RegisterMethod({"getBalance", "Cached balance in koinu",
        [this](const RequestContext& ctx, const JSONValue&, Completion done) {
            Amount balance = GetBalance(ctx.origin);
            JSONValue result = JSONValue::MakeObject();
            result["address"] = accounts_->CurrentAddress();
            result["balance"] = balance;
            done.resolve(result);
        },
        true, {}});

    router.RegisterMethod({"getDoginals", "Paged doginal inventory",
        [this](const RequestContext& ctx, const JSONValue& params, Completion done) {
            size_t offset = OptionalIndex(params, "offset", 0);
            size_t limit = OptionalIndex(params, "limit", DEFAULT_DOGINAL_PAGE_SIZE);
            auto page = GetDoginals(ctx.origin, offset, limit);

            JSONValue list = JSONValue::MakeArray();
            for (const auto& doginal : page.list) {
                list.Push(DoginalToJSON(doginal));
            }
            JSONValue result = JSONValue::MakeObject();
            result["list"] = std::move(list);
            result["total"] = page.total;
            done.resolve(result);
        },
        true, {}});

    router.RegisterMethod({"sendTransaction", "Send DOGE to an address",
        [this](const RequestContext& ctx, const JSONValue& params, Completion done) {
            SendIntent intent;
            intent.kind = ApprovalKind::SendTransaction;
            intent.recipient = RequireString(params, "recipientAddress");
            intent.amount = RequireAmount(params);
            RunSend(ctx, std::move(intent), std::move(done));
        },
        true, {"requestTransaction"}});

    router.RegisterMethod({"sendDoginal", "Transfer one doginal",
        [this](const RequestContext& ctx, const JSONValue& params, Completion done) {
            SendIntent intent;
            intent.kind = ApprovalKind::SendDoginal;
            intent.recipient = RequireString(params, "recipientAddress");
            intent.inscriptionIds.push_back(RequireString(params, "inscriptionId"));
            RunSend(ctx, std::move(intent), std::move(done));
        },
        true, {"requestInscriptionTransaction"}});

    router.RegisterMethod({"sendDoginals", "Transfer several doginals to one recipient",
        [this](const RequestContext& ctx, const JSONValue& params, Completion done) {
            SendIntent intent;
            intent.kind = ApprovalKind::SendDoginal;
            intent.recipient = RequireString(params, "recipientAddress");
            const JSONValue& ids = params["inscriptionIds"];
            if (!ids.IsArray() || ids.Size() == 0) {
                throw ProviderError::InvalidParams("inscriptionIds is required");
            }
            for (const auto& id : ids.GetArray()) {
                if (!id.IsString()) {
                    throw ProviderError::InvalidParams("inscriptionIds must be strings");
                }
                intent.inscriptionIds.push_back(id.GetString());
            }
            RunSend(ctx, std::move(intent), std::move(done));
        },
        true, {}});

    router.RegisterMethod({"signMessage", "Sign a message with the active key",
        [this](const RequestContext& ctx, const JSONValue& params, Completion done) {
            RunSignMessage(ctx, RequireString(params, "message"), std::move(done));
        },
        true, {"requestSignedMessage"}});

    router.RegisterMethod({"getChain", "Chain identifier",
        [](const RequestContext&, const JSONValue&, Completion done) {
            JSONValue result = JSONValue::MakeObject();
            result["chain"] = CHAIN_ID;
            done.resolve(result);
        },
        false, {"chainId"}});
}

} // namespace provider
} // namespace dogeprov
