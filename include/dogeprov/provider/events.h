// DOGEPROV - Event Bus
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Publish/subscribe for page-visible events (connect, disconnect,
// accountsChanged). Delivery is in subscription order over a snapshot of
// the subscriber list taken when the event is emitted.

#ifndef DOGEPROV_PROVIDER_EVENTS_H
#define DOGEPROV_PROVIDER_EVENTS_H

#include "dogeprov/rpc/json.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dogeprov {
namespace provider {

namespace Event {
    constexpr const char* CONNECT = "connect";
    constexpr const char* DISCONNECT = "disconnect";
    constexpr const char* ACCOUNTS_CHANGED = "accountsChanged";
}

using SubscriptionId = uint64_t;
using EventCallback = std::function<void(const std::string& event, const rpc::JSONValue& data)>;

class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId Subscribe(const std::string& origin, const std::string& contextId,
                             const std::string& event, EventCallback callback);

    /// False if already removed
    bool Unsubscribe(SubscriptionId id);

    /// Drop every subscription of a torn-down page context
    size_t RemoveContext(const std::string& contextId);

    /// Deliver to every subscriber of `event`. Returns the number notified.
    size_t Emit(const std::string& event, const rpc::JSONValue& data);

    /// Deliver only to subscribers registered by `origin`
    size_t EmitTo(const std::string& origin, const std::string& event,
                  const rpc::JSONValue& data);

    size_t SubscriberCount(const std::string& event) const;
    size_t Size() const;

private:
    struct Subscription {
        SubscriptionId id;
        std::string origin;
        std::string contextId;
        std::string event;
        EventCallback callback;
        std::atomic<bool> active{true};
    };

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Subscription>> subscriptions_;
    SubscriptionId nextId_{1};

    size_t Deliver(const std::string* origin, const std::string& event,
                   const rpc::JSONValue& data);
};

} // namespace provider
} // namespace dogeprov

#endif // DOGEPROV_PROVIDER_EVENTS_H
