// DOGEPROV - Event Bus Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/provider/events.h"
#include "dogeprov/util/logging.h"

#include <algorithm>

namespace dogeprov {
namespace provider {

using util::LogCategory::EVENTS;

SubscriptionId EventBus::Subscribe(const std::string& origin, const std::string& contextId,
                                   const std::string& event, EventCallback callback) {
    auto sub = std::make_shared<Subscription>();
    sub->origin = origin;
    sub->contextId = contextId;
    sub->event = event;
    sub->callback = std::move(callback);

    std::lock_guard<std::mutex> lock(mutex_);
    sub->id = nextId_++;
    subscriptions_.push_back(sub);
    LOG_TRACE(EVENTS) << origin << " subscribed to " << event << " (#" << sub->id << ")";
    return sub->id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const std::shared_ptr<Subscription>& s) { return s->id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    // An in-flight delivery holding a snapshot skips it from now on
    (*it)->active = false;
    subscriptions_.erase(it);
    return true;
}

size_t EventBus::RemoveContext(const std::string& contextId) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = subscriptions_.size();
    subscriptions_.erase(
        std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                       [&contextId](const std::shared_ptr<Subscription>& s) {
                           if (s->contextId != contextId) return false;
                           s->active = false;
                           return true;
                       }),
        subscriptions_.end());
    return before - subscriptions_.size();
}

size_t EventBus::Emit(const std::string& event, const rpc::JSONValue& data) {
    return Deliver(nullptr, event, data);
}

size_t EventBus::EmitTo(const std::string& origin, const std::string& event,
                        const rpc::JSONValue& data) {
    return Deliver(&origin, event, data);
}

size_t EventBus::Deliver(const std::string* origin, const std::string& event,
                         const rpc::JSONValue& data) {
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subscriptions_) {
            if (sub->event == event && (!origin || sub->origin == *origin)) {
                targets.push_back(sub);
            }
        }
    }

    LOG_DEBUG(EVENTS) << "Emitting " << event << (origin ? " to " + *origin : std::string())
                      << " to " << targets.size() << " subscribers";

    size_t delivered = 0;
    for (const auto& sub : targets) {
        if (!sub->active) {
            continue;
        }
        sub->callback(event, data);
        ++delivered;
    }
    return delivered;
}

size_t EventBus::SubscriberCount(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(
        subscriptions_.begin(), subscriptions_.end(),
        [&event](const std::shared_ptr<Subscription>& s) { return s->event == event; }));
}

size_t EventBus::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace provider
} // namespace dogeprov
