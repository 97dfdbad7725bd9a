// DOGEPROV - Request Router Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/provider/router.h"
#include "dogeprov/util/logging.h"

#include <atomic>
#include <memory>

namespace dogeprov {
namespace provider {

using util::LogCategory::PROVIDER;

RequestRouter::RequestRouter(const PermissionStore& permissions)
    : permissions_(permissions) {}

void RequestRouter::RegisterMethod(const RouterMethod& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    methods_[method.name] = method;
    aliases_[method.name] = method.name;
    for (const auto& alias : method.aliases) {
        aliases_[alias] = method.name;
    }
}

bool RequestRouter::HasMethod(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aliases_.count(name) > 0;
}

std::optional<std::string> RequestRouter::Resolve(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aliases_.find(name);
    if (it == aliases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> RequestRouter::ListMethods() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(methods_.size());
    for (const auto& [name, method] : methods_) {
        names.push_back(name);
    }
    return names;
}

std::future<rpc::JSONValue> RequestRouter::Dispatch(const RequestContext& context,
                                                    const std::string& method,
                                                    const rpc::JSONValue& params) {
    auto promise = std::make_shared<std::promise<rpc::JSONValue>>();
    auto future = promise->get_future();

    // Guards against a handler completing twice
    auto settled = std::make_shared<std::atomic<bool>>(false);
    Completion done;
    done.resolve = [promise, settled](rpc::JSONValue result) {
        if (!settled->exchange(true)) {
            promise->set_value(std::move(result));
        }
    };
    done.reject = [promise, settled](const ProviderError& error) {
        if (!settled->exchange(true)) {
            promise->set_exception(std::make_exception_ptr(error));
        }
    };

    std::optional<RouterMethod> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto alias = aliases_.find(method);
        if (alias != aliases_.end()) {
            entry = methods_.at(alias->second);
        }
    }

    if (!entry) {
        LOG_DEBUG(PROVIDER) << context.origin << " called unknown method " << method;
        done.reject(ProviderError::UnsupportedMethod(method));
        return future;
    }

    if (entry->requiresConnection && !permissions_.IsConnected(context.origin)) {
        LOG_DEBUG(PROVIDER) << context.origin << " called " << method << " while not connected";
        done.reject(ProviderError::NotConnected());
        return future;
    }

    try {
        entry->handler(context, params, done);
    } catch (const ProviderError& error) {
        done.reject(error);
    }
    return future;
}

} // namespace provider
} // namespace dogeprov
