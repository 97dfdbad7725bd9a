// DOGEPROV - Request Router
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Method table behind the generic request({method, params}) surface.
// Several page-facing names may map onto one operation.

#ifndef DOGEPROV_PROVIDER_ROUTER_H
#define DOGEPROV_PROVIDER_ROUTER_H

#include "dogeprov/provider/errors.h"
#include "dogeprov/provider/permissions.h"
#include "dogeprov/rpc/json.h"

#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dogeprov {
namespace provider {

/// Who is asking
struct RequestContext {
    std::string origin;

    /// Page context (tab/frame) the request came from
    std::string contextId;
};

/// Resolves or rejects one request. Exactly one of the two is called.
struct Completion {
    std::function<void(rpc::JSONValue)> resolve;
    std::function<void(const ProviderError&)> reject;
};

/// May throw ProviderError instead of calling reject
using MethodHandler = std::function<void(const RequestContext&, const rpc::JSONValue& params,
                                         Completion done)>;

struct RouterMethod {
    std::string name;
    std::string description;
    MethodHandler handler;
    bool requiresConnection{true};
    std::vector<std::string> aliases;
};

class RequestRouter {
public:
    explicit RequestRouter(const PermissionStore& permissions);

    RequestRouter(const RequestRouter&) = delete;
    RequestRouter& operator=(const RequestRouter&) = delete;

    /// Registers the method under its name and every alias
    void RegisterMethod(const RouterMethod& method);

    bool HasMethod(const std::string& name) const;

    /// Canonical name for a method or alias
    std::optional<std::string> Resolve(const std::string& name) const;

    /// Canonical names, sorted
    std::vector<std::string> ListMethods() const;

    /**
     * Look up and run a method. Unknown methods and unconnected origins
     * calling privileged methods fail without reaching the handler.
     */
    std::future<rpc::JSONValue> Dispatch(const RequestContext& context,
                                         const std::string& method,
                                         const rpc::JSONValue& params);

private:
    const PermissionStore& permissions_;

    mutable std::mutex mutex_;
    std::map<std::string, RouterMethod> methods_;
    std::map<std::string, std::string> aliases_;
};

} // namespace provider
} // namespace dogeprov

#endif // DOGEPROV_PROVIDER_ROUTER_H
