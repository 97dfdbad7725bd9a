// DOGEPROV - Permission Store
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Per-origin connection grants. An origin is either fully connected or
// fully disconnected. Grants survive page reloads and are persisted to
// the database; wallet lock clears all of them.

#ifndef DOGEPROV_PROVIDER_PERMISSIONS_H
#define DOGEPROV_PROVIDER_PERMISSIONS_H

#include "dogeprov/core/serialize.h"
#include "dogeprov/db/database.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dogeprov {
namespace provider {

struct OriginPermission {
    std::string origin;
    std::vector<std::string> addresses;
    int64_t grantedAt{0};

    bool operator==(const OriginPermission& other) const {
        return origin == other.origin && addresses == other.addresses &&
               grantedAt == other.grantedAt;
    }
};

template<typename Stream>
void Serialize(Stream& s, const OriginPermission& perm) {
    Serialize(s, perm.origin);
    Serialize(s, perm.addresses);
    Serialize(s, perm.grantedAt);
}

template<typename Stream>
void Unserialize(Stream& s, OriginPermission& perm) {
    Unserialize(s, perm.origin);
    Unserialize(s, perm.addresses);
    Unserialize(s, perm.grantedAt);
}

class PermissionStore {
public:
    /// Loads every stored grant
    explicit PermissionStore(std::unique_ptr<db::Database> database);

    /// LevelDB at `path`, or an in-memory database when `path` is empty.
    /// Null if the database cannot be opened.
    static std::unique_ptr<PermissionStore> Open(const std::string& path);

    PermissionStore(const PermissionStore&) = delete;
    PermissionStore& operator=(const PermissionStore&) = delete;

    bool IsConnected(const std::string& origin) const;

    /// Replaces any earlier grant for the origin
    db::Status Grant(const std::string& origin, const std::vector<std::string>& addresses);

    /// Immediate; false if the origin had no grant
    bool Revoke(const std::string& origin);

    /// Empty for disconnected origins
    std::vector<std::string> ConnectedAddresses(const std::string& origin) const;

    std::optional<OriginPermission> Get(const std::string& origin) const;
    std::vector<std::string> ConnectedOrigins() const;

    /// Point every grant at a new address set (account switch)
    db::Status RebindAll(const std::vector<std::string>& addresses);

    /// Single batch. Returns the origins that were connected.
    std::vector<std::string> RevokeAll();

    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unique_ptr<db::Database> db_;
    std::map<std::string, OriginPermission> grants_;

    void Load();
};

} // namespace provider
} // namespace dogeprov

#endif // DOGEPROV_PROVIDER_PERMISSIONS_H
