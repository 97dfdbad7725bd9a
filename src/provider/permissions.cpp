// DOGEPROV - Permission Store Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/provider/permissions.h"
#include "dogeprov/db/leveldb.h"
#include "dogeprov/util/logging.h"
#include "dogeprov/util/time.h"

namespace dogeprov {
namespace provider {

using util::LogCategory::PERMISSION;

PermissionStore::PermissionStore(std::unique_ptr<db::Database> database)
    : db_(std::move(database)) {
    Load();
}

std::unique_ptr<PermissionStore> PermissionStore::Open(const std::string& path) {
    if (path.empty()) {
        return std::make_unique<PermissionStore>(std::make_unique<db::MemoryDatabase>());
    }

    db::Options options;
    options.create_if_missing = true;
    auto [status, database] = db::OpenDatabase(path, options);
    if (!status.ok()) {
        LOG_ERROR(PERMISSION) << "Cannot open permission database at " << path << ": "
                              << status.ToString();
        return nullptr;
    }
    return std::make_unique<PermissionStore>(std::move(database));
}

void PermissionStore::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string keyPrefix(1, db::prefix::PERMISSION);

    auto it = db_->NewIterator();
    for (it->Seek(keyPrefix); it->Valid() && it->key().starts_with(keyPrefix); it->Next()) {
        OriginPermission perm;
        if (!db::DeserializeFromString(it->value().ToString(), perm)) {
            LOG_WARN(PERMISSION) << "Skipping corrupt grant record "
                                 << it->key().ToString().substr(1);
            continue;
        }
        grants_[perm.origin] = std::move(perm);
    }
    if (!it->status().ok()) {
        LOG_WARN(PERMISSION) << "Grant scan stopped early: " << it->status().ToString();
    }

    LOG_INFO(PERMISSION) << "Loaded " << grants_.size() << " origin grants";
}

bool PermissionStore::IsConnected(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_.count(origin) > 0;
}

db::Status PermissionStore::Grant(const std::string& origin,
                                  const std::vector<std::string>& addresses) {
    OriginPermission perm;
    perm.origin = origin;
    perm.addresses = addresses;
    perm.grantedAt = util::GetTime();

    std::lock_guard<std::mutex> lock(mutex_);
    grants_[origin] = perm;

    db::WriteOptions options;
    options.sync = true;
    auto status = db_->Put(options, db::MakeKey(db::prefix::PERMISSION, origin),
                           db::SerializeToString(perm));
    if (!status.ok()) {
        LOG_ERROR(PERMISSION) << "Grant for " << origin << " not persisted: "
                              << status.ToString();
    }
    LOG_INFO(PERMISSION) << "Granted " << origin;
    return status;
}

bool PermissionStore::Revoke(const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (grants_.erase(origin) == 0) {
        return false;
    }

    db::WriteOptions options;
    options.sync = true;
    auto status = db_->Delete(options, db::MakeKey(db::prefix::PERMISSION, origin));
    if (!status.ok()) {
        LOG_ERROR(PERMISSION) << "Revocation of " << origin << " not persisted: "
                              << status.ToString();
    }
    LOG_INFO(PERMISSION) << "Revoked " << origin;
    return true;
}

std::vector<std::string> PermissionStore::ConnectedAddresses(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(origin);
    if (it == grants_.end()) {
        return {};
    }
    return it->second.addresses;
}

std::optional<OriginPermission> PermissionStore::Get(const std::string& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(origin);
    if (it == grants_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> PermissionStore::ConnectedOrigins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> origins;
    origins.reserve(grants_.size());
    for (const auto& [origin, perm] : grants_) {
        origins.push_back(origin);
    }
    return origins;
}

db::Status PermissionStore::RebindAll(const std::vector<std::string>& addresses) {
    std::lock_guard<std::mutex> lock(mutex_);
    db::WriteBatch batch;
    for (auto& [origin, perm] : grants_) {
        perm.addresses = addresses;
        batch.Put(db::MakeKey(db::prefix::PERMISSION, origin), db::SerializeToString(perm));
    }
    if (batch.Count() == 0) {
        return db::Status::Ok();
    }

    db::WriteOptions options;
    options.sync = true;
    auto status = db_->Write(options, &batch);
    if (!status.ok()) {
        LOG_ERROR(PERMISSION) << "Rebinding grants not persisted: " << status.ToString();
    }
    return status;
}

std::vector<std::string> PermissionStore::RevokeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> origins;
    db::WriteBatch batch;
    for (const auto& [origin, perm] : grants_) {
        origins.push_back(origin);
        batch.Delete(db::MakeKey(db::prefix::PERMISSION, origin));
    }
    grants_.clear();

    if (batch.Count() > 0) {
        db::WriteOptions options;
        options.sync = true;
        auto status = db_->Write(options, &batch);
        if (!status.ok()) {
            LOG_ERROR(PERMISSION) << "Clearing grants not persisted: " << status.ToString();
        }
    }
    LOG_INFO(PERMISSION) << "Revoked all " << origins.size() << " grants";
    return origins;
}

size_t PermissionStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_.size();
}

} // namespace provider
} // namespace dogeprov
