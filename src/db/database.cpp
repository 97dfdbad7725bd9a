// DOGEPROV - Database Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/db/database.h"
#include "dogeprov/db/leveldb.h"
#include "dogeprov/util/logging.h"

#include <leveldb/options.h>
#include <leveldb/write_batch.h>

namespace dogeprov {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// LevelDB
// ============================================================================

Status LevelDBIterator::status() const {
    return LevelDBDatabase::ConvertStatus(iter_->status());
}

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache)
    : db_(db), cache_(cache) {}

LevelDBDatabase::~LevelDBDatabase() {
    // The DB must close before its block cache goes away
    db_.reset();
    cache_.reset();
}

Status LevelDBDatabase::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::Get(const Slice& key, std::string* value) {
    return ConvertStatus(db_->Get(leveldb::ReadOptions(),
                                  leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Put(lo, leveldb::Slice(key.data(), key.size()),
                                  leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Delete(lo, leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Write(lo, &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator() {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(leveldb::ReadOptions()));
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::string& path, const Options& options) {
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path, &raw);
    if (!s.ok()) {
        delete cache;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open database at " << path
                                         << ": " << s.ToString();
        return {LevelDBDatabase::ConvertStatus(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened database at " << path;
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache)};
}

// ============================================================================
// In-Memory
// ============================================================================

Status MemoryDatabase::Get(const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

} // namespace db
} // namespace dogeprov
