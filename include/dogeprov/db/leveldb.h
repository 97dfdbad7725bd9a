// DOGEPROV - Database Backends
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// LevelDB-backed storage plus an in-memory store used when no database
// directory is configured.

#ifndef DOGEPROV_DB_LEVELDB_H
#define DOGEPROV_DB_LEVELDB_H

#include "dogeprov/db/database.h"
#include <map>
#include <mutex>

#include <leveldb/cache.h>
#include <leveldb/db.h>

namespace dogeprov {
namespace db {

// ============================================================================
// LevelDB
// ============================================================================

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override;

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache);
    ~LevelDBDatabase() override;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator() override;

    using Database::Put;
    using Database::Delete;
    using Database::Write;

    static Status ConvertStatus(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
};

// ============================================================================
// In-Memory
// ============================================================================

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a copy taken at creation time
    std::unique_ptr<Iterator> NewIterator() override;

    using Database::Put;
    using Database::Delete;
    using Database::Write;

    size_t Size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace dogeprov

#endif // DOGEPROV_DB_LEVELDB_H
