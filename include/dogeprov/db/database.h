// DOGEPROV - Database Abstraction Layer
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Key-value storage interface. The provider keeps origin grants here so they
// survive page reloads and process restarts.

#ifndef DOGEPROV_DB_DATABASE_H
#define DOGEPROV_DB_DATABASE_H

#include "dogeprov/core/serialize.h"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dogeprov {
namespace db {

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        INVALID_ARGUMENT = 3,
        IO_ERROR = 4,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a byte range
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

private:
    const char* data_;
    size_t size_;
};

struct Options {
    bool create_if_missing = true;
    bool paranoid_checks = false;
    size_t write_buffer_size = 1024 * 1024;
    size_t block_cache_size = 1024 * 1024;
};

struct WriteOptions {
    /// fsync before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Writes applied atomically by Database::Write
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }

    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator / Database
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    /// First key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const Slice& key, std::string* value) = 0;
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    virtual std::unique_ptr<Iterator> NewIterator() = 0;

    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }
};

/// Open (creating if needed) a LevelDB database at path
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::string& path, const Options& options = Options());

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    ss << obj;
    const auto& bytes = ss.Data();
    return std::string(bytes.begin(), bytes.end());
}

/// False on truncated or trailing data
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        ss >> obj;
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char PERMISSION = 'p';      // origin -> grant record
    constexpr char VERSION = 'V';         // -> schema version
}

inline std::string MakeKey(char prefix, const std::string& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key);
    return result;
}

} // namespace db
} // namespace dogeprov

#endif // DOGEPROV_DB_DATABASE_H
