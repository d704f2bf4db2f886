// BONDVAULT - Database Abstraction Layer
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Ordered key-value storage for the oracle's round history. All mutation
// goes through WriteBatch so multi-key updates land atomically. Reads are
// point lookups and ordered prefix scans.

#ifndef BONDVAULT_DB_DATABASE_H
#define BONDVAULT_DB_DATABASE_H

#include "bondvault/core/serialize.h"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bondvault {
namespace db {

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    enum class Code : uint8_t {
        Ok,
        NotFound,
        Corruption,
        InvalidArgument,
        IOError,
    };

    Status() = default;

    static Status OK() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(Code::NotFound, std::move(msg)); }
    static Status Corruption(std::string msg) { return Status(Code::Corruption, std::move(msg)); }
    static Status InvalidArgument(std::string msg) {
        return Status(Code::InvalidArgument, std::move(msg));
    }
    static Status IOError(std::string msg) { return Status(Code::IOError, std::move(msg)); }

    bool ok() const { return code_ == Code::Ok; }
    bool IsNotFound() const { return code_ == Code::NotFound; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "OK" or "<Code>: <message>"
    std::string ToString() const;

private:
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    Code code_{Code::Ok};
    std::string message_;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Ordered list of puts and deletes; later entries win
class WriteBatch {
public:
    struct Entry {
        std::string key;
        std::optional<std::string> value;  ///< nullopt deletes key
    };

    void Put(std::string key, std::string value) {
        entries_.push_back({std::move(key), std::move(value)});
    }

    void Delete(std::string key) {
        entries_.push_back({std::move(key), std::nullopt});
    }

    const std::vector<Entry>& Entries() const { return entries_; }
    size_t Count() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }
    void Clear() { entries_.clear(); }

private:
    std::vector<Entry> entries_;
};

// ============================================================================
// Database
// ============================================================================

/// Called per key during a scan; return false to stop early
using ScanVisitor = std::function<bool(const std::string& key, const std::string& value)>;

class Database {
public:
    virtual ~Database() = default;

    /// NotFound when the key is absent; value is untouched then
    virtual Status Get(const std::string& key, std::string& value) const = 0;

    virtual Status Write(const WriteBatch& batch) = 0;

    /// Visit every key beginning with prefix in ascending byte order. The
    /// scan sees the state at its start, so the visitor may write.
    virtual Status Scan(const std::string& prefix, const ScanVisitor& visit) const = 0;

    /// "leveldb" or "memory"
    virtual const char* Backend() const = 0;

    Status Put(const std::string& key, const std::string& value);
    Status Delete(const std::string& key);
    bool Exists(const std::string& key) const;
};

/// std::map behind a mutex. Used in tests and when LevelDB is not built in.
class MemoryDatabase : public Database {
public:
    Status Get(const std::string& key, std::string& value) const override;
    Status Write(const WriteBatch& batch) override;
    Status Scan(const std::string& prefix, const ScanVisitor& visit) const override;
    const char* Backend() const override { return "memory"; }

    size_t Size() const;

private:
    std::map<std::string, std::string> entries_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Opening
// ============================================================================

struct OpenOptions {
    bool createIfMissing{true};
    /// fsync each batch before Write() returns
    bool syncWrites{true};
    size_t writeBufferSize{4 * 1024 * 1024};
};

/**
 * Open the store at path, creating the directory first.
 *
 * With BONDVAULT_USE_LEVELDB the data lives in a LevelDB at path; without
 * it a MemoryDatabase is returned and nothing outlives the process.
 */
Status OpenDatabase(const std::filesystem::path& path, std::unique_ptr<Database>& out,
                    const OpenOptions& options = OpenOptions());

/// Remove everything stored at path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Value Encoding
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    ss << obj;
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/// False on truncated input or trailing bytes
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    try {
        ss >> obj;
    } catch (const DecodeError&) {
        return false;
    }
    return ss.empty();
}

} // namespace db
} // namespace bondvault

#endif // BONDVAULT_DB_DATABASE_H
