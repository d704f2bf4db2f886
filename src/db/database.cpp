// BONDVAULT - Database Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/db/database.h"
#include "bondvault/db/leveldb.h"
#include "bondvault/util/logging.h"

#include <system_error>
#include <utility>

namespace bondvault {
namespace db {

std::string Status::ToString() const {
    const char* name = "OK";
    switch (code_) {
        case Code::Ok: return name;
        case Code::NotFound: name = "NotFound"; break;
        case Code::Corruption: name = "Corruption"; break;
        case Code::InvalidArgument: name = "InvalidArgument"; break;
        case Code::IOError: name = "IOError"; break;
    }
    return message_.empty() ? std::string(name) : std::string(name) + ": " + message_;
}

// ============================================================================
// Database
// ============================================================================

Status Database::Put(const std::string& key, const std::string& value) {
    WriteBatch batch;
    batch.Put(key, value);
    return Write(batch);
}

Status Database::Delete(const std::string& key) {
    WriteBatch batch;
    batch.Delete(key);
    return Write(batch);
}

bool Database::Exists(const std::string& key) const {
    std::string ignored;
    return Get(key, ignored).ok();
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const std::string& key, std::string& value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Status::NotFound();
    }
    value = it->second;
    return Status::OK();
}

Status MemoryDatabase::Write(const WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : batch.Entries()) {
        if (entry.value) {
            entries_[entry.key] = *entry.value;
        } else {
            entries_.erase(entry.key);
        }
    }
    return Status::OK();
}

Status MemoryDatabase::Scan(const std::string& prefix, const ScanVisitor& visit) const {
    std::vector<std::pair<std::string, std::string>> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.lower_bound(prefix);
             it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
            matched.emplace_back(it->first, it->second);
        }
    }
    for (const auto& [key, value] : matched) {
        if (!visit(key, value)) break;
    }
    return Status::OK();
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// Opening
// ============================================================================

Status OpenDatabase(const std::filesystem::path& path, std::unique_ptr<Database>& out,
                    const OpenOptions& options) {
    std::error_code ec;
    if (options.createIfMissing) {
        std::filesystem::create_directories(path, ec);
    } else if (!std::filesystem::is_directory(path, ec)) {
        return Status::InvalidArgument(path.string() + " does not exist");
    }
    if (ec) {
        return Status::IOError(path.string() + ": " + ec.message());
    }

#ifdef BONDVAULT_USE_LEVELDB
    return OpenLevelDB(path, options, out);
#else
    LOG_WARN(util::LogCategory::DB) << "Built without LevelDB; " << path.string()
                                    << " will not be written";
    out = std::make_unique<MemoryDatabase>();
    return Status::OK();
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef BONDVAULT_USE_LEVELDB
    Status s = DestroyLevelDB(path);
    if (!s.ok()) return s;
#endif
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    return ec ? Status::IOError(path.string() + ": " + ec.message()) : Status::OK();
}

} // namespace db
} // namespace bondvault
