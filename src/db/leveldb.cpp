// BONDVAULT - LevelDB Backend
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/db/leveldb.h"

#ifdef BONDVAULT_USE_LEVELDB

#include <leveldb/db.h>
#include <leveldb/write_batch.h>

namespace bondvault {
namespace db {

namespace {

Status Convert(const leveldb::Status& s) {
    if (s.ok()) return Status::OK();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, bool sync) : db_(db) { writeOptions_.sync = sync; }

    Status Get(const std::string& key, std::string& value) const override {
        std::string found;
        Status s = Convert(db_->Get(leveldb::ReadOptions(), key, &found));
        if (s.ok()) value.swap(found);
        return s;
    }

    Status Write(const WriteBatch& batch) override {
        leveldb::WriteBatch native;
        for (const auto& entry : batch.Entries()) {
            if (entry.value) {
                native.Put(entry.key, *entry.value);
            } else {
                native.Delete(entry.key);
            }
        }
        return Convert(db_->Write(writeOptions_, &native));
    }

    Status Scan(const std::string& prefix, const ScanVisitor& visit) const override {
        std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(leveldb::ReadOptions()));
        for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
            if (!visit(it->key().ToString(), it->value().ToString())) break;
        }
        return Convert(it->status());
    }

    const char* Backend() const override { return "leveldb"; }

private:
    std::unique_ptr<leveldb::DB> db_;
    leveldb::WriteOptions writeOptions_;
};

} // namespace

Status OpenLevelDB(const std::filesystem::path& path, const OpenOptions& options,
                   std::unique_ptr<Database>& out) {
    leveldb::Options native;
    native.create_if_missing = options.createIfMissing;
    native.write_buffer_size = options.writeBufferSize;

    leveldb::DB* raw = nullptr;
    Status s = Convert(leveldb::DB::Open(native, path.string(), &raw));
    if (s.ok()) {
        out = std::make_unique<LevelDBDatabase>(raw, options.syncWrites);
    }
    return s;
}

Status DestroyLevelDB(const std::filesystem::path& path) {
    return Convert(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace bondvault

#endif // BONDVAULT_USE_LEVELDB
