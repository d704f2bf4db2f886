// BONDVAULT - LevelDB Backend
// Copyright (c) 2024 BondVault Developers
// MIT License

#ifndef BONDVAULT_DB_LEVELDB_H
#define BONDVAULT_DB_LEVELDB_H

#include "bondvault/db/database.h"

#ifdef BONDVAULT_USE_LEVELDB

namespace bondvault {
namespace db {

/// Open (or create) a LevelDB at path; the directory must already exist
Status OpenLevelDB(const std::filesystem::path& path, const OpenOptions& options,
                   std::unique_ptr<Database>& out);

Status DestroyLevelDB(const std::filesystem::path& path);

} // namespace db
} // namespace bondvault

#endif // BONDVAULT_USE_LEVELDB

#endif // BONDVAULT_DB_LEVELDB_H
