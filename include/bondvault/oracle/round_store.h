// BONDVAULT - Persistent Round History
// Copyright (c) 2024 BondVault Developers
// MIT License

#ifndef BONDVAULT_ORACLE_ROUND_STORE_H
#define BONDVAULT_ORACLE_ROUND_STORE_H

#include "bondvault/core/bigint.h"
#include "bondvault/db/database.h"
#include "bondvault/oracle/round.h"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace bondvault {
namespace oracle {

/// Database key prefixes
namespace prefix {
    constexpr char ROUND = 'r';     ///< 'r' + roundId (16 bytes, big-endian) -> PriceRound
    constexpr char LATEST = 'L';    ///< 'L' -> latest roundId
}

constexpr size_t ROUND_KEY_SIZE = 1 + ROUND_ID_STORAGE_SIZE;

/**
 * Round history on top of a key-value database.
 *
 * A round and the latest pointer are written in one batch, so a crash never
 * leaves the pointer naming a round that was not stored. History is never
 * pruned. Storage errors throw OperationError(StorageFailure).
 */
class RoundStore {
public:
    explicit RoundStore(std::shared_ptr<db::Database> db);

    /// Write a round and point "latest" at it
    void Store(const PriceRound& round);

    std::optional<PriceRound> Get(RoundId roundId) const;

    /// Latest round id, 0 if nothing was stored
    RoundId LatestRoundId() const;

    /// Every stored round, ordered by id
    std::map<RoundId, PriceRound> LoadAll() const;

    db::Database& GetDatabase() { return *db_; }

private:
    static std::string RoundKey(RoundId roundId);
    static std::string LatestKey();

    std::shared_ptr<db::Database> db_;
};

} // namespace oracle
} // namespace bondvault

#endif // BONDVAULT_ORACLE_ROUND_STORE_H
