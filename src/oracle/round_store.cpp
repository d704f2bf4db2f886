// BONDVAULT - Persistent Round History Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/oracle/round_store.h"
#include "bondvault/core/bigint.h"
#include "bondvault/core/errors.h"
#include "bondvault/util/logging.h"


namespace bondvault {
namespace oracle {

RoundStore::RoundStore(std::shared_ptr<db::Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw OperationError(ErrorCode::StorageFailure, "no database");
    }
}

std::string RoundStore::RoundKey(RoundId roundId) {
    uint8_t key[ROUND_KEY_SIZE];
    key[0] = static_cast<uint8_t>(prefix::ROUND);
    StoreBigEndian(roundId, key + 1, ROUND_ID_STORAGE_SIZE);
    return std::string(reinterpret_cast<const char*>(key), sizeof(key));
}

std::string RoundStore::LatestKey() {
    return std::string(1, prefix::LATEST);
}

void RoundStore::Store(const PriceRound& round) {
    db::WriteBatch batch;
    batch.Put(RoundKey(round.roundId), db::SerializeToString(round));
    batch.Put(LatestKey(), db::SerializeToString(round.roundId));

    db::Status s = db_->Write(batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to store round " << round.roundId
                                         << ": " << s.ToString();
        throw OperationError(ErrorCode::StorageFailure, s.ToString());
    }
}

std::optional<PriceRound> RoundStore::Get(RoundId roundId) const {
    std::string value;
    db::Status s = db_->Get(RoundKey(roundId), value);
    if (s.IsNotFound()) {
        return std::nullopt;
    }
    if (!s.ok()) {
        throw OperationError(ErrorCode::StorageFailure, s.ToString());
    }

    PriceRound round;
    if (!db::DeserializeFromString(value, round)) {
        throw OperationError(ErrorCode::StorageFailure,
                             "corrupt round " + roundId.str());
    }
    return round;
}

RoundId RoundStore::LatestRoundId() const {
    std::string value;
    db::Status s = db_->Get(LatestKey(), value);
    if (s.IsNotFound()) {
        return 0;
    }
    if (!s.ok()) {
        throw OperationError(ErrorCode::StorageFailure, s.ToString());
    }

    RoundId latest = 0;
    if (!db::DeserializeFromString(value, latest)) {
        throw OperationError(ErrorCode::StorageFailure, "corrupt latest pointer");
    }
    return latest;
}

std::map<RoundId, PriceRound> RoundStore::LoadAll() const {
    std::map<RoundId, PriceRound> rounds;
    std::string problem;

    db::Status s = db_->Scan(std::string(1, prefix::ROUND),
        [&rounds, &problem](const std::string& key, const std::string& value) {
            PriceRound round;
            if (key.size() != ROUND_KEY_SIZE) {
                problem = "malformed round key";
            } else if (!db::DeserializeFromString(value, round)) {
                problem = "corrupt round entry";
            } else {
                RoundId id = LoadBigEndian<RoundId>(
                    reinterpret_cast<const uint8_t*>(key.data()) + 1, ROUND_ID_STORAGE_SIZE);
                if (id != round.roundId) {
                    problem = "round " + id.str() + " stored under wrong key";
                } else {
                    rounds[id] = round;
                }
            }
            return problem.empty();
        });

    if (!s.ok()) {
        throw OperationError(ErrorCode::StorageFailure, s.ToString());
    }
    if (!problem.empty()) {
        throw OperationError(ErrorCode::StorageFailure, problem);
    }
    return rounds;
}

} // namespace oracle
} // namespace bondvault
