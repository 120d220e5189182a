#pragma once

#include "core/shared/types.h"

#include <QVector>

#include <cstdint>
#include <mutex>
#include <optional>

struct sqlite3;

namespace nr {

enum class RewardStatus {
    Recorded,
    UnknownDecision,
    Invalid,
    StorageError,
};

struct ArmStats {
    int armId = 0;
    QString name;
    bool enabled = true;
    int64_t count = 0;
    double sum = 0.0;
    double mean = 0.0;
    double variance = 0.0;
};

// BanditLedger -- arm registry, immutable decisions and append-only rewards.
//
// A reward row and the matching arm counter update are written in one
// IMMEDIATE transaction, so concurrent rewards for the same arm (from any
// connection) serialize in SQLite and never lose an increment.
class BanditLedger {
public:
    explicit BanditLedger(sqlite3* db);

    // okOut is false when the registry could not be read.
    QVector<BanditArm> listArms(bool* okOut = nullptr);
    std::optional<BanditArm> arm(int armId);
    bool setArmEnabled(int armId, bool enabled);

    std::optional<int64_t> recordDecision(const BanditDecision& decision);
    std::optional<BanditDecision> decision(int64_t decisionId);

    RewardStatus recordReward(const BanditReward& reward);
    QVector<BanditReward> rewardsForDecision(int64_t decisionId);

    QVector<ArmStats> armStats();

private:
    sqlite3* m_db = nullptr;
    std::mutex m_mutex;
};

} // namespace nr
