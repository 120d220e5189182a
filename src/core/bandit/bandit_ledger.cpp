#include "core/bandit/bandit_ledger.h"
#include "core/shared/logging.h"
#include "core/store/sql_helpers.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>

#include <cmath>

#include <sqlite3.h>

namespace nr {

namespace {

QString encodeContext(const BanditContext& context)
{
    const QJsonObject json{
        {QStringLiteral("subjectId"), context.subjectId},
        {QStringLiteral("timeSlot"), context.timeSlot},
        {QStringLiteral("category"), context.category},
        {QStringLiteral("experimentKey"), context.experimentKey},
    };
    return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
}

BanditContext decodeContext(const QString& text)
{
    const QJsonObject json = QJsonDocument::fromJson(text.toUtf8()).object();
    BanditContext context;
    context.subjectId = json.value(QStringLiteral("subjectId")).toString();
    context.timeSlot = json.value(QStringLiteral("timeSlot")).toInt();
    context.category = json.value(QStringLiteral("category")).toString(context.category);
    context.experimentKey = json.value(QStringLiteral("experimentKey")).toString();
    return context;
}

BanditArm readArmRow(sqlite3_stmt* stmt)
{
    BanditArm arm;
    arm.armId = sqlite3_column_int(stmt, 0);
    arm.name = sql::columnText(stmt, 1);
    arm.rewardCount = sqlite3_column_int64(stmt, 2);
    arm.rewardSum = sqlite3_column_double(stmt, 3);
    arm.rewardSumSquared = sqlite3_column_double(stmt, 4);
    arm.enabled = sqlite3_column_int(stmt, 5) != 0;
    return arm;
}

constexpr const char* kArmColumns =
    "SELECT arm_id, name, reward_count, reward_sum, reward_sum_squared, enabled FROM bandit_arm";

} // namespace

BanditLedger::BanditLedger(sqlite3* db)
    : m_db(db)
{
}

QVector<BanditArm> BanditLedger::listArms(bool* okOut)
{
    if (okOut) {
        *okOut = false;
    }
    QVector<BanditArm> arms;
    const QByteArray sqlText = QByteArray(kArmColumns) + " ORDER BY arm_id";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrBandit, "Failed to read arm registry: %s", sqlite3_errmsg(m_db));
        return arms;
    }
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        arms.append(readArmRow(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrBandit, "Arm registry scan failed: %s", sqlite3_errmsg(m_db));
        arms.clear();
        return arms;
    }
    if (okOut) {
        *okOut = true;
    }
    return arms;
}

std::optional<BanditArm> BanditLedger::arm(int armId)
{
    const QByteArray sqlText = QByteArray(kArmColumns) + " WHERE arm_id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int(stmt, 1, armId);
    std::optional<BanditArm> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readArmRow(stmt);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool BanditLedger::setArmEnabled(int armId, bool enabled)
{
    const char* sqlText = "UPDATE bandit_arm SET enabled = ?1, updated_at = ?2 WHERE arm_id = ?3";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int(stmt, 1, enabled ? 1 : 0);
    sqlite3_bind_int64(stmt, 2, QDateTime::currentMSecsSinceEpoch());
    sqlite3_bind_int(stmt, 3, armId);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

std::optional<int64_t> BanditLedger::recordDecision(const BanditDecision& decision)
{
    const char* sqlText = R"(
        INSERT INTO bandit_decision (arm_id, subject_id, context, decision_value,
                                     selection_reason, served_item_ids, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(nrBandit, "Failed to prepare decision insert: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QDateTime createdAt = decision.createdAt.isValid() ? decision.createdAt
                                                              : QDateTime::currentDateTimeUtc();
    sqlite3_bind_int(stmt, 1, decision.armId);
    sql::bindText(stmt, 2, decision.subjectId);
    sql::bindText(stmt, 3, encodeContext(decision.context));
    sqlite3_bind_double(stmt, 4, decision.decisionValue);
    sql::bindText(stmt, 5, selectionReasonToString(decision.reason));
    sql::bindText(stmt, 6, sql::encodeStringList(decision.servedItemIds));
    sqlite3_bind_int64(stmt, 7, sql::toEpochMs(createdAt));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(nrBandit, "Failed to record decision for %s: %s",
                  qUtf8Printable(decision.subjectId), sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::optional<BanditDecision> BanditLedger::decision(int64_t decisionId)
{
    const char* sqlText = R"(
        SELECT d.id, d.arm_id, a.name, d.subject_id, d.context, d.decision_value,
               d.selection_reason, d.served_item_ids, d.created_at
        FROM bandit_decision d JOIN bandit_arm a ON a.arm_id = d.arm_id
        WHERE d.id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrBandit, "Failed to prepare decision lookup: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, decisionId);

    std::optional<BanditDecision> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        BanditDecision d;
        d.decisionId = sqlite3_column_int64(stmt, 0);
        d.armId = sqlite3_column_int(stmt, 1);
        d.armName = sql::columnText(stmt, 2);
        d.subjectId = sql::columnText(stmt, 3);
        d.context = decodeContext(sql::columnText(stmt, 4));
        d.decisionValue = sqlite3_column_double(stmt, 5);
        d.reason = selectionReasonFromString(sql::columnText(stmt, 6));
        d.servedItemIds = sql::decodeStringList(sql::columnText(stmt, 7));
        d.createdAt = sql::columnTimestamp(stmt, 8);
        result = d;
    }
    sqlite3_finalize(stmt);
    return result;
}

RewardStatus BanditLedger::recordReward(const BanditReward& reward)
{
    if (!std::isfinite(reward.rewardValue) || reward.rewardValue < 0.0) {
        LOG_WARN(nrBandit, "Rejecting reward %f for decision %lld", reward.rewardValue,
                 static_cast<long long>(reward.decisionId));
        return RewardStatus::Invalid;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (!sql::exec(m_db, "BEGIN IMMEDIATE")) {
        return RewardStatus::StorageError;
    }

    auto rollback = [this](RewardStatus status) {
        if (!sql::exec(m_db, "ROLLBACK")) {
            LOG_ERROR(nrBandit, "Rollback failed after reward error");
        }
        return status;
    };

    // Resolve the decision's arm inside the transaction.
    int armId = 0;
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "SELECT arm_id FROM bandit_decision WHERE id = ?1", -1,
                               &stmt, nullptr) != SQLITE_OK) {
            return rollback(RewardStatus::StorageError);
        }
        sqlite3_bind_int64(stmt, 1, reward.decisionId);
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            armId = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            LOG_WARN(nrBandit, "Reward references unknown decision %lld",
                     static_cast<long long>(reward.decisionId));
            return rollback(RewardStatus::UnknownDecision);
        }
        if (rc != SQLITE_ROW) {
            return rollback(RewardStatus::StorageError);
        }
    }

    const QDateTime createdAt = reward.createdAt.isValid() ? reward.createdAt
                                                            : QDateTime::currentDateTimeUtc();
    {
        sqlite3_stmt* stmt = nullptr;
        const char* sqlText = R"(
            INSERT INTO bandit_reward (decision_id, reward_type, reward_value, item_id, created_at)
            VALUES (?1, ?2, ?3, ?4, ?5)
        )";
        if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
            return rollback(RewardStatus::StorageError);
        }
        sqlite3_bind_int64(stmt, 1, reward.decisionId);
        sql::bindText(stmt, 2, rewardTypeToString(reward.rewardType));
        sqlite3_bind_double(stmt, 3, reward.rewardValue);
        sql::bindOptionalText(stmt, 4, reward.itemId);
        sqlite3_bind_int64(stmt, 5, sql::toEpochMs(createdAt));
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(nrBandit, "Failed to insert reward: %s", sqlite3_errmsg(m_db));
            return rollback(RewardStatus::StorageError);
        }
    }

    {
        sqlite3_stmt* stmt = nullptr;
        const char* sqlText = R"(
            UPDATE bandit_arm
            SET reward_count = reward_count + 1,
                reward_sum = reward_sum + ?1,
                reward_sum_squared = reward_sum_squared + ?1 * ?1,
                updated_at = ?2
            WHERE arm_id = ?3
        )";
        if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
            return rollback(RewardStatus::StorageError);
        }
        sqlite3_bind_double(stmt, 1, reward.rewardValue);
        sqlite3_bind_int64(stmt, 2, sql::toEpochMs(createdAt));
        sqlite3_bind_int(stmt, 3, armId);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(nrBandit, "Failed to update arm %d: %s", armId, sqlite3_errmsg(m_db));
            return rollback(RewardStatus::StorageError);
        }
    }

    if (!sql::exec(m_db, "COMMIT")) {
        return rollback(RewardStatus::StorageError);
    }
    return RewardStatus::Recorded;
}

QVector<BanditReward> BanditLedger::rewardsForDecision(int64_t decisionId)
{
    QVector<BanditReward> rewards;
    const char* sqlText = R"(
        SELECT id, decision_id, reward_type, reward_value, item_id, created_at
        FROM bandit_reward WHERE decision_id = ?1 ORDER BY id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        return rewards;
    }
    sqlite3_bind_int64(stmt, 1, decisionId);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        BanditReward reward;
        reward.id = sqlite3_column_int64(stmt, 0);
        reward.decisionId = sqlite3_column_int64(stmt, 1);
        reward.rewardType = rewardTypeFromString(sql::columnText(stmt, 2)).value_or(RewardType::Click);
        reward.rewardValue = sqlite3_column_double(stmt, 3);
        reward.itemId = sql::columnOptionalText(stmt, 4);
        reward.createdAt = sql::columnTimestamp(stmt, 5);
        rewards.append(reward);
    }
    sqlite3_finalize(stmt);
    return rewards;
}

QVector<ArmStats> BanditLedger::armStats()
{
    QVector<ArmStats> stats;
    for (const BanditArm& arm : listArms()) {
        ArmStats entry;
        entry.armId = arm.armId;
        entry.name = arm.name;
        entry.enabled = arm.enabled;
        entry.count = arm.rewardCount;
        entry.sum = arm.rewardSum;
        entry.mean = arm.meanReward();
        entry.variance = arm.rewardVariance();
        stats.append(entry);
    }
    return stats;
}

} // namespace nr
