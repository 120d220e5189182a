#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QString>
#include <QVector>
#include <cstdint>

struct sqlite3;

namespace nr {

// EventLog -- append-only impression and click logs.
//
// Timestamps default to now when invalid; the date partition is always derived
// from the timestamp so that aggregation and logging agree on day boundaries.
class EventLog {
public:
    explicit EventLog(sqlite3* db);

    bool appendImpression(const ImpressionEvent& event);

    // All impressions of one served list in a single transaction.
    bool appendImpressions(const QVector<ImpressionEvent>& events);

    bool appendClick(const ClickEvent& event);

    // Clicks by subjectId at or after since, newest first. okOut reports
    // whether the lookup succeeded (an empty result is not a failure).
    QVector<ClickEvent> recentClicks(const QString& subjectId, const QDateTime& since,
                                     bool* okOut = nullptr);

    int impressionCount(const QString& experimentKey, const QString& datePartition);

    // Deletes log rows older than retentionDays. Returns rows removed, -1 on error.
    int purgeOlderThan(int retentionDays, const QDateTime& now = QDateTime::currentDateTimeUtc());

private:
    bool insertImpression(const ImpressionEvent& event);

    sqlite3* m_db = nullptr;
};

} // namespace nr
