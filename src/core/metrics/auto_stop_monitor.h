#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

struct sqlite3;

namespace nr {

struct AutoStopConfig {
    int windowDays = 3;
    int consecutiveDays = 2;
};

// One day on which control and a treatment were both compared.
struct DailyCtrComparison {
    QString datePartition;
    double controlCtr = 0.0;
    double treatmentCtr = 0.0;
    double degradation = 0.0;
    bool degraded = false;
};

struct AutoStopEvaluation {
    QString experimentKey;
    QString controlVariant;
    QString treatmentVariant;       // the worst-performing treatment
    QVector<DailyCtrComparison> comparisons;
    double avgControlCtr = 0.0;
    double avgTreatmentCtr = 0.0;
    double maxDegradation = 0.0;
    int consecutiveDegradedDays = 0;
    QStringList degradedDates;
    int skippedForSampleSize = 0;   // days with data under minSampleSize
    bool shouldStop = false;
};

struct AutoStopOutcome {
    QString experimentKey;
    bool stopped = false;
    bool failed = false;
    std::optional<int64_t> alertId;
    AutoStopEvaluation evaluation;
};

// AutoStopMonitor -- deactivates experiments whose treatment CTR trails
// control by at least the experiment's threshold on N consecutive days.
//
// A day only counts when both variants reached minSampleSize impressions on
// that day, so thin data can never trigger a stop. Each stop deactivates the
// experiment and writes an unresolved AUTO_STOP alert.
class AutoStopMonitor {
public:
    explicit AutoStopMonitor(sqlite3* db, AutoStopConfig config = {});

    QVector<AutoStopOutcome> runCheck(const QDateTime& now = QDateTime::currentDateTimeUtc());

    // Side-effect free analysis of one experiment over the window ending at now.
    AutoStopEvaluation evaluate(const ExperimentDefinition& definition, const QDateTime& now);

    static int longestConsecutiveRun(const QStringList& sortedDates);

private:
    AutoStopOutcome checkExperiment(const ExperimentDefinition& definition, const QDateTime& now);

    sqlite3* m_db = nullptr;
    AutoStopConfig m_config;
};

} // namespace nr
