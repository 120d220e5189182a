#pragma once

#include "core/shared/scoring_types.h"

#include <QString>
#include <cstdint>

namespace nr {

struct EngineSettings {
    // Database
    QString databasePath;

    // Bandit
    double epsilon = 0.1;
    QString selector = QStringLiteral("local");     // "local", "ucb1", "thompson" or "remote"
    double thompsonAlpha = 1.0;                      // Beta prior, both > 0
    double thompsonBeta = 1.0;
    QString selectorSocketPath;
    int selectorTimeoutMs = 200;
    int defaultLimit = 10;
    double diverseArmLambda = 0.5;

    // Degradation
    int embeddingLookupBudgetMs = 50;
    int breakerFailureThreshold = 5;
    int breakerHalfOpenDelayMs = 30000;

    // Experiments
    int assignmentCacheTtlSeconds = 300;
    int assignmentCacheMaxEntries = 4096;

    // Ranking
    int defaultTopicCap = 2;
    RankWeights rankWeights;
    PersonalizationWeights personalization;

    // Scheduled jobs
    int aggregationIntervalMs = 3600000;        // hourly
    int autoStopIntervalMs = 21600000;          // every 6 hours
    int autoStopWindowDays = 3;
    int autoStopConsecutiveDays = 2;
};

} // namespace nr
