#pragma once

namespace nr {

// Final rank-score blend. The four weights must sum to 1.
struct RankWeights {
    double importance = 0.45;
    double recency = 0.20;
    double personalized = 0.25;
    double novelty = 0.10;

    // Raw importance scores are normalised against this ceiling.
    double importanceScale = 10.0;

    double sum() const { return importance + recency + personalized + novelty; }
};

// Terms of the user-relevance score.
struct PersonalizationWeights {
    double tickerMatchBoost = 0.3;       // once per candidate, not per ticker
    double keywordBoost = 0.1;           // per keyword hit
    double keywordMaxContribution = 0.5;
    double clickMinWeight = 0.1;
    double clickMaxWeight = 0.3;
    double topicMaxWeight = 0.1;
    int clickHistoryDays = 7;
};

} // namespace nr
