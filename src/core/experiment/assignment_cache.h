#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QHash>
#include <QString>

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace nr {

struct AssignmentCacheConfig {
    int maxEntries = 4096;
    int ttlSeconds = 300;
};

// LRU + TTL cache of computed assignments keyed by (subjectId, experimentKey).
// Purely an optimization: a miss recomputes the same value.
class AssignmentCache {
public:
    explicit AssignmentCache(AssignmentCacheConfig config = {});

    // Returns cached assignment or nullopt. Lazily evicts entries past their
    // TTL or whose validity window no longer contains now.
    std::optional<ExperimentAssignment> get(const QString& subjectId, const QString& experimentKey,
                                            const QDateTime& now = QDateTime::currentDateTimeUtc());

    // validFrom/validUntil bound the wall-clock interval (inclusive) in which
    // the assignment stays correct; invalid means unbounded on that side.
    void put(const ExperimentAssignment& assignment, const QDateTime& validFrom = {},
             const QDateTime& validUntil = {});

    // Drops every entry of one experiment (after a configuration change).
    void invalidateExperiment(const QString& experimentKey);
    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int currentSize = 0;
    };
    Stats stats() const;

private:
    struct Entry {
        QString key;
        ExperimentAssignment value;
        QDateTime validFrom;
        QDateTime validUntil;
        std::chrono::steady_clock::time_point insertedAt;
    };

    static QString cacheKey(const QString& subjectId, const QString& experimentKey);

    AssignmentCacheConfig m_config;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = most recently used

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    std::unordered_map<QString, std::list<Entry>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace nr
