#include "core/experiment/assignment_cache.h"

namespace nr {

AssignmentCache::AssignmentCache(AssignmentCacheConfig config)
    : m_config(config)
{
}

QString AssignmentCache::cacheKey(const QString& subjectId, const QString& experimentKey)
{
    return experimentKey + QChar(0x1f) + subjectId;
}

std::optional<ExperimentAssignment> AssignmentCache::get(const QString& subjectId,
                                                         const QString& experimentKey,
                                                         const QDateTime& now)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(cacheKey(subjectId, experimentKey));
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    const auto age = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - it->second->insertedAt);
    const Entry& entry = *it->second;
    const bool outsideWindow = (entry.validFrom.isValid() && now < entry.validFrom)
        || (entry.validUntil.isValid() && now > entry.validUntil);
    if (age.count() >= m_config.ttlSeconds || outsideWindow) {
        m_list.erase(it->second);
        m_index.erase(it);
        ++m_misses;
        return std::nullopt;
    }

    if (it->second != m_list.begin()) {
        m_list.splice(m_list.begin(), m_list, it->second);
    }

    ++m_hits;
    return it->second->value;
}

void AssignmentCache::put(const ExperimentAssignment& assignment, const QDateTime& validFrom,
                          const QDateTime& validUntil)
{
    if (m_config.maxEntries <= 0) {
        return;
    }
    const QString key = cacheKey(assignment.subjectId, assignment.experimentKey);

    std::lock_guard<std::mutex> lock(m_mutex);

    auto existing = m_index.find(key);
    if (existing != m_index.end()) {
        m_list.erase(existing->second);
        m_index.erase(existing);
    }

    while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        m_index.erase(m_list.back().key);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({key, assignment, validFrom, validUntil, std::chrono::steady_clock::now()});
    m_index[key] = m_list.begin();
}

void AssignmentCache::invalidateExperiment(const QString& experimentKey)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_list.begin(); it != m_list.end();) {
        if (it->value.experimentKey == experimentKey) {
            m_index.erase(it->key);
            it = m_list.erase(it);
        } else {
            ++it;
        }
    }
}

void AssignmentCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

AssignmentCache::Stats AssignmentCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, static_cast<int>(m_list.size())};
}

} // namespace nr
