#include "core/store/write_queue.h"
#include "core/shared/logging.h"

#include <chrono>
#include <exception>

namespace nr {

WriteQueue::WriteQueue(QString dbPath)
    : m_dbPath(std::move(dbPath))
{
}

WriteQueue::~WriteQueue()
{
    shutdown();
}

bool WriteQueue::start()
{
    if (m_running.load()) {
        return true;
    }

    m_store = SQLiteStore::open(m_dbPath);
    if (!m_store) {
        LOG_ERROR(nrStore, "WriteQueue could not open writer connection: %s",
                  qUtf8Printable(m_dbPath));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = false;
    }
    m_running.store(true);
    m_thread = std::thread([this] { writerLoop(); });
    LOG_INFO(nrStore, "WriteQueue started on %s", qUtf8Printable(m_dbPath));
    return true;
}

// ── Submit ──────────────────────────────────────────────────

bool WriteQueue::rememberKey(const QString& key)
{
    if (m_recentKeySet.contains(key)) {
        return false;
    }
    m_recentKeys.push_back(key);
    m_recentKeySet.insert(key);
    while (m_recentKeys.size() > kDedupWindow) {
        m_recentKeySet.remove(m_recentKeys.front());
        m_recentKeys.pop_front();
    }
    return true;
}

bool WriteQueue::submit(WriteJob job)
{
    if (!job.apply) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown || !m_running.load()) {
        ++m_dropped;
        LOG_WARN(nrStore, "WriteQueue not running, dropped %s job", qUtf8Printable(job.kind));
        return false;
    }

    if (m_queue.size() >= MAX_QUEUE_SIZE) {
        ++m_dropped;
        LOG_WARN(nrStore, "WriteQueue at capacity (%d), dropped %s job",
                 static_cast<int>(MAX_QUEUE_SIZE), qUtf8Printable(job.kind));
        return false;
    }

    if (!job.dedupKey.isEmpty() && !rememberKey(job.dedupKey)) {
        ++m_duplicates;
        LOG_DEBUG(nrStore, "Suppressed duplicate %s job %s",
                  qUtf8Printable(job.kind), qUtf8Printable(job.dedupKey));
        return false;
    }

    m_queue.push_back(std::move(job));
    m_cv.notify_one();
    return true;
}

// ── Writer thread ───────────────────────────────────────────

void WriteQueue::writerLoop()
{
    while (true) {
        WriteJob job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });
            if (m_queue.empty()) {
                break;          // shutdown with nothing left to apply
            }
            job = std::move(m_queue.front());
            m_queue.pop_front();
            m_busy = true;
        }

        ++job.attempts;
        bool ok = false;
        try {
            ok = job.apply(m_store->rawDb());
        } catch (const std::exception& e) {
            LOG_ERROR(nrStore, "%s job threw: %s", qUtf8Printable(job.kind), e.what());
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        if (!ok && job.attempts < kMaxAttempts && !m_shutdown) {
            // Stays busy through the backoff.
            ++m_retried;
            LOG_WARN(nrStore, "%s job failed (attempt %d/%d), retrying",
                     qUtf8Printable(job.kind), job.attempts, kMaxAttempts);
            lock.unlock();
            std::this_thread::sleep_for(std::chrono::milliseconds(25 * job.attempts));
            lock.lock();
            m_queue.push_front(std::move(job));
            m_busy = false;
            continue;
        }

        m_busy = false;
        if (ok) {
            ++m_applied;
        } else {
            ++m_failed;
            LOG_WARN(nrStore, "%s job dropped after %d attempt(s)",
                     qUtf8Printable(job.kind), job.attempts);
        }

        if (m_queue.empty()) {
            m_idleCv.notify_all();
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_idleCv.notify_all();
    }
    LOG_INFO(nrStore, "WriteQueue writer loop exited");
}

bool WriteQueue::waitUntilIdle(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return (m_queue.empty() && !m_busy) || !m_running.load();
    });
}

// ── Shutdown ────────────────────────────────────────────────

void WriteQueue::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown && !m_thread.joinable()) {
            return;
        }
        m_shutdown = true;
        LOG_INFO(nrStore, "WriteQueue shutting down (depth=%d, applied=%d, dropped=%d)",
                 static_cast<int>(m_queue.size()), static_cast<int>(m_applied),
                 static_cast<int>(m_dropped));
        m_cv.notify_all();
    }

    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running.store(false);
    m_store.reset();
}

WriteQueueStats WriteQueue::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    WriteQueueStats s;
    s.depth = m_queue.size();
    s.applied = m_applied;
    s.failed = m_failed;
    s.retried = m_retried;
    s.dropped = m_dropped;
    s.duplicates = m_duplicates;
    s.running = m_running.load();
    return s;
}

} // namespace nr
