#pragma once

#include "core/store/sqlite_store.h"

#include <QSet>
#include <QString>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

struct sqlite3;

namespace nr {

// One fire-and-forget write, applied on the writer thread's own connection.
struct WriteJob {
    QString kind;                               // for logging: "impressions", "click", "reward"
    QString dedupKey;                           // empty = never suppressed
    std::function<bool(sqlite3* db)> apply;     // false = failed, retried
    int attempts = 0;
};

struct WriteQueueStats {
    size_t depth = 0;
    size_t applied = 0;
    size_t failed = 0;
    size_t retried = 0;
    size_t dropped = 0;
    size_t duplicates = 0;
    bool running = false;
};

// WriteQueue -- single background writer for impressions, clicks and rewards.
//
// submit() never blocks on I/O. Jobs are applied in order on a dedicated
// thread with its own SQLite connection; a failing job is retried up to
// kMaxAttempts times (at-least-once) and then dropped with a warning. Jobs
// carrying a dedupKey already seen within the last kDedupWindow keys are
// suppressed. When MAX_QUEUE_SIZE jobs are pending new jobs are refused.
class WriteQueue {
public:
    static constexpr size_t MAX_QUEUE_SIZE = 10000;
    static constexpr int kMaxAttempts = 3;
    static constexpr size_t kDedupWindow = 4096;

    explicit WriteQueue(QString dbPath);
    ~WriteQueue();

    // Non-copyable, non-movable
    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;
    WriteQueue(WriteQueue&&) = delete;
    WriteQueue& operator=(WriteQueue&&) = delete;

    // Opens the writer connection and starts the thread.
    bool start();

    // Returns false if the job was refused (queue full, stopped, duplicate).
    bool submit(WriteJob job);

    // Blocks until every accepted job has been applied or dropped.
    bool waitUntilIdle(int timeoutMs);

    // Applies what is still queued, then stops the thread.
    void shutdown();

    WriteQueueStats stats() const;

private:
    void writerLoop();
    bool rememberKey(const QString& key);

    QString m_dbPath;
    std::optional<SQLiteStore> m_store;
    std::thread m_thread;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<WriteJob> m_queue;
    std::deque<QString> m_recentKeys;
    QSet<QString> m_recentKeySet;
    bool m_shutdown = false;
    bool m_busy = false;

    std::atomic<bool> m_running{false};
    size_t m_applied = 0;
    size_t m_failed = 0;
    size_t m_retried = 0;
    size_t m_dropped = 0;
    size_t m_duplicates = 0;
};

} // namespace nr
