#pragma once

#include <QString>
#include <QVector>

struct sqlite3;

namespace nr {

// Outcome of resolving one embedding reference.
struct VectorLookup {
    enum class Status {
        Found,
        NotFound,
        Unavailable,    // store unreachable, timed out, or the stored vector is malformed
    };

    Status status = Status::NotFound;
    QVector<float> vector;
};

// EmbeddingStore -- read access to precomputed item embeddings.
class EmbeddingStore {
public:
    virtual ~EmbeddingStore() = default;

    // timeoutMs < 0 waits as long as the store needs; otherwise a lookup that
    // cannot finish within timeoutMs reports Unavailable.
    virtual VectorLookup lookup(const QString& embeddingRef, int timeoutMs) = 0;
};

// SqliteEmbeddingStore -- embeddings kept as float32 BLOBs in the engine database.
class SqliteEmbeddingStore : public EmbeddingStore {
public:
    explicit SqliteEmbeddingStore(sqlite3* db);

    VectorLookup lookup(const QString& embeddingRef, int timeoutMs = -1) override;

    bool put(const QString& embeddingRef, const QVector<float>& vector);
    bool remove(const QString& embeddingRef);

private:
    sqlite3* m_db = nullptr;
};

} // namespace nr
