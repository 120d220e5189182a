#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>

struct sqlite3;
struct sqlite3_stmt;

namespace nr {
namespace sql {

// Runs one or more statements without results. Logs and returns false on error.
bool exec(sqlite3* db, const char* statements);

// Scoped transaction. Unless commit() succeeds, the destructor rolls back,
// including when the scope is left by an exception.
class Transaction {
public:
    explicit Transaction(sqlite3* db, const char* beginStatement = "BEGIN IMMEDIATE");
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    bool isActive() const { return m_active; }
    bool commit();

private:
    sqlite3* m_db = nullptr;
    bool m_active = false;
};

// Binding helpers. Text is copied by SQLite (SQLITE_TRANSIENT), so temporaries are safe.
void bindText(sqlite3_stmt* stmt, int index, const QString& value);
void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<QString>& value);
void bindTimestamp(sqlite3_stmt* stmt, int index, const QDateTime& value);   // NULL when invalid

QString columnText(sqlite3_stmt* stmt, int column);
std::optional<QString> columnOptionalText(sqlite3_stmt* stmt, int column);
QDateTime columnTimestamp(sqlite3_stmt* stmt, int column);                   // invalid when NULL

// String lists are stored as compact JSON arrays in TEXT columns.
QString encodeStringList(const QStringList& values);
QStringList decodeStringList(const QString& json);

int64_t toEpochMs(const QDateTime& value);
QDateTime fromEpochMs(int64_t ms);

} // namespace sql
} // namespace nr
