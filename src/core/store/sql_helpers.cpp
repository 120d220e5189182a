#include "core/store/sql_helpers.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <sqlite3.h>

namespace nr {
namespace sql {

bool exec(sqlite3* db, const char* statements)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, statements, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_WARN(nrStore, "SQL error: %s", errMsg ? errMsg : sqlite3_errmsg(db));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

Transaction::Transaction(sqlite3* db, const char* beginStatement)
    : m_db(db)
    , m_active(db && exec(db, beginStatement))
{
}

Transaction::~Transaction()
{
    // A failed statement may already have ended the transaction.
    if (m_active && sqlite3_get_autocommit(m_db) == 0 && !exec(m_db, "ROLLBACK")) {
        LOG_ERROR(nrStore, "Rollback failed: %s", sqlite3_errmsg(m_db));
    }
}

bool Transaction::commit()
{
    if (!m_active || !exec(m_db, "COMMIT")) {
        return false;
    }
    m_active = false;
    return true;
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<QString>& value)
{
    if (value.has_value()) {
        bindText(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bindTimestamp(sqlite3_stmt* stmt, int index, const QDateTime& value)
{
    if (value.isValid()) {
        sqlite3_bind_int64(stmt, index, value.toMSecsSinceEpoch());
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

std::optional<QString> columnOptionalText(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(stmt, column);
}

QDateTime columnTimestamp(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return {};
    }
    return fromEpochMs(sqlite3_column_int64(stmt, column));
}

QString encodeStringList(const QStringList& values)
{
    return QString::fromUtf8(
        QJsonDocument(QJsonArray::fromStringList(values)).toJson(QJsonDocument::Compact));
}

QStringList decodeStringList(const QString& json)
{
    QStringList values;
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isArray()) {
        return values;
    }
    const QJsonArray array = doc.array();
    values.reserve(array.size());
    for (const QJsonValue& value : array) {
        values.append(value.toString());
    }
    return values;
}

int64_t toEpochMs(const QDateTime& value)
{
    return value.isValid() ? value.toMSecsSinceEpoch() : 0;
}

QDateTime fromEpochMs(int64_t ms)
{
    return QDateTime::fromMSecsSinceEpoch(ms).toUTC();
}

} // namespace sql
} // namespace nr
