#pragma once

#include "core/shared/types.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

namespace nr {
namespace json {

// Timestamps travel as ISO-8601 UTC strings with milliseconds; readers also
// accept epoch milliseconds. Absent or unparseable values give an invalid
// QDateTime.
QJsonValue fromDateTime(const QDateTime& value);
QDateTime toDateTime(const QJsonValue& value);

QJsonArray fromStringList(const QStringList& values);
QStringList toStringList(const QJsonValue& value);

QJsonObject toJson(const Candidate& candidate);
std::optional<Candidate> candidateFromJson(const QJsonObject& json, QString* errorOut = nullptr);
// Stops at the first malformed entry.
std::optional<QVector<Candidate>> candidatesFromJson(const QJsonArray& array,
                                                     QString* errorOut = nullptr);

QJsonObject toJson(const RankedItem& item);

QJsonObject toJson(const UserProfile& profile);
// Starts from base and overrides only the keys present in json.
UserProfile profileFromJson(const QJsonObject& json, UserProfile base);

std::optional<ImpressionEvent> impressionFromJson(const QJsonObject& json, QString* errorOut = nullptr);
std::optional<ClickEvent> clickFromJson(const QJsonObject& json, QString* errorOut = nullptr);

QJsonObject toJson(const ExperimentDefinition& definition);
std::optional<ExperimentDefinition> experimentFromJson(const QJsonObject& json,
                                                       QString* errorOut = nullptr);

QJsonObject toJson(const ExperimentAssignment& assignment);
QJsonObject toJson(const BanditContext& context);
QJsonObject toJson(const BanditDecision& decision);
QJsonObject toJson(const DailyMetric& metric);
QJsonObject toJson(const VariantSummary& summary);
QJsonObject toJson(const ExperimentAlert& alert);

} // namespace json
} // namespace nr
