#include "core/shared/json_codec.h"

namespace nr {
namespace json {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

std::optional<QString> optionalString(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isString() || value.toString().isEmpty()) {
        return std::nullopt;
    }
    return value.toString();
}

QJsonValue fromOptional(const std::optional<QString>& value)
{
    return value.has_value() ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

} // namespace

QJsonValue fromDateTime(const QDateTime& value)
{
    if (!value.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return value.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime toDateTime(const QJsonValue& value)
{
    if (value.isDouble()) {
        return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(value.toDouble())).toUTC();
    }
    if (value.isString()) {
        const QDateTime parsed = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
        return parsed.isValid() ? parsed.toUTC() : QDateTime();
    }
    return {};
}

QJsonArray fromStringList(const QStringList& values)
{
    return QJsonArray::fromStringList(values);
}

QStringList toStringList(const QJsonValue& value)
{
    QStringList result;
    for (const QJsonValue& entry : value.toArray()) {
        if (entry.isString()) {
            result.append(entry.toString());
        }
    }
    return result;
}

// ── Candidates ──────────────────────────────────────────────

QJsonObject toJson(const Candidate& candidate)
{
    QJsonObject json;
    json[QStringLiteral("id")] = candidate.id;
    json[QStringLiteral("importanceScore")] = candidate.importanceScore;
    json[QStringLiteral("publishedAt")] = fromDateTime(candidate.publishedAt);
    json[QStringLiteral("topicId")] = fromOptional(candidate.topicId);
    json[QStringLiteral("embeddingRef")] = fromOptional(candidate.embeddingRef);
    json[QStringLiteral("title")] = candidate.title;
    json[QStringLiteral("body")] = candidate.body;
    json[QStringLiteral("tickers")] = fromStringList(candidate.tickers);
    return json;
}

std::optional<Candidate> candidateFromJson(const QJsonObject& json, QString* errorOut)
{
    Candidate candidate;
    candidate.id = json.value(QStringLiteral("id")).toString();
    if (candidate.id.isEmpty()) {
        setError(errorOut, QStringLiteral("Candidate is missing 'id'"));
        return std::nullopt;
    }
    candidate.importanceScore = json.value(QStringLiteral("importanceScore")).toDouble();
    candidate.publishedAt = toDateTime(json.value(QStringLiteral("publishedAt")));
    candidate.topicId = optionalString(json, QStringLiteral("topicId"));
    candidate.embeddingRef = optionalString(json, QStringLiteral("embeddingRef"));
    candidate.title = json.value(QStringLiteral("title")).toString();
    candidate.body = json.value(QStringLiteral("body")).toString();
    candidate.tickers = toStringList(json.value(QStringLiteral("tickers")));
    return candidate;
}

std::optional<QVector<Candidate>> candidatesFromJson(const QJsonArray& array, QString* errorOut)
{
    QVector<Candidate> candidates;
    candidates.reserve(array.size());
    for (int i = 0; i < array.size(); ++i) {
        QString error;
        auto candidate = candidateFromJson(array.at(i).toObject(), &error);
        if (!candidate) {
            setError(errorOut, QStringLiteral("candidates[%1]: %2").arg(i).arg(error));
            return std::nullopt;
        }
        candidates.append(std::move(*candidate));
    }
    return candidates;
}

QJsonObject toJson(const RankedItem& item)
{
    QJsonObject json = toJson(item.candidate);
    json[QStringLiteral("rankScore")] = item.rankScore;
    json[QStringLiteral("personalizedRelevance")] = item.personalizedRelevance;
    json[QStringLiteral("selectedVariant")] = item.selectedVariant;
    json[QStringLiteral("isPersonalized")] = item.personalized;
    json[QStringLiteral("diversityApplied")] = item.diversityApplied;
    return json;
}

// ── Profiles and events ─────────────────────────────────────

QJsonObject toJson(const UserProfile& profile)
{
    QJsonObject json;
    json[QStringLiteral("subjectId")] = profile.subjectId;
    json[QStringLiteral("interestedTickers")] = fromStringList(profile.interestedTickers);
    json[QStringLiteral("interestedKeywords")] = fromStringList(profile.interestedKeywords);
    json[QStringLiteral("diversityWeight")] = profile.diversityWeight;
    json[QStringLiteral("personalizationEnabled")] = profile.personalizationEnabled;
    json[QStringLiteral("active")] = profile.active;
    json[QStringLiteral("updatedAt")] = fromDateTime(profile.updatedAt);
    return json;
}

UserProfile profileFromJson(const QJsonObject& json, UserProfile base)
{
    if (json.contains(QStringLiteral("interestedTickers"))) {
        base.interestedTickers = toStringList(json.value(QStringLiteral("interestedTickers")));
    }
    if (json.contains(QStringLiteral("interestedKeywords"))) {
        base.interestedKeywords = toStringList(json.value(QStringLiteral("interestedKeywords")));
    }
    if (json.contains(QStringLiteral("diversityWeight"))) {
        base.diversityWeight = json.value(QStringLiteral("diversityWeight")).toDouble(base.diversityWeight);
    }
    if (json.contains(QStringLiteral("personalizationEnabled"))) {
        base.personalizationEnabled = json.value(QStringLiteral("personalizationEnabled")).toBool();
    }
    return base;
}

std::optional<ImpressionEvent> impressionFromJson(const QJsonObject& json, QString* errorOut)
{
    ImpressionEvent event;
    event.subjectId = json.value(QStringLiteral("subjectId")).toString();
    event.itemId = json.value(QStringLiteral("itemId")).toString();
    if (event.subjectId.isEmpty() || event.itemId.isEmpty()) {
        setError(errorOut, QStringLiteral("Impression needs 'subjectId' and 'itemId'"));
        return std::nullopt;
    }
    event.sessionId = json.value(QStringLiteral("sessionId")).toString();
    event.pageType = json.value(QStringLiteral("pageType")).toString();
    event.position = json.value(QStringLiteral("position")).toInt();
    event.experimentKey = json.value(QStringLiteral("experimentKey")).toString();
    event.variant = json.value(QStringLiteral("variant")).toString();
    event.importanceScore = json.value(QStringLiteral("importanceScore")).toDouble();
    event.rankScore = json.value(QStringLiteral("rankScore")).toDouble();
    event.personalized = json.value(QStringLiteral("isPersonalized")).toBool();
    event.diversityApplied = json.value(QStringLiteral("diversityApplied")).toBool();
    event.timestamp = toDateTime(json.value(QStringLiteral("timestamp")));
    return event;
}

std::optional<ClickEvent> clickFromJson(const QJsonObject& json, QString* errorOut)
{
    ClickEvent event;
    event.subjectId = json.value(QStringLiteral("subjectId")).toString();
    event.itemId = json.value(QStringLiteral("itemId")).toString();
    if (event.subjectId.isEmpty() || event.itemId.isEmpty()) {
        setError(errorOut, QStringLiteral("Click needs 'subjectId' and 'itemId'"));
        return std::nullopt;
    }
    event.sessionId = json.value(QStringLiteral("sessionId")).toString();
    event.position = json.value(QStringLiteral("position")).toInt();
    event.experimentKey = json.value(QStringLiteral("experimentKey")).toString();
    event.variant = json.value(QStringLiteral("variant")).toString();
    const QJsonValue dwell = json.value(QStringLiteral("dwellTimeMs"));
    if (dwell.isDouble()) {
        event.dwellTimeMs = static_cast<int64_t>(dwell.toDouble());
    }
    event.itemTickers = toStringList(json.value(QStringLiteral("itemTickers")));
    event.topicId = optionalString(json, QStringLiteral("topicId"));
    event.timestamp = toDateTime(json.value(QStringLiteral("timestamp")));
    return event;
}

// ── Experiments ─────────────────────────────────────────────

QJsonObject toJson(const ExperimentDefinition& definition)
{
    QJsonArray variants;
    for (const VariantAllocation& variant : definition.orderedVariants) {
        variants.append(QJsonObject{
            {QStringLiteral("name"), variant.name},
            {QStringLiteral("percentage"), variant.percentage},
        });
    }

    QJsonObject json;
    json[QStringLiteral("key")] = definition.key;
    json[QStringLiteral("name")] = definition.name;
    json[QStringLiteral("description")] = definition.description;
    json[QStringLiteral("variants")] = variants;
    json[QStringLiteral("startAt")] = fromDateTime(definition.startAt);
    json[QStringLiteral("endAt")] = fromDateTime(definition.endAt);
    json[QStringLiteral("isActive")] = definition.isActive;
    json[QStringLiteral("autoStopEnabled")] = definition.autoStopEnabled;
    json[QStringLiteral("autoStopThreshold")] = definition.autoStopThreshold;
    json[QStringLiteral("minSampleSize")] = static_cast<qint64>(definition.minSampleSize);
    json[QStringLiteral("stopReason")] = definition.stopReason;
    json[QStringLiteral("createdAt")] = fromDateTime(definition.createdAt);
    json[QStringLiteral("updatedAt")] = fromDateTime(definition.updatedAt);
    return json;
}

std::optional<ExperimentDefinition> experimentFromJson(const QJsonObject& json, QString* errorOut)
{
    ExperimentDefinition definition;
    definition.key = json.value(QStringLiteral("key")).toString();
    if (definition.key.isEmpty()) {
        setError(errorOut, QStringLiteral("Missing 'key' parameter"));
        return std::nullopt;
    }

    // Variants must be an ordered array; an object has no stable order.
    const QJsonValue variants = json.value(QStringLiteral("variants"));
    if (!variants.isArray()) {
        setError(errorOut, QStringLiteral("'variants' must be an ordered array of {name, percentage}"));
        return std::nullopt;
    }
    for (const QJsonValue& entry : variants.toArray()) {
        const QJsonObject variant = entry.toObject();
        VariantAllocation allocation;
        allocation.name = variant.value(QStringLiteral("name")).toString();
        allocation.percentage = variant.value(QStringLiteral("percentage")).toInt(-1);
        definition.orderedVariants.append(allocation);
    }

    definition.name = json.value(QStringLiteral("name")).toString(definition.key);
    definition.description = json.value(QStringLiteral("description")).toString();
    definition.startAt = toDateTime(json.value(QStringLiteral("startAt")));
    definition.endAt = toDateTime(json.value(QStringLiteral("endAt")));
    definition.isActive = json.value(QStringLiteral("isActive")).toBool(false);
    definition.autoStopEnabled = json.value(QStringLiteral("autoStopEnabled")).toBool(true);
    definition.autoStopThreshold =
        json.value(QStringLiteral("autoStopThreshold")).toDouble(definition.autoStopThreshold);
    definition.minSampleSize = static_cast<int64_t>(
        json.value(QStringLiteral("minSampleSize")).toDouble(static_cast<double>(definition.minSampleSize)));
    return definition;
}

QJsonObject toJson(const ExperimentAssignment& assignment)
{
    QJsonObject json;
    json[QStringLiteral("subjectId")] = assignment.subjectId;
    json[QStringLiteral("experimentKey")] = assignment.experimentKey;
    json[QStringLiteral("variant")] = assignment.variant;
    json[QStringLiteral("bucket")] = assignment.bucket;
    json[QStringLiteral("isActive")] = assignment.isActive;
    return json;
}

// ── Bandit ──────────────────────────────────────────────────

QJsonObject toJson(const BanditContext& context)
{
    QJsonObject json;
    json[QStringLiteral("subjectId")] = context.subjectId;
    json[QStringLiteral("timeSlot")] = context.timeSlot;
    json[QStringLiteral("category")] = context.category;
    json[QStringLiteral("experimentKey")] = context.experimentKey;
    return json;
}

QJsonObject toJson(const BanditDecision& decision)
{
    QJsonObject json;
    json[QStringLiteral("decisionId")] = decision.decisionId.has_value()
        ? QJsonValue(static_cast<qint64>(*decision.decisionId))
        : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("armId")] = decision.armId;
    json[QStringLiteral("armName")] = decision.armName;
    json[QStringLiteral("subjectId")] = decision.subjectId;
    json[QStringLiteral("context")] = toJson(decision.context);
    json[QStringLiteral("decisionValue")] = decision.decisionValue;
    json[QStringLiteral("selectionReason")] = selectionReasonToString(decision.reason);
    json[QStringLiteral("servedItemIds")] = fromStringList(decision.servedItemIds);
    json[QStringLiteral("createdAt")] = fromDateTime(decision.createdAt);
    return json;
}

// ── Metrics ─────────────────────────────────────────────────

QJsonObject toJson(const DailyMetric& metric)
{
    QJsonObject json;
    json[QStringLiteral("experimentKey")] = metric.experimentKey;
    json[QStringLiteral("variant")] = metric.variant;
    json[QStringLiteral("datePartition")] = metric.datePartition;
    json[QStringLiteral("impressions")] = static_cast<qint64>(metric.impressions);
    json[QStringLiteral("clicks")] = static_cast<qint64>(metric.clicks);
    json[QStringLiteral("uniqueUsers")] = static_cast<qint64>(metric.uniqueUsers);
    json[QStringLiteral("ctr")] = metric.ctr;
    json[QStringLiteral("avgDwellTimeMs")] = metric.avgDwellTimeMs;
    json[QStringLiteral("avgPosition")] = metric.avgPosition;
    json[QStringLiteral("hideRate")] = metric.hideRate;
    json[QStringLiteral("diversityScore")] = metric.diversityScore;
    json[QStringLiteral("personalizationScore")] = metric.personalizationScore;
    json[QStringLiteral("isFinal")] = metric.isFinal;
    json[QStringLiteral("updatedAt")] = fromDateTime(metric.updatedAt);
    return json;
}

QJsonObject toJson(const VariantSummary& summary)
{
    QJsonObject json;
    json[QStringLiteral("variant")] = summary.variant;
    json[QStringLiteral("days")] = summary.days;
    json[QStringLiteral("totalImpressions")] = static_cast<qint64>(summary.totalImpressions);
    json[QStringLiteral("totalClicks")] = static_cast<qint64>(summary.totalClicks);
    json[QStringLiteral("totalUniqueUsers")] = static_cast<qint64>(summary.totalUniqueUsers);
    json[QStringLiteral("avgCtr")] = summary.avgCtr;
    json[QStringLiteral("avgDwellTimeMs")] = summary.avgDwellTimeMs;
    json[QStringLiteral("avgPosition")] = summary.avgPosition;
    json[QStringLiteral("avgHideRate")] = summary.avgHideRate;
    json[QStringLiteral("avgDiversityScore")] = summary.avgDiversityScore;
    json[QStringLiteral("avgPersonalizationScore")] = summary.avgPersonalizationScore;
    return json;
}

QJsonObject toJson(const ExperimentAlert& alert)
{
    QJsonObject json;
    json[QStringLiteral("id")] = static_cast<qint64>(alert.id);
    json[QStringLiteral("experimentKey")] = alert.experimentKey;
    json[QStringLiteral("alertType")] = alert.alertType;
    json[QStringLiteral("controlCtr")] = alert.controlCtr;
    json[QStringLiteral("treatmentCtr")] = alert.treatmentCtr;
    json[QStringLiteral("degradation")] = alert.degradation;
    json[QStringLiteral("threshold")] = alert.threshold;
    json[QStringLiteral("degradedDates")] = fromStringList(alert.degradedDates);
    json[QStringLiteral("message")] = alert.message;
    json[QStringLiteral("resolved")] = alert.resolved;
    json[QStringLiteral("createdAt")] = fromDateTime(alert.createdAt);
    json[QStringLiteral("resolvedAt")] = fromDateTime(alert.resolvedAt);
    return json;
}

} // namespace json
} // namespace nr
