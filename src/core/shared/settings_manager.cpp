#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <cmath>

namespace nr {

namespace {

constexpr double kWeightSumTolerance = 1e-6;

QJsonObject rankWeightsToJson(const RankWeights& weights)
{
    QJsonObject json;
    json.insert(QStringLiteral("importance"), weights.importance);
    json.insert(QStringLiteral("recency"), weights.recency);
    json.insert(QStringLiteral("personalized"), weights.personalized);
    json.insert(QStringLiteral("novelty"), weights.novelty);
    json.insert(QStringLiteral("importanceScale"), weights.importanceScale);
    return json;
}

RankWeights rankWeightsFromJson(const QJsonObject& json)
{
    const RankWeights defaults;
    RankWeights weights;
    weights.importance = json.value(QStringLiteral("importance")).toDouble(defaults.importance);
    weights.recency = json.value(QStringLiteral("recency")).toDouble(defaults.recency);
    weights.personalized = json.value(QStringLiteral("personalized")).toDouble(defaults.personalized);
    weights.novelty = json.value(QStringLiteral("novelty")).toDouble(defaults.novelty);
    weights.importanceScale =
        json.value(QStringLiteral("importanceScale")).toDouble(defaults.importanceScale);

    if (std::abs(weights.sum() - 1.0) > kWeightSumTolerance) {
        LOG_WARN(nrCore, "Rank weights sum to %.4f instead of 1, using defaults", weights.sum());
        return defaults;
    }
    if (weights.importanceScale <= 0.0) {
        LOG_WARN(nrCore, "importanceScale must be positive, using %.1f",
                 defaults.importanceScale);
        weights.importanceScale = defaults.importanceScale;
    }
    return weights;
}

QJsonObject personalizationToJson(const PersonalizationWeights& weights)
{
    QJsonObject json;
    json.insert(QStringLiteral("tickerMatchBoost"), weights.tickerMatchBoost);
    json.insert(QStringLiteral("keywordBoost"), weights.keywordBoost);
    json.insert(QStringLiteral("keywordMaxContribution"), weights.keywordMaxContribution);
    json.insert(QStringLiteral("clickMinWeight"), weights.clickMinWeight);
    json.insert(QStringLiteral("clickMaxWeight"), weights.clickMaxWeight);
    json.insert(QStringLiteral("topicMaxWeight"), weights.topicMaxWeight);
    json.insert(QStringLiteral("clickHistoryDays"), weights.clickHistoryDays);
    return json;
}

PersonalizationWeights personalizationFromJson(const QJsonObject& json)
{
    PersonalizationWeights weights;
    weights.tickerMatchBoost =
        json.value(QStringLiteral("tickerMatchBoost")).toDouble(weights.tickerMatchBoost);
    weights.keywordBoost = json.value(QStringLiteral("keywordBoost")).toDouble(weights.keywordBoost);
    weights.keywordMaxContribution = json.value(QStringLiteral("keywordMaxContribution"))
                                         .toDouble(weights.keywordMaxContribution);
    weights.clickMinWeight =
        json.value(QStringLiteral("clickMinWeight")).toDouble(weights.clickMinWeight);
    weights.clickMaxWeight =
        json.value(QStringLiteral("clickMaxWeight")).toDouble(weights.clickMaxWeight);
    weights.topicMaxWeight =
        json.value(QStringLiteral("topicMaxWeight")).toDouble(weights.topicMaxWeight);
    weights.clickHistoryDays =
        json.value(QStringLiteral("clickHistoryDays")).toInt(weights.clickHistoryDays);

    if (weights.clickMinWeight > weights.clickMaxWeight) {
        LOG_WARN(nrCore, "clickMinWeight %.2f exceeds clickMaxWeight %.2f, swapping",
                 weights.clickMinWeight, weights.clickMaxWeight);
        std::swap(weights.clickMinWeight, weights.clickMaxWeight);
    }
    return weights;
}

} // namespace

std::optional<EngineSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(nrCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(nrCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

EngineSettings SettingsManager::loadOrDefault(const QString& filePath)
{
    std::optional<EngineSettings> loaded = load(filePath);
    if (!loaded) {
        LOG_INFO(nrCore, "Using default engine settings (no usable file at %s)",
                 qUtf8Printable(filePath));
        EngineSettings defaults;
        defaults.databasePath = defaultDatabasePath();
        return defaults;
    }
    if (loaded->databasePath.isEmpty()) {
        loaded->databasePath = defaultDatabasePath();
    }
    return *loaded;
}

bool SettingsManager::save(const QString& filePath, const EngineSettings& settings)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(nrCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(nrCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(nrCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }
    return true;
}

QString SettingsManager::defaultSettingsPath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/newsrank/engine.json");
}

QString SettingsManager::defaultDatabasePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/newsrank/newsrank.db");
}

QJsonObject SettingsManager::toJson(const EngineSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("databasePath"), settings.databasePath);
    json.insert(QStringLiteral("epsilon"), settings.epsilon);
    json.insert(QStringLiteral("selector"), settings.selector);
    json.insert(QStringLiteral("thompsonAlpha"), settings.thompsonAlpha);
    json.insert(QStringLiteral("thompsonBeta"), settings.thompsonBeta);
    json.insert(QStringLiteral("selectorSocketPath"), settings.selectorSocketPath);
    json.insert(QStringLiteral("selectorTimeoutMs"), settings.selectorTimeoutMs);
    json.insert(QStringLiteral("defaultLimit"), settings.defaultLimit);
    json.insert(QStringLiteral("diverseArmLambda"), settings.diverseArmLambda);
    json.insert(QStringLiteral("embeddingLookupBudgetMs"), settings.embeddingLookupBudgetMs);
    json.insert(QStringLiteral("breakerFailureThreshold"), settings.breakerFailureThreshold);
    json.insert(QStringLiteral("breakerHalfOpenDelayMs"), settings.breakerHalfOpenDelayMs);
    json.insert(QStringLiteral("assignmentCacheTtlSeconds"), settings.assignmentCacheTtlSeconds);
    json.insert(QStringLiteral("assignmentCacheMaxEntries"), settings.assignmentCacheMaxEntries);
    json.insert(QStringLiteral("defaultTopicCap"), settings.defaultTopicCap);
    json.insert(QStringLiteral("rankWeights"), rankWeightsToJson(settings.rankWeights));
    json.insert(QStringLiteral("personalization"), personalizationToJson(settings.personalization));
    json.insert(QStringLiteral("aggregationIntervalMs"), settings.aggregationIntervalMs);
    json.insert(QStringLiteral("autoStopIntervalMs"), settings.autoStopIntervalMs);
    json.insert(QStringLiteral("autoStopWindowDays"), settings.autoStopWindowDays);
    json.insert(QStringLiteral("autoStopConsecutiveDays"), settings.autoStopConsecutiveDays);
    return json;
}

EngineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    EngineSettings settings;

    settings.databasePath = json.value(QStringLiteral("databasePath")).toString(settings.databasePath);

    const double epsilon = json.value(QStringLiteral("epsilon")).toDouble(settings.epsilon);
    if (epsilon < 0.0 || epsilon > 1.0) {
        LOG_WARN(nrCore, "epsilon %.3f outside [0,1], using %.2f", epsilon, settings.epsilon);
    } else {
        settings.epsilon = epsilon;
    }

    const QString selector = json.value(QStringLiteral("selector")).toString(settings.selector);
    if (selector == QLatin1String("local") || selector == QLatin1String("ucb1")
        || selector == QLatin1String("thompson") || selector == QLatin1String("remote")) {
        settings.selector = selector;
    } else {
        LOG_WARN(nrCore, "Unknown selector '%s', using local", qUtf8Printable(selector));
    }
    const double alpha = json.value(QStringLiteral("thompsonAlpha")).toDouble(settings.thompsonAlpha);
    const double beta = json.value(QStringLiteral("thompsonBeta")).toDouble(settings.thompsonBeta);
    if (alpha > 0.0 && beta > 0.0) {
        settings.thompsonAlpha = alpha;
        settings.thompsonBeta = beta;
    } else {
        LOG_WARN(nrCore, "Thompson prior (%.3f, %.3f) must be positive, using (1, 1)", alpha, beta);
    }
    settings.selectorSocketPath =
        json.value(QStringLiteral("selectorSocketPath")).toString(settings.selectorSocketPath);
    settings.selectorTimeoutMs =
        json.value(QStringLiteral("selectorTimeoutMs")).toInt(settings.selectorTimeoutMs);
    settings.defaultLimit = json.value(QStringLiteral("defaultLimit")).toInt(settings.defaultLimit);
    settings.diverseArmLambda =
        json.value(QStringLiteral("diverseArmLambda")).toDouble(settings.diverseArmLambda);

    settings.embeddingLookupBudgetMs = json.value(QStringLiteral("embeddingLookupBudgetMs"))
                                           .toInt(settings.embeddingLookupBudgetMs);
    settings.breakerFailureThreshold = json.value(QStringLiteral("breakerFailureThreshold"))
                                           .toInt(settings.breakerFailureThreshold);
    settings.breakerHalfOpenDelayMs = json.value(QStringLiteral("breakerHalfOpenDelayMs"))
                                          .toInt(settings.breakerHalfOpenDelayMs);

    settings.assignmentCacheTtlSeconds = json.value(QStringLiteral("assignmentCacheTtlSeconds"))
                                             .toInt(settings.assignmentCacheTtlSeconds);
    settings.assignmentCacheMaxEntries = json.value(QStringLiteral("assignmentCacheMaxEntries"))
                                             .toInt(settings.assignmentCacheMaxEntries);

    settings.defaultTopicCap =
        json.value(QStringLiteral("defaultTopicCap")).toInt(settings.defaultTopicCap);
    if (json.contains(QStringLiteral("rankWeights"))) {
        settings.rankWeights = rankWeightsFromJson(json.value(QStringLiteral("rankWeights")).toObject());
    }
    if (json.contains(QStringLiteral("personalization"))) {
        settings.personalization =
            personalizationFromJson(json.value(QStringLiteral("personalization")).toObject());
    }

    settings.aggregationIntervalMs = json.value(QStringLiteral("aggregationIntervalMs"))
                                         .toInt(settings.aggregationIntervalMs);
    settings.autoStopIntervalMs =
        json.value(QStringLiteral("autoStopIntervalMs")).toInt(settings.autoStopIntervalMs);
    settings.autoStopWindowDays =
        json.value(QStringLiteral("autoStopWindowDays")).toInt(settings.autoStopWindowDays);
    settings.autoStopConsecutiveDays = json.value(QStringLiteral("autoStopConsecutiveDays"))
                                           .toInt(settings.autoStopConsecutiveDays);

    return settings;
}

} // namespace nr
