#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace ul {

namespace {

int readInt(const QJsonObject& json, const QString& key, int fallback)
{
    if (!json.contains(key)) {
        return fallback;
    }
    return json.value(key).toVariant().toInt();
}

double readDouble(const QJsonObject& json, const QString& key, double fallback)
{
    return json.value(key).toDouble(fallback);
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(ulCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(ulCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(ulCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(ulCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(ulCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

Settings SettingsManager::defaults()
{
    Settings settings;
    settings.indexPath = defaultIndexPath();
    return settings;
}

QString SettingsManager::defaultSettingsPath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/urbanlex/settings.json");
}

QString SettingsManager::defaultIndexPath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/urbanlex/index");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("indexPath"), settings.indexPath);
    json.insert(QStringLiteral("embeddingModelId"), settings.embeddingModelId);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("chunkSize"), settings.chunkSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("articleOverflowFactor"), settings.articleOverflowFactor);
    json.insert(QStringLiteral("upsertBatchSize"), settings.upsertBatchSize);
    json.insert(QStringLiteral("topK"), settings.topK);
    json.insert(QStringLiteral("scoreThreshold"), settings.scoreThreshold);
    json.insert(QStringLiteral("rerank"), settings.rerank);
    json.insert(QStringLiteral("hybridSearch"), settings.hybridSearch);
    json.insert(QStringLiteral("keywordWeight"), settings.keywordWeight);
    json.insert(QStringLiteral("tierTimeoutMs"), settings.tierTimeoutMs);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings = defaults();

    settings.indexPath = json.value(QStringLiteral("indexPath")).toString(settings.indexPath);
    settings.embeddingModelId = json.value(QStringLiteral("embeddingModelId"))
                                    .toString(settings.embeddingModelId);
    settings.embeddingDimensions = readInt(json, QStringLiteral("embeddingDimensions"),
                                           settings.embeddingDimensions);
    settings.chunkSize = readInt(json, QStringLiteral("chunkSize"), settings.chunkSize);
    settings.chunkOverlap = readInt(json, QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    settings.articleOverflowFactor = readDouble(json, QStringLiteral("articleOverflowFactor"),
                                                settings.articleOverflowFactor);
    settings.upsertBatchSize = readInt(json, QStringLiteral("upsertBatchSize"),
                                       settings.upsertBatchSize);
    settings.topK = readInt(json, QStringLiteral("topK"), settings.topK);
    settings.scoreThreshold = readDouble(json, QStringLiteral("scoreThreshold"),
                                         settings.scoreThreshold);
    settings.rerank = json.value(QStringLiteral("rerank")).toBool(settings.rerank);
    settings.hybridSearch = json.value(QStringLiteral("hybridSearch")).toBool(settings.hybridSearch);
    settings.keywordWeight = readDouble(json, QStringLiteral("keywordWeight"),
                                        settings.keywordWeight);
    settings.tierTimeoutMs = readInt(json, QStringLiteral("tierTimeoutMs"), settings.tierTimeoutMs);

    return settings;
}

} // namespace ul
