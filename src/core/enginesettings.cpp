module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

module reel.core.enginesettings;

import reel.utils.download_utils;

namespace utils = reel::utils;

namespace {

void readString(const QJsonObject& obj, const char* key, QString& out)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined()) return;
    if (!v.isString()) {
        qWarning() << "Setting" << key << "must be a string, ignoring";
        return;
    }
    out = v.toString();
}

void readBool(const QJsonObject& obj, const char* key, bool& out)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined()) return;
    if (!v.isBool()) {
        qWarning() << "Setting" << key << "must be a boolean, ignoring";
        return;
    }
    out = v.toBool();
}

template <typename T>
void readNumber(const QJsonObject& obj, const char* key, T& out, T minimum)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined()) return;
    if (!v.isDouble()) {
        qWarning() << "Setting" << key << "must be a number, ignoring";
        return;
    }
    out = qMax(minimum, static_cast<T>(v.toDouble()));
}

} // namespace

EngineSettings defaultEngineSettings()
{
    EngineSettings settings;
    settings.outputPath = QDir::current().filePath(QStringLiteral("downloads"));
    return settings;
}

EngineSettings settingsFromJson(const QJsonObject& object, const EngineSettings& base)
{
    EngineSettings s = base;
    readString(object, "downloaderPath", s.downloaderPath);
    readString(object, "outputPath", s.outputPath);
    readString(object, "fileNamingTemplate", s.fileNamingTemplate);
    readString(object, "defaultQuality", s.defaultQuality);
    readNumber(object, "maxConcurrentDownloads", s.maxConcurrentDownloads, 1);
    readNumber<qint64>(object, "downloadSpeedLimit", s.downloadSpeedLimit, 0);
    readString(object, "customYtDlpArgs", s.customYtDlpArgs);
    readString(object, "audioFormat", s.audioFormat);

    readBool(object, "keepOriginalFiles", s.keepOriginalFiles);
    readBool(object, "writeSubtitles", s.writeSubtitles);
    readBool(object, "embedSubtitles", s.embedSubtitles);
    readBool(object, "writeThumbnail", s.writeThumbnail);
    readBool(object, "writeDescription", s.writeDescription);
    readBool(object, "writeInfoJson", s.writeInfoJson);
    readBool(object, "autoStartDownloads", s.autoStartDownloads);
    readBool(object, "fetchMetadata", s.fetchMetadata);

    readNumber(object, "queueAdmitDelayMs", s.queueAdmitDelayMs, 0);
    readNumber(object, "queueBackoffMs", s.queueBackoffMs, 0);
    readNumber(object, "exitRequeueDelayMs", s.exitRequeueDelayMs, 0);
    readNumber(object, "batchIntervalMs", s.batchIntervalMs, 0);
    readNumber(object, "batchMaxItems", s.batchMaxItems, 1);

    readString(object, "logLevel", s.logLevel);

    s.outputPath = utils::normalizeFilePath(s.outputPath);
    if (s.downloaderPath.trimmed().isEmpty()) {
        qWarning() << "Setting downloaderPath is empty, using yt-dlp";
        s.downloaderPath = QStringLiteral("yt-dlp");
    }
    return s;
}

QJsonObject settingsToJson(const EngineSettings& s)
{
    QJsonObject obj;
    obj.insert("downloaderPath", s.downloaderPath);
    obj.insert("outputPath", s.outputPath);
    obj.insert("fileNamingTemplate", s.fileNamingTemplate);
    obj.insert("defaultQuality", s.defaultQuality);
    obj.insert("maxConcurrentDownloads", s.maxConcurrentDownloads);
    obj.insert("downloadSpeedLimit", static_cast<double>(s.downloadSpeedLimit));
    obj.insert("customYtDlpArgs", s.customYtDlpArgs);
    obj.insert("audioFormat", s.audioFormat);
    obj.insert("keepOriginalFiles", s.keepOriginalFiles);
    obj.insert("writeSubtitles", s.writeSubtitles);
    obj.insert("embedSubtitles", s.embedSubtitles);
    obj.insert("writeThumbnail", s.writeThumbnail);
    obj.insert("writeDescription", s.writeDescription);
    obj.insert("writeInfoJson", s.writeInfoJson);
    obj.insert("autoStartDownloads", s.autoStartDownloads);
    obj.insert("fetchMetadata", s.fetchMetadata);
    obj.insert("queueAdmitDelayMs", s.queueAdmitDelayMs);
    obj.insert("queueBackoffMs", s.queueBackoffMs);
    obj.insert("exitRequeueDelayMs", s.exitRequeueDelayMs);
    obj.insert("batchIntervalMs", s.batchIntervalMs);
    obj.insert("batchMaxItems", s.batchMaxItems);
    obj.insert("logLevel", s.logLevel);
    return obj;
}

bool loadSettingsFile(const QString& path, EngineSettings& settings, QString* errorMessage)
{
    const QString filePath = utils::normalizeFilePath(path);
    QFile file(filePath);
    if (!file.exists()) {
        if (errorMessage) *errorMessage = QStringLiteral("Config file not found: %1").arg(filePath);
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) *errorMessage = QStringLiteral("Cannot read config file %1: %2").arg(filePath, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) *errorMessage = QStringLiteral("Invalid JSON in %1: %2").arg(filePath, parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (errorMessage) *errorMessage = QStringLiteral("Config file %1 must contain a JSON object").arg(filePath);
        return false;
    }

    settings = settingsFromJson(doc.object(), settings);
    return true;
}
