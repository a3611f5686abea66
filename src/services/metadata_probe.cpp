module;
#include <QDateTime>
#include <QDebug>
#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>
#include <optional>
#include <utility>

module reel.services.metadata_probe;

import reel.core.downloadjob;
import reel.core.downloaderprocess;

namespace {

struct ProbeOutput {
    QStringList stdoutLines;
    QString lastError;
};

} // namespace

MetadataProbe::MetadataProbe(const QString& downloaderPath, DownloaderProcessFactory factory, QObject* parent)
    : QObject(parent)
    , m_downloaderPath(downloaderPath)
    , m_factory(std::move(factory))
{
}

bool MetadataProbe::looksLikePlaylist(const QString& url)
{
    return url.contains(QLatin1String("playlist")) || url.contains(QLatin1String("list="));
}

QStringList MetadataProbe::buildProbeArguments(const QString& url, bool playlist, bool ignoreErrors)
{
    QStringList args;
    args << QStringLiteral("--dump-json");
    if (playlist) {
        args << QStringLiteral("--flat-playlist");
    } else {
        args << QStringLiteral("--no-playlist");
    }
    args << QStringLiteral("--no-warnings");
    if (ignoreErrors) args << QStringLiteral("--ignore-errors");
    args << url;
    return args;
}

PlaylistEntry MetadataProbe::entryFromJson(const QJsonObject& object)
{
    PlaylistEntry entry;
    entry.id = object.value("id").toString();
    entry.title = object.value("title").toString();
    entry.uploader = object.value("uploader").toString();
    entry.thumbnail = object.value("thumbnail").toString();
    entry.duration = object.value("duration").toDouble(0.0);
    entry.url = object.value("webpage_url").toString();
    if (entry.url.isEmpty()) entry.url = object.value("url").toString();
    return entry;
}

std::optional<MediaMetadata> MetadataProbe::parseDumpJson(const QStringList& lines, bool playlist)
{
    QList<QJsonObject> objects;
    for (const QString& line : lines) {
        const QString trimmed = line.trimmed();
        if (!trimmed.startsWith('{')) continue;
        const QJsonDocument doc = QJsonDocument::fromJson(trimmed.toUtf8());
        if (doc.isObject()) objects.append(doc.object());
    }
    if (objects.isEmpty()) return std::nullopt;

    MediaMetadata metadata;
    const QJsonObject& first = objects.first();

    if (!playlist && objects.size() == 1) {
        metadata.title = first.value("title").toString();
        metadata.uploader = first.value("uploader").toString();
        metadata.thumbnail = first.value("thumbnail").toString();
        metadata.duration = first.value("duration").toDouble(0.0);
        return metadata;
    }

    metadata.title = first.value("playlist_title").toString();
    if (metadata.title.isEmpty()) metadata.title = first.value("playlist").toString();
    if (metadata.title.isEmpty()) metadata.title = QStringLiteral("Playlist");
    metadata.uploader = first.value("playlist_uploader").toString();
    if (metadata.uploader.isEmpty()) metadata.uploader = first.value("uploader").toString();

    for (const QJsonObject& object : objects) {
        PlaylistEntry entry = entryFromJson(object);
        if (entry.url.isEmpty()) continue;
        metadata.duration += entry.duration;
        metadata.entries.append(entry);
    }
    if (metadata.entries.isEmpty()) return std::nullopt;
    return metadata;
}

void MetadataProbe::fetch(const QString& url, MetadataCallback callback)
{
    const auto it = m_cache.constFind(url);
    if (it != m_cache.constEnd()) {
        if (it->fetchedAt.msecsTo(QDateTime::currentDateTimeUtc()) < m_cacheTtlMs) {
            qDebug() << "Metadata cache hit for" << url;
            callback(it->metadata, QString());
            return;
        }
        m_cache.remove(url);
    }
    runProbe(url, looksLikePlaylist(url), false, std::move(callback));
}

void MetadataProbe::storeInCache(const QString& url, const MediaMetadata& metadata)
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (it->fetchedAt.msecsTo(now) >= m_cacheTtlMs) {
            it = m_cache.erase(it);
        } else {
            ++it;
        }
    }
    m_cache.insert(url, CacheEntry{ metadata, now });
}

void MetadataProbe::runProbe(const QString& url, bool playlist, bool ignoreErrors, MetadataCallback callback)
{
    DownloaderProcess* process = m_factory ? m_factory(this) : nullptr;
    if (!process) {
        callback(std::nullopt, QStringLiteral("No process factory"));
        return;
    }

    auto output = std::make_shared<ProbeOutput>();
    connect(process, &DownloaderProcess::standardOutputLine, this, [output](const QString& line) {
        output->stdoutLines.append(line);
    });
    connect(process, &DownloaderProcess::standardErrorLine, this, [output](const QString& line) {
        if (line.contains(QLatin1String("ERROR:"))) output->lastError = line;
    });
    connect(process, &DownloaderProcess::failedToStart, this, [process, callback](const QString& message) {
        process->deleteLater();
        qWarning() << "Metadata probe could not start:" << message;
        callback(std::nullopt, message);
    });
    connect(process, &DownloaderProcess::exited, this,
            [this, process, output, url, playlist, ignoreErrors, callback](int exitCode, bool crashed) {
        process->deleteLater();
        const std::optional<MediaMetadata> metadata = parseDumpJson(output->stdoutLines, playlist);
        const bool succeeded = !crashed && (exitCode == 0 || ignoreErrors);
        if (succeeded && metadata) {
            storeInCache(url, *metadata);
            callback(metadata, QString());
            return;
        }
        if (playlist && !ignoreErrors) {
            qInfo() << "Retrying playlist probe with errors ignored:" << url;
            runProbe(url, playlist, true, callback);
            return;
        }
        const QString reason = !output->lastError.isEmpty()
            ? classifyErrorText(output->lastError).message
            : QStringLiteral("yt-dlp exited with code %1").arg(exitCode);
        qWarning() << "Metadata probe failed for" << url << ":" << reason;
        callback(std::nullopt, reason);
    });

    qDebug() << "Probing metadata for" << url;
    process->start(m_downloaderPath, buildProbeArguments(url, playlist, ignoreErrors));
}

void MetadataProbe::checkAvailability(AvailabilityCallback callback)
{
    DownloaderProcess* process = m_factory ? m_factory(this) : nullptr;
    if (!process) {
        callback(false, QString());
        return;
    }

    auto output = std::make_shared<ProbeOutput>();
    connect(process, &DownloaderProcess::standardOutputLine, this, [output](const QString& line) {
        output->stdoutLines.append(line);
    });
    connect(process, &DownloaderProcess::failedToStart, this, [process, callback](const QString& message) {
        process->deleteLater();
        qWarning() << "Downloader is not available:" << message;
        callback(false, QString());
    });
    connect(process, &DownloaderProcess::exited, this, [process, output, callback](int exitCode, bool crashed) {
        process->deleteLater();
        const bool ok = !crashed && exitCode == 0;
        const QString version = ok && !output->stdoutLines.isEmpty() ? output->stdoutLines.first().trimmed() : QString();
        callback(ok, version);
    });

    process->start(m_downloaderPath, { QStringLiteral("--version") });
}
