/*!
 * @file        metadata_probe.cppm
 * @brief       Media metadata and downloader availability probing.
 * @details     Runs the downloader in JSON dump mode to learn the title,
 *              duration, uploader and thumbnail of a URL, or the entries of a
 *              playlist. Results are cached per URL for a short time.
 *
 *              Also checks whether the downloader binary can be executed and
 *              reports its version.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module reel.services.metadata_probe;
import reel.core.downloadjob;
import reel.core.downloaderprocess;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Asynchronous metadata lookups through the downloader.
 */
REEL_MODULE_EXPORT class MetadataProbe : public QObject {

    Q_OBJECT

public:
    //!< @brief Receives the metadata, or nullopt and a reason.
    using MetadataCallback = std::function<void(const std::optional<MediaMetadata>& metadata, const QString& error)>;

    //!< @brief Receives availability and the reported version.
    using AvailabilityCallback = std::function<void(bool available, const QString& version)>;

    /**
     * @brief Construct a probe.
     * @param downloaderPath Downloader executable.
     * @param factory Process factory.
     * @param parent Optional parent QObject.
     */
    explicit MetadataProbe(const QString& downloaderPath,
                           DownloaderProcessFactory factory = defaultProcessFactory(),
                           QObject* parent = nullptr);

    //!< @brief Change the downloader executable.
    void setDownloaderPath(const QString& path) { m_downloaderPath = path; }

    /**
     * @brief Fetch metadata for a URL.
     *
     * Served from the cache when a fresh entry exists. Playlist URLs are
     * expanded into entries, and a failed playlist probe is retried once
     * with errors ignored.
     *
     * @param url Media or playlist URL.
     * @param callback Result receiver, always invoked exactly once.
     */
    void fetch(const QString& url, MetadataCallback callback);

    /**
     * @brief Check that the downloader can be executed.
     * @param callback Result receiver, always invoked exactly once.
     */
    void checkAvailability(AvailabilityCallback callback);

    //!< @brief Cache lifetime in milliseconds.
    void setCacheTtl(qint64 ms) { m_cacheTtlMs = ms; }

    //!< @brief Drop every cached entry.
    void clearCache() { m_cache.clear(); }

    //!< @brief Number of cached URLs.
    int cacheSize() const { return static_cast<int>(m_cache.size()); }

    //!< @brief True for URLs that name a playlist.
    static bool looksLikePlaylist(const QString& url);

    /**
     * @brief Arguments of a metadata probe.
     * @param url Target URL.
     * @param playlist Expand playlist entries.
     * @param ignoreErrors Continue past failing entries.
     * @return Argument vector, URL last.
     */
    static QStringList buildProbeArguments(const QString& url, bool playlist, bool ignoreErrors);

    /**
     * @brief Interpret the JSON lines printed by a probe.
     * @param lines Standard output lines.
     * @param playlist Treat the output as playlist entries.
     * @return Metadata, or nullopt when no JSON object was found.
     */
    static std::optional<MediaMetadata> parseDumpJson(const QStringList& lines, bool playlist);

    /**
     * @brief Convert one playlist JSON object into an entry.
     * @param object Object printed by the downloader.
     * @return Playlist entry.
     */
    static PlaylistEntry entryFromJson(const QJsonObject& object);

private:
    /**
     * @brief Spawn one probe process.
     * @param url Target URL.
     * @param playlist Expand playlist entries.
     * @param ignoreErrors Continue past failing entries.
     * @param callback Result receiver.
     */
    void runProbe(const QString& url, bool playlist, bool ignoreErrors, MetadataCallback callback);

    //!< @brief Store a result after dropping every expired entry.
    void storeInCache(const QString& url, const MediaMetadata& metadata);

    struct CacheEntry {
        MediaMetadata metadata;     //!< Cached result.
        QDateTime fetchedAt;        //!< Time of the probe.
    };

    QString m_downloaderPath;                   //!< Downloader executable.
    DownloaderProcessFactory m_factory;         //!< Process factory.
    QHash<QString, CacheEntry> m_cache;         //!< Results per URL.
    qint64 m_cacheTtlMs = 5 * 60 * 1000;        //!< Cache lifetime.
};

#include "metadata_probe.moc"
