/*!
 * @file        enginesettings.cppm
 * @brief       Engine configuration values and JSON loading.
 * @details     Holds every tunable of the download engine: the downloader
 *              executable, output layout, feature flags forwarded to the
 *              downloader, scheduler timing, batching thresholds and log
 *              level.
 *
 *              Settings are read from an optional JSON document. Missing keys
 *              keep their defaults and keys of the wrong type are skipped with
 *              a warning.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.core.enginesettings;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Configuration of one download engine instance.
 */
REEL_MODULE_EXPORT struct EngineSettings {
    QString downloaderPath = QStringLiteral("yt-dlp");                  //!< Downloader executable.
    QString outputPath;                                                 //!< Default output directory.
    QString fileNamingTemplate = QStringLiteral("%(title)s.%(ext)s");  //!< Output template.
    QString defaultQuality = QStringLiteral("best");                    //!< Quality when none is given.
    int maxConcurrentDownloads = 3;                                     //!< Concurrency limit.
    qint64 downloadSpeedLimit = 0;                                      //!< KiB/s, 0 = unlimited.
    QString customYtDlpArgs;                                            //!< Free-form argument string.
    QString audioFormat = QStringLiteral("mp3");                        //!< Container for audio jobs.

    bool keepOriginalFiles = false;                                     //!< --keep-video
    bool writeSubtitles = false;                                        //!< --write-subs
    bool embedSubtitles = false;                                        //!< --embed-subs
    bool writeThumbnail = false;                                        //!< --write-thumbnail
    bool writeDescription = false;                                      //!< --write-description
    bool writeInfoJson = false;                                         //!< --write-info-json

    bool autoStartDownloads = true;                                     //!< Start the queue unpaused.
    bool fetchMetadata = false;                                         //!< Probe metadata on submit.

    int queueAdmitDelayMs = 1000;                                       //!< Tick delay after an admission.
    int queueBackoffMs = 2000;                                          //!< Tick delay at the concurrency cap.
    int exitRequeueDelayMs = 2000;                                      //!< Tick delay after a process exit.
    int batchIntervalMs = 100;                                          //!< Batcher flush interval.
    int batchMaxItems = 10;                                             //!< Batcher channel threshold.

    QString logLevel = QStringLiteral("info");                          //!< Log threshold.
};

/**
 * @brief Settings with the output path resolved against the working directory.
 * @return Default settings.
 */
REEL_MODULE_EXPORT EngineSettings defaultEngineSettings();

/**
 * @brief Overlay the keys present in a JSON object onto base settings.
 * @param object Parsed configuration object.
 * @param base Values used for absent keys.
 * @return Merged settings.
 */
REEL_MODULE_EXPORT EngineSettings settingsFromJson(const QJsonObject& object, const EngineSettings& base);

/**
 * @brief Serialize settings with the same keys settingsFromJson() reads.
 * @param settings Settings.
 * @return JSON object.
 */
REEL_MODULE_EXPORT QJsonObject settingsToJson(const EngineSettings& settings);

/**
 * @brief Load settings from a JSON file.
 * @param path File path or file:// URL.
 * @param settings In: base values. Out: merged values on success.
 * @param errorMessage Optional receiver for the failure reason.
 * @return false if the file is missing, unreadable or not a JSON object.
 */
REEL_MODULE_EXPORT bool loadSettingsFile(const QString& path, EngineSettings& settings, QString* errorMessage = nullptr);
