/*!
 * @file        downloadjob.cppm
 * @brief       Download job record, status model and transition table.
 * @details     Defines the authoritative per-job record shared by the engine
 *              components, the closed set of job states, and the table of
 *              legal transitions between them.
 *
 *              A job is plain data. It is owned by the JobTable and mutated
 *              only from the event loop thread, by the QueueScheduler on
 *              admission, by the DownloadRunner while its process runs, and by
 *              DownloadManager for explicit commands.
 *
 *              This unit also hosts the failure taxonomy and the mapping from
 *              downloader error text to classified, user-facing errors.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module reel.core.downloadjob;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Lifecycle state of a download job.
 *
 * Active states own a live downloader process. Completed is the only
 * successful terminal state; Error is terminal until retried.
 */
REEL_MODULE_EXPORT enum class JobStatus {
    Pending,        //!< Waiting in the queue for admission.
    Initializing,   //!< Explicitly started, preparing the run.
    Connecting,     //!< Process spawned, no progress seen yet.
    Downloading,    //!< Receiving media.
    Processing,     //!< Post-processing (merge, remux, audio extraction).
    Paused,         //!< Stopped by an external command, resumable.
    Completed,      //!< Finished successfully.
    Error           //!< Failed, see DownloadJob::lastError.
};

/**
 * @brief Failure taxonomy recorded on a job.
 */
REEL_MODULE_EXPORT enum class ErrorKind {
    SpawnFailure,           //!< Downloader binary missing or not executable.
    AccessDenied,           //!< HTTP 403 or equivalent.
    NotFound,               //!< HTTP 404 or removed media.
    MediaUnavailable,       //!< Private, deleted or region-restricted media.
    AuthRequired,           //!< Age gate or sign-in required.
    FormatUnavailable,      //!< Requested format cannot be served.
    GenericExtractorError,  //!< Unclassified ERROR: line.
    NonZeroExit,            //!< Process failed without a classified error line.
    FilesystemError         //!< Output directory or file access failure.
};

/**
 * @brief Confidence of the source that produced DownloadJob::resolvedFilename.
 *
 * Ordered from weakest to strongest. A weaker source never replaces a
 * stronger one.
 */
REEL_MODULE_EXPORT enum class FilenameSource {
    None,               //!< No name known.
    BareToken,          //!< Line ending in a media file name.
    AlreadyDownloaded,  //!< "has already been downloaded" line.
    Destination,        //!< "Destination:" line.
    Merge               //!< Post-processor output named in quotes.
};

/**
 * @brief Classified failure attached to a job.
 */
REEL_MODULE_EXPORT struct JobError {
    ErrorKind kind = ErrorKind::GenericExtractorError;  //!< Taxonomy kind.
    QString message;                                    //!< Human readable message.
    QString detail;                                     //!< Raw downloader text or OS error.
};

/**
 * @brief One entry of an expanded playlist.
 */
REEL_MODULE_EXPORT struct PlaylistEntry {
    QString id;             //!< Extractor id.
    QString title;          //!< Entry title.
    QString url;            //!< Page URL, used for submission.
    QString uploader;       //!< Channel or uploader name.
    QString thumbnail;      //!< Thumbnail URL.
    double duration = 0.0;  //!< Duration in seconds.
};

/**
 * @brief Media information reported by the downloader.
 */
REEL_MODULE_EXPORT struct MediaMetadata {
    QString title;                      //!< Media or playlist title.
    QString uploader;                   //!< Uploader name.
    QString thumbnail;                  //!< Thumbnail URL.
    double duration = 0.0;              //!< Duration in seconds.
    QVector<PlaylistEntry> entries;     //!< Child entries for playlists.

    //!< @brief True when the metadata describes a playlist.
    bool isPlaylist() const { return !entries.isEmpty(); }
};

/**
 * @brief The authoritative record of one requested download.
 */
REEL_MODULE_EXPORT struct DownloadJob {
    QString id;                                         //!< Unique, immutable identifier.
    QString url;                                        //!< Source URL.
    JobStatus status = JobStatus::Pending;              //!< Current state.
    QString quality = QStringLiteral("best");           //!< Quality selector.
    QString outputDirectory;                            //!< Absolute output directory.

    int progressPercent = 0;                            //!< 0..100.
    qint64 speedBytesPerSec = 0;                        //!< Last reported speed.
    std::optional<int> etaSeconds;                      //!< Remaining time, null when unknown.
    qint64 downloadedBytes = 0;                         //!< Bytes received.
    qint64 totalBytes = 0;                              //!< Expected size.

    QString resolvedFilename;                           //!< Output file name, empty when unknown.
    FilenameSource filenameSource = FilenameSource::None; //!< Confidence of resolvedFilename.

    std::optional<MediaMetadata> metadata;              //!< Probed media information.
    std::optional<JobError> lastError;                  //!< Last classified failure.
    int retryCount = 0;                                 //!< Explicit retries so far.

    QDateTime addedAt;                                  //!< Submission time.
    QDateTime startedAt;                                //!< First admission of the current attempt.
    QDateTime completedAt;                              //!< Successful completion time.
};

/**
 * @brief Lower-case wire name of a status.
 * @param status Job status.
 * @return Name such as "downloading".
 */
REEL_MODULE_EXPORT QString jobStatusName(JobStatus status);

/**
 * @brief Parse a wire status name.
 * @param name Lower-case status name.
 * @return Status, or nullopt when unknown.
 */
REEL_MODULE_EXPORT std::optional<JobStatus> jobStatusFromName(const QString& name);

//!< @brief True for states that own a running process.
REEL_MODULE_EXPORT bool isActiveJobStatus(JobStatus status);

//!< @brief True for Completed and Error.
REEL_MODULE_EXPORT bool isTerminalJobStatus(JobStatus status);

/**
 * @brief Check the transition table.
 *
 * Self transitions are not part of the table and return false.
 *
 * @param from Current status.
 * @param to Requested status.
 * @return true if the transition is legal.
 */
REEL_MODULE_EXPORT bool canTransition(JobStatus from, JobStatus to);

//!< @brief Wire name of an error kind, e.g. "AccessDenied".
REEL_MODULE_EXPORT QString errorKindName(ErrorKind kind);

/**
 * @brief Classify a downloader error line.
 *
 * Known phrases map to specific kinds with a friendly message. Anything else
 * becomes GenericExtractorError carrying the raw text.
 *
 * @param text Error line as printed by the downloader.
 * @return Classified error.
 */
REEL_MODULE_EXPORT JobError classifyErrorText(const QString& text);

/**
 * @brief Build a failure record for one of the engine-detected kinds.
 * @param kind Error kind.
 * @param message Human readable message.
 * @param detail Raw detail.
 * @return Error record.
 */
REEL_MODULE_EXPORT JobError makeJobError(ErrorKind kind, const QString& message, const QString& detail = QString());

//!< @brief JSON form of a metadata record.
REEL_MODULE_EXPORT QJsonObject metadataToJson(const MediaMetadata& metadata);

/**
 * @brief Snapshot of a job as published on the update channel.
 * @param job Job record.
 * @return JSON object.
 */
REEL_MODULE_EXPORT QJsonObject jobToJson(const DownloadJob& job);
