/*!
 * @file        downloadmanager.cppm
 * @brief       Central download orchestration engine.
 * @details     Provides the high-level controller that owns the job table,
 *              the queue scheduler, the update batcher and one runner per
 *              live download.
 *
 *              This class is the façade between the host (command line or an
 *              embedding application) and the download core. Hosts submit
 *              URLs and issue commands by job id; they observe state through
 *              the update channels:
 *              - download-updated: job snapshots
 *              - download-removed: ids of removed jobs
 *              - log-added: job-scoped log lines
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>

#ifndef Q_MOC_RUN
export module reel.core.downloadmanager;
import reel.core.downloadjob;
import reel.core.jobtable;
import reel.core.downloaderprocess;
import reel.core.downloadrunner;
import reel.core.enginesettings;
import reel.core.queuescheduler;
import reel.core.updatebatcher;
import reel.services.metadata_probe;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

//!< @brief Per-submission overrides; empty fields fall back to the settings.
REEL_MODULE_EXPORT struct SubmitOptions {
    QString quality;            //!< Quality selector.
    QString outputDirectory;    //!< Target directory.
};

/**
 * @brief Coordinator for every download job.
 *
 * All state lives on the thread that owns the manager. Commands never
 * throw; failures are recorded on the job and published on the update
 * channels.
 */
REEL_MODULE_EXPORT class DownloadManager : public QObject {

    Q_OBJECT

    //!< @brief Global maximum number of concurrent downloads.
    Q_PROPERTY(int maxConcurrent READ maxConcurrent WRITE setMaxConcurrent NOTIFY maxConcurrentChanged)

    //!< @brief Number of currently active downloads.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

    //!< @brief True while queue admission is suspended.
    Q_PROPERTY(bool queuePaused READ isQueuePaused NOTIFY queuePausedChanged)

public:
    static constexpr auto kUpdatedChannel = "download-updated";     //!< Job snapshots.
    static constexpr auto kRemovedChannel = "download-removed";     //!< Removed ids.
    static constexpr auto kLogChannel = "log-added";                //!< Job log lines.

    /**
     * @brief Construct the engine.
     * @param settings Initial settings.
     * @param factory Factory for downloader processes.
     * @param parent Optional parent QObject.
     */
    explicit DownloadManager(const EngineSettings& settings = defaultEngineSettings(),
                             DownloaderProcessFactory factory = defaultProcessFactory(),
                             QObject* parent = nullptr);

    ~DownloadManager() override;

    /**
     * @brief Create a job in pending state.
     * @param url Media URL.
     * @param options Quality and output directory overrides.
     * @return Job snapshot, or an empty object for an empty URL.
     */
    QJsonObject submit(const QString& url, const SubmitOptions& options = {});

    /**
     * @brief Create one job per playlist entry.
     * @param entries Expanded playlist entries.
     * @param options Shared overrides.
     * @return Snapshots in entry order.
     */
    QJsonArray submitBatch(const QVector<PlaylistEntry>& entries, const SubmitOptions& options = {});

    /**
     * @brief Launch a job now, bypassing the queue.
     *
     * A paused job is resumed first. The concurrency limit does not apply.
     *
     * @param id Job id.
     * @return true if a run was launched.
     */
    bool start(const QString& id);

    //!< @brief Resume admission from the queue.
    bool startQueue();

    //!< @brief Suspend admission; running jobs continue.
    bool pauseQueue();

    /**
     * @brief Suspend admission and pause every live run.
     * @return true if the queue is paused afterwards.
     */
    bool stopAll();

    /**
     * @brief Pause one job.
     *
     * A live run is killed and the job settles in paused. A pending job is
     * parked without a run.
     *
     * @param id Job id.
     * @return true on success.
     */
    bool pause(const QString& id);

    //!< @brief Return a paused job to pending.
    bool resume(const QString& id);

    //!< @brief Return a failed job to pending.
    bool retry(const QString& id);

    /**
     * @brief Kill any run and delete the job record.
     * @param id Job id.
     * @return false if the id is unknown.
     */
    bool remove(const QString& id);

    /**
     * @brief Delete every completed and failed job.
     * @return Number of removed jobs.
     */
    int clearCompleted();

    /**
     * @brief Submit every URL listed in a file.
     *
     * Accepts a JSON array of strings or objects, a JSON object with an
     * items array, or plain text with one URL per line.
     *
     * @param path File path or file URL.
     * @return Snapshots of the created jobs.
     */
    QJsonArray importList(const QString& path);

    //!< @brief Snapshots of every job in submission order.
    QJsonArray listJobs() const;

    //!< @brief Snapshots of the queued jobs in queue order.
    QJsonArray listQueue() const;

    //!< @brief Snapshot of one job, empty when unknown.
    QJsonObject job(const QString& id) const;

    //!< @brief Read access to the job table.
    const JobTable& table() const { return m_table; }

    /**
     * @brief Receive update events of one channel.
     * @param channel Channel name.
     * @param handler Event callback.
     * @return Connection usable with QObject::disconnect().
     */
    QMetaObject::Connection subscribe(const QString& channel, UpdateBatcher::Handler handler);

    //!< @brief Deliver pending update events now.
    void flushUpdates() { m_batcher.flush(); }

    //!< @brief Current settings.
    const EngineSettings& settings() const { return m_settings; }

    /**
     * @brief Replace the settings.
     *
     * Scheduler and batcher parameters apply immediately. Live runs keep the
     * settings they were started with.
     *
     * @param settings New settings.
     */
    void updateSettings(const EngineSettings& settings);

    /**
     * @brief Look up metadata of a URL.
     * @param url Media or playlist URL.
     * @param callback Result receiver.
     */
    void probeMetadata(const QString& url, MetadataProbe::MetadataCallback callback);

    //!< @brief The metadata probe.
    MetadataProbe& metadataProbe() { return m_probe; }

    //!< @brief The scheduler.
    QueueScheduler& scheduler() { return m_scheduler; }

    int maxConcurrent() const { return m_scheduler.concurrencyLimit(); }
    void setMaxConcurrent(int limit);

    int activeCount() const { return m_table.activeCount(); }

    bool isQueuePaused() const { return m_scheduler.isPaused(); }

    //!< @brief Number of live runs.
    int runningCount() const { return static_cast<int>(m_runners.size()); }

    //!< @brief True if the job has a live run.
    bool hasRunner(const QString& id) const { return m_runners.contains(id); }

    //!< @brief True when no run is live, no job is pending or active and no hold is taken.
    bool isDrained() const;

    /**
     * @brief Keep drained() from firing while outside work may still submit jobs.
     *
     * Every call must be matched by releaseDrainHold().
     */
    void acquireDrainHold();

    /**
     * @brief Drop a hold taken with acquireDrainHold().
     *
     * Emits drained() if this was the last hold and nothing else is running.
     */
    void releaseDrainHold();

signals:
    void maxConcurrentChanged();
    void countsChanged();
    void queuePausedChanged();

    /**
     * @brief A run ended.
     * @param id Job id.
     * @param status Status the job settled in.
     */
    void jobFinished(const QString& id, JobStatus status);

    //!< @brief No run is live and no job is pending.
    void drained();

private:
    //!< @brief Create and start the runner of an admitted job.
    bool launchRunner(const QString& id);

    //!< @brief Clean up after a runner finished.
    void onRunnerFinished(const QString& id);

    //!< @brief Fill in metadata once the probe answers.
    void attachMetadata(const QString& id, const QString& url);

    //!< @brief Publish a snapshot of a job.
    void publishJob(const QString& id);

    //!< @brief Publish a job-scoped log line.
    void publishLog(const QString& id, const QString& level, const QString& message);

    //!< @brief Emit drained() when the engine is idle.
    void checkDrained();

    //!< @brief Push settings into scheduler, batcher and probe.
    void applySettings();

    EngineSettings m_settings;                      //!< Active settings.
    DownloaderProcessFactory m_factory;             //!< Process factory.
    JobTable m_table;                               //!< Authoritative job records.
    QueueScheduler m_scheduler;                     //!< Admission loop.
    UpdateBatcher m_batcher;                        //!< Outbound event coalescing.
    MetadataProbe m_probe;                          //!< Metadata lookups.
    QHash<QString, DownloadRunner*> m_runners;      //!< Live runs by job id.
    int m_drainHolds = 0;                           //!< Outstanding acquireDrainHold() calls.
};

#include "downloadmanager.moc"
