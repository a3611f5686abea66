/*!
 * @file        downloadrunner.cppm
 * @brief       Orchestration of a single downloader run.
 * @details     A DownloadRunner drives one run of the external downloader for
 *              one job. It builds the argument vector, owns the process
 *              handle for the lifetime of the run, feeds every output line
 *              through the progress parser, applies the resulting updates to
 *              the job, and settles the job when the run ends.
 *
 *              A run is finalized exactly once. Whichever comes first of an
 *              explicit kill or the process exit performs the finalization;
 *              the later one is ignored. Finalization releases the process,
 *              so nothing else can observe or signal it afterwards.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.core.downloadrunner;
import reel.core.downloadjob;
import reel.core.jobtable;
import reel.core.downloaderprocess;
import reel.core.enginesettings;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Why a run is being stopped from outside.
 */
REEL_MODULE_EXPORT enum class KillReason {
    Pause,      //!< Job moves to Paused and can be resumed.
    Remove      //!< Job is about to be deleted, status is left alone.
};

/**
 * @brief Owner of one downloader process and its job updates.
 *
 * The runner references its job by id only and looks it up in the JobTable
 * for every event, so a job removed from the table simply stops receiving
 * updates.
 */
REEL_MODULE_EXPORT class DownloadRunner : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a runner.
     * @param table Job table holding the job.
     * @param jobId Id of the job to run.
     * @param settings Engine settings used for the argument vector.
     * @param process Process handle; the runner takes ownership.
     * @param parent Optional parent QObject.
     */
    DownloadRunner(JobTable& table,
                   const QString& jobId,
                   const EngineSettings& settings,
                   DownloaderProcess* process,
                   QObject* parent = nullptr);

    ~DownloadRunner() override;

    /**
     * @brief Build the downloader argument vector for a job.
     * @param job Job to download.
     * @param settings Engine settings.
     * @return Arguments, URL last.
     */
    static QStringList buildArguments(const DownloadJob& job, const EngineSettings& settings);

    /**
     * @brief Replace `${quality}` in a custom argument string.
     *
     * `<N>p` selectors substitute the height N, anything else is inserted
     * verbatim.
     *
     * @param customArgs Argument string.
     * @param quality Quality selector.
     * @return Substituted string.
     */
    static QString substituteQuality(const QString& customArgs, const QString& quality);

    /**
     * @brief Prepare the output directory and spawn the process.
     *
     * A job in Initializing moves to Connecting before the spawn. Directory
     * failures finalize the run with a FilesystemError.
     *
     * @return true if the process was launched.
     */
    bool start();

    /**
     * @brief Stop the run from outside.
     *
     * Idempotent. Returns false when the run was already finalized or when
     * the job cannot be paused in its current state.
     *
     * @param reason Pause or Remove.
     * @return true if this call finalized the run.
     */
    bool kill(KillReason reason);

    //!< @brief Id of the job this runner drives.
    QString jobId() const { return m_jobId; }

    //!< @brief True once the run has been settled.
    bool isFinalized() const { return m_finalized; }

    //!< @brief True once start() has been called.
    bool isLaunched() const { return m_launched; }

signals:
    //!< @brief The job record changed.
    void jobUpdated(const QString& jobId);

    /**
     * @brief A job-scoped log line.
     * @param jobId Job id.
     * @param level "debug", "info", "warning" or "error".
     * @param message Log text.
     */
    void logMessage(const QString& jobId, const QString& level, const QString& message);

    /**
     * @brief Emitted once after a successful reconciliation.
     * @param jobId Job id.
     * @param fileName Reconciled file name.
     * @param size File size in bytes.
     */
    void reconciled(const QString& jobId, const QString& fileName, qint64 size);

    //!< @brief The run was finalized; emitted exactly once.
    void finished(const QString& jobId);

private:
    //!< @brief Process reported a successful spawn.
    void onStarted();

    /**
     * @brief Handle one output line.
     * @param line Line text.
     * @param fromStderr True for standard error.
     */
    void onOutputLine(const QString& line, bool fromStderr);

    /**
     * @brief Handle process exit.
     * @param exitCode Exit code.
     * @param crashed True when terminated by a signal.
     */
    void onExited(int exitCode, bool crashed);

    //!< @brief Handle a spawn failure.
    void onFailedToStart(const QString& message);

    //!< @brief Mark the job failed and finalize.
    void fail(const JobError& error);

    //!< @brief Request a status change and publish it.
    bool moveTo(JobStatus status);

    //!< @brief Settle the run: release the process and emit finished().
    void finalize();

    //!< @brief Detach and terminate the process handle.
    void releaseProcess();

    JobTable& m_table;                          //!< Shared job table.
    QString m_jobId;                            //!< Driven job.
    EngineSettings m_settings;                  //!< Settings snapshot for this run.
    QPointer<DownloaderProcess> m_process;      //!< Owned process handle.
    bool m_launched = false;                    //!< start() was called.
    bool m_finalized = false;                   //!< Run has been settled.
    bool m_sawProgress = false;                 //!< A percentage was reported in this run.
};

#include "downloadrunner.moc"
