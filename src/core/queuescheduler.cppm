/*!
 * @file        queuescheduler.cppm
 * @brief       Concurrency-limited admission of queued jobs.
 * @details     The scheduler polls the job table on a timer. Each tick admits
 *              at most one pending job, in queue order, while the number of
 *              active jobs stays below the concurrency limit.
 *
 *              Ticks are driven by a single single-shot timer. Asking for a
 *              tick while one is pending never creates a second one; a request
 *              for an earlier tick only moves the pending one forward. A guard
 *              flag turns nested tick() calls into no-ops.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <functional>

#ifndef Q_MOC_RUN
export module reel.core.queuescheduler;
import reel.core.jobtable;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Polling admission loop over a JobTable.
 *
 * Admission moves the job to Downloading, stamps startedAt and emits
 * admitted(); the receiver is expected to launch the run.
 */
REEL_MODULE_EXPORT class QueueScheduler : public QObject {

    Q_OBJECT

    //!< @brief Maximum number of concurrently active jobs.
    Q_PROPERTY(int concurrencyLimit READ concurrencyLimit WRITE setConcurrencyLimit NOTIFY concurrencyLimitChanged)

    //!< @brief Global pause flag.
    Q_PROPERTY(bool paused READ isPaused WRITE setPaused NOTIFY pausedChanged)

public:
    //!< @brief Returns the ids of jobs whose run has not released its process yet.
    using LiveJobsProvider = std::function<QStringList()>;

    /**
     * @brief Construct a scheduler.
     * @param table Job table to admit from.
     * @param parent Optional parent QObject.
     */
    explicit QueueScheduler(JobTable& table, QObject* parent = nullptr);

    //!< @brief Return the concurrency limit.
    int concurrencyLimit() const { return m_concurrencyLimit; }

    /**
     * @brief Set the concurrency limit.
     * @param limit New limit, clamped to at least 1.
     */
    void setConcurrencyLimit(int limit);

    //!< @brief True while admission is suspended.
    bool isPaused() const { return m_paused; }

    /**
     * @brief Suspend or resume admission.
     *
     * Running jobs are not affected. Unpausing requests an immediate tick.
     *
     * @param paused New pause state.
     */
    void setPaused(bool paused);

    /**
     * @brief Set the tick delays.
     * @param admitDelayMs Delay after an admission.
     * @param backoffMs Delay when at the concurrency limit.
     */
    void setIntervals(int admitDelayMs, int backoffMs);

    /**
     * @brief Ask for a tick after a delay.
     *
     * No-op if a tick is already due no later than the requested time.
     *
     * @param delayMs Delay in milliseconds.
     */
    void requestTick(int delayMs = 0);

    /**
     * @brief Report runs that still hold a process.
     *
     * A live run counts against the limit even after its job left the active
     * states, and its job is never admitted again until the run is released.
     *
     * @param provider Live job ids, queried on every tick.
     */
    void setLiveJobsProvider(LiveJobsProvider provider);

    //!< @brief True while a tick is scheduled.
    bool isTickPending() const { return m_tickTimer.isActive(); }

    /**
     * @brief Run one scheduling step now.
     *
     * Cancels any pending tick and schedules the follow-up tick itself.
     */
    void tick();

signals:
    //!< @brief A job was admitted and must be launched.
    void admitted(const QString& jobId);

    //!< @brief Emitted when the concurrency limit changes.
    void concurrencyLimitChanged();

    //!< @brief Emitted when the pause flag changes.
    void pausedChanged();

private:
    //!< @brief Active jobs plus live runs whose job is no longer active.
    int occupancy(const QStringList& live) const;

    JobTable& m_table;                  //!< Jobs to admit from.
    LiveJobsProvider m_liveJobs;        //!< Runs still holding a process.
    QTimer m_tickTimer;                 //!< The single tick timer.
    int m_concurrencyLimit = 3;         //!< Active job cap.
    int m_admitDelayMs = 1000;          //!< Delay after an admission.
    int m_backoffMs = 2000;             //!< Delay when at the cap.
    bool m_paused = false;              //!< Admission suspended.
    bool m_inTick = false;              //!< Reentrancy guard.
};

#include "queuescheduler.moc"
