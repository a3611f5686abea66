/*!
 * @file        jobtable.cppm
 * @brief       Owned job table and admission queue.
 * @details     Holds every DownloadJob keyed by id together with the insertion
 *              order used for listing and the ordered admission queue.
 *
 *              All status changes go through transition(), which consults the
 *              transition table and stamps lifecycle timestamps. Rejected
 *              transitions are logged and leave the job untouched.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QDateTime>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module reel.core.jobtable;
import reel.core.downloadjob;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Central store of download jobs and the admission queue.
 *
 * The queue is an ordered list of job ids without duplicates. A job stays
 * queued until it completes or is removed. Removing a job from the table
 * always removes it from the queue.
 */
REEL_MODULE_EXPORT class JobTable {
public:
    JobTable() = default;

    /**
     * @brief Insert a new job and append it to the queue.
     * @param job Job record with a unique id.
     * @return false if the id is empty or already present.
     */
    bool insert(const DownloadJob& job);

    /**
     * @brief Delete a job from the table and the queue.
     * @param id Job id.
     * @return false if the id is unknown.
     */
    bool remove(const QString& id);

    //!< @brief True if a job with this id exists.
    bool contains(const QString& id) const { return m_jobs.contains(id); }

    /**
     * @brief Mutable access to a job.
     *
     * The pointer stays valid until the next insert() or remove().
     *
     * @param id Job id.
     * @return Job pointer or null.
     */
    DownloadJob* find(const QString& id);

    //!< @brief Const access to a job, null when unknown.
    const DownloadJob* find(const QString& id) const;

    /**
     * @brief Move a job to a new status.
     *
     * Applies the transition table. Entering Downloading or Initializing
     * stamps startedAt when unset, entering Completed stamps completedAt and
     * leaves the queue. Requesting the current status is a no-op that
     * succeeds.
     *
     * @param id Job id.
     * @param to Requested status.
     * @param now Timestamp used for stamping.
     * @return true if the job is in the requested status afterwards.
     */
    bool transition(const QString& id, JobStatus to, const QDateTime& now = QDateTime::currentDateTimeUtc());

    /**
     * @brief Return a failed job to the queue.
     *
     * Clears lastError and the attempt timestamps, increments retryCount and
     * re-queues the id if needed. addedAt and progress values are kept.
     *
     * @param id Job id.
     * @return false unless the job is in Error.
     */
    bool retry(const QString& id);

    //!< @brief Jobs in submission order.
    QVector<DownloadJob> jobs() const;

    //!< @brief Ids in submission order.
    QStringList ids() const { return m_order; }

    //!< @brief Ordered admission queue.
    QStringList queue() const { return m_queue; }

    //!< @brief Number of jobs in the table.
    int size() const { return static_cast<int>(m_jobs.size()); }

    //!< @brief Number of jobs in a running state.
    int activeCount() const;

    //!< @brief Number of jobs in a given state.
    int countWithStatus(JobStatus status) const;

    /**
     * @brief Earliest queued job that is still pending.
     * @param skip Ids that must not be returned.
     * @return Job id, or an empty string.
     */
    QString nextPending(const QStringList& skip = {}) const;

private:
    //!< @brief Append an id to the queue unless present.
    void enqueue(const QString& id);

    QHash<QString, DownloadJob> m_jobs;     //!< Jobs by id.
    QStringList m_order;                    //!< Submission order.
    QStringList m_queue;                    //!< Admission queue.
};
