module;
#include <QDebug>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <utility>

module reel.core.queuescheduler;

import reel.core.downloadjob;
import reel.core.jobtable;

QueueScheduler::QueueScheduler(JobTable& table, QObject* parent)
    : QObject(parent)
    , m_table(table)
{
    m_tickTimer.setSingleShot(true);
    connect(&m_tickTimer, &QTimer::timeout, this, &QueueScheduler::tick);
}

void QueueScheduler::setConcurrencyLimit(int limit)
{
    if (limit < 1) limit = 1;
    if (m_concurrencyLimit == limit) return;
    m_concurrencyLimit = limit;
    emit concurrencyLimitChanged();
    requestTick(0);
}

void QueueScheduler::setPaused(bool paused)
{
    if (m_paused == paused) return;
    m_paused = paused;
    qInfo() << (paused ? "Queue paused" : "Queue started");
    emit pausedChanged();
    if (paused) {
        m_tickTimer.stop();
    } else {
        requestTick(0);
    }
}

void QueueScheduler::setIntervals(int admitDelayMs, int backoffMs)
{
    m_admitDelayMs = qMax(0, admitDelayMs);
    m_backoffMs = qMax(0, backoffMs);
}

void QueueScheduler::setLiveJobsProvider(LiveJobsProvider provider)
{
    m_liveJobs = std::move(provider);
}

int QueueScheduler::occupancy(const QStringList& live) const
{
    int count = m_table.activeCount();
    for (const QString& id : live) {
        const DownloadJob* job = m_table.find(id);
        if (!job || !isActiveJobStatus(job->status)) count++;
    }
    return count;
}

void QueueScheduler::requestTick(int delayMs)
{
    delayMs = qMax(0, delayMs);
    if (m_tickTimer.isActive() && m_tickTimer.remainingTime() <= delayMs) return;
    m_tickTimer.start(delayMs);
}

void QueueScheduler::tick()
{
    if (m_inTick) return;
    m_inTick = true;
    m_tickTimer.stop();

    if (m_paused) {
        m_inTick = false;
        return;
    }

    const QStringList live = m_liveJobs ? m_liveJobs() : QStringList();
    const int active = occupancy(live);
    if (active >= m_concurrencyLimit) {
        qDebug() << "Concurrency limit reached:" << active << "/" << m_concurrencyLimit;
        m_inTick = false;
        requestTick(m_backoffMs);
        return;
    }

    const QString id = m_table.nextPending(live);
    if (id.isEmpty()) {
        m_inTick = false;
        return;
    }

    if (m_table.transition(id, JobStatus::Downloading)) {
        qInfo() << "Admitting job" << id << "(" << active + 1 << "/" << m_concurrencyLimit << ")";
        emit admitted(id);
    }

    m_inTick = false;
    requestTick(m_admitDelayMs);
}
