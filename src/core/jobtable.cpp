module;
#include <QDateTime>
#include <QDebug>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

module reel.core.jobtable;

import reel.core.downloadjob;

bool JobTable::insert(const DownloadJob& job)
{
    if (job.id.isEmpty() || m_jobs.contains(job.id)) {
        qWarning() << "Rejecting job with empty or duplicate id:" << job.id;
        return false;
    }
    m_jobs.insert(job.id, job);
    m_order.append(job.id);
    if (job.status != JobStatus::Completed) {
        enqueue(job.id);
    }
    return true;
}

bool JobTable::remove(const QString& id)
{
    if (!m_jobs.remove(id)) return false;
    m_order.removeAll(id);
    m_queue.removeAll(id);
    return true;
}

DownloadJob* JobTable::find(const QString& id)
{
    auto it = m_jobs.find(id);
    return it == m_jobs.end() ? nullptr : &it.value();
}

const DownloadJob* JobTable::find(const QString& id) const
{
    auto it = m_jobs.constFind(id);
    return it == m_jobs.constEnd() ? nullptr : &it.value();
}

bool JobTable::transition(const QString& id, JobStatus to, const QDateTime& now)
{
    DownloadJob* job = find(id);
    if (!job) return false;
    if (job->status == to) return true;

    if (!canTransition(job->status, to)) {
        qWarning() << "Ignoring transition" << jobStatusName(job->status)
                   << "->" << jobStatusName(to) << "for job" << id;
        return false;
    }

    qDebug() << "Job" << id << jobStatusName(job->status) << "->" << jobStatusName(to);
    job->status = to;

    switch (to) {
    case JobStatus::Initializing:
    case JobStatus::Downloading:
        if (!job->startedAt.isValid()) job->startedAt = now;
        break;
    case JobStatus::Completed:
        if (!job->completedAt.isValid()) job->completedAt = now;
        m_queue.removeAll(id);
        break;
    case JobStatus::Pending:
        enqueue(id);
        break;
    default:
        break;
    }
    return true;
}

bool JobTable::retry(const QString& id)
{
    DownloadJob* job = find(id);
    if (!job || job->status != JobStatus::Error) return false;
    if (!transition(id, JobStatus::Pending)) return false;

    job->lastError.reset();
    job->retryCount += 1;
    job->startedAt = QDateTime();
    job->completedAt = QDateTime();
    job->speedBytesPerSec = 0;
    job->etaSeconds.reset();
    return true;
}

QVector<DownloadJob> JobTable::jobs() const
{
    QVector<DownloadJob> out;
    out.reserve(m_order.size());
    for (const QString& id : m_order) {
        if (const DownloadJob* job = find(id)) out.append(*job);
    }
    return out;
}

int JobTable::activeCount() const
{
    int count = 0;
    for (const DownloadJob& job : m_jobs) {
        if (isActiveJobStatus(job.status)) count++;
    }
    return count;
}

int JobTable::countWithStatus(JobStatus status) const
{
    int count = 0;
    for (const DownloadJob& job : m_jobs) {
        if (job.status == status) count++;
    }
    return count;
}

QString JobTable::nextPending(const QStringList& skip) const
{
    for (const QString& id : m_queue) {
        const DownloadJob* job = find(id);
        if (job && job->status == JobStatus::Pending && !skip.contains(id)) return id;
    }
    return QString();
}

void JobTable::enqueue(const QString& id)
{
    if (!m_queue.contains(id)) m_queue.append(id);
}
