module;
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <QPointer>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QVector>

#include <optional>
#include <utility>

module reel.core.downloadmanager;

import reel.core.downloadjob;
import reel.core.jobtable;
import reel.core.downloaderprocess;
import reel.core.downloadrunner;
import reel.core.enginesettings;
import reel.core.queuescheduler;
import reel.core.updatebatcher;
import reel.services.metadata_probe;
import reel.utils.download_utils;

namespace utils = reel::utils;

DownloadManager::DownloadManager(const EngineSettings& settings, DownloaderProcessFactory factory, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_factory(std::move(factory))
    , m_scheduler(m_table)
    , m_probe(settings.downloaderPath, m_factory)
{
    connect(&m_scheduler, &QueueScheduler::admitted, this, [this](const QString& id) {
        publishJob(id);
        if (!launchRunner(id)) checkDrained();
        emit countsChanged();
    });
    m_scheduler.setLiveJobsProvider([this] { return m_runners.keys(); });
    connect(&m_scheduler, &QueueScheduler::concurrencyLimitChanged, this, &DownloadManager::maxConcurrentChanged);
    connect(&m_scheduler, &QueueScheduler::pausedChanged, this, &DownloadManager::queuePausedChanged);

    applySettings();
    m_scheduler.setPaused(!m_settings.autoStartDownloads);
}

DownloadManager::~DownloadManager()
{
    const auto runners = m_runners.values();
    m_runners.clear();
    for (DownloadRunner* runner : runners) {
        runner->disconnect(this);
        delete runner;
    }
}

void DownloadManager::applySettings()
{
    m_scheduler.setIntervals(m_settings.queueAdmitDelayMs, m_settings.queueBackoffMs);
    m_scheduler.setConcurrencyLimit(m_settings.maxConcurrentDownloads);
    m_batcher.setInterval(m_settings.batchIntervalMs);
    m_batcher.setDefaultMaxItems(m_settings.batchMaxItems);
    m_probe.setDownloaderPath(m_settings.downloaderPath);
}

void DownloadManager::updateSettings(const EngineSettings& settings)
{
    const bool autoStartChanged = settings.autoStartDownloads != m_settings.autoStartDownloads;
    m_settings = settings;
    applySettings();
    if (autoStartChanged) m_scheduler.setPaused(!m_settings.autoStartDownloads);
    qInfo() << "Settings updated";
}

void DownloadManager::setMaxConcurrent(int limit)
{
    m_settings.maxConcurrentDownloads = qMax(1, limit);
    m_scheduler.setConcurrencyLimit(m_settings.maxConcurrentDownloads);
}

QJsonObject DownloadManager::submit(const QString& url, const SubmitOptions& options)
{
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) {
        qWarning() << "Ignoring submission with an empty URL";
        return {};
    }

    DownloadJob job;
    job.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    job.url = trimmed;
    job.quality = options.quality.isEmpty() ? m_settings.defaultQuality : options.quality;
    const QString directory = utils::normalizeFilePath(
        options.outputDirectory.isEmpty() ? m_settings.outputPath : options.outputDirectory);
    job.outputDirectory = directory.isEmpty() ? directory : QFileInfo(directory).absoluteFilePath();
    job.addedAt = QDateTime::currentDateTimeUtc();

    if (!m_table.insert(job)) {
        qWarning() << "Could not insert job for" << trimmed;
        return {};
    }
    qInfo() << "Submitted job" << job.id << trimmed << "quality" << job.quality;

    publishJob(job.id);
    publishLog(job.id, QStringLiteral("info"), QStringLiteral("Added to queue: %1").arg(trimmed));
    emit countsChanged();

    if (m_settings.fetchMetadata) attachMetadata(job.id, trimmed);
    if (m_settings.autoStartDownloads) m_scheduler.requestTick(0);

    return this->job(job.id);
}

QJsonArray DownloadManager::submitBatch(const QVector<PlaylistEntry>& entries, const SubmitOptions& options)
{
    QJsonArray out;
    for (const PlaylistEntry& entry : entries) {
        if (entry.url.isEmpty()) continue;
        const QJsonObject snapshot = submit(entry.url, options);
        const QString id = snapshot.value("id").toString();
        if (id.isEmpty()) continue;

        if (DownloadJob* job = m_table.find(id); job && !entry.title.isEmpty()) {
            MediaMetadata metadata;
            metadata.title = entry.title;
            metadata.uploader = entry.uploader;
            metadata.thumbnail = entry.thumbnail;
            metadata.duration = entry.duration;
            job->metadata = metadata;
            publishJob(id);
        }
        out.append(job(id));
    }
    qInfo() << "Submitted batch of" << out.size() << "jobs";
    return out;
}

bool DownloadManager::start(const QString& id)
{
    DownloadJob* job = m_table.find(id);
    if (!job) return false;
    if (m_runners.contains(id)) return false;

    if (job->status == JobStatus::Paused && !m_table.transition(id, JobStatus::Pending)) return false;
    if (!m_table.transition(id, JobStatus::Initializing)) {
        qWarning() << "Cannot start job" << id << "in state" << jobStatusName(job->status);
        return false;
    }
    publishJob(id);
    const bool launched = launchRunner(id);
    emit countsChanged();
    if (!launched) checkDrained();
    return launched;
}

bool DownloadManager::startQueue()
{
    m_scheduler.setPaused(false);
    return true;
}

bool DownloadManager::pauseQueue()
{
    m_scheduler.setPaused(true);
    return true;
}

bool DownloadManager::stopAll()
{
    m_scheduler.setPaused(true);
    const QStringList ids = m_runners.keys();
    for (const QString& id : ids) {
        if (DownloadRunner* runner = m_runners.value(id)) runner->kill(KillReason::Pause);
    }
    qInfo() << "Stopped" << ids.size() << "running jobs";
    return true;
}

bool DownloadManager::pause(const QString& id)
{
    DownloadJob* job = m_table.find(id);
    if (!job) return false;

    if (DownloadRunner* runner = m_runners.value(id)) return runner->kill(KillReason::Pause);

    if (job->status != JobStatus::Pending) return false;
    if (!m_table.transition(id, JobStatus::Paused)) return false;
    publishJob(id);
    publishLog(id, QStringLiteral("info"), QStringLiteral("Download paused"));
    checkDrained();
    return true;
}

bool DownloadManager::resume(const QString& id)
{
    const DownloadJob* job = m_table.find(id);
    if (!job || job->status != JobStatus::Paused) return false;
    if (!m_table.transition(id, JobStatus::Pending)) return false;
    publishJob(id);
    publishLog(id, QStringLiteral("info"), QStringLiteral("Download resumed"));
    m_scheduler.requestTick(0);
    return true;
}

bool DownloadManager::retry(const QString& id)
{
    if (m_runners.contains(id)) {
        qWarning() << "Cannot retry job" << id << "while its previous run is still exiting";
        return false;
    }
    if (!m_table.retry(id)) return false;
    publishJob(id);
    publishLog(id, QStringLiteral("info"), QStringLiteral("Retrying download"));
    m_scheduler.requestTick(0);
    return true;
}

bool DownloadManager::remove(const QString& id)
{
    if (!m_table.contains(id)) return false;

    if (DownloadRunner* runner = m_runners.value(id)) runner->kill(KillReason::Remove);
    m_table.remove(id);

    QJsonObject payload;
    payload.insert("id", id);
    m_batcher.enqueue(QString::fromLatin1(kRemovedChannel), payload);
    qInfo() << "Removed job" << id;

    emit countsChanged();
    checkDrained();
    return true;
}

int DownloadManager::clearCompleted()
{
    QStringList doomed;
    for (const QString& id : m_table.ids()) {
        const DownloadJob* job = m_table.find(id);
        if (job && isTerminalJobStatus(job->status)) doomed.append(id);
    }
    for (const QString& id : std::as_const(doomed)) remove(id);
    return static_cast<int>(doomed.size());
}

QJsonArray DownloadManager::importList(const QString& path)
{
    QJsonArray out;
    const QString filePath = utils::normalizeFilePath(path);
    if (filePath.isEmpty()) return out;
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot open import list" << filePath << ":" << file.errorString();
        return out;
    }

    const QByteArray raw = file.readAll();
    file.close();

    const auto addSnapshot = [&out](const QJsonObject& snapshot) {
        if (!snapshot.isEmpty()) out.append(snapshot);
    };

    const QJsonDocument doc = QJsonDocument::fromJson(raw);
    if (doc.isArray() || doc.isObject()) {
        const QJsonArray items = doc.isArray() ? doc.array() : doc.object().value("items").toArray();
        for (const QJsonValue& v : items) {
            if (v.isString()) {
                addSnapshot(submit(v.toString()));
            } else if (v.isObject()) {
                const QJsonObject obj = v.toObject();
                SubmitOptions options;
                options.quality = obj.value("quality").toString();
                options.outputDirectory = obj.value("outputDirectory").toString();
                addSnapshot(submit(obj.value("url").toString(), options));
            }
        }
        qInfo() << "Imported" << out.size() << "downloads from" << filePath;
        return out;
    }

    const QStringList lines = QString::fromUtf8(raw).split('\n');
    for (const QString& line : lines) {
        const QString trimmed = line.trimmed();
        if (trimmed.isEmpty() || trimmed.startsWith('#')) continue;
        const QString urlStr = trimmed.split(QRegularExpression(QStringLiteral("\\s+"))).value(0);
        addSnapshot(submit(urlStr));
    }
    qInfo() << "Imported" << out.size() << "downloads from" << filePath;
    return out;
}

QJsonArray DownloadManager::listJobs() const
{
    QJsonArray out;
    for (const DownloadJob& job : m_table.jobs()) out.append(jobToJson(job));
    return out;
}

QJsonArray DownloadManager::listQueue() const
{
    QJsonArray out;
    for (const QString& id : m_table.queue()) {
        if (const DownloadJob* job = m_table.find(id)) out.append(jobToJson(*job));
    }
    return out;
}

QJsonObject DownloadManager::job(const QString& id) const
{
    const DownloadJob* job = m_table.find(id);
    return job ? jobToJson(*job) : QJsonObject();
}

QMetaObject::Connection DownloadManager::subscribe(const QString& channel, UpdateBatcher::Handler handler)
{
    return m_batcher.subscribe(channel, std::move(handler));
}

void DownloadManager::probeMetadata(const QString& url, MetadataProbe::MetadataCallback callback)
{
    m_probe.fetch(url, std::move(callback));
}

bool DownloadManager::launchRunner(const QString& id)
{
    if (m_runners.contains(id)) {
        qWarning() << "Job" << id << "already has a live run";
        return false;
    }

    DownloaderProcess* process = m_factory ? m_factory(nullptr) : nullptr;
    if (!process) {
        if (DownloadJob* job = m_table.find(id)) {
            job->lastError = makeJobError(ErrorKind::SpawnFailure, QStringLiteral("No downloader process available"));
            m_table.transition(id, JobStatus::Error);
        }
        publishJob(id);
        return false;
    }

    auto* runner = new DownloadRunner(m_table, id, m_settings, process, this);
    connect(runner, &DownloadRunner::jobUpdated, this, &DownloadManager::publishJob);
    connect(runner, &DownloadRunner::logMessage, this, &DownloadManager::publishLog);
    connect(runner, &DownloadRunner::finished, this, &DownloadManager::onRunnerFinished);
    m_runners.insert(id, runner);

    if (!runner->start() && m_runners.contains(id)) {
        // start() refused without finalizing, so nothing else cleans up.
        m_runners.remove(id);
        runner->deleteLater();
        return false;
    }
    return true;
}

void DownloadManager::onRunnerFinished(const QString& id)
{
    auto* runner = qobject_cast<DownloadRunner*>(sender());
    if (!runner || m_runners.value(id) != runner) {
        qWarning() << "Ignoring finish of a stale run for job" << id;
        if (runner) {
            runner->disconnect(this);
            runner->deleteLater();
        }
        return;
    }
    m_runners.remove(id);
    runner->disconnect(this);
    runner->deleteLater();

    if (const DownloadJob* job = m_table.find(id)) {
        qInfo() << "Job" << id << "finished as" << jobStatusName(job->status);
        emit jobFinished(id, job->status);
    }
    emit countsChanged();

    m_scheduler.requestTick(m_settings.exitRequeueDelayMs);
    checkDrained();
}

void DownloadManager::attachMetadata(const QString& id, const QString& url)
{
    QPointer<DownloadManager> self(this);
    m_probe.fetch(url, [self, id](const std::optional<MediaMetadata>& metadata, const QString& error) {
        if (!self) return;
        if (!metadata) {
            self->publishLog(id, QStringLiteral("warning"), QStringLiteral("Metadata unavailable: %1").arg(error));
            return;
        }
        if (DownloadJob* job = self->m_table.find(id)) {
            job->metadata = metadata;
            self->publishJob(id);
        }
    });
}

void DownloadManager::publishJob(const QString& id)
{
    if (const DownloadJob* job = m_table.find(id)) {
        m_batcher.enqueue(QString::fromLatin1(kUpdatedChannel), jobToJson(*job));
    }
}

void DownloadManager::publishLog(const QString& id, const QString& level, const QString& message)
{
    QJsonObject entry;
    entry.insert("level", level);
    entry.insert("message", message);
    entry.insert("downloadId", id);
    entry.insert("timestamp", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    m_batcher.enqueue(QString::fromLatin1(kLogChannel), entry);
}

void DownloadManager::acquireDrainHold()
{
    ++m_drainHolds;
}

void DownloadManager::releaseDrainHold()
{
    if (m_drainHolds == 0) {
        qWarning() << "releaseDrainHold() without a matching acquireDrainHold()";
        return;
    }
    --m_drainHolds;
    checkDrained();
}

bool DownloadManager::isDrained() const
{
    return m_drainHolds == 0
        && m_runners.isEmpty()
        && m_table.countWithStatus(JobStatus::Pending) == 0
        && m_table.activeCount() == 0;
}

void DownloadManager::checkDrained()
{
    if (!isDrained()) return;
    m_batcher.flush();
    emit drained();
}
