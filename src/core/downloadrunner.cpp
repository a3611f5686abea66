module;
#include <QDebug>
#include <QDir>
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

module reel.core.downloadrunner;

import reel.core.downloadjob;
import reel.core.jobtable;
import reel.core.downloaderprocess;
import reel.core.enginesettings;
import reel.core.progressparser;
import reel.core.outputreconciler;
import reel.utils.download_utils;

namespace utils = reel::utils;

namespace {

const QString kProgressTemplate = QStringLiteral(
    "download:[%(progress._percent_str)s] %(progress._speed_str)s ETA %(progress._eta_str)s "
    "downloaded %(progress._downloaded_bytes_str)s of %(progress._total_bytes_str)s");

const QRegularExpression& heightQualityRe()
{
    static const QRegularExpression re(QStringLiteral("^(\\d+)p$"));
    return re;
}

} // namespace

DownloadRunner::DownloadRunner(JobTable& table,
                               const QString& jobId,
                               const EngineSettings& settings,
                               DownloaderProcess* process,
                               QObject* parent)
    : QObject(parent)
    , m_table(table)
    , m_jobId(jobId)
    , m_settings(settings)
    , m_process(process)
{
    if (m_process) m_process->setParent(this);
}

DownloadRunner::~DownloadRunner()
{
    // A still-owned process dies with us as a child object.
    if (m_process) {
        m_process->disconnect(this);
        m_process->terminate();
    }
}

QString DownloadRunner::substituteQuality(const QString& customArgs, const QString& quality)
{
    const auto match = heightQualityRe().match(quality);
    const QString value = match.hasMatch() ? match.captured(1) : quality;
    QString out = customArgs;
    out.replace(QStringLiteral("${quality}"), value);
    return out;
}

QStringList DownloadRunner::buildArguments(const DownloadJob& job, const EngineSettings& settings)
{
    QStringList args;
    args << QStringLiteral("--newline")
         << QStringLiteral("--progress-template") << kProgressTemplate
         << QStringLiteral("--output") << QDir(job.outputDirectory).filePath(settings.fileNamingTemplate)
         << QStringLiteral("--no-playlist");

    if (settings.keepOriginalFiles) args << QStringLiteral("--keep-video");
    if (settings.writeSubtitles) args << QStringLiteral("--write-subs");
    if (settings.embedSubtitles) args << QStringLiteral("--embed-subs");
    if (settings.writeThumbnail) args << QStringLiteral("--write-thumbnail");
    if (settings.writeDescription) args << QStringLiteral("--write-description");
    if (settings.writeInfoJson) args << QStringLiteral("--write-info-json");
    if (settings.downloadSpeedLimit > 0) {
        args << QStringLiteral("--limit-rate") << QStringLiteral("%1K").arg(settings.downloadSpeedLimit);
    }

    const QString custom = settings.customYtDlpArgs.trimmed();
    if (!custom.isEmpty()) {
        args << QProcess::splitCommand(substituteQuality(custom, job.quality));
    } else if (job.quality == QLatin1String("audio")) {
        args << QStringLiteral("--extract-audio")
             << QStringLiteral("--audio-format") << settings.audioFormat;
    } else if (const auto match = heightQualityRe().match(job.quality); match.hasMatch()) {
        const QString height = match.captured(1);
        args << QStringLiteral("--format")
             << QStringLiteral("bestvideo[height<=%1][ext=mp4]+bestaudio[ext=m4a]/best[height<=%1]").arg(height);
    } else if (!job.quality.isEmpty() && job.quality != QLatin1String("best")) {
        args << QStringLiteral("--format") << job.quality;
    }

    args << job.url;
    return args;
}

bool DownloadRunner::start()
{
    if (m_launched || m_finalized) return false;

    DownloadJob* job = m_table.find(m_jobId);
    if (!job) {
        qWarning() << "Cannot start unknown job" << m_jobId;
        return false;
    }
    if (!m_process) {
        qWarning() << "No process handle for job" << m_jobId;
        return false;
    }
    m_launched = true;

    QString dirError;
    if (!utils::ensureDirectory(job->outputDirectory, &dirError)) {
        fail(makeJobError(ErrorKind::FilesystemError, dirError, job->outputDirectory));
        return false;
    }

    if (job->status == JobStatus::Initializing) moveTo(JobStatus::Connecting);

    const QStringList args = buildArguments(*job, m_settings);

    DownloaderProcess* process = m_process.data();
    connect(process, &DownloaderProcess::started, this, &DownloadRunner::onStarted);
    connect(process, &DownloaderProcess::standardOutputLine, this, [this](const QString& line) {
        onOutputLine(line, false);
    });
    connect(process, &DownloaderProcess::standardErrorLine, this, [this](const QString& line) {
        onOutputLine(line, true);
    });
    connect(process, &DownloaderProcess::exited, this, &DownloadRunner::onExited);
    connect(process, &DownloaderProcess::failedToStart, this, &DownloadRunner::onFailedToStart);

    qInfo() << "Starting" << m_settings.downloaderPath << "for job" << m_jobId << job->url;
    qDebug() << "Arguments:" << args;
    emit logMessage(m_jobId, QStringLiteral("info"), QStringLiteral("Starting download: %1").arg(job->url));

    process->start(m_settings.downloaderPath, args);
    return true;
}

bool DownloadRunner::kill(KillReason reason)
{
    if (m_finalized) return false;

    if (reason == KillReason::Pause) {
        DownloadJob* job = m_table.find(m_jobId);
        if (!job || !m_table.transition(m_jobId, JobStatus::Paused)) return false;
        job->speedBytesPerSec = 0;
        job->etaSeconds.reset();
        emit jobUpdated(m_jobId);
        emit logMessage(m_jobId, QStringLiteral("info"), QStringLiteral("Download paused"));
    }

    finalize();
    return true;
}

void DownloadRunner::onStarted()
{
    if (m_finalized) return;
    const DownloadJob* job = m_table.find(m_jobId);
    if (job && job->status == JobStatus::Connecting) moveTo(JobStatus::Downloading);
}

void DownloadRunner::onOutputLine(const QString& line, bool fromStderr)
{
    if (m_finalized) return;
    DownloadJob* job = m_table.find(m_jobId);
    if (!job) return;

    qDebug().noquote() << (fromStderr ? "[yt-dlp:err]" : "[yt-dlp]") << line;

    const ProgressUpdate update = parseProgressLine(line, *job);

    if (update.isError) {
        qWarning().noquote() << "Downloader error for job" << m_jobId << ":" << update.message;
        emit logMessage(m_jobId, QStringLiteral("error"), update.message);
        if (!isTerminalJobStatus(job->status)) {
            job->lastError = classifyErrorText(update.message);
            m_table.transition(m_jobId, JobStatus::Error);
            job->speedBytesPerSec = 0;
            job->etaSeconds.reset();
            emit jobUpdated(m_jobId);
            // The run stays live until the process reports its exit.
            if (m_process && m_process->isRunning()) m_process->terminate();
        }
        return;
    }
    if (update.isWarning) {
        qWarning().noquote() << "Downloader warning for job" << m_jobId << ":" << update.message;
        emit logMessage(m_jobId, QStringLiteral("warning"), update.message);
        return;
    }
    if (isTerminalJobStatus(job->status)) return;

    if (update.matchedRules.contains(QLatin1String("post-process"))
        || update.matchedRules.contains(QLatin1String("destination"))
        || update.matchedRules.contains(QLatin1String("already-downloaded"))) {
        emit logMessage(m_jobId, QStringLiteral("info"), line);
    }

    bool changed = applyProgressUpdate(*job, update, m_sawProgress ? ProgressMode::Monotonic : ProgressMode::Overwrite);
    if (update.progressPercent) m_sawProgress = true;

    if (update.status && *update.status != job->status) {
        if (m_table.transition(m_jobId, *update.status)) changed = true;
    }
    if (changed) emit jobUpdated(m_jobId);
}

void DownloadRunner::onExited(int exitCode, bool crashed)
{
    if (m_finalized) return;
    DownloadJob* job = m_table.find(m_jobId);
    if (!job) {
        finalize();
        return;
    }

    if (exitCode == 0 && !crashed) {
        if (job->status == JobStatus::Error) {
            finalize();
            return;
        }
        if (!m_table.transition(m_jobId, JobStatus::Completed)) {
            finalize();
            return;
        }
        job->progressPercent = 100;
        job->speedBytesPerSec = 0;
        job->etaSeconds.reset();

        const ReconcileResult result = reconcileOutput(*job);
        if (result.found()) {
            applyReconcileResult(*job, result);
            qInfo() << "Job" << m_jobId << "output" << result.fileName << result.size << "bytes via"
                    << reconcileStrategyName(result.strategy);
            emit reconciled(m_jobId, result.fileName, result.size);
        } else {
            qWarning() << "Could not verify output of job" << m_jobId << ":" << result.error;
            emit logMessage(m_jobId, QStringLiteral("warning"),
                            QStringLiteral("%1: %2").arg(errorKindName(ErrorKind::FilesystemError), result.error));
        }
        emit jobUpdated(m_jobId);
        emit logMessage(m_jobId, QStringLiteral("info"), QStringLiteral("Download completed"));
        finalize();
        return;
    }

    if (job->status != JobStatus::Error) {
        if (!job->lastError) {
            job->lastError = crashed
                ? makeJobError(ErrorKind::NonZeroExit, QStringLiteral("yt-dlp terminated unexpectedly"))
                : makeJobError(ErrorKind::NonZeroExit, QStringLiteral("yt-dlp exited with code %1").arg(exitCode));
        }
        m_table.transition(m_jobId, JobStatus::Error);
        job->speedBytesPerSec = 0;
        job->etaSeconds.reset();
        emit jobUpdated(m_jobId);
    }
    qWarning() << "Job" << m_jobId << "failed:" << (job->lastError ? job->lastError->message : QString());
    emit logMessage(m_jobId, QStringLiteral("error"),
                    job->lastError ? job->lastError->message : QStringLiteral("Download failed"));
    finalize();
}

void DownloadRunner::onFailedToStart(const QString& message)
{
    fail(makeJobError(ErrorKind::SpawnFailure,
                      QStringLiteral("Failed to start %1: %2").arg(m_settings.downloaderPath, message),
                      message));
}

void DownloadRunner::fail(const JobError& error)
{
    if (m_finalized) return;
    if (DownloadJob* job = m_table.find(m_jobId)) {
        job->lastError = error;
        m_table.transition(m_jobId, JobStatus::Error);
        job->speedBytesPerSec = 0;
        job->etaSeconds.reset();
        emit jobUpdated(m_jobId);
    }
    qWarning() << "Job" << m_jobId << errorKindName(error.kind) << ":" << error.message;
    emit logMessage(m_jobId, QStringLiteral("error"), error.message);
    finalize();
}

bool DownloadRunner::moveTo(JobStatus status)
{
    if (!m_table.transition(m_jobId, status)) return false;
    emit jobUpdated(m_jobId);
    return true;
}

void DownloadRunner::finalize()
{
    if (m_finalized) return;
    m_finalized = true;
    releaseProcess();
    emit finished(m_jobId);
}

void DownloadRunner::releaseProcess()
{
    if (!m_process) return;
    DownloaderProcess* process = m_process;
    m_process = nullptr;

    process->disconnect(this);
    if (process->isRunning()) {
        // Outlive the runner until the termination signal takes effect.
        process->setParent(parent());
        connect(process, &DownloaderProcess::exited, process, &QObject::deleteLater);
        connect(process, &DownloaderProcess::failedToStart, process, &QObject::deleteLater);
        process->terminate();
    } else {
        process->deleteLater();
    }
}
