module;
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

module reel.core.downloadjob;

namespace {

QJsonValue timestampValue(const QDateTime& dt)
{
    if (!dt.isValid()) return QJsonValue(QJsonValue::Null);
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QJsonValue optionalString(const QString& value)
{
    if (value.isEmpty()) return QJsonValue(QJsonValue::Null);
    return value;
}

} // namespace

QString jobStatusName(JobStatus status)
{
    switch (status) {
    case JobStatus::Pending: return QStringLiteral("pending");
    case JobStatus::Initializing: return QStringLiteral("initializing");
    case JobStatus::Connecting: return QStringLiteral("connecting");
    case JobStatus::Downloading: return QStringLiteral("downloading");
    case JobStatus::Processing: return QStringLiteral("processing");
    case JobStatus::Paused: return QStringLiteral("paused");
    case JobStatus::Completed: return QStringLiteral("completed");
    case JobStatus::Error: return QStringLiteral("error");
    }
    return QStringLiteral("unknown");
}

std::optional<JobStatus> jobStatusFromName(const QString& name)
{
    static const JobStatus all[] = {
        JobStatus::Pending, JobStatus::Initializing, JobStatus::Connecting, JobStatus::Downloading,
        JobStatus::Processing, JobStatus::Paused, JobStatus::Completed, JobStatus::Error
    };
    for (JobStatus s : all) {
        if (jobStatusName(s) == name) return s;
    }
    return std::nullopt;
}

bool isActiveJobStatus(JobStatus status)
{
    return status == JobStatus::Initializing || status == JobStatus::Connecting
        || status == JobStatus::Downloading || status == JobStatus::Processing;
}

bool isTerminalJobStatus(JobStatus status)
{
    return status == JobStatus::Completed || status == JobStatus::Error;
}

bool canTransition(JobStatus from, JobStatus to)
{
    switch (from) {
    case JobStatus::Pending:
        return to == JobStatus::Initializing || to == JobStatus::Downloading || to == JobStatus::Paused;
    case JobStatus::Initializing:
        return to == JobStatus::Connecting || to == JobStatus::Downloading || to == JobStatus::Error;
    case JobStatus::Connecting:
        return to == JobStatus::Downloading || to == JobStatus::Processing || to == JobStatus::Completed
            || to == JobStatus::Error || to == JobStatus::Paused;
    case JobStatus::Downloading:
        return to == JobStatus::Processing || to == JobStatus::Completed
            || to == JobStatus::Error || to == JobStatus::Paused;
    case JobStatus::Processing:
        // Multi-stream downloads interleave post-processing with further streams.
        return to == JobStatus::Downloading || to == JobStatus::Completed
            || to == JobStatus::Error || to == JobStatus::Paused;
    case JobStatus::Paused:
        return to == JobStatus::Pending;
    case JobStatus::Error:
        return to == JobStatus::Pending;
    case JobStatus::Completed:
        return false;
    }
    return false;
}

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::SpawnFailure: return QStringLiteral("SpawnFailure");
    case ErrorKind::AccessDenied: return QStringLiteral("AccessDenied");
    case ErrorKind::NotFound: return QStringLiteral("NotFound");
    case ErrorKind::MediaUnavailable: return QStringLiteral("MediaUnavailable");
    case ErrorKind::AuthRequired: return QStringLiteral("AuthRequired");
    case ErrorKind::FormatUnavailable: return QStringLiteral("FormatUnavailable");
    case ErrorKind::GenericExtractorError: return QStringLiteral("GenericExtractorError");
    case ErrorKind::NonZeroExit: return QStringLiteral("NonZeroExit");
    case ErrorKind::FilesystemError: return QStringLiteral("FilesystemError");
    }
    return QStringLiteral("Unknown");
}

JobError classifyErrorText(const QString& text)
{
    const QString raw = text.trimmed();
    if (raw.contains("403: Forbidden") || raw.contains("HTTP Error 403")) {
        return makeJobError(ErrorKind::AccessDenied,
                            QStringLiteral("Access denied (403). This video might be private, age-restricted, or require authentication."),
                            raw);
    }
    if (raw.contains("404: Not Found") || raw.contains("HTTP Error 404")) {
        return makeJobError(ErrorKind::NotFound,
                            QStringLiteral("Video not found (404). The URL might be invalid or the video has been removed."),
                            raw);
    }
    if (raw.contains("Sign in to confirm") || raw.contains("login required", Qt::CaseInsensitive)
        || (raw.contains("cookies") && raw.contains("authentication"))) {
        return makeJobError(ErrorKind::AuthRequired,
                            QStringLiteral("This video requires age verification or a signed-in account."),
                            raw);
    }
    if (raw.contains("Video unavailable") || raw.contains("This video is unavailable") || raw.contains("Private video")) {
        return makeJobError(ErrorKind::MediaUnavailable,
                            QStringLiteral("This video is unavailable. It might be private, deleted, or region-restricted."),
                            raw);
    }
    if (raw.contains("Requested format is not available")) {
        return makeJobError(ErrorKind::FormatUnavailable,
                            QStringLiteral("The selected format is not available for this video. Try a different preset or quality setting."),
                            raw);
    }
    return makeJobError(ErrorKind::GenericExtractorError, raw, raw);
}

JobError makeJobError(ErrorKind kind, const QString& message, const QString& detail)
{
    JobError error;
    error.kind = kind;
    error.message = message;
    error.detail = detail;
    return error;
}

QJsonObject metadataToJson(const MediaMetadata& metadata)
{
    QJsonObject obj;
    obj.insert("title", metadata.title);
    obj.insert("uploader", metadata.uploader);
    obj.insert("thumbnail", metadata.thumbnail);
    obj.insert("duration", metadata.duration);
    if (metadata.isPlaylist()) {
        QJsonArray entries;
        for (const PlaylistEntry& entry : metadata.entries) {
            QJsonObject e;
            e.insert("id", entry.id);
            e.insert("title", entry.title);
            e.insert("url", entry.url);
            e.insert("uploader", entry.uploader);
            e.insert("thumbnail", entry.thumbnail);
            e.insert("duration", entry.duration);
            entries.append(e);
        }
        obj.insert("entries", entries);
    }
    return obj;
}

QJsonObject jobToJson(const DownloadJob& job)
{
    QJsonObject obj;
    obj.insert("id", job.id);
    obj.insert("url", job.url);
    obj.insert("status", jobStatusName(job.status));
    obj.insert("quality", job.quality);
    obj.insert("outputDirectory", job.outputDirectory);
    obj.insert("progress", job.progressPercent);
    obj.insert("speed", static_cast<double>(job.speedBytesPerSec));
    obj.insert("eta", job.etaSeconds ? QJsonValue(*job.etaSeconds) : QJsonValue(QJsonValue::Null));
    obj.insert("downloaded", static_cast<double>(job.downloadedBytes));
    obj.insert("filesize", static_cast<double>(job.totalBytes));
    obj.insert("filename", optionalString(job.resolvedFilename));
    obj.insert("metadata", job.metadata ? QJsonValue(metadataToJson(*job.metadata)) : QJsonValue(QJsonValue::Null));
    if (job.lastError) {
        QJsonObject err;
        err.insert("kind", errorKindName(job.lastError->kind));
        err.insert("message", job.lastError->message);
        err.insert("detail", job.lastError->detail);
        obj.insert("error", err);
    } else {
        obj.insert("error", QJsonValue(QJsonValue::Null));
    }
    obj.insert("retryCount", job.retryCount);
    obj.insert("addedAt", timestampValue(job.addedAt));
    obj.insert("startedAt", timestampValue(job.startedAt));
    obj.insert("completedAt", timestampValue(job.completedAt));
    return obj;
}
