module;
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <cmath>
#include <optional>

module reel.core.progressparser;

import reel.core.downloadjob;
import reel.utils.download_utils;
import reel.utils.category_utils;

namespace utils = reel::utils;

namespace {

const QString kSizePattern = QStringLiteral("~?\\s*\\d+(?:\\.\\d+)?\\s*(?:GiB|MiB|KiB|B)");

const QRegularExpression& templatePercentRe()
{
    static const QRegularExpression re(QStringLiteral("\\[\\s*(\\d+(?:\\.\\d+)?)%\\]"));
    return re;
}

const QRegularExpression& nativePercentRe()
{
    static const QRegularExpression re(QStringLiteral("^\\[download\\]\\s+(\\d+(?:\\.\\d+)?)%"));
    return re;
}

const QRegularExpression& speedRe()
{
    static const QRegularExpression re(QStringLiteral("(\\d+(?:\\.\\d+)?\\s*(?:GiB|MiB|KiB|B)/s)"));
    return re;
}

const QRegularExpression& etaRe()
{
    static const QRegularExpression re(QStringLiteral("ETA\\s+(\\d{1,2}:\\d{2}(?::\\d{2})?|--:--|Unknown|N/A)"));
    return re;
}

const QRegularExpression& downloadedRe()
{
    static const QRegularExpression re(QStringLiteral("downloaded\\s+(%1|N/A)").arg(kSizePattern));
    return re;
}

const QRegularExpression& totalRe()
{
    static const QRegularExpression re(QStringLiteral("\\bof\\s+(%1|N/A)").arg(kSizePattern));
    return re;
}

const QRegularExpression& postProcessRe()
{
    static const QRegularExpression re(QStringLiteral(
        "^\\[(Merger|ExtractAudio|VideoRemuxer|VideoConvertor|FFmpeg\\w*|Fixup\\w*|EmbedSubtitle|EmbedThumbnail|Metadata)\\]"));
    return re;
}

const QRegularExpression& quotedRe()
{
    static const QRegularExpression re(QStringLiteral("\"([^\"]+)\""));
    return re;
}

const QRegularExpression& destinationRe()
{
    static const QRegularExpression re(QStringLiteral("Destination:\\s+(.+)$"));
    return re;
}

const QRegularExpression& alreadyDownloadedRe()
{
    static const QRegularExpression re(QStringLiteral("^\\[download\\]\\s+(.+?)\\s+has already been downloaded"));
    return re;
}

const QRegularExpression& leadingTagRe()
{
    static const QRegularExpression re(QStringLiteral("^\\[[^\\]]+\\]\\s*"));
    return re;
}

const QRegularExpression& bareFilenameRe()
{
    static const QRegularExpression re(
        QStringLiteral("([^/\\\\]+\\.(?:%1))$").arg(utils::mediaExtensions().join('|')),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

void setFilename(ProgressUpdate& update, const QString& path, FilenameSource source)
{
    if (!update.filename.isEmpty()) return;
    const QString name = utils::baseFileName(path);
    if (name.isEmpty()) return;
    update.filename = name;
    update.filenameSource = source;
}

bool applyProgressRule(const QString& line, const DownloadJob& snapshot, ProgressUpdate& update)
{
    auto match = templatePercentRe().match(line);
    if (!match.hasMatch()) match = nativePercentRe().match(line);
    if (!match.hasMatch()) return false;

    const std::optional<int> percent = parsePercentToken(match.captured(1));
    if (!percent) return false;
    update.progressPercent = percent;

    if (const auto m = speedRe().match(line); m.hasMatch()) {
        update.speedBytesPerSec = parseSpeedToken(m.captured(1));
    }
    if (const auto m = etaRe().match(line); m.hasMatch()) {
        update.hasEta = true;
        update.etaSeconds = parseEtaToken(m.captured(1));
    }
    if (const auto m = downloadedRe().match(line); m.hasMatch()) {
        update.downloadedBytes = parseSizeToken(m.captured(1));
    }
    if (const auto m = totalRe().match(line); m.hasMatch()) {
        update.totalBytes = parseSizeToken(m.captured(1));
    }

    if (!update.downloadedBytes && *percent > 0) {
        const qint64 total = update.totalBytes ? *update.totalBytes : snapshot.totalBytes;
        if (total > 0) {
            update.downloadedBytes = static_cast<qint64>(std::llround(*percent / 100.0 * static_cast<double>(total)));
        }
    }

    if (!update.status) update.status = JobStatus::Downloading;
    return true;
}

bool applyPostProcessRule(const QString& line, const DownloadJob&, ProgressUpdate& update)
{
    if (!postProcessRe().match(line).hasMatch()) return false;
    if (!update.status) update.status = JobStatus::Processing;

    QString quoted;
    auto it = quotedRe().globalMatch(line);
    while (it.hasNext()) {
        quoted = it.next().captured(1);
    }
    if (!quoted.isEmpty()) setFilename(update, quoted, FilenameSource::Merge);
    return true;
}

bool applyDestinationRule(const QString& line, const DownloadJob&, ProgressUpdate& update)
{
    const auto match = destinationRe().match(line);
    if (!match.hasMatch()) return false;
    setFilename(update, match.captured(1), FilenameSource::Destination);
    return true;
}

bool applyAlreadyDownloadedRule(const QString& line, const DownloadJob&, ProgressUpdate& update)
{
    const auto match = alreadyDownloadedRe().match(line);
    if (!match.hasMatch()) return false;
    setFilename(update, match.captured(1), FilenameSource::AlreadyDownloaded);
    return true;
}

bool applyBareFilenameRule(const QString& line, const DownloadJob&, ProgressUpdate& update)
{
    QString rest = line;
    rest.remove(leadingTagRe());
    const auto match = bareFilenameRe().match(rest);
    if (!match.hasMatch()) return false;
    setFilename(update, match.captured(1), FilenameSource::BareToken);
    return true;
}

bool applyDiagnosticRule(const QString& line, const DownloadJob&, ProgressUpdate& update)
{
    if (line.contains(QLatin1String("ERROR:"))) {
        update.isError = true;
        update.message = line;
        return true;
    }
    if (line.contains(QLatin1String("WARNING:"))) {
        update.isWarning = true;
        update.message = line;
        return true;
    }
    return false;
}

bool applyThroughputRule(const QString& line, const DownloadJob&, ProgressUpdate& update)
{
    if (update.progressPercent) return false;
    bool matched = false;
    if (const auto m = speedRe().match(line); m.hasMatch()) {
        update.speedBytesPerSec = parseSpeedToken(m.captured(1));
        matched = update.speedBytesPerSec.has_value();
    }
    if (const auto m = etaRe().match(line); m.hasMatch()) {
        update.hasEta = true;
        update.etaSeconds = parseEtaToken(m.captured(1));
        matched = true;
    }
    return matched;
}

struct ParseRule {
    const char* name;
    bool (*apply)(const QString& line, const DownloadJob& snapshot, ProgressUpdate& update);
};

const ParseRule kRules[] = {
    { "progress", applyProgressRule },
    { "post-process", applyPostProcessRule },
    { "destination", applyDestinationRule },
    { "already-downloaded", applyAlreadyDownloadedRule },
    { "bare-filename", applyBareFilenameRule },
    { "diagnostic", applyDiagnosticRule },
    { "throughput", applyThroughputRule },
};

} // namespace

ProgressUpdate parseProgressLine(const QString& line, const DownloadJob& snapshot)
{
    ProgressUpdate update;
    const QString trimmed = line.trimmed();
    if (trimmed.isEmpty()) return update;

    for (const ParseRule& rule : kRules) {
        if (rule.apply(trimmed, snapshot, update)) {
            update.matchedRules.append(QLatin1String(rule.name));
        }
    }
    return update;
}

bool applyProgressUpdate(DownloadJob& job, const ProgressUpdate& update, ProgressMode mode)
{
    bool changed = false;

    if (update.progressPercent) {
        const int next = mode == ProgressMode::Monotonic
            ? qMax(job.progressPercent, *update.progressPercent)
            : *update.progressPercent;
        if (next != job.progressPercent) {
            job.progressPercent = next;
            changed = true;
        }
    }
    if (update.speedBytesPerSec && *update.speedBytesPerSec != job.speedBytesPerSec) {
        job.speedBytesPerSec = *update.speedBytesPerSec;
        changed = true;
    }
    if (update.hasEta && update.etaSeconds != job.etaSeconds) {
        job.etaSeconds = update.etaSeconds;
        changed = true;
    }
    if (update.downloadedBytes && *update.downloadedBytes != job.downloadedBytes) {
        job.downloadedBytes = *update.downloadedBytes;
        changed = true;
    }
    if (update.totalBytes && *update.totalBytes != job.totalBytes) {
        job.totalBytes = *update.totalBytes;
        changed = true;
    }

    if (!update.filename.isEmpty()) {
        bool accept = false;
        switch (update.filenameSource) {
        case FilenameSource::Merge:
            accept = true;
            break;
        case FilenameSource::Destination:
            accept = job.filenameSource != FilenameSource::Merge;
            break;
        case FilenameSource::AlreadyDownloaded:
        case FilenameSource::BareToken:
            accept = job.filenameSource < update.filenameSource;
            break;
        case FilenameSource::None:
            break;
        }
        if (accept && (job.resolvedFilename != update.filename || job.filenameSource != update.filenameSource)) {
            job.resolvedFilename = update.filename;
            job.filenameSource = update.filenameSource;
            changed = true;
        }
    }
    return changed;
}

std::optional<int> parsePercentToken(const QString& text)
{
    bool ok = false;
    const double value = text.trimmed().toDouble(&ok);
    if (!ok || std::isnan(value)) return std::nullopt;
    const long rounded = std::lround(value);
    return static_cast<int>(qBound(0L, rounded, 100L));
}

std::optional<qint64> parseSizeToken(const QString& text)
{
    const qint64 bytes = utils::parseByteSize(text);
    if (bytes < 0) return std::nullopt;
    return bytes;
}

std::optional<qint64> parseSpeedToken(const QString& text)
{
    QString token = text.trimmed();
    if (!token.endsWith(QLatin1String("/s"))) return std::nullopt;
    token.chop(2);
    return parseSizeToken(token);
}

std::optional<int> parseEtaToken(const QString& text)
{
    const QString token = text.trimmed();
    const QStringList parts = token.split(':');
    if (parts.size() < 2 || parts.size() > 3) return std::nullopt;

    int seconds = 0;
    for (const QString& part : parts) {
        bool ok = false;
        const int value = part.toInt(&ok);
        if (!ok || value < 0) return std::nullopt;
        seconds = seconds * 60 + value;
    }
    if (seconds == 0) return std::nullopt;
    return seconds;
}
