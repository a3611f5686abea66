module;
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QStringList>

module reel.core.outputreconciler;

import reel.core.downloadjob;
import reel.utils.download_utils;
import reel.utils.category_utils;

namespace utils = reel::utils;

namespace {

ReconcileResult makeResult(ReconcileStrategy strategy, const QFileInfo& info)
{
    ReconcileResult result;
    result.strategy = strategy;
    result.fileName = info.fileName();
    result.size = info.size();
    return result;
}

} // namespace

QString reconcileStrategyName(ReconcileStrategy strategy)
{
    switch (strategy) {
    case ReconcileStrategy::None: return QStringLiteral("none");
    case ReconcileStrategy::ResolvedFilename: return QStringLiteral("resolved-filename");
    case ReconcileStrategy::RecentFile: return QStringLiteral("recent-file");
    case ReconcileStrategy::MetadataTitle: return QStringLiteral("metadata-title");
    case ReconcileStrategy::RecentVideo: return QStringLiteral("recent-video");
    }
    return QStringLiteral("none");
}

ReconcileResult reconcileOutput(const DownloadJob& job)
{
    const QDir dir(utils::normalizeFilePath(job.outputDirectory));

    if (!job.resolvedFilename.isEmpty()) {
        const QFileInfo info(dir.filePath(job.resolvedFilename));
        if (info.exists() && info.isFile()) {
            return makeResult(ReconcileStrategy::ResolvedFilename, info);
        }
        ReconcileResult missing;
        missing.error = QStringLiteral("Resolved file %1 is missing").arg(info.filePath());
        return missing;
    }

    if (!dir.exists()) {
        ReconcileResult missing;
        missing.error = QStringLiteral("Output directory %1 does not exist").arg(dir.path());
        return missing;
    }

    const QString recent = utils::mostRecentFile(
        dir.path(),
        [](const QString& name) { return !utils::isPartialArtifact(name); },
        job.startedAt);
    if (!recent.isEmpty()) {
        return makeResult(ReconcileStrategy::RecentFile, QFileInfo(dir.filePath(recent)));
    }

    if (job.metadata && !job.metadata->title.isEmpty()) {
        const QString base = utils::sanitizeFileName(job.metadata->title);
        for (const QString& ext : utils::candidateExtensionsFor(job.quality)) {
            const QFileInfo info(dir.filePath(base + ext));
            if (info.exists() && info.isFile()) {
                return makeResult(ReconcileStrategy::MetadataTitle, info);
            }
        }
    }

    const QString video = utils::mostRecentFile(dir.path(), [](const QString& name) {
        return utils::isVideoFileName(name) && !utils::isPartialArtifact(name);
    });
    if (!video.isEmpty()) {
        return makeResult(ReconcileStrategy::RecentVideo, QFileInfo(dir.filePath(video)));
    }

    ReconcileResult missing;
    missing.error = QStringLiteral("No output file found in %1").arg(dir.path());
    return missing;
}

bool applyReconcileResult(DownloadJob& job, const ReconcileResult& result)
{
    if (!result.found()) return false;
    bool changed = false;
    if (job.resolvedFilename != result.fileName) {
        job.resolvedFilename = result.fileName;
        changed = true;
    }
    if (job.downloadedBytes != result.size || job.totalBytes != result.size) {
        job.downloadedBytes = result.size;
        job.totalBytes = result.size;
        changed = true;
    }
    return changed;
}
