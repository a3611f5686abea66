module;
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrl>
#include <QtGlobal>

#include <cmath>
#include <functional>

module reel.utils.download_utils;

namespace reel::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

bool fileExistsPath(const QString& path)
{
    if (path.isEmpty()) return false;
    QFileInfo info(path);
    return info.exists() && info.isFile();
}

bool ensureDirectory(const QString& path, QString* errorMessage)
{
    const QString localPath = normalizeFilePath(path);
    if (localPath.isEmpty()) {
        if (errorMessage) *errorMessage = QStringLiteral("Output directory is empty");
        return false;
    }
    QFileInfo info(localPath);
    if (info.exists()) {
        if (info.isDir()) return true;
        if (errorMessage) *errorMessage = QStringLiteral("Cannot create output directory %1: a file is in the way").arg(localPath);
        return false;
    }
    if (!QDir().mkpath(localPath)) {
        if (errorMessage) *errorMessage = QStringLiteral("Cannot create output directory %1").arg(localPath);
        return false;
    }
    return true;
}

QString baseFileName(const QString& path)
{
    QString p = path.trimmed();
    if (p.size() >= 2 && p.startsWith('"') && p.endsWith('"')) {
        p = p.mid(1, p.size() - 2);
    }
    const int slash = qMax(p.lastIndexOf('/'), p.lastIndexOf('\\'));
    return slash >= 0 ? p.mid(slash + 1) : p;
}

QString sanitizeFileName(const QString& title)
{
    static const QRegularExpression forbidden(QStringLiteral("[<>:\"/\\\\|?*]"));
    QString name = title;
    name.replace(forbidden, QStringLiteral("_"));
    return name;
}

bool isPartialArtifact(const QString& fileName)
{
    if (fileName.isEmpty() || fileName.startsWith('.')) return true;
    const QString lower = fileName.toLower();
    return lower.endsWith(".part") || lower.endsWith(".ytdl")
        || lower.endsWith(".temp") || lower.endsWith(".tmp")
        || lower.contains(".part-frag");
}

QString mostRecentFile(const QString& directory,
                       const std::function<bool(const QString&)>& accept,
                       const QDateTime& notBefore)
{
    QDir dir(normalizeFilePath(directory));
    if (!dir.exists()) return QString();

    QString best;
    QDateTime bestTime;
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot);
    for (const QFileInfo& info : entries) {
        const QString name = info.fileName();
        if (accept && !accept(name)) continue;
        const QDateTime modified = info.lastModified();
        if (notBefore.isValid()) {
            const QDateTime changed = info.metadataChangeTime();
            if (modified < notBefore && (!changed.isValid() || changed < notBefore)) continue;
        }
        if (best.isEmpty() || modified > bestTime) {
            best = name;
            bestTime = modified;
        }
    }
    return best;
}

qint64 parseByteSize(const QString& text)
{
    static const QRegularExpression re(QStringLiteral("^~?\\s*(\\d+(?:\\.\\d+)?)\\s*(GiB|MiB|KiB|B)$"));
    const auto match = re.match(text.trimmed());
    if (!match.hasMatch()) return -1;

    bool ok = false;
    const double value = match.captured(1).toDouble(&ok);
    if (!ok) return -1;

    const QString unit = match.captured(2);
    double multiplier = 1.0;
    if (unit == "KiB") multiplier = 1024.0;
    else if (unit == "MiB") multiplier = 1024.0 * 1024.0;
    else if (unit == "GiB") multiplier = 1024.0 * 1024.0 * 1024.0;
    return static_cast<qint64>(std::llround(value * multiplier));
}

QString formatByteSize(qint64 bytes)
{
    const char* units[] = { "B", "KiB", "MiB", "GiB" };
    double value = static_cast<double>(qMax<qint64>(0, bytes));
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) return QStringLiteral("%1B").arg(bytes);
    return QStringLiteral("%1%2").arg(value, 0, 'f', 2).arg(QLatin1String(units[unit]));
}

} // namespace reel::utils
