module;
#include <QString>
#include <QStringList>

module reel.utils.category_utils;

namespace reel::utils {

namespace {

QString extensionOf(const QString& filePath)
{
    const QString lower = filePath.toLower();
    const int dot = lower.lastIndexOf('.');
    return dot >= 0 ? lower.mid(dot + 1) : QString();
}

} // namespace

QString detectCategory(const QString& filePath)
{
    const QString ext = extensionOf(filePath);
    if (videoExtensions().contains(ext)) return "Video";
    if (audioExtensions().contains(ext)) return "Audio";
    return "Other";
}

QStringList videoExtensions()
{
    return { "mp4", "mkv", "avi", "mov", "webm", "flv", "wmv" };
}

QStringList audioExtensions()
{
    return { "mp3", "m4a", "aac", "ogg", "wav", "opus", "flac" };
}

QStringList mediaExtensions()
{
    return { "mp4", "mp3", "mkv", "avi", "mov", "wmv", "flv", "webm", "m4a", "aac", "ogg", "wav" };
}

bool isVideoFileName(const QString& fileName)
{
    return videoExtensions().contains(extensionOf(fileName));
}

QStringList candidateExtensionsFor(const QString& quality)
{
    if (quality == "audio") {
        return { ".mp3", ".m4a", ".aac", ".ogg" };
    }
    return { ".mp4", ".mkv", ".avi", ".mov" };
}

} // namespace reel::utils
