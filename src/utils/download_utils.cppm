/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for output path and file handling.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across download core components. These utilities handle common
 *              tasks such as path normalization, output directory preparation,
 *              title sanitizing, and inspection of the files a downloader run
 *              left behind.
 *
 *              Helpers that touch the filesystem only read from it, except
 *              ensureDirectory() which creates the requested path.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <functional>

#ifndef Q_MOC_RUN
export module reel.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Checks whether a normalized path exists and refers to a regular file.
 *
 * @param path Normalized filesystem path.
 * @return true if the path exists and is a file, false otherwise.
 */
bool fileExistsPath(const QString& path);

/**
 * @brief Creates a directory and all missing parents.
 *
 * @param path Directory path.
 * @param errorMessage Optional receiver for a human readable failure reason.
 * @return true if the directory exists afterwards.
 */
bool ensureDirectory(const QString& path, QString* errorMessage = nullptr);

/**
 * @brief Returns the last path component of a file reference.
 *
 * Accepts both '/' and '\\' separators and strips surrounding quotes, so
 * downloader output written on any platform reduces to a bare file name.
 *
 * @param path File path as printed by the downloader.
 * @return Base name, or an empty string.
 */
QString baseFileName(const QString& path);

/**
 * @brief Replaces characters that are not allowed in file names.
 *
 * Each of `< > : " / \ | ? *` becomes an underscore.
 *
 * @param title Media title.
 * @return File-system safe name.
 */
QString sanitizeFileName(const QString& title);

/**
 * @brief Checks whether a file name belongs to an unfinished download.
 * @param fileName Bare file name.
 * @return true for .part/.ytdl/.temp/.tmp artifacts and hidden files.
 */
bool isPartialArtifact(const QString& fileName);

/**
 * @brief Finds the most recently modified regular file in a directory.
 *
 * @param directory Directory to scan (not recursive).
 * @param accept Predicate on the bare file name; null accepts everything.
 * @param notBefore When valid, files whose modification and metadata-change
 *                  times are both older than this are skipped.
 * @return Bare file name, or an empty string when nothing matched.
 */
QString mostRecentFile(const QString& directory,
                       const std::function<bool(const QString&)>& accept = {},
                       const QDateTime& notBefore = QDateTime());

/**
 * @brief Parses a human readable byte count printed by the downloader.
 *
 * Accepts `<number><unit>` with unit B, KiB, MiB or GiB and an optional
 * leading `~`. Returns -1 for `N/A`, `Unknown` and anything unparsable.
 *
 * @param text Size token.
 * @return Size in bytes, or -1.
 */
qint64 parseByteSize(const QString& text);

/**
 * @brief Formats a byte count with binary units.
 * @param bytes Byte count.
 * @return Text such as "50.00MiB".
 */
QString formatByteSize(qint64 bytes);

} // namespace reel::utils
