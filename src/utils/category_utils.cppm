/*!
 * @file        category_utils.cppm
 * @brief       Media category detection utilities.
 * @details     Provides helpers for classifying downloaded files by extension
 *              and for listing the extensions a given quality selector is
 *              expected to produce.
 *
 *              These lists drive output reconciliation after a run and the
 *              bare-filename rule of the progress parser.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.utils.category_utils;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::utils {

/**
 * @brief Detects the media category for a given file path.
 *
 * The category is inferred from the file extension.
 *
 * @param filePath Full file name or path.
 * @return "Video", "Audio" or "Other".
 */
QString detectCategory(const QString& filePath);

//!< @brief Extensions (without dot) that identify a video container.
QStringList videoExtensions();

//!< @brief Extensions (without dot) that identify an audio container.
QStringList audioExtensions();

//!< @brief Every extension the downloader is known to produce for media.
QStringList mediaExtensions();

/**
 * @brief Checks whether a file name ends in a video extension.
 * @param fileName File name or path.
 * @return true for video containers.
 */
bool isVideoFileName(const QString& fileName);

/**
 * @brief Extensions (with dot) to probe for the output of a quality selector.
 *
 * Audio-only selectors probe audio containers, everything else probes the
 * common video containers.
 *
 * @param quality Quality selector of the job.
 * @return Ordered list of candidate suffixes.
 */
QStringList candidateExtensionsFor(const QString& quality);

} // namespace reel::utils
