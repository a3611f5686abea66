/*!
 * @file        log_utils.cppm
 * @brief       Logging setup helpers.
 * @details     Configures the Qt message handler pattern and category filter
 *              rules from a textual severity threshold. The effective level is
 *              resolved from the environment first, then from configuration.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module reel.utils.log_utils;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::utils {

/**
 * @brief Resolve the effective log level.
 *
 * REEL_LOG_LEVEL wins over the configured value, which wins over "info".
 *
 * @param configured Level from settings or the command line.
 * @return Lower-case level name.
 */
QString resolveLogLevel(const QString& configured);

/**
 * @brief Check whether a level name is understood by configureLogging().
 * @param level Level name.
 * @return true for debug, info, warning and error.
 */
bool isKnownLogLevel(const QString& level);

/**
 * @brief Install message pattern and filter rules.
 *
 * The pattern can be overridden with REEL_LOG_PATTERN. Unknown levels fall
 * back to "info" with a warning.
 *
 * @param level Threshold name.
 * @return false when the level was unknown.
 */
bool configureLogging(const QString& level);

} // namespace reel::utils
