/*!
 * @file        progressparser.cppm
 * @brief       Line-oriented parser for downloader progress and diagnostics.
 * @details     Turns one line of downloader output into a structured partial
 *              update. Parsing is a pure function of the line and a snapshot
 *              of the job, so replaying a line yields the same update.
 *
 *              Lines are matched against an ordered rule list. When several
 *              rules match, the earlier rule owns every field it sets and
 *              later rules only fill fields that are still empty.
 *
 *              Applying an update to a job is a separate step so that the
 *              filename precedence and progress monotonicity policies can be
 *              exercised without any line matching.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module reel.core.progressparser;
import reel.core.downloadjob;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Partial job update extracted from a single output line.
 *
 * Absent optionals mean "not mentioned by this line". ETA needs a separate
 * presence flag because an explicit unknown ETA clears the stored value.
 */
REEL_MODULE_EXPORT struct ProgressUpdate {
    std::optional<int> progressPercent;         //!< Rounded and clamped percentage.
    std::optional<qint64> speedBytesPerSec;     //!< Current speed.
    bool hasEta = false;                        //!< Line carried an ETA token.
    std::optional<int> etaSeconds;              //!< ETA, null for unknown.
    std::optional<qint64> downloadedBytes;      //!< Bytes received so far.
    std::optional<qint64> totalBytes;           //!< Expected size.
    std::optional<JobStatus> status;            //!< Status implied by the line.
    QString filename;                           //!< Candidate output file name.
    FilenameSource filenameSource = FilenameSource::None; //!< Confidence of filename.
    bool isError = false;                       //!< Line is a hard error.
    bool isWarning = false;                     //!< Line is a warning.
    QString message;                            //!< Raw diagnostic text.
    QStringList matchedRules;                   //!< Names of the rules that fired.

    //!< @brief True when the line contributed nothing.
    bool isEmpty() const { return matchedRules.isEmpty(); }
};

/**
 * @brief How a progress percentage is merged into a job.
 */
REEL_MODULE_EXPORT enum class ProgressMode {
    Overwrite,      //!< Take the reported value as is (first report of a run).
    Monotonic       //!< Never lower the stored value.
};

/**
 * @brief Parse one line of downloader output.
 *
 * Rules in priority order: structured progress, post-processing marker,
 * destination, already-downloaded, bare file name, error/warning marker,
 * throughput without a percentage.
 *
 * @param line Raw output line.
 * @param snapshot Current job state, used to derive received bytes.
 * @return Partial update.
 */
REEL_MODULE_EXPORT ProgressUpdate parseProgressLine(const QString& line, const DownloadJob& snapshot);

/**
 * @brief Merge a partial update into a job.
 *
 * Status and diagnostics are left to the caller. Filenames follow the
 * confidence order of FilenameSource: a merge marker always wins, a
 * destination replaces anything but a merge, weaker sources only fill in
 * a missing name.
 *
 * @param job Job to update.
 * @param update Parsed update.
 * @param mode Percentage merge policy.
 * @return true if any field changed.
 */
REEL_MODULE_EXPORT bool applyProgressUpdate(DownloadJob& job, const ProgressUpdate& update, ProgressMode mode);

/**
 * @brief Parse a percentage token such as " 50.0".
 * @param text Number without the percent sign.
 * @return Rounded value clamped into [0,100], or nullopt.
 */
REEL_MODULE_EXPORT std::optional<int> parsePercentToken(const QString& text);

/**
 * @brief Parse a size token such as "~10.5MiB".
 * @param text Size token.
 * @return Bytes, or nullopt for N/A and malformed input.
 */
REEL_MODULE_EXPORT std::optional<qint64> parseSizeToken(const QString& text);

/**
 * @brief Parse a speed token such as "2.00MiB/s".
 * @param text Speed token.
 * @return Bytes per second, or nullopt.
 */
REEL_MODULE_EXPORT std::optional<qint64> parseSpeedToken(const QString& text);

/**
 * @brief Parse an ETA token.
 *
 * "mm:ss" and "h:mm:ss" give seconds. "--:--", "00:00", "Unknown" and
 * malformed input give nullopt.
 *
 * @param text ETA token.
 * @return Seconds, or nullopt when unknown.
 */
REEL_MODULE_EXPORT std::optional<int> parseEtaToken(const QString& text);
