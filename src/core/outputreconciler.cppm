/*!
 * @file        outputreconciler.cppm
 * @brief       Post-completion recovery of the real output file.
 * @details     After a successful run the streamed filename and byte counts
 *              are only estimates. The reconciler looks at the output
 *              directory to find the file the downloader actually produced
 *              and reports its real size.
 *
 *              Candidates are tried in order: the resolved filename, the
 *              newest file written during the run, a name synthesized from the
 *              media title, and finally the newest video file in the
 *              directory.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.core.outputreconciler;
import reel.core.downloadjob;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Which candidate produced the reconciled file.
 */
REEL_MODULE_EXPORT enum class ReconcileStrategy {
    None,               //!< Nothing usable was found.
    ResolvedFilename,   //!< Name reported by the downloader.
    RecentFile,         //!< Newest file written during the run.
    MetadataTitle,      //!< Title plus a known extension.
    RecentVideo         //!< Newest video file in the directory.
};

/**
 * @brief Outcome of a reconciliation pass.
 */
REEL_MODULE_EXPORT struct ReconcileResult {
    ReconcileStrategy strategy = ReconcileStrategy::None;  //!< Winning candidate.
    QString fileName;                                       //!< Bare file name.
    qint64 size = 0;                                        //!< Size on disk.
    QString error;                                          //!< Reason when nothing was found.

    //!< @brief True when a file was found.
    bool found() const { return strategy != ReconcileStrategy::None; }
};

//!< @brief Readable name of a strategy for logs.
REEL_MODULE_EXPORT QString reconcileStrategyName(ReconcileStrategy strategy);

/**
 * @brief Locate the output of a finished job.
 *
 * Only reads the filesystem.
 *
 * @param job Finished job.
 * @return Result describing the file, or the failure.
 */
REEL_MODULE_EXPORT ReconcileResult reconcileOutput(const DownloadJob& job);

/**
 * @brief Apply a reconciliation result to a job.
 *
 * On success the filename is replaced and both byte counters take the real
 * size. On failure the job keeps its estimates.
 *
 * @param job Job to update.
 * @param result Reconciliation outcome.
 * @return true if the job changed.
 */
REEL_MODULE_EXPORT bool applyReconcileResult(DownloadJob& job, const ReconcileResult& result);
