#include <QString>
#include <QStringList>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>

import reel.core.downloadjob;
import reel.core.progressparser;
import reel.utils.download_utils;

using testing::Eq;
using testing::IsFalse;
using testing::IsTrue;
using testing::Optional;

namespace {

constexpr qint64 kMiB = 1024 * 1024;

// Feed lines through the parser the way a run does.
auto Replay(const QStringList& lines, DownloadJob job = {}) -> DownloadJob
{
    bool saw_progress = false;
    for (const QString& line : lines) {
        const ProgressUpdate update = parseProgressLine(line, job);
        applyProgressUpdate(job, update, saw_progress ? ProgressMode::Monotonic : ProgressMode::Overwrite);
        if (update.progressPercent) saw_progress = true;
    }
    return job;
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, TemplateLineFillsEveryField)
{
    const ProgressUpdate update = parseProgressLine(
        QStringLiteral("[ 50.0%]  2.00MiB/s ETA 00:10 downloaded 50.00MiB of 100.00MiB"), DownloadJob {});

    EXPECT_THAT(update.progressPercent, Optional(50));
    EXPECT_THAT(update.speedBytesPerSec, Optional(2 * kMiB));
    EXPECT_THAT(update.hasEta, IsTrue());
    EXPECT_THAT(update.etaSeconds, Optional(10));
    EXPECT_THAT(update.downloadedBytes, Optional(50 * kMiB));
    EXPECT_THAT(update.totalBytes, Optional(100 * kMiB));
    EXPECT_THAT(update.status, Optional(JobStatus::Downloading));
    EXPECT_THAT(update.matchedRules.contains(QStringLiteral("progress")), IsTrue());
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, PercentIsRoundedAndClamped)
{
    for (int percent = 0; percent <= 100; ++percent) {
        const QString line = QStringLiteral("[%1%] 1.00KiB/s").arg(percent);
        EXPECT_THAT(parseProgressLine(line, DownloadJob {}).progressPercent, Optional(percent)) << line.toStdString();
    }
    EXPECT_THAT(parseProgressLine(QStringLiteral("[ 49.6%]"), DownloadJob {}).progressPercent, Optional(50));
    EXPECT_THAT(parseProgressLine(QStringLiteral("[ 12.4%]"), DownloadJob {}).progressPercent, Optional(12));
    EXPECT_THAT(parsePercentToken(QStringLiteral("104.2")), Optional(100));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, NativeProgressLine)
{
    const ProgressUpdate update = parseProgressLine(
        QStringLiteral("[download]  42.3% of ~ 10.00MiB at  1.50MiB/s ETA 00:05"), DownloadJob {});

    EXPECT_THAT(update.progressPercent, Optional(42));
    EXPECT_THAT(update.totalBytes, Optional(10 * kMiB));
    EXPECT_THAT(update.speedBytesPerSec, Optional(static_cast<qint64>(1.5 * kMiB)));
    EXPECT_THAT(update.etaSeconds, Optional(5));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, DerivesDownloadedBytesFromTotal)
{
    const ProgressUpdate from_line = parseProgressLine(
        QStringLiteral("[ 25.0%] 1.00MiB/s ETA 00:30 downloaded N/A of 8.00MiB"), DownloadJob {});
    EXPECT_THAT(from_line.downloadedBytes, Optional(2 * kMiB));

    DownloadJob known;
    known.totalBytes = 1000;
    const ProgressUpdate from_snapshot = parseProgressLine(QStringLiteral("[ 10%]"), known);
    EXPECT_THAT(from_snapshot.downloadedBytes, Optional(qint64 { 100 }));

    const ProgressUpdate zero = parseProgressLine(QStringLiteral("[ 0%]"), known);
    EXPECT_THAT(zero.downloadedBytes.has_value(), IsFalse());
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, SizeTokens)
{
    EXPECT_THAT(parseSizeToken(QStringLiteral("512B")), Optional(qint64 { 512 }));
    EXPECT_THAT(parseSizeToken(QStringLiteral("1.50KiB")), Optional(qint64 { 1536 }));
    EXPECT_THAT(parseSizeToken(QStringLiteral("~3.00MiB")), Optional(3 * kMiB));
    EXPECT_THAT(parseSizeToken(QStringLiteral("~ 2GiB")), Optional(2 * 1024 * kMiB));
    EXPECT_THAT(parseSizeToken(QStringLiteral("N/A")).has_value(), IsFalse());
    EXPECT_THAT(parseSizeToken(QStringLiteral("12MB")).has_value(), IsFalse());

    EXPECT_THAT(parseSpeedToken(QStringLiteral("2.00MiB/s")), Optional(2 * kMiB));
    EXPECT_THAT(parseSpeedToken(QStringLiteral("2.00MiB")).has_value(), IsFalse());
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, FormattedSizesParseBack)
{
    for (const qint64 bytes : { qint64 { 0 }, qint64 { 1023 }, qint64 { 1024 }, 5 * kMiB, 3 * 1024 * kMiB }) {
        EXPECT_THAT(reel::utils::parseByteSize(reel::utils::formatByteSize(bytes)), Eq(bytes));
    }
    EXPECT_THAT(reel::utils::parseByteSize(QStringLiteral("~") + reel::utils::formatByteSize(7 * kMiB)), Eq(7 * kMiB));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, EtaTokens)
{
    EXPECT_THAT(parseEtaToken(QStringLiteral("00:00")).has_value(), IsFalse());
    EXPECT_THAT(parseEtaToken(QStringLiteral("--:--")).has_value(), IsFalse());
    EXPECT_THAT(parseEtaToken(QStringLiteral("Unknown")).has_value(), IsFalse());
    EXPECT_THAT(parseEtaToken(QStringLiteral("05:30")), Optional(330));
    EXPECT_THAT(parseEtaToken(QStringLiteral("1:02:03")), Optional(3723));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, UnknownEtaClearsThePreviousValue)
{
    DownloadJob job;
    job.etaSeconds = 42;
    const ProgressUpdate update = parseProgressLine(QStringLiteral("[ 60%] 1.00MiB/s ETA --:--"), job);
    EXPECT_THAT(update.hasEta, IsTrue());
    applyProgressUpdate(job, update, ProgressMode::Monotonic);
    EXPECT_THAT(job.etaSeconds.has_value(), IsFalse());
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, MergeWinsOverDestination)
{
    const DownloadJob job = Replay({
        QStringLiteral("[download] Destination: /tmp/out/a.mp4"),
        QStringLiteral("[Merger] Merging formats into \"/tmp/out/b.mp4\""),
    });
    EXPECT_THAT(job.resolvedFilename, Eq(QStringLiteral("b.mp4")));
    EXPECT_THAT(job.filenameSource, Eq(FilenameSource::Merge));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, DestinationAlone)
{
    const DownloadJob job = Replay({ QStringLiteral("[download] Destination: a.mp4") });
    EXPECT_THAT(job.resolvedFilename, Eq(QStringLiteral("a.mp4")));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, DestinationAfterMergeIsIgnored)
{
    const DownloadJob job = Replay({
        QStringLiteral("[Merger] Merging formats into \"b.mp4\""),
        QStringLiteral("[download] Destination: c.f137.mp4"),
    });
    EXPECT_THAT(job.resolvedFilename, Eq(QStringLiteral("b.mp4")));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, WeakSourcesOnlyFillGaps)
{
    const DownloadJob from_bare = Replay({ QStringLiteral("[info] clip.webm") });
    EXPECT_THAT(from_bare.resolvedFilename, Eq(QStringLiteral("clip.webm")));
    EXPECT_THAT(from_bare.filenameSource, Eq(FilenameSource::BareToken));

    const DownloadJob kept = Replay({
        QStringLiteral("[download] Destination: a.mp4"),
        QStringLiteral("[download] other.mp4 has already been downloaded"),
        QStringLiteral("[info] stray.mkv"),
    });
    EXPECT_THAT(kept.resolvedFilename, Eq(QStringLiteral("a.mp4")));

    const DownloadJob already = Replay({ QStringLiteral("[download] /x/done.mp4 has already been downloaded") });
    EXPECT_THAT(already.resolvedFilename, Eq(QStringLiteral("done.mp4")));
    EXPECT_THAT(already.filenameSource, Eq(FilenameSource::AlreadyDownloaded));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, PostProcessMarkerSetsProcessing)
{
    const ProgressUpdate update = parseProgressLine(
        QStringLiteral("[ExtractAudio] Destination: song.mp3"), DownloadJob {});
    EXPECT_THAT(update.status, Optional(JobStatus::Processing));
    EXPECT_THAT(update.filename, Eq(QStringLiteral("song.mp3")));
    EXPECT_THAT(update.filenameSource, Eq(FilenameSource::Destination));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, ProgressIsMonotonicAfterTheFirstReport)
{
    DownloadJob job;
    job.progressPercent = 80;
    job = Replay({ QStringLiteral("[ 10%]"), QStringLiteral("[ 30%]"), QStringLiteral("[ 20%]") }, job);
    EXPECT_THAT(job.progressPercent, Eq(30));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, ReplayingALineIsIdempotent)
{
    const QString line = QStringLiteral("[ 33.3%] 1.00MiB/s ETA 01:00 downloaded 1.00MiB of 3.00MiB");
    DownloadJob job = Replay({ line });
    const DownloadJob before = job;
    const bool changed = applyProgressUpdate(job, parseProgressLine(line, job), ProgressMode::Monotonic);
    EXPECT_THAT(changed, IsFalse());
    EXPECT_THAT(job.progressPercent, Eq(before.progressPercent));
    EXPECT_THAT(job.downloadedBytes, Eq(before.downloadedBytes));
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, ErrorAndWarningLines)
{
    const ProgressUpdate error = parseProgressLine(
        QStringLiteral("ERROR: [youtube] abc: Video unavailable"), DownloadJob {});
    EXPECT_THAT(error.isError, IsTrue());
    EXPECT_THAT(error.message, Eq(QStringLiteral("ERROR: [youtube] abc: Video unavailable")));
    EXPECT_THAT(error.status.has_value(), IsFalse());

    const ProgressUpdate warning = parseProgressLine(
        QStringLiteral("WARNING: falling back to generic extractor"), DownloadJob {});
    EXPECT_THAT(warning.isWarning, IsTrue());
    EXPECT_THAT(warning.isError, IsFalse());
    EXPECT_THAT(warning.status.has_value(), IsFalse());

    const ProgressUpdate lower = parseProgressLine(QStringLiteral("error: not a marker"), DownloadJob {});
    EXPECT_THAT(lower.isError, IsFalse());
}

// NOLINTNEXTLINE
TEST(ProgressParserTest, UnrecognizedLineIsEmpty)
{
    EXPECT_THAT(parseProgressLine(QStringLiteral("[youtube] abc: Downloading webpage"), DownloadJob {}).isEmpty(),
                IsTrue());
    EXPECT_THAT(parseProgressLine(QStringLiteral("   "), DownloadJob {}).isEmpty(), IsTrue());
}

} // namespace
