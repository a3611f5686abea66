#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QTimeZone>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

import reel.core.downloadjob;

using testing::Eq;
using testing::IsFalse;
using testing::IsTrue;
using testing::Optional;

namespace {

const JobStatus kAllStates[] = {
    JobStatus::Pending, JobStatus::Initializing, JobStatus::Connecting, JobStatus::Downloading,
    JobStatus::Processing, JobStatus::Paused, JobStatus::Completed, JobStatus::Error,
};

// NOLINTNEXTLINE
TEST(DownloadJobTest, StatusNamesRoundTrip)
{
    for (const JobStatus status : kAllStates) {
        EXPECT_THAT(jobStatusFromName(jobStatusName(status)), Optional(status));
    }
    EXPECT_THAT(jobStatusName(JobStatus::Downloading), Eq(QStringLiteral("downloading")));
    EXPECT_THAT(jobStatusFromName(QStringLiteral("Downloading")).has_value(), IsFalse());
}

// NOLINTNEXTLINE
TEST(DownloadJobTest, HappyPathTransitions)
{
    EXPECT_THAT(canTransition(JobStatus::Pending, JobStatus::Initializing), IsTrue());
    EXPECT_THAT(canTransition(JobStatus::Initializing, JobStatus::Connecting), IsTrue());
    EXPECT_THAT(canTransition(JobStatus::Connecting, JobStatus::Downloading), IsTrue());
    EXPECT_THAT(canTransition(JobStatus::Downloading, JobStatus::Processing), IsTrue());
    EXPECT_THAT(canTransition(JobStatus::Processing, JobStatus::Completed), IsTrue());
    EXPECT_THAT(canTransition(JobStatus::Pending, JobStatus::Downloading), IsTrue());
}

// NOLINTNEXTLINE
TEST(DownloadJobTest, PauseAndResumePaths)
{
    for (const JobStatus from : { JobStatus::Pending, JobStatus::Connecting, JobStatus::Downloading,
                                  JobStatus::Processing }) {
        EXPECT_THAT(canTransition(from, JobStatus::Paused), IsTrue()) << jobStatusName(from).toStdString();
    }
    EXPECT_THAT(canTransition(JobStatus::Paused, JobStatus::Pending), IsTrue());
    EXPECT_THAT(canTransition(JobStatus::Paused, JobStatus::Downloading), IsFalse());
}

// NOLINTNEXTLINE
TEST(DownloadJobTest, TerminalStatesOnlyAllowRetry)
{
    for (const JobStatus to : kAllStates) {
        EXPECT_THAT(canTransition(JobStatus::Completed, to), IsFalse());
        EXPECT_THAT(canTransition(JobStatus::Error, to), Eq(to == JobStatus::Pending));
    }
    EXPECT_THAT(canTransition(JobStatus::Pending, JobStatus::Error), IsFalse());
    EXPECT_THAT(canTransition(JobStatus::Pending, JobStatus::Completed), IsFalse());
}

// NOLINTNEXTLINE
TEST(DownloadJobTest, ActiveStates)
{
    EXPECT_THAT(isActiveJobStatus(JobStatus::Pending), IsFalse());
    EXPECT_THAT(isActiveJobStatus(JobStatus::Initializing), IsTrue());
    EXPECT_THAT(isActiveJobStatus(JobStatus::Connecting), IsTrue());
    EXPECT_THAT(isActiveJobStatus(JobStatus::Downloading), IsTrue());
    EXPECT_THAT(isActiveJobStatus(JobStatus::Processing), IsTrue());
    EXPECT_THAT(isActiveJobStatus(JobStatus::Paused), IsFalse());
    EXPECT_THAT(isTerminalJobStatus(JobStatus::Completed), IsTrue());
    EXPECT_THAT(isTerminalJobStatus(JobStatus::Error), IsTrue());
}

// NOLINTNEXTLINE
TEST(DownloadJobTest, ClassifiesKnownPhrases)
{
    EXPECT_THAT(classifyErrorText(QStringLiteral("ERROR: unable to download video data: HTTP Error 403: Forbidden")).kind,
                Eq(ErrorKind::AccessDenied));
    EXPECT_THAT(classifyErrorText(QStringLiteral("ERROR: HTTP Error 404: Not Found")).kind, Eq(ErrorKind::NotFound));
    EXPECT_THAT(classifyErrorText(QStringLiteral("ERROR: [youtube] x: Sign in to confirm your age")).kind,
                Eq(ErrorKind::AuthRequired));
    EXPECT_THAT(classifyErrorText(QStringLiteral("ERROR: [youtube] x: Video unavailable")).kind,
                Eq(ErrorKind::MediaUnavailable));
    EXPECT_THAT(classifyErrorText(QStringLiteral("ERROR: Requested format is not available")).kind,
                Eq(ErrorKind::FormatUnavailable));
}

// NOLINTNEXTLINE
TEST(DownloadJobTest, UnknownErrorKeepsRawText)
{
    const QString raw = QStringLiteral("ERROR: [generic] Unsupported URL: https://example.com");
    const JobError error = classifyErrorText(raw);
    EXPECT_THAT(error.kind, Eq(ErrorKind::GenericExtractorError));
    EXPECT_THAT(error.message, Eq(raw));
    EXPECT_THAT(error.detail, Eq(raw));
}

// NOLINTNEXTLINE
TEST(DownloadJobTest, SnapshotJson)
{
    DownloadJob job;
    job.id = QStringLiteral("j1");
    job.url = QStringLiteral("https://example.com/v");
    job.quality = QStringLiteral("720p");
    job.outputDirectory = QStringLiteral("/tmp/out");
    job.status = JobStatus::Error;
    job.progressPercent = 40;
    job.addedAt = QDateTime(QDate(2026, 1, 2), QTime(3, 4, 5), QTimeZone::UTC);
    job.lastError = makeJobError(ErrorKind::NonZeroExit, QStringLiteral("yt-dlp exited with code 1"));
    job.retryCount = 2;

    const QJsonObject obj = jobToJson(job);
    EXPECT_THAT(obj.value("id").toString(), Eq(QStringLiteral("j1")));
    EXPECT_THAT(obj.value("status").toString(), Eq(QStringLiteral("error")));
    EXPECT_THAT(obj.value("quality").toString(), Eq(QStringLiteral("720p")));
    EXPECT_THAT(obj.value("progress").toInt(), Eq(40));
    EXPECT_THAT(obj.value("eta").isNull(), IsTrue());
    EXPECT_THAT(obj.value("filename").isNull(), IsTrue());
    EXPECT_THAT(obj.value("metadata").isNull(), IsTrue());
    EXPECT_THAT(obj.value("startedAt").isNull(), IsTrue());
    EXPECT_THAT(obj.value("addedAt").toString(), Eq(QStringLiteral("2026-01-02T03:04:05.000Z")));
    EXPECT_THAT(obj.value("retryCount").toInt(), Eq(2));

    const QJsonObject error = obj.value("error").toObject();
    EXPECT_THAT(error.value("kind").toString(), Eq(QStringLiteral("NonZeroExit")));
    EXPECT_THAT(error.value("message").toString(), Eq(QStringLiteral("yt-dlp exited with code 1")));
}

// NOLINTNEXTLINE
TEST(DownloadJobTest, PlaylistMetadataJson)
{
    MediaMetadata metadata;
    metadata.title = QStringLiteral("Mix");
    PlaylistEntry entry;
    entry.id = QStringLiteral("a");
    entry.url = QStringLiteral("https://example.com/a");
    metadata.entries.append(entry);

    EXPECT_THAT(metadata.isPlaylist(), IsTrue());
    const QJsonObject obj = metadataToJson(metadata);
    EXPECT_THAT(obj.value("title").toString(), Eq(QStringLiteral("Mix")));
    ASSERT_THAT(obj.value("entries").toArray().size(), Eq(1));
    EXPECT_THAT(obj.value("entries").toArray().first().toObject().value("url").toString(),
                Eq(QStringLiteral("https://example.com/a")));
}

} // namespace
