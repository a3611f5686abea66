#include <QDateTime>
#include <QString>
#include <QStringList>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

import reel.core.downloadjob;
import reel.core.jobtable;

using testing::ElementsAre;
using testing::Eq;
using testing::IsEmpty;
using testing::IsFalse;
using testing::IsTrue;

namespace {

auto MakeJob(const QString& id) -> DownloadJob
{
    DownloadJob job;
    job.id = id;
    job.url = QStringLiteral("https://example.com/") + id;
    job.addedAt = QDateTime::currentDateTimeUtc();
    return job;
}

class JobTableTest : public testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(table_.insert(MakeJob(QStringLiteral("a"))));
        ASSERT_TRUE(table_.insert(MakeJob(QStringLiteral("b"))));
        ASSERT_TRUE(table_.insert(MakeJob(QStringLiteral("c"))));
    }

    auto Status(const QString& id) const -> JobStatus { return table_.find(id)->status; }

    JobTable table_;
};

// NOLINTNEXTLINE
TEST_F(JobTableTest, InsertKeepsOrderAndRejectsDuplicates)
{
    EXPECT_THAT(table_.insert(MakeJob(QStringLiteral("b"))), IsFalse());
    EXPECT_THAT(table_.insert(MakeJob(QString())), IsFalse());
    EXPECT_THAT(table_.ids(), ElementsAre("a", "b", "c"));
    EXPECT_THAT(table_.queue(), ElementsAre("a", "b", "c"));
    EXPECT_THAT(table_.size(), Eq(3));
}

// NOLINTNEXTLINE
TEST_F(JobTableTest, InvalidTransitionIsRejected)
{
    EXPECT_THAT(table_.transition(QStringLiteral("a"), JobStatus::Completed), IsFalse());
    EXPECT_THAT(Status(QStringLiteral("a")), Eq(JobStatus::Pending));
    EXPECT_THAT(table_.transition(QStringLiteral("missing"), JobStatus::Paused), IsFalse());
    EXPECT_THAT(table_.transition(QStringLiteral("a"), JobStatus::Pending), IsTrue());
}

// NOLINTNEXTLINE
TEST_F(JobTableTest, TransitionsStampTimes)
{
    const QDateTime t1 = QDateTime::currentDateTimeUtc().addSecs(-10);
    const QDateTime t2 = t1.addSecs(5);
    ASSERT_TRUE(table_.transition(QStringLiteral("a"), JobStatus::Downloading, t1));
    ASSERT_TRUE(table_.transition(QStringLiteral("a"), JobStatus::Processing, t2));
    ASSERT_TRUE(table_.transition(QStringLiteral("a"), JobStatus::Completed, t2));

    const DownloadJob* job = table_.find(QStringLiteral("a"));
    EXPECT_THAT(job->startedAt, Eq(t1));
    EXPECT_THAT(job->completedAt, Eq(t2));
    EXPECT_THAT(table_.queue(), ElementsAre("b", "c"));
}

// NOLINTNEXTLINE
TEST_F(JobTableTest, ActiveCountAndNextPending)
{
    EXPECT_THAT(table_.activeCount(), Eq(0));
    EXPECT_THAT(table_.nextPending(), Eq(QStringLiteral("a")));

    ASSERT_TRUE(table_.transition(QStringLiteral("a"), JobStatus::Downloading));
    ASSERT_TRUE(table_.transition(QStringLiteral("b"), JobStatus::Paused));
    EXPECT_THAT(table_.activeCount(), Eq(1));
    EXPECT_THAT(table_.nextPending(), Eq(QStringLiteral("c")));
    EXPECT_THAT(table_.nextPending({ QStringLiteral("c") }), IsEmpty());
    EXPECT_THAT(table_.countWithStatus(JobStatus::Paused), Eq(1));
}

// NOLINTNEXTLINE
TEST_F(JobTableTest, ResumeNeverDuplicatesQueueEntries)
{
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(table_.transition(QStringLiteral("b"), JobStatus::Paused));
        ASSERT_TRUE(table_.transition(QStringLiteral("b"), JobStatus::Pending));
    }
    EXPECT_THAT(table_.queue(), ElementsAre("a", "b", "c"));
    EXPECT_THAT(table_.queue().count(QStringLiteral("b")), Eq(1));
}

// NOLINTNEXTLINE
TEST_F(JobTableTest, RetryResetsErrorState)
{
    const QString id = QStringLiteral("a");
    const QDateTime added = table_.find(id)->addedAt;
    ASSERT_TRUE(table_.transition(id, JobStatus::Downloading));
    DownloadJob* job = table_.find(id);
    job->progressPercent = 37;
    job->downloadedBytes = 1234;
    job->lastError = makeJobError(ErrorKind::NotFound, QStringLiteral("gone"));
    ASSERT_TRUE(table_.transition(id, JobStatus::Error));

    EXPECT_THAT(table_.retry(id), IsTrue());
    job = table_.find(id);
    EXPECT_THAT(job->status, Eq(JobStatus::Pending));
    EXPECT_THAT(job->lastError.has_value(), IsFalse());
    EXPECT_THAT(job->retryCount, Eq(1));
    EXPECT_THAT(job->addedAt, Eq(added));
    EXPECT_THAT(job->startedAt.isValid(), IsFalse());
    EXPECT_THAT(job->progressPercent, Eq(37));
    EXPECT_THAT(job->downloadedBytes, Eq(1234));
    EXPECT_THAT(table_.queue().count(id), Eq(1));
}

// NOLINTNEXTLINE
TEST_F(JobTableTest, RetryRequiresError)
{
    EXPECT_THAT(table_.retry(QStringLiteral("a")), IsFalse());
    EXPECT_THAT(table_.find(QStringLiteral("a"))->retryCount, Eq(0));
}

// NOLINTNEXTLINE
TEST_F(JobTableTest, RemoveDropsTableAndQueueEntries)
{
    EXPECT_THAT(table_.remove(QStringLiteral("b")), IsTrue());
    EXPECT_THAT(table_.remove(QStringLiteral("b")), IsFalse());
    EXPECT_THAT(table_.contains(QStringLiteral("b")), IsFalse());
    EXPECT_THAT(table_.queue(), ElementsAre("a", "c"));

    table_.remove(QStringLiteral("a"));
    table_.remove(QStringLiteral("c"));
    EXPECT_THAT(table_.queue(), IsEmpty());
    EXPECT_THAT(table_.nextPending(), IsEmpty());
}

} // namespace
