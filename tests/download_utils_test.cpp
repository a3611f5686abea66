#include <QDir>
#include <QString>
#include <QTemporaryDir>
#include <QtGlobal>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support.h"

import reel.utils.download_utils;
import reel.utils.category_utils;
import reel.utils.log_utils;

using testing::Eq;
using testing::IsFalse;
using testing::IsTrue;

namespace utils = reel::utils;

namespace {

// NOLINTNEXTLINE
TEST(DownloadUtilsTest, BaseFileName)
{
    EXPECT_THAT(utils::baseFileName(QStringLiteral("/a/b/c.mp4")), Eq(QStringLiteral("c.mp4")));
    EXPECT_THAT(utils::baseFileName(QStringLiteral("C:\\media\\c.mkv")), Eq(QStringLiteral("c.mkv")));
    EXPECT_THAT(utils::baseFileName(QStringLiteral("\"/x/y z.mp3\"")), Eq(QStringLiteral("y z.mp3")));
    EXPECT_THAT(utils::baseFileName(QStringLiteral("plain.webm")), Eq(QStringLiteral("plain.webm")));
}

// NOLINTNEXTLINE
TEST(DownloadUtilsTest, SanitizeAndArtifacts)
{
    EXPECT_THAT(utils::sanitizeFileName(QStringLiteral("a<b>c:d\"e/f\\g|h?i*j")), Eq(QStringLiteral("a_b_c_d_e_f_g_h_i_j")));
    EXPECT_THAT(utils::isPartialArtifact(QStringLiteral("x.mp4.part")), IsTrue());
    EXPECT_THAT(utils::isPartialArtifact(QStringLiteral("x.f137.mp4.part-Frag3")), IsTrue());
    EXPECT_THAT(utils::isPartialArtifact(QStringLiteral("x.ytdl")), IsTrue());
    EXPECT_THAT(utils::isPartialArtifact(QStringLiteral(".DS_Store")), IsTrue());
    EXPECT_THAT(utils::isPartialArtifact(QStringLiteral("x.mp4")), IsFalse());
}

// NOLINTNEXTLINE
TEST(DownloadUtilsTest, EnsureDirectory)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString nested = QDir(dir.path()).filePath(QStringLiteral("a/b"));
    EXPECT_THAT(utils::ensureDirectory(nested), IsTrue());
    EXPECT_THAT(QDir(nested).exists(), IsTrue());

    const QString file = reel::test::WriteFile(QDir(dir.path()).filePath(QStringLiteral("f")), 1);
    QString error;
    EXPECT_THAT(utils::ensureDirectory(file, &error), IsFalse());
    EXPECT_THAT(error.isEmpty(), IsFalse());
    EXPECT_THAT(utils::ensureDirectory(QString(), &error), IsFalse());
}

// NOLINTNEXTLINE
TEST(DownloadUtilsTest, ByteSizes)
{
    EXPECT_THAT(utils::parseByteSize(QStringLiteral("1.00GiB")), Eq(qint64 { 1073741824 }));
    EXPECT_THAT(utils::parseByteSize(QStringLiteral("~ 1.5 KiB")), Eq(qint64 { 1536 }));
    EXPECT_THAT(utils::parseByteSize(QStringLiteral("1.5 kB")), Eq(qint64 { -1 }));
    EXPECT_THAT(utils::formatByteSize(2 * 1024 * 1024), Eq(QStringLiteral("2.00MiB")));
    EXPECT_THAT(utils::formatByteSize(12), Eq(QStringLiteral("12B")));
}

// NOLINTNEXTLINE
TEST(DownloadUtilsTest, Categories)
{
    EXPECT_THAT(utils::detectCategory(QStringLiteral("x.MKV")), Eq(QStringLiteral("Video")));
    EXPECT_THAT(utils::detectCategory(QStringLiteral("x.opus")), Eq(QStringLiteral("Audio")));
    EXPECT_THAT(utils::detectCategory(QStringLiteral("x.txt")), Eq(QStringLiteral("Other")));
    EXPECT_THAT(utils::candidateExtensionsFor(QStringLiteral("audio")).first(), Eq(QStringLiteral(".mp3")));
    EXPECT_THAT(utils::candidateExtensionsFor(QStringLiteral("720p")).first(), Eq(QStringLiteral(".mp4")));
}

// NOLINTNEXTLINE
TEST(LogUtilsTest, LevelResolution)
{
    qunsetenv("REEL_LOG_LEVEL");
    EXPECT_THAT(utils::resolveLogLevel(QString()), Eq(QStringLiteral("info")));
    EXPECT_THAT(utils::resolveLogLevel(QStringLiteral("Debug")), Eq(QStringLiteral("debug")));

    qputenv("REEL_LOG_LEVEL", "error");
    EXPECT_THAT(utils::resolveLogLevel(QStringLiteral("debug")), Eq(QStringLiteral("error")));
    qunsetenv("REEL_LOG_LEVEL");

    EXPECT_THAT(utils::isKnownLogLevel(QStringLiteral("warning")), IsTrue());
    EXPECT_THAT(utils::isKnownLogLevel(QStringLiteral("verbose")), IsFalse());
}

} // namespace
