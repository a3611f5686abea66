#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QVector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support.h"

import reel.core.updatebatcher;

using testing::Eq;
using testing::IsFalse;
using testing::IsTrue;
using testing::SizeIs;

using reel::test::WaitUntil;

namespace {

auto Item(int n) -> QJsonObject
{
    QJsonObject obj;
    obj.insert("n", n);
    return obj;
}

class UpdateBatcherTest : public testing::Test {
protected:
    void SetUp() override
    {
        batcher_.setInterval(20);
        for (const char* channel : { "download-updated", "log-added" }) {
            batcher_.subscribe(QString::fromLatin1(channel), [this](const UpdateEvent& event) {
                events_.append(event);
            });
        }
    }

    UpdateBatcher batcher_;
    QVector<UpdateEvent> events_;
};

// NOLINTNEXTLINE
TEST_F(UpdateBatcherTest, SingleItemFlushesAsSingleEvent)
{
    batcher_.enqueue(QStringLiteral("download-updated"), Item(1));
    EXPECT_THAT(events_, SizeIs(0));
    ASSERT_TRUE(WaitUntil([this] { return !events_.isEmpty(); }));

    ASSERT_THAT(events_, SizeIs(1));
    EXPECT_THAT(events_[0].isBatch(), IsFalse());
    EXPECT_THAT(events_[0].name(), Eq(QStringLiteral("download-updated")));
    EXPECT_THAT(events_[0].payload().toObject().value("n").toInt(), Eq(1));
}

// NOLINTNEXTLINE
TEST_F(UpdateBatcherTest, BurstFlushesAsOrderedBatch)
{
    for (int i = 0; i < 4; ++i) batcher_.enqueue(QStringLiteral("download-updated"), Item(i));
    ASSERT_TRUE(WaitUntil([this] { return !events_.isEmpty(); }));

    ASSERT_THAT(events_, SizeIs(1));
    const UpdateEvent& event = events_[0];
    EXPECT_THAT(event.isBatch(), IsTrue());
    EXPECT_THAT(event.name(), Eq(QStringLiteral("download-updated-batch")));
    ASSERT_THAT(event.items.size(), Eq(4));
    for (int i = 0; i < 4; ++i) {
        EXPECT_THAT(event.items.at(i).toObject().value("n").toInt(), Eq(i));
    }
}

// NOLINTNEXTLINE
TEST_F(UpdateBatcherTest, ThresholdFlushesImmediately)
{
    batcher_.setInterval(10000);
    batcher_.setChannelMaxItems(QStringLiteral("log-added"), 3);
    batcher_.enqueue(QStringLiteral("log-added"), Item(1));
    batcher_.enqueue(QStringLiteral("log-added"), Item(2));
    EXPECT_THAT(events_, SizeIs(0));
    batcher_.enqueue(QStringLiteral("log-added"), Item(3));

    ASSERT_THAT(events_, SizeIs(1));
    EXPECT_THAT(events_[0].items.size(), Eq(3));
    EXPECT_THAT(batcher_.pendingCount(QStringLiteral("log-added")), Eq(0));
}

// NOLINTNEXTLINE
TEST_F(UpdateBatcherTest, ChannelsStaySeparateAndNothingIsDropped)
{
    batcher_.setInterval(10000);
    batcher_.enqueue(QStringLiteral("log-added"), Item(10));
    batcher_.enqueue(QStringLiteral("download-updated"), Item(1));
    batcher_.enqueue(QStringLiteral("download-updated"), Item(2));
    batcher_.flush();

    ASSERT_THAT(events_, SizeIs(2));
    EXPECT_THAT(events_[0].channel, Eq(QStringLiteral("log-added")));
    EXPECT_THAT(events_[0].isBatch(), IsFalse());
    EXPECT_THAT(events_[1].channel, Eq(QStringLiteral("download-updated")));
    EXPECT_THAT(events_[1].items.size(), Eq(2));

    batcher_.flush();
    EXPECT_THAT(events_, SizeIs(2));
}

// NOLINTNEXTLINE
TEST_F(UpdateBatcherTest, ItemsEnqueuedDuringDeliveryAreKept)
{
    batcher_.setInterval(10000);
    bool requeued = false;
    batcher_.subscribe(QStringLiteral("log-added"), [this, &requeued](const UpdateEvent&) {
        if (requeued) return;
        requeued = true;
        batcher_.enqueue(QStringLiteral("log-added"), Item(99));
    });
    batcher_.enqueue(QStringLiteral("log-added"), Item(1));
    batcher_.flush();
    EXPECT_THAT(batcher_.pendingCount(QStringLiteral("log-added")), Eq(1));
    batcher_.flush();
    ASSERT_THAT(events_, SizeIs(2));
    EXPECT_THAT(events_[1].payload().toObject().value("n").toInt(), Eq(99));
}

// NOLINTNEXTLINE
TEST_F(UpdateBatcherTest, HandlerMayOpenChannelsAndTriggerThresholds)
{
    batcher_.setInterval(10000);
    batcher_.setChannelMaxItems(QStringLiteral("download-updated"), 2);
    QVector<QString> delivered;
    int depth = 0;
    int max_depth = 0;
    for (const char* channel : { "download-updated", "download-removed" }) {
        batcher_.subscribe(QString::fromLatin1(channel), [&](const UpdateEvent& event) {
            max_depth = qMax(max_depth, ++depth);
            delivered.append(event.name());
            if (delivered.size() == 1) {
                // A channel nobody has used yet, then a threshold on the channel being delivered.
                batcher_.enqueue(QStringLiteral("download-removed"), Item(7));
                batcher_.enqueue(QStringLiteral("download-updated"), Item(2));
                batcher_.enqueue(QStringLiteral("download-updated"), Item(3));
            }
            --depth;
        });
    }

    batcher_.enqueue(QStringLiteral("download-updated"), Item(1));
    batcher_.flush();

    EXPECT_THAT(max_depth, Eq(1));
    ASSERT_THAT(delivered, SizeIs(3));
    EXPECT_THAT(delivered[0], Eq(QStringLiteral("download-updated")));
    EXPECT_THAT(delivered[1], Eq(QStringLiteral("download-updated-batch")));
    EXPECT_THAT(delivered[2], Eq(QStringLiteral("download-removed")));
    EXPECT_THAT(batcher_.pendingCount(QStringLiteral("download-removed")), Eq(0));

    ASSERT_THAT(events_, SizeIs(2));
    EXPECT_THAT(events_[0].payload().toObject().value("n").toInt(), Eq(1));
    EXPECT_THAT(events_[1].payload().toArray().at(0).toObject().value("n").toInt(), Eq(2));
}

} // namespace
