/*!
 * @file        updatebatcher.cppm
 * @brief       Coalescing of outbound update events.
 * @details     Collects update items per logical channel and delivers them to
 *              subscribers in flushes. A flush happens when the flush interval
 *              elapses or when any channel reaches its item threshold,
 *              whichever comes first.
 *
 *              A channel holding one item is delivered as a single event, a
 *              channel holding several items is delivered as one batch event
 *              carrying them in arrival order. Items are never dropped or
 *              reordered within a channel.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QHash>
#include <QJsonArray>
#include <QJsonValue>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <functional>

#ifndef Q_MOC_RUN
export module reel.core.updatebatcher;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief One delivered update event.
 */
REEL_MODULE_EXPORT struct UpdateEvent {
    QString channel;    //!< Logical channel, e.g. "download-updated".
    QJsonArray items;   //!< Items in arrival order, at least one.

    //!< @brief True when several items were coalesced.
    bool isBatch() const { return items.size() > 1; }

    //!< @brief Channel name for single events, "<channel>-batch" for batches.
    QString name() const { return isBatch() ? channel + QStringLiteral("-batch") : channel; }

    //!< @brief The single item, or the whole array for batches.
    QJsonValue payload() const { return isBatch() ? QJsonValue(items) : items.first(); }
};

/**
 * @brief Per-channel event coalescer.
 */
REEL_MODULE_EXPORT class UpdateBatcher : public QObject {

    Q_OBJECT

public:
    using Handler = std::function<void(const UpdateEvent&)>;

    /**
     * @brief Construct a batcher.
     * @param parent Optional parent QObject.
     */
    explicit UpdateBatcher(QObject* parent = nullptr);

    /**
     * @brief Queue an item on a channel.
     *
     * Starts the flush timer when idle and flushes immediately when the
     * channel reaches its threshold.
     *
     * @param channel Channel name.
     * @param item Item payload.
     */
    void enqueue(const QString& channel, const QJsonValue& item);

    /**
     * @brief Deliver every pending item now.
     *
     * Called from inside a handler, the flush runs after the current
     * delivery finishes.
     */
    void flush();

    /**
     * @brief Register a handler for one channel.
     * @param channel Channel name.
     * @param handler Callback receiving each delivered event.
     * @return Connection usable with QObject::disconnect().
     */
    QMetaObject::Connection subscribe(const QString& channel, Handler handler);

    //!< @brief Number of items waiting on a channel.
    int pendingCount(const QString& channel) const;

    //!< @brief Flush interval in milliseconds.
    int interval() const { return m_flushTimer.interval(); }

    //!< @brief Set the flush interval in milliseconds.
    void setInterval(int ms);

    //!< @brief Default per-channel threshold.
    int defaultMaxItems() const { return m_defaultMaxItems; }

    //!< @brief Set the default per-channel threshold (min 1).
    void setDefaultMaxItems(int count);

    //!< @brief Override the threshold of one channel (min 1).
    void setChannelMaxItems(const QString& channel, int count);

    //!< @brief Effective threshold of a channel.
    int maxItems(const QString& channel) const;

signals:
    /**
     * @brief Emitted for each delivered event.
     * @param channel Channel name.
     * @param items Items in arrival order.
     */
    void eventReady(const QString& channel, const QJsonArray& items);

private:
    QHash<QString, QJsonArray> m_pending;           //!< Items per channel.
    QStringList m_channelOrder;                     //!< Channels in first-use order.
    QHash<QString, int> m_channelMaxItems;          //!< Threshold overrides.
    int m_defaultMaxItems = 10;                     //!< Default threshold.
    QTimer m_flushTimer;                            //!< Interval flush timer.
    bool m_delivering = false;                      //!< Inside flush().
    bool m_flushRequested = false;                  //!< Flush asked for during delivery.
};

#include "updatebatcher.moc"
