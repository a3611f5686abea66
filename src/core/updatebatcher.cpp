module;
#include <QHash>
#include <QJsonArray>
#include <QJsonValue>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <functional>
#include <utility>

module reel.core.updatebatcher;

UpdateBatcher::UpdateBatcher(QObject* parent) : QObject(parent)
{
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(100);
    connect(&m_flushTimer, &QTimer::timeout, this, &UpdateBatcher::flush);
}

void UpdateBatcher::enqueue(const QString& channel, const QJsonValue& item)
{
    if (channel.isEmpty()) return;
    if (!m_channelOrder.contains(channel)) m_channelOrder.append(channel);

    QJsonArray& items = m_pending[channel];
    items.append(item);

    if (items.size() >= maxItems(channel)) {
        flush();
        return;
    }
    if (!m_flushTimer.isActive()) m_flushTimer.start();
}

void UpdateBatcher::flush()
{
    m_flushTimer.stop();

    // A flush requested by a handler runs once the current delivery is over,
    // so a channel's older items always go out first.
    if (m_delivering) {
        m_flushRequested = true;
        return;
    }

    m_delivering = true;
    do {
        m_flushRequested = false;

        // Take everything first so handlers may enqueue while we deliver.
        QHash<QString, QJsonArray> pending;
        pending.swap(m_pending);
        const QStringList order = m_channelOrder;

        for (const QString& channel : order) {
            const QJsonArray items = pending.value(channel);
            if (items.isEmpty()) continue;
            emit eventReady(channel, items);
        }
    } while (m_flushRequested);
    m_delivering = false;
}

QMetaObject::Connection UpdateBatcher::subscribe(const QString& channel, Handler handler)
{
    return connect(this, &UpdateBatcher::eventReady, this,
                   [channel, handler = std::move(handler)](const QString& eventChannel, const QJsonArray& items) {
                       if (eventChannel != channel || !handler) return;
                       UpdateEvent event;
                       event.channel = eventChannel;
                       event.items = items;
                       handler(event);
                   });
}

int UpdateBatcher::pendingCount(const QString& channel) const
{
    return static_cast<int>(m_pending.value(channel).size());
}

void UpdateBatcher::setInterval(int ms)
{
    m_flushTimer.setInterval(qMax(0, ms));
}

void UpdateBatcher::setDefaultMaxItems(int count)
{
    m_defaultMaxItems = qMax(1, count);
}

void UpdateBatcher::setChannelMaxItems(const QString& channel, int count)
{
    m_channelMaxItems.insert(channel, qMax(1, count));
}

int UpdateBatcher::maxItems(const QString& channel) const
{
    return m_channelMaxItems.value(channel, m_defaultMaxItems);
}
