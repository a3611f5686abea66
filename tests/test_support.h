#ifndef REEL_TESTS_TEST_SUPPORT_H
#define REEL_TESTS_TEST_SUPPORT_H

#include <QCoreApplication>
#include <QDateTime>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QThread>

#include <functional>

namespace reel::test {

//! Spin the event loop until the predicate holds or the timeout expires.
inline auto WaitUntil(const std::function<bool()>& predicate, int timeout_ms = 2000) -> bool
{
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeout_ms) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

//! Run the event loop for a fixed time.
inline void SpinFor(int ms)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
        QThread::msleep(1);
    }
}

//! Create a file of the given size and return its absolute path.
inline auto WriteFile(const QString& path, qint64 size) -> QString
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return {};
    file.write(QByteArray(static_cast<int>(size), 'x'));
    file.close();
    return QFileInfo(path).absoluteFilePath();
}

//! Set the modification time of a file.
inline auto Touch(const QString& path, const QDateTime& when) -> bool
{
    QFile file(path);
    if (!file.open(QIODevice::ReadWrite)) return false;
    return file.setFileTime(when, QFileDevice::FileModificationTime);
}

} // namespace reel::test

#endif // REEL_TESTS_TEST_SUPPORT_H
