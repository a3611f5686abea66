module;
#include <QByteArray>
#include <QDebug>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <functional>

module reel.core.downloaderprocess;

DownloaderProcess::DownloaderProcess(QObject* parent) : QObject(parent) {}

DownloaderProcess::~DownloaderProcess() = default;

QtDownloaderProcess::QtDownloaderProcess(QObject* parent) : DownloaderProcess(parent)
{
    m_process.setProcessChannelMode(QProcess::SeparateChannels);

    connect(&m_process, &QProcess::started, this, [this]() {
        emit started();
    });
    connect(&m_process, &QProcess::readyReadStandardOutput, this, [this]() {
        m_stdoutBuffer.append(m_process.readAllStandardOutput());
        drain(m_stdoutBuffer, false, false);
    });
    connect(&m_process, &QProcess::readyReadStandardError, this, [this]() {
        m_stderrBuffer.append(m_process.readAllStandardError());
        drain(m_stderrBuffer, true, false);
    });
    connect(&m_process, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;
        m_running = false;
        emit failedToStart(m_process.errorString());
    });
    connect(&m_process, &QProcess::finished, this, [this](int exitCode, QProcess::ExitStatus status) {
        m_stdoutBuffer.append(m_process.readAllStandardOutput());
        m_stderrBuffer.append(m_process.readAllStandardError());
        drain(m_stdoutBuffer, false, true);
        drain(m_stderrBuffer, true, true);
        m_running = false;
        emit exited(exitCode, status == QProcess::CrashExit);
    });
}

QtDownloaderProcess::~QtDownloaderProcess()
{
    if (m_process.state() != QProcess::NotRunning) {
        m_process.disconnect(this);
        m_process.kill();
        m_process.waitForFinished(1000);
    }
}

void QtDownloaderProcess::start(const QString& program, const QStringList& arguments)
{
    if (m_running) {
        qWarning() << "Downloader process already running, ignoring start of" << program;
        return;
    }
    m_stdoutBuffer.clear();
    m_stderrBuffer.clear();
    m_running = true;
    m_process.start(program, arguments);
}

void QtDownloaderProcess::terminate()
{
    if (m_process.state() == QProcess::NotRunning) return;
    m_process.terminate();
}

bool QtDownloaderProcess::isRunning() const
{
    return m_running;
}

void QtDownloaderProcess::drain(QByteArray& buffer, bool isError, bool flush)
{
    qsizetype start = 0;
    for (qsizetype i = 0; i < buffer.size(); ++i) {
        const char c = buffer.at(i);
        if (c != '\n' && c != '\r') continue;
        const QString line = QString::fromUtf8(buffer.constData() + start, i - start).trimmed();
        start = i + 1;
        if (line.isEmpty()) continue;
        if (isError) emit standardErrorLine(line);
        else emit standardOutputLine(line);
    }
    buffer.remove(0, start);

    if (flush && !buffer.isEmpty()) {
        const QString line = QString::fromUtf8(buffer).trimmed();
        buffer.clear();
        if (line.isEmpty()) return;
        if (isError) emit standardErrorLine(line);
        else emit standardOutputLine(line);
    }
}

DownloaderProcessFactory defaultProcessFactory()
{
    return [](QObject* parent) -> DownloaderProcess* {
        return new QtDownloaderProcess(parent);
    };
}
