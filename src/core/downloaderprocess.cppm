/*!
 * @file        downloaderprocess.cppm
 * @brief       Subprocess boundary for the external downloader.
 * @details     Declares the abstract process handle the engine talks to and
 *              its QProcess-backed implementation.
 *
 *              A handle streams standard output and standard error as whole
 *              lines, reports a successful spawn, a spawn failure, or an exit
 *              code, and can be asked to terminate. Terminating an idle or
 *              finished handle does nothing.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <functional>

#ifndef Q_MOC_RUN
export module reel.core.downloaderprocess;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Abstract handle on one downloader invocation.
 *
 * Signals are emitted on the owning thread's event loop. After exited() or
 * failedToStart() no further signals are emitted.
 */
REEL_MODULE_EXPORT class DownloaderProcess : public QObject {

    Q_OBJECT

public:
    explicit DownloaderProcess(QObject* parent = nullptr);
    ~DownloaderProcess() override;

    /**
     * @brief Launch the program asynchronously.
     * @param program Executable name or path.
     * @param arguments Argument vector.
     */
    virtual void start(const QString& program, const QStringList& arguments) = 0;

    //!< @brief Send the termination signal if the process is running.
    virtual void terminate() = 0;

    //!< @brief True between start() and the final signal.
    virtual bool isRunning() const = 0;

signals:
    //!< @brief Emitted once the program is running.
    void started();

    //!< @brief One line of standard output, without terminator.
    void standardOutputLine(const QString& line);

    //!< @brief One line of standard error, without terminator.
    void standardErrorLine(const QString& line);

    /**
     * @brief Emitted when the program ended.
     * @param exitCode Exit status reported by the program.
     * @param crashed True when the program was killed by a signal.
     */
    void exited(int exitCode, bool crashed);

    //!< @brief Emitted when the program could not be launched.
    void failedToStart(const QString& message);
};

/**
 * @brief DownloaderProcess backed by QProcess.
 *
 * Output is buffered per channel and split on '\n' and '\r', so carriage
 * return progress redraws become separate lines. Partial trailing data is
 * flushed as a final line when the process ends.
 */
REEL_MODULE_EXPORT class QtDownloaderProcess final : public DownloaderProcess {

    Q_OBJECT

public:
    explicit QtDownloaderProcess(QObject* parent = nullptr);
    ~QtDownloaderProcess() override;

    void start(const QString& program, const QStringList& arguments) override;
    void terminate() override;
    bool isRunning() const override;

    //!< @brief Operating system process id, 0 when not running.
    qint64 processId() const { return m_process.processId(); }

private:
    /**
     * @brief Emit every complete line held in a buffer.
     * @param buffer Channel buffer, consumed lines are removed.
     * @param isError True for standard error.
     * @param flush Also emit a trailing partial line.
     */
    void drain(QByteArray& buffer, bool isError, bool flush);

    QProcess m_process;             //!< Underlying process.
    QByteArray m_stdoutBuffer;      //!< Pending standard output bytes.
    QByteArray m_stderrBuffer;      //!< Pending standard error bytes.
    bool m_running = false;         //!< Between start() and the final signal.
};

/**
 * @brief Factory used by the engine to create process handles.
 */
REEL_MODULE_EXPORT using DownloaderProcessFactory = std::function<DownloaderProcess*(QObject* parent)>;

//!< @brief Factory producing QtDownloaderProcess instances.
REEL_MODULE_EXPORT DownloaderProcessFactory defaultProcessFactory();

#include "downloaderprocess.moc"
