#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMetaObject>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include <cstdio>
#include <optional>

import reel.core.downloadjob;
import reel.core.downloadmanager;
import reel.core.enginesettings;
import reel.core.updatebatcher;
import reel.services.metadata_probe;
import reel.utils.log_utils;

namespace utils = reel::utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

constexpr int kExitUsage = 2;

void printJsonLine(const QJsonObject& object)
{
    static QTextStream out(stdout);
    out << QJsonDocument(object).toJson(QJsonDocument::Compact) << '\n';
    out.flush();
}

void printEvent(const UpdateEvent& event)
{
    QJsonObject line;
    line.insert("event", event.name());
    line.insert("payload", event.payload());
    printJsonLine(line);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("reel"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Queue and run media downloads through yt-dlp."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption({ "c", "config" }, "JSON settings file.", "file");
    const QCommandLineOption outputOption({ "o", "output" }, "Output directory.", "dir");
    const QCommandLineOption qualityOption({ "q", "quality" }, "Quality: best, audio, <N>p or a format string.", "quality");
    const QCommandLineOption concurrencyOption({ "j", "max-concurrent" }, "Maximum concurrent downloads.", "n");
    const QCommandLineOption downloaderOption("downloader", "Downloader executable.", "path");
    const QCommandLineOption argsOption("args", "Custom downloader arguments; ${quality} is substituted.", "string");
    const QCommandLineOption inputOption({ "i", "input" }, "Import URLs from a JSON or text file.", "file");
    const QCommandLineOption playlistOption("playlist", "Expand playlist URLs into one job per entry.");
    const QCommandLineOption logLevelOption("log-level", "debug, info, warning or error.", "level");
    const QCommandLineOption checkOption("check", "Check that the downloader can be executed and exit.");
    parser.addOptions({ configOption, outputOption, qualityOption, concurrencyOption, downloaderOption,
                        argsOption, inputOption, playlistOption, logLevelOption, checkOption });
    parser.addPositionalArgument("urls", "Media URLs to download.", "[urls...]");
    parser.process(app);

    EngineSettings settings = defaultEngineSettings();
    if (parser.isSet(configOption)) {
        QString error;
        if (!loadSettingsFile(parser.value(configOption), settings, &error)) {
            qCritical().noquote() << "Invalid configuration:" << error;
            return kExitUsage;
        }
    }
    if (parser.isSet(outputOption)) settings.outputPath = QFileInfo(parser.value(outputOption)).absoluteFilePath();
    if (parser.isSet(qualityOption)) settings.defaultQuality = parser.value(qualityOption);
    if (parser.isSet(downloaderOption)) settings.downloaderPath = parser.value(downloaderOption);
    if (parser.isSet(argsOption)) settings.customYtDlpArgs = parser.value(argsOption);
    if (parser.isSet(logLevelOption)) settings.logLevel = parser.value(logLevelOption);
    if (parser.isSet(concurrencyOption)) {
        bool ok = false;
        const int limit = parser.value(concurrencyOption).toInt(&ok);
        if (!ok || limit < 1) {
            qCritical().noquote() << "Invalid --max-concurrent value:" << parser.value(concurrencyOption);
            return kExitUsage;
        }
        settings.maxConcurrentDownloads = limit;
    }

    utils::configureLogging(utils::resolveLogLevel(settings.logLevel));
    qInfo() << "reel" << APP_VERSION << "using" << settings.downloaderPath;

    if (parser.isSet(checkOption)) {
        MetadataProbe probe(settings.downloaderPath);
        int exitCode = 1;
        probe.checkAvailability([&exitCode](bool available, const QString& version) {
            QJsonObject result;
            result.insert("available", available);
            result.insert("version", version);
            printJsonLine(result);
            exitCode = available ? 0 : 1;
            QCoreApplication::quit();
        });
        app.exec();
        return exitCode;
    }

    const QStringList urls = parser.positionalArguments();
    if (urls.isEmpty() && !parser.isSet(inputOption)) {
        qCritical() << "Nothing to download: pass URLs or --input";
        return kExitUsage;
    }

    settings.autoStartDownloads = true;
    DownloadManager manager(settings);
    for (const QString& channel : { QString::fromLatin1(DownloadManager::kUpdatedChannel),
                                    QString::fromLatin1(DownloadManager::kRemovedChannel),
                                    QString::fromLatin1(DownloadManager::kLogChannel) }) {
        manager.subscribe(channel, printEvent);
    }

    const auto finish = [&manager]() {
        manager.flushUpdates();
        const bool failed = manager.table().size() == 0
            || manager.table().countWithStatus(JobStatus::Error) > 0;
        const int exitCode = failed ? 1 : 0;
        QMetaObject::invokeMethod(QCoreApplication::instance(), [exitCode]() {
            QCoreApplication::exit(exitCode);
        }, Qt::QueuedConnection);
    };
    QObject::connect(&manager, &DownloadManager::drained, &app, finish);

    int submitted = 0;
    if (parser.isSet(inputOption)) {
        submitted += static_cast<int>(manager.importList(parser.value(inputOption)).size());
    }

    if (parser.isSet(playlistOption)) {
        // Each pending probe holds the engine open until its entries are submitted.
        for (const QString& url : urls) {
            manager.acquireDrainHold();
            manager.probeMetadata(url, [&manager, url](const std::optional<MediaMetadata>& metadata,
                                                       const QString& error) {
                if (metadata && metadata->isPlaylist()) {
                    manager.submitBatch(metadata->entries);
                } else {
                    if (!error.isEmpty()) qWarning().noquote() << "Playlist expansion failed for" << url << ":" << error;
                    manager.submit(url);
                }
                manager.releaseDrainHold();
            });
        }
    } else {
        for (const QString& url : urls) {
            if (!manager.submit(url).isEmpty()) ++submitted;
        }
    }

    if (submitted == 0 && (!parser.isSet(playlistOption) || urls.isEmpty())) {
        qCritical() << "No valid downloads were submitted";
        return 1;
    }

    return app.exec();
}
