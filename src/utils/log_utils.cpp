module;
#include <QDebug>
#include <QLoggingCategory>
#include <QString>
#include <QtGlobal>

module reel.utils.log_utils;

namespace reel::utils {

QString resolveLogLevel(const QString& configured)
{
    const QString fromEnv = qEnvironmentVariable("REEL_LOG_LEVEL").trimmed().toLower();
    if (!fromEnv.isEmpty()) return fromEnv;
    const QString fromConfig = configured.trimmed().toLower();
    if (!fromConfig.isEmpty()) return fromConfig;
    return QStringLiteral("info");
}

bool isKnownLogLevel(const QString& level)
{
    return level == "debug" || level == "info" || level == "warning" || level == "error";
}

bool configureLogging(const QString& level)
{
    QString pattern = qEnvironmentVariable("REEL_LOG_PATTERN");
    if (pattern.isEmpty()) {
        pattern = QStringLiteral("%{time yyyy-MM-ddThh:mm:ss.zzz} [%{type}] %{message}");
    }
    qSetMessagePattern(pattern);

    const bool known = isKnownLogLevel(level);
    const QString effective = known ? level : QStringLiteral("info");

    QString rules;
    if (effective == "info") {
        rules = QStringLiteral("*.debug=false");
    } else if (effective == "warning") {
        rules = QStringLiteral("*.debug=false\n*.info=false");
    } else if (effective == "error") {
        rules = QStringLiteral("*.debug=false\n*.info=false\n*.warning=false");
    }
    QLoggingCategory::setFilterRules(rules);

    if (!known) {
        qWarning() << "Unknown log level" << level << "- using info";
    }
    return known;
}

} // namespace reel::utils
