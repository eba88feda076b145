#include "logging_utils.h"

#include <QDebug>

Q_LOGGING_CATEGORY(lcAutocref, "autocref")
Q_LOGGING_CATEGORY(lcAutocrefTrace, "autocref.trace")

QString verbosityFilterRules(int level)
{
    if (level < 0 || level > MAX_VERBOSITY)
        level = DEFAULT_VERBOSITY;

    const auto flag = [](const bool on) { return on ? QStringLiteral("true") : QStringLiteral("false"); };

    return QStringLiteral("autocref.debug=%1\n"
                          "autocref.info=%2\n"
                          "autocref.warning=%3\n"
                          "autocref.trace.debug=%4")
        .arg(flag(level >= 4),
             flag(level >= 3),
             flag(level >= 2),
             flag(level >= 5));
}

void applyVerbosity(const int level)
{
    QLoggingCategory::setFilterRules(verbosityFilterRules(level));
}

void installMessagePattern()
{
    qSetMessagePattern(QStringLiteral(
        "%{time hh:mm:ss.zzz} "
        "%{if-debug}DEBG%{endif}%{if-info}INFO%{endif}%{if-warning}WARN%{endif}"
        "%{if-critical}CRIT%{endif}%{if-fatal}FATL%{endif} "
        "%{message}"));
}

autocref::TraceSink makeQtTraceSink()
{
    return [](const autocref::TraceLevel level, const std::string &message) {
        const QString text = QString::fromUtf8(message.data(), static_cast<qsizetype>(message.size()));

        switch (level) {
            case autocref::TraceLevel::Trace:
                qCDebug(lcAutocrefTrace).noquote() << text;
                break;
            case autocref::TraceLevel::Debug:
                qCDebug(lcAutocref).noquote() << text;
                break;
            case autocref::TraceLevel::Info:
                qCInfo(lcAutocref).noquote() << text;
                break;
            case autocref::TraceLevel::Warning:
                qCWarning(lcAutocref).noquote() << text;
                break;
        }
    };
}
