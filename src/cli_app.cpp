#include "cli_app.h"

#include <QCommandLineParser>
#include <QFileInfo>

#include <cstdio>
#include <exception>

#include "logging_utils.h"

#ifndef AUTOCREF_VERSION
#define AUTOCREF_VERSION "0.0.0"
#endif

namespace {
    int usageError(const QCommandLineParser &parser, const QString &message) {
        std::fprintf(stderr, "%s\n\n%s", qPrintable(message), qPrintable(parser.helpText()));
        return ExitUsage;
    }
} // namespace

int runCli(const QStringList &arguments, const DocxConverter &convert) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("A Supra + Pandoc post-processor for footnote cross-references"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption inputOption(
        {QStringLiteral("i"), QStringLiteral("input")},
        QStringLiteral("The .docx file to process"),
        QStringLiteral("INPUT FILE"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("The .docx file to output (blank overwrites input)"),
        QStringLiteral("OUTPUT FILE"));
    QCommandLineOption verboseOption(
        {QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Verbosity level between 0 (critical) and 5 (trace)"),
        QStringLiteral("NUMBER"),
        QString::number(DEFAULT_VERBOSITY));
    verboseOption.setFlags(QCommandLineOption::HiddenFromHelp);
    const QCommandLineOption keepMissingOption(
        QStringLiteral("keep-missing"),
        QStringLiteral("Leave cross-references to unknown footnotes as plain numbers instead of failing"));

    parser.addOption(inputOption);
    parser.addOption(outputOption);
    parser.addOption(verboseOption);
    parser.addOption(keepMissingOption);

    // parse(), not process(): usage errors must come back as ExitUsage
    if (!parser.parse(arguments))
        return usageError(parser, parser.errorText());

    if (parser.isSet(helpOption)) {
        std::fprintf(stdout, "%s", qPrintable(parser.helpText()));
        return ExitOk;
    }
    if (parser.isSet(versionOption)) {
        std::fprintf(stdout, "autocref %s\n", AUTOCREF_VERSION);
        return ExitOk;
    }

    bool verbosityOk = false;
    const int verbosity = parser.value(verboseOption).toInt(&verbosityOk);
    if (!verbosityOk)
        return usageError(parser, QStringLiteral("Invalid verbosity: %1").arg(parser.value(verboseOption)));

    applyVerbosity(verbosity);
    qCDebug(lcAutocref) << "Logger setup.";

    if (!parser.isSet(inputOption))
        return usageError(parser, QStringLiteral("Missing required option --input."));

    const QString inputPath = parser.value(inputOption);
    const QString outputPath = resolveOutputPath(inputPath, parser.value(outputOption));

    if (!QFileInfo::exists(inputPath)) {
        qCCritical(lcAutocref).noquote() << "Application error: input file not found:" << inputPath;
        return ExitFailure;
    }
    if (!isDocxPath(inputPath))
        qCWarning(lcAutocref).noquote() << inputPath << "does not have a .docx extension.";

    autocref::ProcessOptions options;
    options.missingReference = parser.isSet(keepMissingOption)
                                   ? autocref::MissingReferencePolicy::KeepNumber
                                   : autocref::MissingReferencePolicy::Fail;
    options.trace = makeQtTraceSink();

    qCInfo(lcAutocref).noquote() << "Processing" << inputPath << "->" << outputPath;

    try {
        const auto [ok, msg] = convert(inputPath, outputPath, options);
        if (!ok) {
            qCCritical(lcAutocref).noquote() << "Application error:" << QString::fromStdString(msg);
            return ExitFailure;
        }

        qCInfo(lcAutocref).noquote() << QString::fromStdString(msg);
        return ExitOk;
    } catch (const std::exception &ex) {
        qCCritical(lcAutocref).noquote() << "Application error:" << QString::fromUtf8(ex.what());
        return ExitFailure;
    }
}
