#pragma once

#include <QString>
#include <QStringList>

#include <functional>

#include "fileio_utils.h"

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

using DocxConverter = std::function<ConvertResult(const QString &inputPath,
                                                  const QString &outputPath,
                                                  const autocref::ProcessOptions &options)>;

// Command-line front end. |arguments| includes the program name first.
// Returns an ExitCode; never calls exit() itself.
int runCli(const QStringList &arguments, const DocxConverter &convert = convertDocxFile);
