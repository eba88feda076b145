#include <QCoreApplication>

#include "cli_app.h"
#include "logging_utils.h"

#ifndef AUTOCREF_VERSION
#define AUTOCREF_VERSION "0.0.0"
#endif

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("autocref"));
    QCoreApplication::setApplicationVersion(QStringLiteral(AUTOCREF_VERSION));

    installMessagePattern();
    return runCli(QCoreApplication::arguments());
}
