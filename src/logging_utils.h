#pragma once

#include <QLoggingCategory>
#include <QString>

#include "Trace.hpp"

Q_DECLARE_LOGGING_CATEGORY(lcAutocref)
Q_DECLARE_LOGGING_CATEGORY(lcAutocrefTrace)

// Verbosity: 0 critical, 1 error, 2 warning, 3 info, 4 debug, 5 trace.
// Qt has no separate error level, so 0 and 1 both show critical only.
inline constexpr int DEFAULT_VERBOSITY = 3;
inline constexpr int MAX_VERBOSITY = 5;

QString verbosityFilterRules(int level);

void applyVerbosity(int level);

void installMessagePattern();

// Pipeline sink that forwards to the autocref / autocref.trace categories.
autocref::TraceSink makeQtTraceSink();
