#include "logging_utils.h"

#include <QLoggingCategory>

#include <gtest/gtest.h>

TEST(VerbosityFilterRules, InfoIsTheDefault) {
    EXPECT_EQ(verbosityFilterRules(DEFAULT_VERBOSITY),
              QStringLiteral("autocref.debug=false\n"
                             "autocref.info=true\n"
                             "autocref.warning=true\n"
                             "autocref.trace.debug=false"));
}

TEST(VerbosityFilterRules, EachLevelOpensOneMoreCategory) {
    EXPECT_EQ(verbosityFilterRules(0),
              QStringLiteral("autocref.debug=false\nautocref.info=false\nautocref.warning=false\nautocref.trace.debug=false"));
    EXPECT_EQ(verbosityFilterRules(1), verbosityFilterRules(0));
    EXPECT_EQ(verbosityFilterRules(2),
              QStringLiteral("autocref.debug=false\nautocref.info=false\nautocref.warning=true\nautocref.trace.debug=false"));
    EXPECT_EQ(verbosityFilterRules(4),
              QStringLiteral("autocref.debug=true\nautocref.info=true\nautocref.warning=true\nautocref.trace.debug=false"));
    EXPECT_EQ(verbosityFilterRules(5),
              QStringLiteral("autocref.debug=true\nautocref.info=true\nautocref.warning=true\nautocref.trace.debug=true"));
}

TEST(VerbosityFilterRules, OutOfRangeFallsBackToDefault) {
    EXPECT_EQ(verbosityFilterRules(-1), verbosityFilterRules(DEFAULT_VERBOSITY));
    EXPECT_EQ(verbosityFilterRules(MAX_VERBOSITY + 1), verbosityFilterRules(DEFAULT_VERBOSITY));
}

TEST(ApplyVerbosity, TogglesTheCategories) {
    applyVerbosity(5);
    EXPECT_TRUE(lcAutocrefTrace().isDebugEnabled());
    EXPECT_TRUE(lcAutocref().isDebugEnabled());

    applyVerbosity(2);
    EXPECT_FALSE(lcAutocrefTrace().isDebugEnabled());
    EXPECT_FALSE(lcAutocref().isInfoEnabled());
    EXPECT_TRUE(lcAutocref().isWarningEnabled());

    applyVerbosity(DEFAULT_VERBOSITY);
}

TEST(QtTraceSink, AcceptsEveryLevel) {
    applyVerbosity(0);
    const autocref::TraceSink sink = makeQtTraceSink();
    ASSERT_TRUE(sink);
    EXPECT_NO_THROW(sink(autocref::TraceLevel::Trace, "trace"));
    EXPECT_NO_THROW(sink(autocref::TraceLevel::Debug, "debug"));
    EXPECT_NO_THROW(sink(autocref::TraceLevel::Info, "info"));
    EXPECT_NO_THROW(sink(autocref::TraceLevel::Warning, "warning"));
    applyVerbosity(DEFAULT_VERBOSITY);
}
