#include "BookmarkIds.hpp"
#include "CrossRefErrors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace autocref;

TEST(StartingBookmarkId, NoBookmarksStartsAtOne) {
    EXPECT_EQ(StartingBookmarkId(""), 1u);
    EXPECT_EQ(StartingBookmarkId("<w:body><w:p><w:r><w:t>x</w:t></w:r></w:p></w:body>"), 1u);
}

TEST(StartingBookmarkId, OneAboveHighestExistingId) {
    const std::string doc =
        R"(<w:bookmarkStart w:id="5" w:name="intro" /><w:p/><w:bookmarkEnd w:id="5" />)"
        R"(<w:bookmarkStart w:id="9" w:name="end" /><w:p/><w:bookmarkEnd w:id="9" />)"
        R"(<w:bookmarkStart w:id="2" w:name="mid" /><w:bookmarkEnd w:id="2" />)";
    EXPECT_EQ(StartingBookmarkId(doc), 10u);
}

TEST(StartingBookmarkId, IgnoresBookmarkEndIds) {
    const std::string doc =
        R"(<w:bookmarkStart w:id="3" w:name="a" /><w:bookmarkEnd w:id="300" />)";
    EXPECT_EQ(StartingBookmarkId(doc), 4u);
}

TEST(StartingBookmarkId, ZeroIdGivesOne) {
    EXPECT_EQ(StartingBookmarkId(R"(<w:bookmarkStart w:id="0" w:name="_GoBack"/>)"), 1u);
}

TEST(StartingBookmarkId, OverflowingIdIsParseError) {
    const std::string doc = R"(<w:bookmarkStart w:id="99999999999" w:name="huge"/>)";
    try {
        (void) StartingBookmarkId(doc);
        FAIL() << "expected ParseError";
    } catch (const ParseError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Parse);
        EXPECT_NE(std::string(e.what()).find("99999999999"), std::string::npos);
    }
}

TEST(StartingBookmarkId, ExhaustedIdSpaceIsParseError) {
    EXPECT_THROW((void) StartingBookmarkId(R"(<w:bookmarkStart w:id="4294967295" w:name="x"/>)"),
                 ParseError);
    EXPECT_EQ(StartingBookmarkId(R"(<w:bookmarkStart w:id="4294967294" w:name="x"/>)"), 4294967295u);
}

TEST(StartingBookmarkId, ReportsThroughTraceSink) {
    std::vector<std::string> messages;
    const TraceSink sink = [&messages](TraceLevel, const std::string &message) {
        messages.push_back(message);
    };

    EXPECT_EQ(StartingBookmarkId(R"(<w:bookmarkStart w:id="41" w:name="x"/>)", sink), 42u);
    ASSERT_FALSE(messages.empty());
    EXPECT_EQ(messages.back(), "Starting bookmark is 42");
}
