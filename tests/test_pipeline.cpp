/*
 * Pipeline tests
 * ==============
 *
 * End-to-end runs of Process() over hand-written snippets and over the
 * Pandoc fixtures in tests/data (doc-orig.xml / fn-orig.xml and their
 * expected outputs doc-target.xml / fn-target.xml).
 */

#include "CrossRefPipeline.hpp"
#include "CrossRefErrors.hpp"
#include "fileio_utils.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

using namespace autocref;

namespace {
    std::string FootnoteRun(const int id) {
        return R"(<w:r><w:rPr><w:rStyle w:val="FootnoteReference" /></w:rPr><w:footnoteReference w:id=")" +
               std::to_string(id) + R"(" /></w:r>)";
    }

    std::string Paragraph(const std::string &text, const int footnoteId) {
        return R"(<w:p><w:r><w:t xml:space="preserve">)" + text + "</w:t></w:r>" +
               FootnoteRun(footnoteId) + "</w:p>";
    }

    std::string Footnote(const int id, const std::string &text) {
        return R"(<w:footnote w:id=")" + std::to_string(id) +
               R"("><w:p><w:r><w:t xml:space="preserve">)" + text + "</w:t></w:r></w:p></w:footnote>";
    }

    std::string Field(const int number) {
        char referenceId[16];
        std::snprintf(referenceId, sizeof(referenceId), "_Ref%09d", number);
        return std::string(R"(</w:t></w:r><w:fldSimple w:instr=" NOTEREF )") + referenceId +
               R"( "><w:r><w:t>)" + std::to_string(number) +
               R"(</w:t></w:r></w:fldSimple><w:r><w:t xml:space="preserve">)";
    }

    QString DataFile(const char *name) {
        return QString::fromUtf8(AUTOCREF_TEST_DATA_DIR) + QLatin1Char('/') + QString::fromUtf8(name);
    }
}

// ========================================================================
// Scenarios
// ========================================================================

TEST(Process, SingleReference) {
    const std::string doc = "<w:body>" + Paragraph("Claim.", 20) + Paragraph("Another.", 21) + "</w:body>";
    const std::string fns = Footnote(20, "Source.") + Footnote(21, "note 1.");

    const ProcessResult out = Process(doc, fns);

    const std::string expectedDoc =
        "<w:body>" +
        std::string(R"(<w:p><w:r><w:t xml:space="preserve">Claim.</w:t></w:r>)") +
        R"(<w:bookmarkStart w:id="1" w:name="_Ref000000001"/>)" + FootnoteRun(20) +
        R"(<w:bookmarkEnd w:id="1"/></w:p>)" +
        Paragraph("Another.", 21) + "</w:body>";
    EXPECT_EQ(out.document, expectedDoc);

    EXPECT_EQ(out.footnotes, Footnote(20, "Source.") + Footnote(21, "note " + Field(1) + "."));

    EXPECT_EQ(out.stats.startingBookmarkId, 1u);
    EXPECT_EQ(out.stats.footnoteReferences, 2u);
    EXPECT_EQ(out.stats.crossReferences, 1u);
    EXPECT_EQ(out.stats.referencedFootnotes, 1u);
    EXPECT_EQ(out.stats.bookmarksInserted, 1u);
}

TEST(Process, RangedReferenceKeepsTheEnDash) {
    const std::string doc = Paragraph("One.", 20) + Paragraph("Two.", 21) + Paragraph("Three.", 22);
    const std::string fns = Footnote(22, "notes 1–2.");

    const ProcessResult out = Process(doc, fns);

    EXPECT_EQ(out.footnotes, Footnote(22, "notes " + Field(1) + "–" + Field(2) + "."));
    EXPECT_EQ(out.stats.crossReferences, 2u);
    EXPECT_EQ(out.stats.referencedFootnotes, 2u);
    EXPECT_NE(out.document.find(R"(<w:bookmarkStart w:id="1" w:name="_Ref000000001"/>)"), std::string::npos);
    EXPECT_NE(out.document.find(R"(<w:bookmarkStart w:id="2" w:name="_Ref000000002"/>)"), std::string::npos);
}

TEST(Process, UnreferencedFootnoteIsUntouched) {
    const std::string doc = Paragraph("One.", 20) + Paragraph("Two.", 21) + Paragraph("Three.", 22);
    const std::string fns = Footnote(22, "note 2.");

    const ProcessResult out = Process(doc, fns);

    // footnotes 1 and 3 pass through byte for byte; 2 takes the first id
    const std::string expectedDoc =
        Paragraph("One.", 20) +
        R"(<w:p><w:r><w:t xml:space="preserve">Two.</w:t></w:r>)" +
        R"(<w:bookmarkStart w:id="1" w:name="_Ref000000002"/>)" + FootnoteRun(21) +
        R"(<w:bookmarkEnd w:id="1"/></w:p>)" +
        Paragraph("Three.", 22);
    EXPECT_EQ(out.document, expectedDoc);
    EXPECT_EQ(out.stats.bookmarksInserted, 1u);
}

TEST(Process, PreExistingBookmarksPushTheStartingId) {
    const std::string doc =
        R"(<w:bookmarkStart w:id="5" w:name="intro" /><w:bookmarkEnd w:id="5" />)" +
        Paragraph("One.", 20) +
        R"(<w:bookmarkStart w:id="9" w:name="end" /><w:bookmarkEnd w:id="9" />)" +
        Paragraph("Two.", 21);
    const std::string fns = Footnote(21, "notes 1-2.");

    const ProcessResult out = Process(doc, fns);

    EXPECT_EQ(out.stats.startingBookmarkId, 10u);
    EXPECT_NE(out.document.find(R"(<w:bookmarkStart w:id="10" w:name="_Ref000000001"/>)"), std::string::npos);
    EXPECT_NE(out.document.find(R"(<w:bookmarkEnd w:id="10"/>)"), std::string::npos);
    EXPECT_NE(out.document.find(R"(<w:bookmarkStart w:id="11" w:name="_Ref000000002"/>)"), std::string::npos);
    EXPECT_EQ(out.document.find(R"(w:id="12")"), std::string::npos);
}

TEST(Process, EmptyInputs) {
    const ProcessResult out = Process("", "");
    EXPECT_TRUE(out.document.empty());
    EXPECT_TRUE(out.footnotes.empty());
    EXPECT_EQ(out.stats.bookmarksInserted, 0u);
}

// ========================================================================
// Properties
// ========================================================================

TEST(Process, NoCrossReferencesLeavesBothDocumentsIdentical) {
    const std::string doc = Paragraph("One.", 20) + Paragraph("Two.", 21);
    const std::string fns = Footnote(20, "Footnote 1. Mentions a note 3 in passing.") + Footnote(21, "Plain.");

    const ProcessResult out = Process(doc, fns);
    EXPECT_EQ(out.document, doc);
    EXPECT_EQ(out.footnotes, fns);
}

TEST(Process, CrossReferenceToUnknownFootnote) {
    const std::string doc = Paragraph("Only one footnote.", 20);
    const std::string fns = Footnote(20, "note 4.");

    EXPECT_THROW((void) Process(doc, fns), MissingReference);

    ProcessOptions options;
    options.missingReference = MissingReferencePolicy::KeepNumber;
    const ProcessResult out = Process(doc, fns, options);
    EXPECT_EQ(out.footnotes, fns);
    // footnote 4 is in the referenced set but has no run to bookmark
    EXPECT_EQ(out.document, doc);
    EXPECT_EQ(out.stats.referencedFootnotes, 1u);
}

TEST(Process, MalformedBookmarkIdAbortsTheRun) {
    const std::string doc = R"(<w:bookmarkStart w:id="123456789012" w:name="x"/>)" + Paragraph("One.", 20);
    EXPECT_THROW((void) Process(doc, Footnote(20, "note 1.")), ParseError);
}

TEST(Process, TraceSinkReceivesSummary) {
    std::string summary;
    ProcessOptions options;
    options.trace = [&summary](const TraceLevel level, const std::string &message) {
        if (level == TraceLevel::Info)
            summary = message;
    };

    (void) Process(Paragraph("One.", 20) + Paragraph("Two.", 21), Footnote(21, "note 1."), options);
    EXPECT_EQ(summary, "Linked 1 cross-reference(s) to 1 bookmarked footnote(s).");
}

// ========================================================================
// Pandoc fixtures
// ========================================================================

TEST(ProcessFixtures, MatchesExpectedOutput) {
    const std::string docInput = loadTextFile(DataFile("doc-orig.xml"));
    const std::string docTarget = loadTextFile(DataFile("doc-target.xml"));
    const std::string fnInput = loadTextFile(DataFile("fn-orig.xml"));
    const std::string fnTarget = loadTextFile(DataFile("fn-target.xml"));

    const ProcessResult out = Process(docInput, fnInput);

    EXPECT_EQ(out.document, docTarget);
    EXPECT_EQ(out.footnotes, fnTarget);

    EXPECT_EQ(out.stats.startingBookmarkId, 10u);
    EXPECT_EQ(out.stats.footnoteReferences, 5u);
    EXPECT_EQ(out.stats.crossReferences, 6u);
    EXPECT_EQ(out.stats.referencedFootnotes, 3u);
    EXPECT_EQ(out.stats.bookmarksInserted, 3u);
}
