#include "CrossRefPipeline.hpp"
#include "BookmarkIds.hpp"
#include "CrossRefLexer.hpp"
#include "CrossRefParser.hpp"

#include <algorithm>
#include <utility>

namespace autocref {
    ProcessResult Process(const std::string_view document,
                          const std::string_view footnotes,
                          const ProcessOptions &options) {
        const TraceSink &trace = options.trace;

        const std::uint32_t startingBookmarkId = StartingBookmarkId(document, trace);

        const LexResult segments = Lex(document, footnotes, trace);
        ParseResult tree = Parse(segments.document, segments.footnotes, trace);

        ProcessStats stats;
        stats.startingBookmarkId = startingBookmarkId;
        stats.referencedFootnotes = tree.referenced.size();
        stats.footnoteReferences = static_cast<std::size_t>(
            std::count_if(tree.document.begin(), tree.document.end(), [](const Branch &branch) {
                return std::holds_alternative<FootnoteRefBranch>(branch);
            }));

        RenderResult rendered = Render(tree.document,
                                       std::move(tree.referenced),
                                       startingBookmarkId,
                                       tree.footnotes,
                                       options.missingReference,
                                       trace);

        stats.crossReferences = rendered.crossReferences;
        stats.bookmarksInserted = rendered.bookmarksInserted;

        Emit(trace, TraceLevel::Info,
             "Linked " + std::to_string(stats.crossReferences) + " cross-reference(s) to " +
             std::to_string(stats.bookmarksInserted) + " bookmarked footnote(s).");

        return {std::move(rendered.document), std::move(rendered.footnotes), stats};
    }
} // namespace autocref
