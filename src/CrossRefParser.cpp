#include "CrossRefParser.hpp"
#include "ParseNumber.hpp"

#include <string>
#include <utility>

namespace autocref {
    Branches ParseDocument(const Segments &segments, const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Starting document parser...");

        Branches branches;
        branches.reserve(segments.size());

        std::uint32_t footnoteNumber = 1;

        for (const auto &[kind, text]: segments) {
            switch (kind) {
                case SegmentKind::Other:
                    branches.emplace_back(TextBranch{text});
                    break;

                case SegmentKind::FootnoteReference:
                    if (trace) {
                        Emit(trace, TraceLevel::Trace,
                             "Pushing FootnoteRef branch for footnote " + std::to_string(footnoteNumber));
                    }
                    branches.emplace_back(FootnoteRefBranch{footnoteNumber, text});
                    ++footnoteNumber;
                    break;

                case SegmentKind::CrossReference:
                    // not produced for document.xml
                    break;
            }
        }

        Emit(trace, TraceLevel::Debug,
             "Document parser finished (" + std::to_string(footnoteNumber - 1) + " footnote references).");
        return branches;
    }

    FootnoteParse ParseFootnotes(const Segments &segments, const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Starting footnotes parser...");

        FootnoteParse result;
        result.branches.reserve(segments.size());

        for (const auto &[kind, text]: segments) {
            switch (kind) {
                case SegmentKind::Other:
                    result.branches.emplace_back(TextBranch{text});
                    break;

                case SegmentKind::CrossReference: {
                    const std::uint32_t number = detail::ParseUnsigned(text, "cross reference");

                    if (result.referenced.insert(number) && trace) {
                        Emit(trace, TraceLevel::Trace,
                             "Adding footnote " + std::to_string(number) + " to used cross-references");
                    }
                    result.branches.emplace_back(CrossRefBranch{number});
                    break;
                }

                case SegmentKind::FootnoteReference:
                    // not produced for footnotes.xml
                    break;
            }
        }

        Emit(trace, TraceLevel::Debug,
             "Footnote parser finished (" + std::to_string(result.referenced.size()) +
             " distinct footnotes referenced).");
        return result;
    }

    ParseResult Parse(const Segments &document, const Segments &footnotes, const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Starting parser...");

        ParseResult result;
        result.document = ParseDocument(document, trace);

        FootnoteParse footnoteParse = ParseFootnotes(footnotes, trace);
        result.footnotes = std::move(footnoteParse.branches);
        result.referenced = std::move(footnoteParse.referenced);

        Emit(trace, TraceLevel::Debug, "Parser finished.");
        return result;
    }
} // namespace autocref
