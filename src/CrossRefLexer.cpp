#include "CrossRefLexer.hpp"

#include <boost/regex.hpp>

#include <string>
#include <utility>

namespace autocref {
    namespace {
        // Cuts an input into consecutive segments. |cursor_| is the start of the
        // Other segment that is currently open.
        class SegmentBuilder {
        public:
            SegmentBuilder(const std::string_view input, const TraceSink &trace)
                : input_(input), trace_(trace) {
                segments_.reserve(64);
            }

            // Close the open Other segment at |at|.
            void closeOther(const char *at) {
                push(SegmentKind::Other, cursor_, at);
            }

            void push(const SegmentKind kind, const char *first, const char *last) {
                const std::string_view text(first, static_cast<std::size_t>(last - first));

                if (trace_) {
                    Emit(trace_, TraceLevel::Trace,
                         std::string("Pushing segment ") + SegmentKindName(kind) +
                         " containing \"" + Excerpt(text) + "\"");
                }

                segments_.push_back(Segment{kind, text});
                cursor_ = last;
            }

            // Close the trailing Other segment and hand the result over.
            Segments finish() {
                push(SegmentKind::Other, cursor_, end());
                return std::move(segments_);
            }

            [[nodiscard]] const char *begin() const noexcept { return input_.data(); }
            [[nodiscard]] const char *end() const noexcept { return input_.data() + input_.size(); }

        private:
            std::string_view input_;
            const TraceSink &trace_;
            const char *cursor_ = input_.data();
            Segments segments_;
        };

        const boost::regex &FootnoteReferencePattern() {
            static const boost::regex pattern(
                R"(<w:r><w:rPr><w:rStyle w:val="FootnoteReference" /></w:rPr>)"
                R"(<w:footnoteReference w:id="[0-9]{1,9}" /></w:r>)");
            return pattern;
        }

        // Groups:
        //   1 : number of a single reference
        //   2 : first number of a range
        //   3 : the dash, hyphen or U+2013 EN DASH
        //   4 : second number of a range
        const boost::regex &CrossReferencePattern() {
            static const boost::regex pattern(
                std::string(R"(>note ([0-9]{1,9})|>notes ([0-9]{1,9})(-|)") +
                "\xE2\x80\x93" +
                R"()([0-9]{1,9}))");
            return pattern;
        }
    } // namespace

    Segments LexDocument(const std::string_view document, const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Lexing document...");

        SegmentBuilder builder(document, trace);

        if (!document.empty()) {
            const boost::regex &pattern = FootnoteReferencePattern();
            for (boost::cregex_iterator it(builder.begin(), builder.end(), pattern), last; it != last; ++it) {
                const auto &match = (*it)[0];
                builder.closeOther(match.first);
                builder.push(SegmentKind::FootnoteReference, match.first, match.second);
            }
        }

        Segments segments = builder.finish();
        Emit(trace, TraceLevel::Debug,
             "Document lexing finished (" + std::to_string(segments.size()) + " segments).");
        return segments;
    }

    Segments LexFootnotes(const std::string_view footnotes, const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Lexing footnotes...");

        SegmentBuilder builder(footnotes, trace);

        if (!footnotes.empty()) {
            const boost::regex &pattern = CrossReferencePattern();
            for (boost::cregex_iterator it(builder.begin(), builder.end(), pattern), last; it != last; ++it) {
                const boost::cmatch &match = *it;

                if (match[1].matched) {
                    // >note N
                    builder.closeOther(match[1].first);
                    builder.push(SegmentKind::CrossReference, match[1].first, match[1].second);
                } else {
                    // >notes N-M : the dash is emitted verbatim between the two numbers
                    builder.closeOther(match[2].first);
                    builder.push(SegmentKind::CrossReference, match[2].first, match[2].second);
                    builder.push(SegmentKind::Other, match[3].first, match[3].second);
                    builder.push(SegmentKind::CrossReference, match[4].first, match[4].second);
                }
            }
        }

        Segments segments = builder.finish();
        Emit(trace, TraceLevel::Debug,
             "Footnote lexing finished (" + std::to_string(segments.size()) + " segments).");
        return segments;
    }

    LexResult Lex(const std::string_view document, const std::string_view footnotes, const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Starting lexer...");

        LexResult result;
        result.document = LexDocument(document, trace);
        result.footnotes = LexFootnotes(footnotes, trace);

        Emit(trace, TraceLevel::Debug, "Lexer finished.");
        return result;
    }
} // namespace autocref
