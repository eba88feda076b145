#pragma once

#include "CrossRefTypes.hpp"
#include "Trace.hpp"

#include <string_view>

namespace autocref {
    struct LexResult {
        Segments document;
        Segments footnotes;
    };

    // Lex document.xml into Other / FootnoteReference segments.
    //
    // A footnote reference is the run Pandoc writes for every footnote:
    //   <w:r><w:rPr><w:rStyle w:val="FootnoteReference" /></w:rPr><w:footnoteReference w:id="N" /></w:r>
    // The result always starts and ends with an Other segment (possibly empty)
    // and the two kinds alternate.
    [[nodiscard]] Segments LexDocument(std::string_view document,
                                       const TraceSink &trace = nullptr);

    // Lex footnotes.xml into Other / CrossReference segments.
    //
    // Recognizes ">note N" and ">notes N-M" / ">notes N–M" (hyphen or en-dash).
    // Only the digits become CrossReference segments; the marker text and the
    // dash stay in Other segments so they round-trip untouched.
    [[nodiscard]] Segments LexFootnotes(std::string_view footnotes,
                                        const TraceSink &trace = nullptr);

    [[nodiscard]] LexResult Lex(std::string_view document,
                                std::string_view footnotes,
                                const TraceSink &trace = nullptr);
} // namespace autocref
