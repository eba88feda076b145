#pragma once

#include "CrossRefTypes.hpp"
#include "Trace.hpp"

namespace autocref {
    struct FootnoteParse {
        Branches branches;
        ReferencedSet referenced;
    };

    struct ParseResult {
        Branches document;
        Branches footnotes;
        ReferencedSet referenced;
    };

    // Number the footnote references of document.xml.
    //
    // Footnotes are assumed to be numbered 1, 2, 3... in source order. Supra's
    // numbering offset breaks this assumption and is not supported.
    [[nodiscard]] Branches ParseDocument(const Segments &segments,
                                         const TraceSink &trace = nullptr);

    // Resolve the cross-references of footnotes.xml and collect the distinct
    // footnote numbers they point at. Throws ParseError on unparsable digits.
    [[nodiscard]] FootnoteParse ParseFootnotes(const Segments &segments,
                                               const TraceSink &trace = nullptr);

    [[nodiscard]] ParseResult Parse(const Segments &document,
                                    const Segments &footnotes,
                                    const TraceSink &trace = nullptr);
} // namespace autocref
