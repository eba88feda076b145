#pragma once

#include "CrossRefRenderer.hpp"
#include "Trace.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace autocref {
    struct ProcessOptions {
        MissingReferencePolicy missingReference = MissingReferencePolicy::Fail;
        TraceSink trace;
    };

    struct ProcessStats {
        std::uint32_t startingBookmarkId = 0;
        std::size_t footnoteReferences = 0;
        std::size_t crossReferences = 0;
        std::size_t referencedFootnotes = 0;
        std::size_t bookmarksInserted = 0;
    };

    struct ProcessResult {
        std::string document;
        std::string footnotes;
        ProcessStats stats;
    };

    // Turn the "note N" back-references of footnotes.xml into NOTEREF fields
    // bound to new bookmarks around the footnote references of document.xml.
    //
    // Runs bookmark allocation, lexing, parsing and rendering in sequence.
    // Any failure throws an autocref::Error and nothing is returned. Both
    // inputs are borrowed for the duration of the call only.
    [[nodiscard]] ProcessResult Process(std::string_view document,
                                        std::string_view footnotes,
                                        const ProcessOptions &options = {});
} // namespace autocref
