#pragma once

#include "Trace.hpp"

#include <cstdint>
#include <string_view>

namespace autocref {
    /// Determine the first bookmark id that is safe to use.
    ///
    /// document.xml usually carries bookmarks already (headings, Pandoc
    /// anchors), with arbitrary ids. New ids must never collide with those, so
    /// this returns one more than the highest existing <w:bookmarkStart> id,
    /// or 1 when the document has no bookmarks.
    [[nodiscard]] std::uint32_t StartingBookmarkId(std::string_view document,
                                                   const TraceSink &trace = nullptr);
} // namespace autocref
