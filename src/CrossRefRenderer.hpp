#pragma once

#include "CrossRefTypes.hpp"
#include "Trace.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace autocref {
    // What to do with a cross-reference whose footnote never received a
    // bookmark (a "note 40" in a document with 39 footnotes).
    enum class MissingReferencePolicy {
        Fail,      // throw MissingReference, produce nothing
        KeepNumber // leave the number as plain text and log a warning
    };

    // Output strings start with this much capacity; larger inputs get more.
    inline constexpr std::size_t OUTPUT_RESERVE_BYTES = 512000;

    // Reference names look like "_Ref000000042": the prefix plus the footnote
    // number zero-padded to a fixed total width.
    inline constexpr char REFERENCE_ID_PREFIX[] = "_Ref";
    inline constexpr std::size_t REFERENCE_ID_WIDTH = 13;
    inline constexpr std::uint32_t MAX_REFERENCE_NUMBER = 999999999;

    // Throws ReferenceIdOverflow when |number| needs more digits than the
    // fixed width leaves.
    [[nodiscard]] std::string MakeReferenceId(std::uint32_t number);

    struct DocumentRender {
        std::string xml;
        ReferenceIdTable referenceIds;
        std::uint32_t nextBookmarkId = 0;
        std::size_t bookmarksInserted = 0;
    };

    struct RenderResult {
        std::string document;
        std::string footnotes;
        std::size_t bookmarksInserted = 0;
        std::size_t crossReferences = 0;
    };

    /// Render the new document.xml.
    ///
    /// Every footnote reference whose number is in |referenced| is wrapped in a
    /// bookmark:
    ///
    ///   <w:bookmarkStart w:id="7" w:name="_Ref000000003"/>...<w:bookmarkEnd w:id="7"/>
    ///
    /// Ids count up from |startingBookmarkId|, one per bookmark. The returned
    /// table maps each bookmarked footnote number to its bookmark name.
    [[nodiscard]] DocumentRender RenderDocument(const Branches &branches,
                                                const ReferencedSet &referenced,
                                                std::uint32_t startingBookmarkId,
                                                const TraceSink &trace = nullptr);

    /// Render the new footnotes.xml.
    ///
    /// A cross-reference sits in the middle of a text run, so the field closes
    /// the run, inserts the NOTEREF field and reopens a run:
    ///
    ///   </w:t></w:r><w:fldSimple w:instr=" NOTEREF _Ref000000001 "><w:r><w:t>1</w:t></w:r></w:fldSimple><w:r><w:t xml:space="preserve">
    [[nodiscard]] std::string RenderFootnotes(const Branches &branches,
                                              const ReferenceIdTable &referenceIds,
                                              MissingReferencePolicy policy = MissingReferencePolicy::Fail,
                                              const TraceSink &trace = nullptr);

    // Document pass, then footnotes pass. The reference table lives only for
    // the duration of this call.
    [[nodiscard]] RenderResult Render(const Branches &document,
                                      ReferencedSet referenced,
                                      std::uint32_t startingBookmarkId,
                                      const Branches &footnotes,
                                      MissingReferencePolicy policy = MissingReferencePolicy::Fail,
                                      const TraceSink &trace = nullptr);
} // namespace autocref
