#include "CrossRefRenderer.hpp"
#include "CrossRefErrors.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace autocref {
    namespace {
        // Markup added per bookmark / per field, rounded up.
        constexpr std::size_t BOOKMARK_OVERHEAD = 96;
        constexpr std::size_t FIELD_OVERHEAD = 160;

        std::size_t EstimateOutputSize(const Branches &branches, const std::size_t perInsertion) {
            std::size_t size = 0;
            for (const Branch &branch: branches) {
                if (const auto *text = std::get_if<TextBranch>(&branch))
                    size += text->contents.size();
                else if (const auto *footnote = std::get_if<FootnoteRefBranch>(&branch))
                    size += footnote->contents.size() + perInsertion;
                else
                    size += perInsertion;
            }
            return std::max(OUTPUT_RESERVE_BYTES, size);
        }

        void AppendField(std::string &out, const std::string &referenceId, const std::uint32_t number) {
            out += R"(</w:t></w:r><w:fldSimple w:instr=" NOTEREF )";
            out += referenceId;
            out += R"( "><w:r><w:t>)";
            out += std::to_string(number);
            out += R"(</w:t></w:r></w:fldSimple><w:r><w:t xml:space="preserve">)";
        }
    } // namespace

    std::string MakeReferenceId(const std::uint32_t number) {
        if (number > MAX_REFERENCE_NUMBER) {
            throw ReferenceIdOverflow("Footnote " + std::to_string(number) +
                                      " does not fit a " + std::to_string(REFERENCE_ID_WIDTH) +
                                      "-character reference id");
        }

        const std::string digits = std::to_string(number);
        const std::size_t prefixLength = sizeof(REFERENCE_ID_PREFIX) - 1;

        std::string referenceId;
        referenceId.reserve(REFERENCE_ID_WIDTH);
        referenceId += REFERENCE_ID_PREFIX;
        referenceId.append(REFERENCE_ID_WIDTH - prefixLength - digits.size(), '0');
        referenceId += digits;
        return referenceId;
    }

    DocumentRender RenderDocument(const Branches &branches,
                                  const ReferencedSet &referenced,
                                  const std::uint32_t startingBookmarkId,
                                  const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Beginning document rendering...");

        DocumentRender result;
        result.xml.reserve(EstimateOutputSize(branches, BOOKMARK_OVERHEAD));

        // 64-bit so that running past the last uint32 id is detected, not wrapped
        std::uint64_t bookmarkId = startingBookmarkId;

        for (const Branch &branch: branches) {
            if (const auto *text = std::get_if<TextBranch>(&branch)) {
                result.xml += text->contents;
                continue;
            }

            const auto *footnote = std::get_if<FootnoteRefBranch>(&branch);
            if (!footnote)
                continue;

            if (!referenced.contains(footnote->number)) {
                result.xml += footnote->contents;
                continue;
            }

            if (bookmarkId > std::numeric_limits<std::uint32_t>::max())
                throw ReferenceIdOverflow("Ran out of bookmark ids at footnote " +
                                          std::to_string(footnote->number));

            std::string referenceId = MakeReferenceId(footnote->number);
            const std::string id = std::to_string(bookmarkId);

            if (trace) {
                Emit(trace, TraceLevel::Trace,
                     "Bookmarking footnote " + std::to_string(footnote->number) +
                     " as " + referenceId + " (id " + id + ")");
            }

            result.xml += R"(<w:bookmarkStart w:id=")";
            result.xml += id;
            result.xml += R"(" w:name=")";
            result.xml += referenceId;
            result.xml += R"("/>)";
            result.xml += footnote->contents;
            result.xml += R"(<w:bookmarkEnd w:id=")";
            result.xml += id;
            result.xml += R"("/>)";

            result.referenceIds.insert_or_assign(footnote->number, std::move(referenceId));
            ++bookmarkId;
            ++result.bookmarksInserted;
        }

        result.nextBookmarkId = static_cast<std::uint32_t>(
            std::min<std::uint64_t>(bookmarkId, std::numeric_limits<std::uint32_t>::max()));

        Emit(trace, TraceLevel::Debug,
             "Document rendering finished (" + std::to_string(result.bookmarksInserted) + " bookmarks).");
        return result;
    }

    std::string RenderFootnotes(const Branches &branches,
                                const ReferenceIdTable &referenceIds,
                                const MissingReferencePolicy policy,
                                const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Beginning footnote rendering...");

        std::string out;
        out.reserve(EstimateOutputSize(branches, FIELD_OVERHEAD));

        for (const Branch &branch: branches) {
            if (const auto *text = std::get_if<TextBranch>(&branch)) {
                out += text->contents;
                continue;
            }

            const auto *crossRef = std::get_if<CrossRefBranch>(&branch);
            if (!crossRef)
                continue;

            const auto found = referenceIds.find(crossRef->number);
            if (found == referenceIds.end()) {
                const std::string message = "Cross reference to footnote " +
                                            std::to_string(crossRef->number) +
                                            ", which has no footnote reference in document.xml";
                if (policy == MissingReferencePolicy::Fail)
                    throw MissingReference(crossRef->number, message);

                Emit(trace, TraceLevel::Warning, message + "; left as plain text.");
                out += std::to_string(crossRef->number);
                continue;
            }

            AppendField(out, found->second, crossRef->number);
        }

        Emit(trace, TraceLevel::Debug, "Footnote rendering finished.");
        return out;
    }

    RenderResult Render(const Branches &document,
                        ReferencedSet referenced,
                        const std::uint32_t startingBookmarkId,
                        const Branches &footnotes,
                        const MissingReferencePolicy policy,
                        const TraceSink &trace) {
        Emit(trace, TraceLevel::Debug, "Beginning rendering...");

        DocumentRender documentRender = RenderDocument(document, referenced, startingBookmarkId, trace);

        RenderResult result;
        result.footnotes = RenderFootnotes(footnotes, documentRender.referenceIds, policy, trace);
        result.document = std::move(documentRender.xml);
        result.bookmarksInserted = documentRender.bookmarksInserted;
        result.crossReferences = static_cast<std::size_t>(
            std::count_if(footnotes.begin(), footnotes.end(), [](const Branch &branch) {
                return std::holds_alternative<CrossRefBranch>(branch);
            }));

        Emit(trace, TraceLevel::Debug, "Rendering finished.");
        return result;
    }
} // namespace autocref
