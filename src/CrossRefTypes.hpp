#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace autocref {
    // ============================================================
    //  Lexer output
    // ============================================================

    // FootnoteReference : a footnote-reference run in document.xml
    // CrossReference    : the digits of a "note N" back-reference in footnotes.xml
    // Other             : everything else, passed through untouched
    enum class SegmentKind {
        Other,
        FootnoteReference,
        CrossReference
    };

    // A typed slice of the lexed input. |text| points into the caller's buffer,
    // which must outlive the segment.
    struct Segment {
        SegmentKind kind = SegmentKind::Other;
        std::string_view text;

        bool operator==(const Segment &other) const {
            return kind == other.kind && text == other.text;
        }
    };

    using Segments = std::vector<Segment>;

    [[nodiscard]] inline const char *SegmentKindName(const SegmentKind kind) noexcept {
        switch (kind) {
            case SegmentKind::Other: return "Other";
            case SegmentKind::FootnoteReference: return "FootnoteReference";
            case SegmentKind::CrossReference: return "CrossReference";
        }
        return "?";
    }

    // ============================================================
    //  Parser output
    // ============================================================

    struct TextBranch {
        std::string_view contents;
    };

    struct FootnoteRefBranch {
        std::uint32_t number = 0;
        std::string_view contents;
    };

    // The contents of a cross-reference are its number.
    struct CrossRefBranch {
        std::uint32_t number = 0;
    };

    using Branch = std::variant<TextBranch, FootnoteRefBranch, CrossRefBranch>;
    using Branches = std::vector<Branch>;

    // Distinct footnote numbers that are cross-referenced somewhere in
    // footnotes.xml, in the order they were first seen.
    class ReferencedSet {
    public:
        // Returns false if |number| was already present.
        bool insert(const std::uint32_t number) {
            if (!lookup_.insert(number).second)
                return false;
            ordered_.push_back(number);
            return true;
        }

        [[nodiscard]] bool contains(const std::uint32_t number) const {
            return lookup_.count(number) != 0;
        }

        [[nodiscard]] const std::vector<std::uint32_t> &values() const noexcept { return ordered_; }
        [[nodiscard]] std::size_t size() const noexcept { return ordered_.size(); }
        [[nodiscard]] bool empty() const noexcept { return ordered_.empty(); }

    private:
        std::vector<std::uint32_t> ordered_;
        std::unordered_set<std::uint32_t> lookup_;
    };

    // Footnote number -> bookmark name ("_Ref000000003").
    using ReferenceIdTable = std::unordered_map<std::uint32_t, std::string>;
} // namespace autocref
