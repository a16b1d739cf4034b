#pragma once

#include <richsdf/segment.h>
#include <richsdf/style-sheet.h>

#include <string>
#include <string_view>

namespace richsdf {

//=============================================================================
// MarkupParser - rich-text markup to SegmentTree
//
//   Deals {red,s-2:{dmg}} damage!    scope "red,s-2" around placeholder dmg
//   {{ and }}                        literal braces
//
// Parsing is total: malformed markup degrades to literal text.
//  - an unmatched '{' turns the rest of the input, from that '{', into text
//  - a '}' that closes nothing is text; '}}' outside a scope is one '}'
//  - inside a scope a single '}' always closes the innermost scope
//  - a '{' inside a style or placeholder name makes the outer '{' and the
//    name text, parsing resumes at the inner '{'
//  - names are matched exactly (no trimming), only the first ':' splits
//
// Style names resolve through the StyleSheet first, then the standard
// styles: CSS colors and #hex (fill), s-<int> (stroke width), s-<color>
// (stroke color), v-<float> (magic number), bold, italic, underline,
// strikethrough. Unknown names are kept as opaque ids in styleIds.
//=============================================================================
class MarkupParser {
public:
    explicit MarkupParser(const StyleSheet* styleSheet = nullptr)
        : _styleSheet(styleSheet) {}

    SegmentTree parse(std::string_view input) const;

    // Style for a possibly comma-chained name, parts applied left to right
    SegmentStyle resolveStyle(std::string_view name) const;

    // Concatenated literal text, depth-first
    static std::string flatten(const SegmentTree& tree);

    // Double every brace so the text parses back as one literal
    static std::string escape(std::string_view text);

    // Serialize back to markup. Exact for trees produced by parse() unless a
    // literal inside a scope contains '}', which has no escape there.
    static std::string toMarkup(const SegmentTree& tree);

private:
    SegmentStyle resolvePart(std::string_view part) const;

    const StyleSheet* _styleSheet = nullptr;
};

} // namespace richsdf
