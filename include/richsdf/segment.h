#pragma once

#include <richsdf/style.h>

#include <string>
#include <vector>

namespace richsdf {

//=============================================================================
// Segment - node of the parsed markup tree
//
// Literal:     text run
// Placeholder: named value resolved by a FetchSource ({name})
// Scope:       {style:...}; text holds the style name, children the content
//
// Every node carries its fully resolved style (all enclosing scopes joined,
// inner over outer), so consumers never walk up the tree.
//=============================================================================
struct Segment {
    enum class Kind : uint8_t {
        Literal,
        Placeholder,
        Scope,
    };

    Kind kind = Kind::Literal;
    std::string text;
    SegmentStyle style;
    std::vector<Segment> children;

    Segment() = default;
    Segment(const Segment&) = default;
    Segment(Segment&&) noexcept = default;
    Segment& operator=(const Segment&) = default;
    Segment& operator=(Segment&&) noexcept = default;

    // Tears down the subtree without recursing once per nesting level
    ~Segment();

    static Segment literal(std::string text, SegmentStyle style);
    static Segment placeholder(std::string name, SegmentStyle style);
    static Segment scope(std::string styleName, SegmentStyle style);

    bool isLiteral() const { return kind == Kind::Literal; }
    bool isPlaceholder() const { return kind == Kind::Placeholder; }
    bool isScope() const { return kind == Kind::Scope; }

    bool operator==(const Segment&) const = default;
};

class SegmentTree {
public:
    SegmentTree() = default;
    explicit SegmentTree(std::vector<Segment> roots) : _roots(std::move(roots)) {}

    const std::vector<Segment>& roots() const { return _roots; }
    std::vector<Segment>& roots() { return _roots; }

    bool empty() const { return _roots.empty(); }

    // Literal and Placeholder nodes in depth-first order
    std::vector<const Segment*> leaves() const;

    // Placeholder names in order of appearance, duplicates kept
    std::vector<std::string> placeholderNames() const;

    bool operator==(const SegmentTree&) const = default;

private:
    std::vector<Segment> _roots;
};

} // namespace richsdf
