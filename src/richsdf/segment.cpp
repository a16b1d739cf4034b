#include <richsdf/segment.h>

#include <utility>

namespace richsdf {

Segment::~Segment() {
    std::vector<Segment> pending = std::move(children);
    while (!pending.empty()) {
        Segment node = std::move(pending.back());
        pending.pop_back();
        for (auto& child : node.children) {
            pending.push_back(std::move(child));
        }
        node.children.clear();
    }
}

Segment Segment::literal(std::string text, SegmentStyle style) {
    Segment seg;
    seg.kind = Kind::Literal;
    seg.text = std::move(text);
    seg.style = std::move(style);
    return seg;
}

Segment Segment::placeholder(std::string name, SegmentStyle style) {
    Segment seg;
    seg.kind = Kind::Placeholder;
    seg.text = std::move(name);
    seg.style = std::move(style);
    return seg;
}

Segment Segment::scope(std::string styleName, SegmentStyle style) {
    Segment seg;
    seg.kind = Kind::Scope;
    seg.text = std::move(styleName);
    seg.style = std::move(style);
    return seg;
}

std::vector<const Segment*> SegmentTree::leaves() const {
    std::vector<const Segment*> out;

    // Explicit stack of (siblings, next index)
    std::vector<std::pair<const std::vector<Segment>*, size_t>> stack;
    stack.emplace_back(&_roots, 0);
    while (!stack.empty()) {
        auto& [nodes, index] = stack.back();
        if (index == nodes->size()) {
            stack.pop_back();
            continue;
        }
        const Segment& node = (*nodes)[index++];
        if (node.isScope()) {
            stack.emplace_back(&node.children, 0);
        } else {
            out.push_back(&node);
        }
    }
    return out;
}

std::vector<std::string> SegmentTree::placeholderNames() const {
    std::vector<std::string> names;
    for (const Segment* leaf : leaves()) {
        if (leaf->isPlaceholder()) {
            names.push_back(leaf->text);
        }
    }
    return names;
}

} // namespace richsdf
