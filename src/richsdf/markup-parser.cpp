#include <richsdf/markup-parser.h>
#include <richsdf/color.h>
#include <ytrace/ytrace.hpp>

#include <charconv>
#include <utility>
#include <vector>

namespace richsdf {

namespace {

// One open scope while parsing; the root frame has no opening brace
struct Frame {
    size_t start = std::string_view::npos;  // Offset of the opening '{'
    std::string name;
    SegmentStyle style;
    std::vector<Segment> children;
    std::string buffer;                     // Pending literal text

    void flush() {
        if (buffer.empty()) return;
        if (!children.empty() && children.back().isLiteral() && children.back().style == style) {
            children.back().text += buffer;
        } else {
            children.push_back(Segment::literal(std::move(buffer), style));
        }
        buffer.clear();
    }
};

template<typename T>
bool parseNumber(std::string_view text, T& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

void appendEscaped(const std::string& text, bool inScope, std::string& out) {
    for (char c : text) {
        if (c == '{') {
            out += "{{";
        } else if (c == '}' && !inScope) {
            out += "}}";
        } else {
            out += c;
        }
    }
}

} // namespace

SegmentTree MarkupParser::parse(std::string_view input) const {
    std::vector<Frame> frames(1);
    size_t pos = 0;
    const size_t size = input.size();

    while (pos < size) {
        const char c = input[pos];

        if (c == '{') {
            if (pos + 1 < size && input[pos + 1] == '{') {
                frames.back().buffer += '{';
                pos += 2;
                continue;
            }

            // Scan the name up to the first ':', '}' or '{'
            size_t q = pos + 1;
            while (q < size && input[q] != ':' && input[q] != '}' && input[q] != '{') {
                ++q;
            }

            if (q == size) {
                // Unmatched: everything from here on is text
                frames.back().buffer += input.substr(pos);
                pos = size;
                break;
            }

            std::string_view name = input.substr(pos + 1, q - pos - 1);
            if (input[q] == '{') {
                frames.back().buffer += input.substr(pos, q - pos);
                pos = q;
                continue;
            }

            Frame& top = frames.back();
            top.flush();
            if (input[q] == '}') {
                top.children.push_back(Segment::placeholder(std::string(name), top.style));
                pos = q + 1;
                continue;
            }

            Frame scope;
            scope.start = pos;
            scope.name = std::string(name);
            scope.style = top.style.join(resolveStyle(name));
            frames.push_back(std::move(scope));
            pos = q + 1;
            continue;
        }

        if (c == '}') {
            if (frames.size() > 1) {
                Frame closed = std::move(frames.back());
                frames.pop_back();
                closed.flush();
                Segment seg = Segment::scope(std::move(closed.name), std::move(closed.style));
                seg.children = std::move(closed.children);
                frames.back().children.push_back(std::move(seg));
                ++pos;
                continue;
            }
            frames.back().buffer += '}';
            pos += (pos + 1 < size && input[pos + 1] == '}') ? 2 : 1;
            continue;
        }

        // Plain run up to the next brace
        size_t end = input.find_first_of("{}", pos);
        if (end == std::string_view::npos) end = size;
        frames.back().buffer.append(input.substr(pos, end - pos));
        pos = end;
    }

    if (frames.size() > 1) {
        // The outermost unclosed scope and everything after it become text
        const size_t start = frames[1].start;
        frames.resize(1);
        frames[0].buffer += input.substr(start);
        ydebug("MarkupParser: unmatched '{{' at {}, kept as text", start);
    }

    frames[0].flush();
    return SegmentTree(std::move(frames[0].children));
}

SegmentStyle MarkupParser::resolveStyle(std::string_view name) const {
    SegmentStyle style;
    size_t begin = 0;
    while (begin <= name.size()) {
        size_t comma = name.find(',', begin);
        if (comma == std::string_view::npos) comma = name.size();
        std::string_view part = name.substr(begin, comma - begin);
        if (!part.empty()) {
            style = style.join(resolvePart(part));
        }
        begin = comma + 1;
    }
    return style;
}

SegmentStyle MarkupParser::resolvePart(std::string_view part) const {
    SegmentStyle style;

    if (_styleSheet) {
        if (const SegmentStyle* found = _styleSheet->find(part)) {
            style = *found;
            style.styleIds = {std::string(part)};
            return style;
        }
    }

    style.styleIds = {std::string(part)};

    if (part.starts_with("v-")) {
        float magic = 0.0f;
        if (parseNumber(part.substr(2), magic)) {
            style.magicNumber = magic;
        }
        return style;
    }

    if (part.starts_with("s-")) {
        uint16_t width = 0;
        if (parseNumber(part.substr(2), width)) {
            // s-0 means no stroke
            if (width > 0) style.stroke = width;
        } else if (auto color = parseColor(part.substr(2))) {
            style.strokeColor = *color;
        }
        return style;
    }

    if (auto color = parseColor(part)) {
        style.fillColor = *color;
    } else if (part == "bold") {
        style.weight = weight::Bold;
    } else if (part == "italic") {
        style.slant = FontSlant::Italic;
    } else if (part == "underline") {
        style.underline = true;
    } else if (part == "strikethrough") {
        style.strikethrough = true;
    }
    return style;
}

std::string MarkupParser::flatten(const SegmentTree& tree) {
    std::string out;
    for (const Segment* leaf : tree.leaves()) {
        if (leaf->isLiteral()) out += leaf->text;
    }
    return out;
}

std::string MarkupParser::escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += c;
        if (c == '{' || c == '}') out += c;
    }
    return out;
}

std::string MarkupParser::toMarkup(const SegmentTree& tree) {
    std::string out;

    // (siblings, next index); every entry above the first is an open scope
    std::vector<std::pair<const std::vector<Segment>*, size_t>> stack;
    stack.emplace_back(&tree.roots(), 0);
    while (!stack.empty()) {
        auto& [nodes, index] = stack.back();
        if (index == nodes->size()) {
            stack.pop_back();
            if (!stack.empty()) out += '}';
            continue;
        }

        const Segment& node = (*nodes)[index++];
        switch (node.kind) {
        case Segment::Kind::Literal:
            appendEscaped(node.text, stack.size() > 1, out);
            break;
        case Segment::Kind::Placeholder:
            out += '{';
            out += node.text;
            out += '}';
            break;
        case Segment::Kind::Scope:
            out += '{';
            out += node.text;
            out += ':';
            stack.emplace_back(&node.children, 0);
            break;
        }
    }
    return out;
}

} // namespace richsdf
