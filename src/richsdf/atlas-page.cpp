#include <richsdf/atlas-page.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cstring>

namespace richsdf {

namespace {

// Beyond this many rects a page reports one bounding box instead
constexpr size_t MAX_DIRTY_RECTS = 64;

} // namespace

AtlasPage::AtlasPage(uint32_t size, uint32_t padding)
    : _size(size), _padding(padding), _pixels(static_cast<size_t>(size) * size, 0) {}

bool AtlasPage::fits(uint32_t width, uint32_t height) const {
    return width + _padding <= _size && height + _padding <= _size;
}

std::optional<AtlasRect> AtlasPage::allocate(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0 || !fits(width, height)) {
        return std::nullopt;
    }

    const uint32_t blockW = width + _padding;
    const uint32_t blockH = height + _padding;

    // First fit on a shelf that wastes at most half the block height
    for (auto& shelf : _shelves) {
        if (shelf.height < blockH || shelf.height > blockH + blockH / 2) continue;
        if (auto rect = placeOnShelf(shelf, blockW, width, height)) {
            return rect;
        }
    }

    // New shelf below the last one
    const uint32_t bottom = shelvesBottom();
    if (bottom + blockH <= _size) {
        Shelf shelf;
        shelf.y = bottom;
        shelf.height = blockH;
        shelf.free.push_back({0, _size});
        _shelves.push_back(std::move(shelf));
        return placeOnShelf(_shelves.back(), blockW, width, height);
    }

    // Page is tall enough only with waste: take any shelf that fits
    for (auto& shelf : _shelves) {
        if (shelf.height < blockH) continue;
        if (auto rect = placeOnShelf(shelf, blockW, width, height)) {
            return rect;
        }
    }
    return std::nullopt;
}

std::optional<AtlasRect> AtlasPage::placeOnShelf(Shelf& shelf, uint32_t blockW,
                                                 uint32_t width, uint32_t height) {
    for (auto it = shelf.free.begin(); it != shelf.free.end(); ++it) {
        if (it->width < blockW) continue;

        AtlasRect rect{it->x, shelf.y, width, height};
        it->x += blockW;
        it->width -= blockW;
        if (it->width == 0) {
            shelf.free.erase(it);
        }
        ++shelf.used;
        ++_allocated;
        _allocatedArea += static_cast<uint64_t>(width) * height;
        return rect;
    }
    return std::nullopt;
}

void AtlasPage::release(const AtlasRect& rect) {
    if (rect.empty()) return;

    auto shelfIt = std::find_if(_shelves.begin(), _shelves.end(), [&](const Shelf& s) {
        return s.y == rect.y && s.used > 0;
    });
    if (shelfIt == _shelves.end()) {
        ywarn("AtlasPage: release of unknown rect {}x{} at ({}, {})",
              rect.width, rect.height, rect.x, rect.y);
        return;
    }

    Shelf& shelf = *shelfIt;
    Span span{rect.x, rect.width + _padding};
    auto pos = std::lower_bound(shelf.free.begin(), shelf.free.end(), span,
                                [](const Span& a, const Span& b) { return a.x < b.x; });
    pos = shelf.free.insert(pos, span);

    // Merge with the right neighbour, then the left one
    auto next = pos + 1;
    if (next != shelf.free.end() && pos->x + pos->width == next->x) {
        pos->width += next->width;
        shelf.free.erase(next);
    }
    if (pos != shelf.free.begin()) {
        auto prev = pos - 1;
        if (prev->x + prev->width == pos->x) {
            prev->width += pos->width;
            shelf.free.erase(pos);
        }
    }

    --shelf.used;
    --_allocated;
    _allocatedArea -= static_cast<uint64_t>(rect.width) * rect.height;

    for (uint32_t row = 0; row < rect.height; ++row) {
        std::memset(&_pixels[static_cast<size_t>(rect.y + row) * _size + rect.x], 0, rect.width);
    }
    markDirty(rect);

    if (shelf.used == 0) {
        shelf.free.assign(1, Span{0, _size});
    }
    while (!_shelves.empty() && _shelves.back().used == 0) {
        _shelves.pop_back();
    }
}

void AtlasPage::write(const AtlasRect& rect, const SdfImage& image) {
    if (rect.empty()) return;
    if (image.width != rect.width || image.height != rect.height ||
        image.pixels.size() < static_cast<size_t>(image.width) * image.height) {
        ywarn("AtlasPage: image {}x{} does not match rect {}x{}",
              image.width, image.height, rect.width, rect.height);
        return;
    }

    for (uint32_t row = 0; row < rect.height; ++row) {
        std::memcpy(&_pixels[static_cast<size_t>(rect.y + row) * _size + rect.x],
                    &image.pixels[static_cast<size_t>(row) * image.width],
                    image.width);
    }
    markDirty(rect);
}

void AtlasPage::clear() {
    std::fill(_pixels.begin(), _pixels.end(), 0);
    _shelves.clear();
    _dirty.assign(1, AtlasRect{0, 0, _size, _size});
    _allocated = 0;
    _allocatedArea = 0;
}

std::vector<AtlasRect> AtlasPage::takeDirtyRects() {
    std::vector<AtlasRect> out;
    out.swap(_dirty);
    return out;
}

uint32_t AtlasPage::shelvesBottom() const {
    if (_shelves.empty()) return 0;
    return _shelves.back().y + _shelves.back().height;
}

void AtlasPage::markDirty(const AtlasRect& rect) {
    _dirty.push_back(rect);
    if (_dirty.size() <= MAX_DIRTY_RECTS) return;

    uint32_t x0 = _size, y0 = _size, x1 = 0, y1 = 0;
    for (const auto& r : _dirty) {
        x0 = std::min(x0, r.x);
        y0 = std::min(y0, r.y);
        x1 = std::max(x1, r.x + r.width);
        y1 = std::max(y1, r.y + r.height);
    }
    _dirty.assign(1, AtlasRect{x0, y0, x1 - x0, y1 - y0});
}

} // namespace richsdf
