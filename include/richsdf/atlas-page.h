#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace richsdf {

//-----------------------------------------------------------------------------
// SdfImage - rasterized glyph, 8-bit single channel, rows top-down
//-----------------------------------------------------------------------------
struct SdfImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;    // width * height, 128 = outline, >128 inside
    float bearingX = 0.0f;          // Pen to left edge of the image, pixels
    float bearingY = 0.0f;          // Baseline to top edge of the image, pixels (up)
    float advance = 0.0f;
    uint32_t margin = 0;            // Field margin included on every side

    bool empty() const { return width == 0 || height == 0; }
};

struct AtlasRect {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    bool empty() const { return width == 0 || height == 0; }
    bool overlaps(const AtlasRect& other) const {
        return x < other.x + other.width && other.x < x + width &&
               y < other.y + other.height && other.y < y + height;
    }
    bool operator==(const AtlasRect&) const = default;
};

//=============================================================================
// AtlasPage - square 8-bit page with shelf packing
//
// Each placed rect reserves padding to its right and bottom. Shelves keep a
// sorted free-span list so released rects are reused; an empty shelf resets
// to full width and a trailing empty shelf gives its height back.
//=============================================================================
class AtlasPage {
public:
    AtlasPage(uint32_t size, uint32_t padding);

    uint32_t size() const { return _size; }
    uint32_t padding() const { return _padding; }

    // Largest rect that can ever fit
    bool fits(uint32_t width, uint32_t height) const;

    std::optional<AtlasRect> allocate(uint32_t width, uint32_t height);

    // Free a rect from allocate(); its pixels are zeroed and marked dirty
    void release(const AtlasRect& rect);

    // Copy image pixels into an allocated rect
    void write(const AtlasRect& rect, const SdfImage& image);

    void clear();

    const std::vector<uint8_t>& pixels() const { return _pixels; }
    uint8_t pixel(uint32_t x, uint32_t y) const { return _pixels[y * _size + x]; }

    const std::vector<AtlasRect>& dirtyRects() const { return _dirty; }
    std::vector<AtlasRect> takeDirtyRects();

    uint32_t allocatedCount() const { return _allocated; }
    uint64_t allocatedArea() const { return _allocatedArea; }
    uint32_t shelfCount() const { return static_cast<uint32_t>(_shelves.size()); }

private:
    struct Span {
        uint32_t x;
        uint32_t width;
    };

    struct Shelf {
        uint32_t y = 0;
        uint32_t height = 0;
        uint32_t used = 0;
        std::vector<Span> free;
    };

    std::optional<AtlasRect> placeOnShelf(Shelf& shelf, uint32_t blockW,
                                          uint32_t width, uint32_t height);
    uint32_t shelvesBottom() const;
    void markDirty(const AtlasRect& rect);

    uint32_t _size;
    uint32_t _padding;
    std::vector<uint8_t> _pixels;
    std::vector<Shelf> _shelves;
    std::vector<AtlasRect> _dirty;
    uint32_t _allocated = 0;
    uint64_t _allocatedArea = 0;
};

} // namespace richsdf
