#pragma once

#include <richsdf/atlas-page.h>
#include <richsdf/result.hpp>
#include <richsdf/shaping.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace richsdf {

class Config;

//-----------------------------------------------------------------------------
// AtlasKey - identity of one rasterized glyph
//-----------------------------------------------------------------------------
struct AtlasKey {
    FontId font = 0;
    uint32_t glyph = 0;
    uint32_t size26_6 = 0;      // Quantized pixel size, 26.6 fixed point
    uint8_t subpixel = 0;       // Horizontal subpixel bucket
    uint16_t stroke = 0;        // Outline ring width, percent of the pixel size, 0 = filled

    float pixelSize() const { return static_cast<float>(size26_6) / 64.0f; }

    // Quantize pixelSize to sizeQuantum and penX's fraction to buckets
    static AtlasKey make(FontId font, uint32_t glyph, float pixelSize, float penX,
                         float sizeQuantum, uint32_t subpixelBuckets);

    bool operator==(const AtlasKey&) const = default;
};

// Synthetic glyph ids for decoration lines. They rasterize to a square as
// thick as the font's line, centered on the line; the image advance is the
// thickness.
constexpr uint32_t UNDERLINE_GLYPH = 0xFFFF0001u;
constexpr uint32_t STRIKETHROUGH_GLYPH = 0xFFFF0002u;

inline bool isLineGlyph(uint32_t glyph) {
    return glyph == UNDERLINE_GLYPH || glyph == STRIKETHROUGH_GLYPH;
}

struct AtlasKeyHash {
    size_t operator()(const AtlasKey& key) const noexcept;
};

struct AtlasConfig {
    uint32_t pageSize = 1024;
    uint32_t maxPages = 0;              // 0 = grow without limit
    uint32_t maxEmptyEntries = 4096;    // Cached glyphs without an outline
    uint32_t padding = 1;
    float sizeQuantum = 1.0f;
    uint32_t subpixelBuckets = 1;

    static AtlasConfig fromConfig(const Config& config);
};

struct AtlasLocation {
    uint32_t page = 0;
    AtlasRect rect;             // Empty for glyphs without an outline
    float bearingX = 0.0f;
    float bearingY = 0.0f;
    float advance = 0.0f;
    uint32_t margin = 0;
    float pixelSize = 0.0f;     // Size the image was rasterized at

    bool empty() const { return rect.empty(); }
    bool operator==(const AtlasLocation&) const = default;
};

struct AtlasStats {
    size_t entries = 0;
    size_t pages = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
};

struct AtlasDirtyRegion {
    uint32_t page = 0;
    AtlasRect rect;
};

//=============================================================================
// GlyphAtlas - SDF glyph cache over one or more AtlasPages
//
// Entries live in a dense slot array indexed by key. Every access stamps the
// entry with a new generation; eviction takes the oldest generation first.
// Keys touched inside the current pass (beginPass/endPass) are pinned and
// never evicted until the pass ends.
//
// Misses pack into the existing pages first, then evict unpinned entries one
// at a time, then add a page. GlyphTooLarge is fatal. AtlasFull only happens
// with a maxPages limit, when every entry on the last page is pinned.
//
// epoch() changes whenever a cached location may have been handed to
// another key (eviction, clear). A mesh built at an older epoch must check
// its locations with find() before it is drawn again.
//=============================================================================
class GlyphAtlas {
public:
    using Ptr = std::shared_ptr<GlyphAtlas>;
    using Producer = std::function<Result<SdfImage>()>;

    static Result<Ptr> create(const AtlasConfig& config = AtlasConfig()) noexcept;

    ~GlyphAtlas() = default;

    GlyphAtlas(const GlyphAtlas&) = delete;
    GlyphAtlas& operator=(const GlyphAtlas&) = delete;

    // Scoped pass, ends when destroyed
    class Pass {
    public:
        explicit Pass(GlyphAtlas& atlas) : _atlas(&atlas) { _atlas->beginPass(); }
        ~Pass() { _atlas->endPass(); }
        Pass(const Pass&) = delete;
        Pass& operator=(const Pass&) = delete;
    private:
        GlyphAtlas* _atlas;
    };

    // Passes nest; keys stay pinned until the outermost pass ends
    void beginPass();
    void endPass();
    bool inPass() const { return _passDepth > 0; }

    Result<AtlasLocation> getOrInsert(const AtlasKey& key, const Producer& produce);

    // Lookup without touching the generation or pinning
    std::optional<AtlasLocation> find(const AtlasKey& key) const;
    bool contains(const AtlasKey& key) const { return _index.contains(key); }

    AtlasKey makeKey(FontId font, uint32_t glyph, float pixelSize, float penX,
                     uint16_t stroke = 0) const;

    size_t pageCount() const { return _pages.size(); }
    const AtlasPage& page(size_t index) const { return *_pages[index]; }

    std::vector<AtlasDirtyRegion> takeDirtyRects();

    AtlasStats stats() const;
    uint64_t epoch() const { return _epoch; }
    const AtlasConfig& config() const { return _config; }

    // Drop every entry and reset to one blank page
    void clear();

private:
    struct Entry {
        AtlasKey key;
        AtlasLocation location;
        uint64_t generation = 0;
        uint64_t pass = 0;      // Last pass that touched the entry
    };

    explicit GlyphAtlas(const AtlasConfig& config) noexcept;
    Result<void> init() noexcept;

    bool pinned(const Entry& entry) const;
    void touch(uint32_t slot);
    std::optional<std::pair<uint32_t, AtlasRect>> place(uint32_t width, uint32_t height);
    std::optional<AtlasRect> evictUntilFits(uint32_t width, uint32_t height, uint32_t& page);
    void trimEmpty();
    void evict(uint32_t slot);
    uint32_t storeEntry(const AtlasKey& key, const AtlasLocation& location);

    AtlasConfig _config;
    std::vector<std::unique_ptr<AtlasPage>> _pages;
    std::vector<Entry> _slots;
    std::vector<uint32_t> _freeSlots;
    std::unordered_map<AtlasKey, uint32_t, AtlasKeyHash> _index;
    std::set<std::pair<uint64_t, uint32_t>> _lru;       // (generation, slot), packed entries
    std::set<std::pair<uint64_t, uint32_t>> _emptyLru;  // (generation, slot), no rect

    uint64_t _generation = 0;
    uint64_t _pass = 0;
    uint32_t _passDepth = 0;
    uint64_t _epoch = 0;

    uint64_t _hits = 0;
    uint64_t _misses = 0;
    uint64_t _evictions = 0;
};

} // namespace richsdf
