#include <richsdf/glyph-atlas.h>
#include <richsdf/config.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace richsdf {

//=============================================================================
// AtlasKey
//=============================================================================

AtlasKey AtlasKey::make(FontId font, uint32_t glyph, float pixelSize, float penX,
                        float sizeQuantum, uint32_t subpixelBuckets) {
    float size = pixelSize;
    if (sizeQuantum > 0.0f) {
        size = std::max(sizeQuantum, std::round(pixelSize / sizeQuantum) * sizeQuantum);
    }

    uint8_t bucket = 0;
    if (subpixelBuckets > 1) {
        float frac = penX - std::floor(penX);
        bucket = static_cast<uint8_t>(
            std::min<uint32_t>(static_cast<uint32_t>(frac * subpixelBuckets), subpixelBuckets - 1));
    }

    AtlasKey key;
    key.font = font;
    key.glyph = glyph;
    key.size26_6 = static_cast<uint32_t>(std::lround(std::max(size, 0.0f) * 64.0f));
    key.subpixel = bucket;
    return key;
}

size_t AtlasKeyHash::operator()(const AtlasKey& key) const noexcept {
    uint64_t h = key.font;
    h = h * 0x9E3779B97F4A7C15ull ^ key.glyph;
    h = h * 0x9E3779B97F4A7C15ull ^ key.size26_6;
    h = h * 0x9E3779B97F4A7C15ull ^ key.subpixel;
    h = h * 0x9E3779B97F4A7C15ull ^ key.stroke;
    return static_cast<size_t>(h ^ (h >> 29));
}

AtlasConfig AtlasConfig::fromConfig(const Config& config) {
    AtlasConfig out;
    out.pageSize = config.get<uint32_t>(Config::KEY_ATLAS_PAGE_SIZE, out.pageSize);
    out.maxPages = config.get<uint32_t>(Config::KEY_ATLAS_MAX_PAGES, out.maxPages);
    out.maxEmptyEntries = config.get<uint32_t>(Config::KEY_ATLAS_MAX_EMPTY_ENTRIES,
                                               out.maxEmptyEntries);
    out.padding = config.get<uint32_t>(Config::KEY_ATLAS_PADDING, out.padding);
    out.sizeQuantum = config.get<float>(Config::KEY_ATLAS_SIZE_QUANTUM, out.sizeQuantum);
    out.subpixelBuckets = config.get<uint32_t>(Config::KEY_ATLAS_SUBPIXEL_BUCKETS, out.subpixelBuckets);
    return out;
}

//=============================================================================
// GlyphAtlas
//=============================================================================

GlyphAtlas::GlyphAtlas(const AtlasConfig& config) noexcept : _config(config) {}

Result<GlyphAtlas::Ptr> GlyphAtlas::create(const AtlasConfig& config) noexcept {
    auto atlas = Ptr(new GlyphAtlas(config));
    if (auto res = atlas->init(); !res) {
        return Err<Ptr>("Failed to create GlyphAtlas", res);
    }
    return Ok(std::move(atlas));
}

Result<void> GlyphAtlas::init() noexcept {
    if (_config.pageSize == 0 || _config.pageSize > 16384) {
        return Err("atlas page size " + std::to_string(_config.pageSize) + " out of range",
                   ErrorCode::InvalidArgument);
    }
    if (_config.padding >= _config.pageSize) {
        return Err("atlas padding must be smaller than the page", ErrorCode::InvalidArgument);
    }
    if (_config.subpixelBuckets == 0 || _config.subpixelBuckets > 255) {
        return Err("atlas subpixel buckets must be in [1, 255]", ErrorCode::InvalidArgument);
    }

    _pages.push_back(std::make_unique<AtlasPage>(_config.pageSize, _config.padding));
    if (_config.maxPages > 0) {
        yinfo("GlyphAtlas: {}x{} pages, max {}, padding {}",
              _config.pageSize, _config.pageSize, _config.maxPages, _config.padding);
    } else {
        yinfo("GlyphAtlas: {}x{} pages, unlimited, padding {}",
              _config.pageSize, _config.pageSize, _config.padding);
    }
    return Ok();
}

void GlyphAtlas::beginPass() {
    if (_passDepth++ == 0) {
        ++_pass;
    } else {
        ydebug("GlyphAtlas: nested pass, depth {}", _passDepth);
    }
}

void GlyphAtlas::endPass() {
    if (_passDepth == 0) {
        ywarn("GlyphAtlas: endPass without a pass");
        return;
    }
    --_passDepth;
}

bool GlyphAtlas::pinned(const Entry& entry) const {
    return _passDepth > 0 && entry.pass == _pass;
}

AtlasKey GlyphAtlas::makeKey(FontId font, uint32_t glyph, float pixelSize, float penX,
                             uint16_t stroke) const {
    AtlasKey key = AtlasKey::make(font, glyph, pixelSize, penX,
                                  _config.sizeQuantum, _config.subpixelBuckets);
    key.stroke = stroke;
    return key;
}

void GlyphAtlas::touch(uint32_t slot) {
    Entry& entry = _slots[slot];
    auto& lru = entry.location.empty() ? _emptyLru : _lru;
    lru.erase({entry.generation, slot});
    entry.generation = ++_generation;
    entry.pass = _pass;
    lru.insert({entry.generation, slot});
}

Result<AtlasLocation> GlyphAtlas::getOrInsert(const AtlasKey& key, const Producer& produce) {
    if (auto it = _index.find(key); it != _index.end()) {
        ++_hits;
        touch(it->second);
        return Ok(_slots[it->second].location);
    }

    ++_misses;
    auto image = produce();
    if (!image) {
        return Err<AtlasLocation>("glyph " + std::to_string(key.glyph) + " of font " +
                                  std::to_string(key.font) + " failed to rasterize", image);
    }

    AtlasLocation location;
    location.bearingX = image->bearingX;
    location.bearingY = image->bearingY;
    location.advance = image->advance;
    location.margin = image->margin;
    location.pixelSize = key.pixelSize();

    if (image->empty()) {
        storeEntry(key, location);
        trimEmpty();
        return Ok(location);
    }

    if (!_pages.front()->fits(image->width, image->height)) {
        yerror("GlyphAtlas: glyph {} ({}x{} at {}px) exceeds page {}x{} with padding {}",
               key.glyph, image->width, image->height, key.pixelSize(),
               _config.pageSize, _config.pageSize, _config.padding);
        return Err<AtlasLocation>(
            "glyph " + std::to_string(key.glyph) + " is " + std::to_string(image->width) + "x" +
            std::to_string(image->height) + " px, larger than the " +
            std::to_string(_config.pageSize) + "x" + std::to_string(_config.pageSize) +
            " atlas page (padding " + std::to_string(_config.padding) + ")",
            ErrorCode::GlyphTooLarge);
    }

    auto placed = place(image->width, image->height);
    if (!placed) {
        yerror("GlyphAtlas: full, {} of {} pages and every entry pinned by the current pass",
               _pages.size(), _config.maxPages);
        return Err<AtlasLocation>("atlas full: " + std::to_string(_config.maxPages) +
                                  " pages in use and every entry is pinned",
                                  ErrorCode::AtlasFull);
    }

    location.page = placed->first;
    location.rect = placed->second;
    _pages[location.page]->write(location.rect, *image);
    storeEntry(key, location);

    ydebug("GlyphAtlas: glyph {} font {} {}px -> page {} ({}, {}) {}x{}",
           key.glyph, key.font, key.pixelSize(), location.page,
           location.rect.x, location.rect.y, location.rect.width, location.rect.height);
    return Ok(location);
}

std::optional<std::pair<uint32_t, AtlasRect>> GlyphAtlas::place(uint32_t width, uint32_t height) {
    for (uint32_t i = 0; i < _pages.size(); ++i) {
        if (auto rect = _pages[i]->allocate(width, height)) {
            return std::make_pair(i, *rect);
        }
    }

    uint32_t page = 0;
    if (auto rect = evictUntilFits(width, height, page)) {
        return std::make_pair(page, *rect);
    }

    if (_config.maxPages == 0 || _pages.size() < _config.maxPages) {
        _pages.push_back(std::make_unique<AtlasPage>(_config.pageSize, _config.padding));
        const auto index = static_cast<uint32_t>(_pages.size() - 1);
        yinfo("GlyphAtlas: added page {} ({} entries)", index, _index.size());
        if (auto rect = _pages.back()->allocate(width, height)) {
            return std::make_pair(index, *rect);
        }
    }
    return std::nullopt;
}

std::optional<AtlasRect> GlyphAtlas::evictUntilFits(uint32_t width, uint32_t height,
                                                    uint32_t& page) {
    uint64_t evicted = 0;
    auto it = _lru.begin();
    while (it != _lru.end()) {
        const uint32_t slot = it->second;
        if (pinned(_slots[slot])) {
            ++it;
            continue;
        }
        it = _lru.erase(it);

        const uint32_t freedPage = _slots[slot].location.page;
        evict(slot);
        ++evicted;

        if (auto rect = _pages[freedPage]->allocate(width, height)) {
            page = freedPage;
            yinfo("GlyphAtlas: evicted {} entries to fit {}x{}", evicted, width, height);
            return rect;
        }
    }
    if (evicted > 0) {
        ywarn("GlyphAtlas: evicted {} entries without room for {}x{}", evicted, width, height);
    }
    return std::nullopt;
}

// Oldest unpinned outline-less entries beyond maxEmptyEntries
void GlyphAtlas::trimEmpty() {
    auto it = _emptyLru.begin();
    while (_emptyLru.size() > _config.maxEmptyEntries && it != _emptyLru.end()) {
        const uint32_t slot = it->second;
        if (pinned(_slots[slot])) {
            ++it;
            continue;
        }
        it = _emptyLru.erase(it);
        evict(slot);
    }
}

// Caller removes the slot from its LRU set
void GlyphAtlas::evict(uint32_t slot) {
    Entry& entry = _slots[slot];
    ydebug("GlyphAtlas: evict glyph {} font {} gen {}", entry.key.glyph, entry.key.font,
           entry.generation);
    if (!entry.location.empty()) {
        _pages[entry.location.page]->release(entry.location.rect);
    }
    _index.erase(entry.key);
    _freeSlots.push_back(slot);
    ++_evictions;
    ++_epoch;
}

uint32_t GlyphAtlas::storeEntry(const AtlasKey& key, const AtlasLocation& location) {
    uint32_t slot;
    if (!_freeSlots.empty()) {
        slot = _freeSlots.back();
        _freeSlots.pop_back();
    } else {
        slot = static_cast<uint32_t>(_slots.size());
        _slots.emplace_back();
    }

    Entry& entry = _slots[slot];
    entry.key = key;
    entry.location = location;
    entry.generation = ++_generation;
    entry.pass = _pass;
    auto& lru = location.empty() ? _emptyLru : _lru;
    lru.insert({entry.generation, slot});
    _index[key] = slot;
    return slot;
}

std::optional<AtlasLocation> GlyphAtlas::find(const AtlasKey& key) const {
    auto it = _index.find(key);
    if (it == _index.end()) return std::nullopt;
    return _slots[it->second].location;
}

std::vector<AtlasDirtyRegion> GlyphAtlas::takeDirtyRects() {
    std::vector<AtlasDirtyRegion> out;
    for (uint32_t i = 0; i < _pages.size(); ++i) {
        for (const auto& rect : _pages[i]->takeDirtyRects()) {
            out.push_back({i, rect});
        }
    }
    return out;
}

AtlasStats GlyphAtlas::stats() const {
    AtlasStats s;
    s.entries = _index.size();
    s.pages = _pages.size();
    s.hits = _hits;
    s.misses = _misses;
    s.evictions = _evictions;
    return s;
}

void GlyphAtlas::clear() {
    yinfo("GlyphAtlas: clear ({} entries, {} pages)", _index.size(), _pages.size());
    _slots.clear();
    _freeSlots.clear();
    _index.clear();
    _lru.clear();
    _emptyLru.clear();
    _pages.resize(1);
    _pages.front()->clear();
    ++_epoch;
}

} // namespace richsdf
