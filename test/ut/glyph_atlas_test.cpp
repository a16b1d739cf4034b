//=============================================================================
// GlyphAtlas Tests
//
// Cache hits, LRU eviction, pass pinning and the fatal error paths, with a
// fake producer in place of the SDF rasterizer
//=============================================================================

#include <boost/ut.hpp>
#include <richsdf/glyph-atlas.h>

using namespace boost::ut;
using namespace richsdf;

namespace {

struct FakeProducer {
    uint32_t width = 16;
    uint32_t height = 16;
    int calls = 0;

    GlyphAtlas::Producer operator()() {
        return [this]() -> Result<SdfImage> {
            ++calls;
            SdfImage image;
            image.width = width;
            image.height = height;
            image.pixels.assign(static_cast<size_t>(width) * height, 128);
            image.bearingX = -1.0f;
            image.bearingY = 12.0f;
            image.advance = 10.0f;
            return image;
        };
    }
};

AtlasKey key(uint32_t glyph) {
    AtlasKey k;
    k.font = 0;
    k.glyph = glyph;
    k.size26_6 = 32 * 64;
    return k;
}

GlyphAtlas::Ptr makeAtlas(uint32_t pageSize, uint32_t maxPages, uint32_t padding = 0) {
    AtlasConfig config;
    config.pageSize = pageSize;
    config.maxPages = maxPages;
    config.padding = padding;
    auto atlas = GlyphAtlas::create(config);
    return atlas ? *atlas : nullptr;
}

} // namespace

suite glyph_atlas_tests = [] {
    "create validates the configuration"_test = [] {
        AtlasConfig config;
        config.pageSize = 0;
        auto atlas = GlyphAtlas::create(config);
        expect(!atlas.has_value());
        expect(atlas.error().code() == ErrorCode::InvalidArgument);

        config = AtlasConfig();
        config.subpixelBuckets = 0;
        expect(!GlyphAtlas::create(config).has_value());

        expect(GlyphAtlas::create().has_value());
    };

    "keys quantize size and subpixel offset"_test = [] {
        auto k = AtlasKey::make(1, 42, 31.6f, 10.6f, 1.0f, 4);
        expect(k.size26_6 == 32u * 64u);
        expect(k.pixelSize() == 32.0_f);
        expect(k.subpixel == 2_i);

        auto whole = AtlasKey::make(1, 42, 31.6f, 10.6f, 1.0f, 1);
        expect(whole.subpixel == 0_i);
        expect(AtlasKey::make(1, 42, 32.2f, 3.0f, 1.0f, 1) == AtlasKey::make(1, 42, 31.8f, 5.0f, 1.0f, 1));
    };

    "second request is a hit"_test = [] {
        auto atlas = makeAtlas(64, 1);
        FakeProducer producer;

        auto first = atlas->getOrInsert(key(1), producer());
        auto second = atlas->getOrInsert(key(1), producer());
        expect(first.has_value() && second.has_value());
        expect(*first == *second);
        expect(producer.calls == 1_i);

        auto stats = atlas->stats();
        expect(stats.hits == 1_u);
        expect(stats.misses == 1_u);
        expect(stats.entries == 1_u);
        expect(first->bearingY == 12.0_f);
        expect(first->pixelSize == 32.0_f);
    };

    "empty images are cached without a rect"_test = [] {
        auto atlas = makeAtlas(64, 1);
        FakeProducer producer;
        producer.width = 0;
        producer.height = 0;

        auto loc = atlas->getOrInsert(key(' '), producer());
        expect(loc.has_value());
        expect(loc->empty());
        expect(loc->advance == 10.0_f);
        expect(atlas->contains(key(' ')));
        expect(atlas->page(0).allocatedCount() == 0_u);

        atlas->getOrInsert(key(' '), producer());
        expect(producer.calls == 1_i);
    };

    "producer errors pass through and are not cached"_test = [] {
        auto atlas = makeAtlas(64, 1);
        auto failing = []() -> Result<SdfImage> {
            return Err<SdfImage>("no outline", ErrorCode::Raster);
        };
        auto loc = atlas->getOrInsert(key(5), failing);
        expect(!loc.has_value());
        expect(loc.error().code() == ErrorCode::Raster);
        expect(!loc.error().isFatal());
        expect(!atlas->contains(key(5)));
    };

    "glyph larger than a page is fatal"_test = [] {
        auto atlas = makeAtlas(32, 4, 1);
        FakeProducer producer;
        producer.width = 32;
        producer.height = 8;

        auto loc = atlas->getOrInsert(key(1), producer());
        expect(!loc.has_value());
        expect(loc.error().code() == ErrorCode::GlyphTooLarge);
        expect(loc.error().isFatal());
        expect(atlas->stats().entries == 0_u);
    };

    "full atlas with everything pinned is fatal"_test = [] {
        auto atlas = makeAtlas(32, 1);
        FakeProducer producer;
        producer.width = 32;
        producer.height = 32;

        GlyphAtlas::Pass pass(*atlas);
        expect(atlas->getOrInsert(key(1), producer()).has_value());
        auto loc = atlas->getOrInsert(key(2), producer());
        expect(!loc.has_value());
        expect(loc.error().code() == ErrorCode::AtlasFull);
        expect(atlas->contains(key(1)));
    };

    "least recently used entry is evicted first"_test = [] {
        auto atlas = makeAtlas(32, 1);
        FakeProducer producer;

        for (uint32_t g = 0; g < 4; ++g) {
            expect(atlas->getOrInsert(key(g), producer()).has_value());
        }
        // Refresh 0 and 1, leaving 2 as the oldest
        atlas->getOrInsert(key(0), producer());
        atlas->getOrInsert(key(1), producer());

        auto loc = atlas->getOrInsert(key(4), producer());
        expect(loc.has_value());
        expect(!atlas->contains(key(2)));
        expect(atlas->contains(key(0)) && atlas->contains(key(1)));
        expect(atlas->contains(key(3)) && atlas->contains(key(4)));
        expect(atlas->stats().evictions == 1_u);
    };

    "keys used in the current pass are never evicted"_test = [] {
        auto atlas = makeAtlas(32, 1);
        FakeProducer producer;

        for (uint32_t g = 0; g < 4; ++g) {
            atlas->getOrInsert(key(g), producer());
        }

        GlyphAtlas::Pass pass(*atlas);
        // 0 and 1 are oldest, but this pass uses them
        atlas->getOrInsert(key(0), producer());
        atlas->getOrInsert(key(1), producer());
        std::vector<AtlasLocation> used;
        for (uint32_t g = 4; g < 6; ++g) {
            auto loc = atlas->getOrInsert(key(g), producer());
            expect(loc.has_value());
            used.push_back(*loc);
        }

        for (uint32_t g : {0u, 1u, 4u, 5u}) {
            expect(atlas->contains(key(g))) << "pinned glyph was evicted";
        }
        expect(!atlas->contains(key(2)));
        expect(!atlas->contains(key(3)));

        auto zero = atlas->find(key(0));
        auto one = atlas->find(key(1));
        for (const auto& loc : used) {
            expect(!loc.rect.overlaps(zero->rect));
            expect(!loc.rect.overlaps(one->rect));
        }
    };

    "atlas grows when every entry is pinned"_test = [] {
        auto atlas = makeAtlas(32, 2);
        FakeProducer producer;

        GlyphAtlas::Pass pass(*atlas);
        std::vector<AtlasLocation> locations;
        for (uint32_t g = 0; g < 5; ++g) {
            auto loc = atlas->getOrInsert(key(g), producer());
            expect(loc.has_value());
            locations.push_back(*loc);
        }
        expect(atlas->pageCount() == 2_u);
        expect(locations[4].page == 1_u);
        expect(atlas->stats().evictions == 0_u);
    };

    "new glyphs report dirty regions"_test = [] {
        auto atlas = makeAtlas(64, 1);
        FakeProducer producer;
        auto loc = atlas->getOrInsert(key(9), producer());

        auto dirty = atlas->takeDirtyRects();
        expect(dirty.size() == 1_u);
        expect(dirty[0].page == 0_u);
        expect(dirty[0].rect == loc->rect);
        expect(atlas->takeDirtyRects().empty());
        expect(atlas->page(0).pixel(loc->rect.x, loc->rect.y) == 128_i);
    };

    "clear drops every entry"_test = [] {
        auto atlas = makeAtlas(32, 2);
        FakeProducer producer;
        {
            GlyphAtlas::Pass pass(*atlas);
            for (uint32_t g = 0; g < 6; ++g) {
                atlas->getOrInsert(key(g), producer());
            }
        }
        expect(atlas->pageCount() == 2_u);

        atlas->clear();
        expect(atlas->pageCount() == 1_u);
        expect(atlas->stats().entries == 0_u);
        expect(!atlas->contains(key(0)));
        expect(atlas->getOrInsert(key(0), producer()).has_value());
    };

    "nested passes keep the outer pins"_test = [] {
        auto atlas = makeAtlas(32, 1);
        FakeProducer producer;

        GlyphAtlas::Pass outer(*atlas);
        for (uint32_t g = 0; g < 4; ++g) {
            expect(atlas->getOrInsert(key(g), producer()).has_value());
        }
        {
            GlyphAtlas::Pass inner(*atlas);
            expect(atlas->getOrInsert(key(0), producer()).has_value());
        }
        expect(atlas->inPass());

        // Page full and every entry still pinned by the outer pass
        auto loc = atlas->getOrInsert(key(4), producer());
        expect(!loc.has_value() >> fatal);
        expect(loc.error().code() == ErrorCode::AtlasFull);
        for (uint32_t g = 0; g < 4; ++g) {
            expect(atlas->contains(key(g)));
        }
    };

    "the default atlas grows without a page limit"_test = [] {
        expect(AtlasConfig().maxPages == 0_u);
        auto atlas = makeAtlas(32, 0);
        FakeProducer producer;

        GlyphAtlas::Pass pass(*atlas);
        for (uint32_t g = 0; g < 40; ++g) {
            expect(atlas->getOrInsert(key(g), producer()).has_value());
        }
        expect(atlas->pageCount() == 10_u);
        expect(atlas->stats().evictions == 0_u);
    };

    "entries without an outline are trimmed oldest first"_test = [] {
        AtlasConfig config;
        config.pageSize = 64;
        config.maxEmptyEntries = 4;
        auto atlas = *GlyphAtlas::create(config);
        FakeProducer blank;
        blank.width = 0;
        blank.height = 0;

        for (uint32_t g = 0; g < 10; ++g) {
            expect(atlas->getOrInsert(key(g), blank()).has_value());
        }
        expect(atlas->stats().entries == 4_u);
        expect(atlas->stats().evictions == 6_u);
        expect(!atlas->contains(key(5)));
        expect(atlas->contains(key(6)) && atlas->contains(key(9)));

        // Packed glyphs are not counted against the limit
        FakeProducer producer;
        expect(atlas->getOrInsert(key(100), producer()).has_value());
        expect(atlas->stats().entries == 5_u);

        // Pinned entries stay until their pass ends
        GlyphAtlas::Pass pass(*atlas);
        for (uint32_t g = 20; g < 30; ++g) {
            atlas->getOrInsert(key(g), blank());
        }
        for (uint32_t g = 20; g < 30; ++g) {
            expect(atlas->contains(key(g)));
        }
    };

    "epoch moves on eviction and clear"_test = [] {
        auto atlas = makeAtlas(32, 1);
        FakeProducer producer;
        const uint64_t start = atlas->epoch();

        for (uint32_t g = 0; g < 4; ++g) {
            atlas->getOrInsert(key(g), producer());
        }
        atlas->getOrInsert(key(0), producer());
        expect(atlas->epoch() == start);

        atlas->getOrInsert(key(4), producer());
        const uint64_t evicted = atlas->epoch();
        expect(evicted > start);

        atlas->clear();
        expect(atlas->epoch() > evicted);
    };

    "outline keys are separate entries"_test = [] {
        auto atlas = makeAtlas(64, 1);
        FakeProducer producer;
        auto fill = atlas->makeKey(0, 'a', 32.0f, 0.0f);
        auto ring = atlas->makeKey(0, 'a', 32.0f, 0.0f, 10);
        expect(!(fill == ring));
        expect(ring.stroke == 10_u);

        auto a = atlas->getOrInsert(fill, producer());
        auto b = atlas->getOrInsert(ring, producer());
        expect(a.has_value() && b.has_value());
        expect(producer.calls == 2_i);
        expect(!a->rect.overlaps(b->rect));
    };
};

