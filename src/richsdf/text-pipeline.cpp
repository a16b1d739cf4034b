#include <richsdf/text-pipeline.h>
#include <ytrace/ytrace.hpp>

#include <unordered_map>
#include <unordered_set>

namespace richsdf {

namespace {

struct LayerRequest {
    size_t glyph;
    AtlasLocation GlyphLocations::* slot;
    AtlasKey key;
};

} // namespace

//=============================================================================
// TextObject
//=============================================================================

TextObject::TextObject(std::string markup, const MarkupParser& parser,
                       const TextStyling& styling)
    : _styling(styling) {
    setMarkup(std::move(markup), parser);
}

void TextObject::setMarkup(std::string markup, const MarkupParser& parser) {
    _tree = parser.parse(markup);
    _markup = std::move(markup);
    _resolver.invalidate();
}

void TextObject::setStyling(const TextStyling& styling) {
    _styling = styling;
    _resolver.invalidate();
}

//=============================================================================
// TextPipeline
//=============================================================================

TextPipeline::TextPipeline(ShapingEngine::Ptr shaper, GlyphRasterizer::Ptr rasterizer,
                           GlyphAtlas::Ptr atlas) noexcept
    : _shaper(std::move(shaper))
    , _rasterizer(std::move(rasterizer))
    , _atlas(std::move(atlas)) {}

Result<TextPipeline::Ptr> TextPipeline::create(ShapingEngine::Ptr shaper,
                                               GlyphRasterizer::Ptr rasterizer,
                                               GlyphAtlas::Ptr atlas) noexcept {
    if (!shaper) {
        return Err<Ptr>("TextPipeline: no shaping engine", ErrorCode::InvalidArgument);
    }
    if (!rasterizer) {
        return Err<Ptr>("TextPipeline: no rasterizer", ErrorCode::InvalidArgument);
    }
    if (!atlas) {
        return Err<Ptr>("TextPipeline: no atlas", ErrorCode::InvalidArgument);
    }
    return Ok(Ptr(new TextPipeline(std::move(shaper), std::move(rasterizer), std::move(atlas))));
}

bool TextPipeline::placementsValid(TextObject& object) const {
    if (object._atlas != _atlas.get()) return false;
    if (object._atlasEpoch == _atlas->epoch()) return true;

    for (const auto& [key, location] : object._placed) {
        if (_atlas->find(key) != location) {
            ydebug("TextPipeline: glyph {} of '{}' left the atlas", key.glyph, object._markup);
            return false;
        }
    }
    object._atlasEpoch = _atlas->epoch();
    return true;
}

Result<bool> TextPipeline::update(TextObject& object, FetchSource& source) {
    auto runs = object._resolver.resolve(object._tree, source);
    if (!object._resolver.changed() && placementsValid(object)) {
        return Ok(false);
    }

    auto shaped = _shaper->shape(runs, object._styling);
    if (!shaped) {
        // Retry on the next update, values may have moved on
        object._resolver.invalidate();
        return Err<bool>("TextPipeline: shaping failed", shaped);
    }
    deriveGlyphAttributes(*shaped, runs, object._styling);

    std::vector<std::pair<AtlasKey, AtlasLocation>> placed;
    {
        GlyphAtlas::Pass pass(*_atlas);
        auto locations = placeGlyphs(*shaped, placed);
        if (!locations) {
            object._resolver.invalidate();
            return Err<bool>("TextPipeline: atlas update failed", locations);
        }
        object._locations = std::move(*locations);
    }

    object._mesh = MeshEmitter::emit(*shaped, object._locations, *_atlas, object._styling);
    object._shaped = std::move(*shaped);
    object._runs = std::move(runs);
    object._placed = std::move(placed);
    object._atlas = _atlas.get();
    object._atlasEpoch = _atlas->epoch();
    ++object._buildCount;

    ydebug("TextPipeline: rebuilt '{}' as {} quads", object._markup, object._mesh.quadCount());
    return Ok(true);
}

Result<std::vector<GlyphLocations>> TextPipeline::placeGlyphs(
    const ShapedText& shaped, std::vector<std::pair<AtlasKey, AtlasLocation>>& placed) {
    // One request per drawn layer of every glyph
    std::vector<LayerRequest> requests;
    requests.reserve(shaped.glyphs.size());
    for (size_t i = 0; i < shaped.glyphs.size(); ++i) {
        const auto& g = shaped.glyphs[i];
        auto request = [&](AtlasLocation GlyphLocations::* slot, uint32_t glyph, float penX,
                           uint16_t stroke) {
            requests.push_back({i, slot, _atlas->makeKey(g.font, glyph, g.pixelSize, penX, stroke)});
        };

        if (g.fill) request(&GlyphLocations::fill, g.glyphId, g.origin.x, 0);
        if (g.stroke > 0) request(&GlyphLocations::stroke, g.glyphId, g.origin.x, g.stroke);
        if (g.underline) {
            if (g.fill) request(&GlyphLocations::underline, UNDERLINE_GLYPH, 0.0f, 0);
            if (g.stroke > 0) {
                request(&GlyphLocations::underlineStroke, UNDERLINE_GLYPH, 0.0f, g.stroke);
            }
        }
        if (g.strikethrough) {
            if (g.fill) request(&GlyphLocations::strikethrough, STRIKETHROUGH_GLYPH, 0.0f, 0);
            if (g.stroke > 0) {
                request(&GlyphLocations::strikethroughStroke, STRIKETHROUGH_GLYPH, 0.0f, g.stroke);
            }
        }
    }

    // Rasterize every distinct miss in one batch
    std::vector<AtlasKey> missing;
    std::unordered_set<AtlasKey, AtlasKeyHash> seen;
    for (const auto& request : requests) {
        if (!_atlas->contains(request.key) && seen.insert(request.key).second) {
            missing.push_back(request.key);
        }
    }

    std::unordered_map<AtlasKey, Result<SdfImage>, AtlasKeyHash> images;
    if (!missing.empty()) {
        auto batch = _rasterizer->rasterizeBatch(missing);
        for (size_t i = 0; i < missing.size() && i < batch.size(); ++i) {
            images.emplace(missing[i], std::move(batch[i]));
        }
    }

    std::vector<GlyphLocations> locations(shaped.glyphs.size());
    for (const auto& request : requests) {
        const AtlasKey& key = request.key;
        auto location = _atlas->getOrInsert(key, [&]() -> Result<SdfImage> {
            if (auto it = images.find(key); it != images.end()) {
                return it->second;
            }
            return _rasterizer->rasterize(key);
        });

        if (location) {
            locations[request.glyph].*request.slot = *location;
            if (!location->empty()) placed.emplace_back(key, *location);
            continue;
        }
        if (location.error().isFatal()) {
            return Err<std::vector<GlyphLocations>>("glyph placement failed", location);
        }
        ywarn("TextPipeline: {}", location.error().message());
    }
    return Ok(std::move(locations));
}

} // namespace richsdf
