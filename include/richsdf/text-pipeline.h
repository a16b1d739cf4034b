#pragma once

#include <richsdf/fetch-resolver.h>
#include <richsdf/glyph-atlas.h>
#include <richsdf/markup-parser.h>
#include <richsdf/mesh-emitter.h>
#include <richsdf/result.hpp>
#include <richsdf/sdf-rasterizer.h>
#include <richsdf/segment.h>
#include <richsdf/shaping.h>
#include <richsdf/style.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace richsdf {

//=============================================================================
// TextObject - one piece of rich text and its last generated mesh
//
// The markup is parsed once; updates only re-resolve placeholders. Changing
// the markup or the styling forces the next update to rebuild, and so does
// losing any of its atlas entries to another object's eviction.
//=============================================================================
class TextObject {
public:
    TextObject() = default;
    TextObject(std::string markup, const MarkupParser& parser,
               const TextStyling& styling = TextStyling());

    void setMarkup(std::string markup, const MarkupParser& parser);
    void setStyling(const TextStyling& styling);

    const std::string& markup() const { return _markup; }
    const SegmentTree& tree() const { return _tree; }
    const TextStyling& styling() const { return _styling; }

    const FetchResolver& resolver() const { return _resolver; }
    const std::vector<StyledRun>& runs() const { return _runs; }
    const ShapedText& shaped() const { return _shaped; }
    const TextMesh& mesh() const { return _mesh; }
    const std::vector<GlyphLocations>& locations() const { return _locations; }

    // Rebuild on the next update even if no value changed
    void invalidate() { _resolver.invalidate(); }

    uint64_t buildCount() const { return _buildCount; }

private:
    friend class TextPipeline;

    std::string _markup;
    SegmentTree _tree;
    TextStyling _styling;
    FetchResolver _resolver;

    std::vector<StyledRun> _runs;
    ShapedText _shaped;
    std::vector<GlyphLocations> _locations;
    TextMesh _mesh;
    uint64_t _buildCount = 0;

    // Atlas entries the mesh samples, checked when the atlas epoch moves
    std::vector<std::pair<AtlasKey, AtlasLocation>> _placed;
    const GlyphAtlas* _atlas = nullptr;
    uint64_t _atlasEpoch = 0;
};

//=============================================================================
// TextPipeline - resolve, shape, rasterize and emit
//
// Holds no state of its own beyond the services it was created with; any
// number of TextObjects can share one pipeline and its atlas. Each update
// runs inside one atlas pass so no glyph of the text is evicted while the
// text is being built.
//=============================================================================
class TextPipeline {
public:
    using Ptr = std::shared_ptr<TextPipeline>;

    static Result<Ptr> create(ShapingEngine::Ptr shaper,
                              GlyphRasterizer::Ptr rasterizer,
                              GlyphAtlas::Ptr atlas) noexcept;

    ~TextPipeline() = default;

    TextPipeline(const TextPipeline&) = delete;
    TextPipeline& operator=(const TextPipeline&) = delete;

    // Ok(true) when the mesh was rebuilt, Ok(false) when nothing changed
    // and every atlas entry of the mesh is still in place. Fails on shaping
    // errors and on fatal atlas errors; the object keeps its previous mesh
    // in that case.
    Result<bool> update(TextObject& object, FetchSource& source);

    ShapingEngine& shaper() { return *_shaper; }
    GlyphRasterizer& rasterizer() { return *_rasterizer; }
    GlyphAtlas& atlas() { return *_atlas; }
    const GlyphAtlas& atlas() const { return *_atlas; }

private:
    TextPipeline(ShapingEngine::Ptr shaper, GlyphRasterizer::Ptr rasterizer,
                 GlyphAtlas::Ptr atlas) noexcept;

    bool placementsValid(TextObject& object) const;
    Result<std::vector<GlyphLocations>> placeGlyphs(
        const ShapedText& shaped, std::vector<std::pair<AtlasKey, AtlasLocation>>& placed);

    ShapingEngine::Ptr _shaper;
    GlyphRasterizer::Ptr _rasterizer;
    GlyphAtlas::Ptr _atlas;
};

} // namespace richsdf
