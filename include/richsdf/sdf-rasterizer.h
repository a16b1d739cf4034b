#pragma once

#include <richsdf/atlas-page.h>
#include <richsdf/font/font-library.h>
#include <richsdf/glyph-atlas.h>
#include <richsdf/result.hpp>

#include <memory>
#include <vector>

namespace richsdf {

class Config;

struct SdfConfig {
    float pixelRange = 4.0f;        // Distance range across the edge, pixels
    uint32_t margin = 4;            // Raised to ceil(pixelRange) if smaller
    uint32_t subpixelBuckets = 1;

    static SdfConfig fromConfig(const Config& config);
};

//=============================================================================
// GlyphRasterizer - AtlasKey to SdfImage
//
// rasterize() must be pure: equal keys give bit-identical images.
//=============================================================================
class GlyphRasterizer {
public:
    using Ptr = std::shared_ptr<GlyphRasterizer>;

    virtual ~GlyphRasterizer() = default;

    virtual Result<SdfImage> rasterize(const AtlasKey& key) = 0;

    // Results in key order. Sequential unless overridden.
    virtual std::vector<Result<SdfImage>> rasterizeBatch(const std::vector<AtlasKey>& keys);
};

//=============================================================================
// SdfRasterizer - single-channel SDF through msdfgen
//
// The outline comes from the FontLibrary face; the field is generated in
// font units scaled to the key's pixel size. Batches run on std::async
// workers, each opening its own FT_Face over the font bytes.
//=============================================================================
class SdfRasterizer : public GlyphRasterizer {
public:
    using Ptr = std::shared_ptr<SdfRasterizer>;

    static Result<Ptr> create(font::FontLibrary::Ptr fonts,
                              const SdfConfig& config = SdfConfig()) noexcept;

    ~SdfRasterizer() override = default;

    Result<SdfImage> rasterize(const AtlasKey& key) override;
    Result<SdfImage> rasterize(uint32_t glyphId, FontId font, float pixelSize);

    std::vector<Result<SdfImage>> rasterizeBatch(const std::vector<AtlasKey>& keys) override;

    const SdfConfig& config() const { return _config; }

    // Keys per worker below which a batch stays on the calling thread
    static constexpr size_t MIN_KEYS_PER_WORKER = 8;

private:
    SdfRasterizer(font::FontLibrary::Ptr fonts, const SdfConfig& config) noexcept;
    Result<void> init() noexcept;

    font::FontLibrary::Ptr _fonts;
    SdfConfig _config;
};

} // namespace richsdf
