#include <richsdf/sdf-rasterizer.h>
#include <richsdf/config.h>
#include <ytrace/ytrace.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H
#include <msdfgen.h>
#include <msdfgen-ext.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

namespace richsdf {

namespace {

// msdfgen handle over an FT_Face it does not own
struct MsdfFont {
    msdfgen::FontHandle* handle = nullptr;

    explicit MsdfFont(FT_Face face) : handle(msdfgen::adoptFreetypeFont(face)) {}
    ~MsdfFont() { if (handle) msdfgen::destroyFont(handle); }

    MsdfFont(const MsdfFont&) = delete;
    MsdfFont& operator=(const MsdfFont&) = delete;
};

std::string describe(const AtlasKey& key) {
    return "glyph " + std::to_string(key.glyph) + " of font " + std::to_string(key.font) +
           " at " + std::to_string(key.pixelSize()) + "px";
}

// Font units of the FT_Face to msdfgen shape units
double shapeUnitsPerFontUnit(FT_Face face, double emSize) {
    return face->units_per_EM > 0 ? emSize / face->units_per_EM : 0.0;
}

// Square of the line thickness centered on the decoration line, in font
// units. False when the font carries no metrics for it.
bool lineMetrics(FT_Face face, uint32_t glyph, double& thickness, double& center) {
    if (glyph == UNDERLINE_GLYPH) {
        thickness = face->underline_thickness;
        center = face->underline_position;
    } else {
        auto* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
        if (!os2 || os2->version == 0xFFFFu) return false;
        thickness = os2->yStrikeoutSize;
        // Position is the top of the stroke
        center = os2->yStrikeoutPosition - thickness * 0.5;
    }
    return thickness > 0.0;
}

void addLineSquare(msdfgen::Shape& shape, double thickness, double center) {
    const double half = thickness * 0.5;
    msdfgen::Point2 a(0.0, center - half);
    msdfgen::Point2 b(thickness, center - half);
    msdfgen::Point2 c(thickness, center + half);
    msdfgen::Point2 d(0.0, center + half);

    msdfgen::Contour& contour = shape.addContour();
    contour.addEdge(msdfgen::EdgeHolder(a, b));
    contour.addEdge(msdfgen::EdgeHolder(b, c));
    contour.addEdge(msdfgen::EdgeHolder(c, d));
    contour.addEdge(msdfgen::EdgeHolder(d, a));
}

Result<SdfImage> generateGlyph(FT_Face face, msdfgen::FontHandle* font, const AtlasKey& key,
                               const SdfConfig& config) {
    msdfgen::FontMetrics metrics;
    if (!msdfgen::getFontMetrics(metrics, font)) {
        return Err<SdfImage>("msdfgen cannot read font metrics", ErrorCode::Raster);
    }
    double unitsPerEm = metrics.emSize > 0 ? metrics.emSize :
                        (metrics.ascenderY - metrics.descenderY);
    if (unitsPerEm <= 0) {
        return Err<SdfImage>("font has no em size", ErrorCode::Raster);
    }
    const double scale = key.pixelSize() / unitsPerEm;

    msdfgen::Shape shape;
    double advance = 0.0;
    if (isLineGlyph(key.glyph)) {
        double thickness = 0.0;
        double center = 0.0;
        const double units = shapeUnitsPerFontUnit(face, unitsPerEm);
        if (lineMetrics(face, key.glyph, thickness, center) && units > 0.0) {
            addLineSquare(shape, thickness * units, center * units);
            advance = thickness * units;
        }
    } else if (!msdfgen::loadGlyph(shape, font, msdfgen::GlyphIndex(key.glyph), &advance)) {
        return Err<SdfImage>("msdfgen cannot load " + describe(key), ErrorCode::Raster);
    }

    SdfImage image;
    image.advance = static_cast<float>(advance * scale);
    image.margin = config.margin;

    // Space and control glyphs: advance only
    if (shape.contours.empty() || scale <= 0) {
        return Ok(std::move(image));
    }

    shape.normalize();
    msdfgen::Shape::Bounds bounds = shape.getBounds();
    if (bounds.r <= bounds.l || bounds.t <= bounds.b) {
        return Ok(std::move(image));
    }

    // A point outside the bounds must measure negative, else the winding is reversed
    msdfgen::Point2 outer(bounds.l - (bounds.r - bounds.l) - 1,
                          bounds.b - (bounds.t - bounds.b) - 1);
    if (msdfgen::SimpleTrueShapeDistanceFinder::oneShotDistance(shape, outer) > 0) {
        for (auto& contour : shape.contours) {
            contour.reverse();
        }
    }

    // Ring of the stroke width centered on the outline, as a field of its own
    const float strokeHalf = static_cast<float>(key.stroke) / 200.0f * key.pixelSize();
    const uint32_t strokeMargin = key.stroke > 0
        ? static_cast<uint32_t>(std::ceil(strokeHalf)) : 0;
    image.margin = config.margin + strokeMargin;

    const double shift = config.subpixelBuckets > 1
        ? static_cast<double>(key.subpixel) / config.subpixelBuckets : 0.0;
    const int margin = static_cast<int>(image.margin);
    const int width = static_cast<int>(std::ceil((bounds.r - bounds.l) * scale + shift)) + margin * 2;
    const int height = static_cast<int>(std::ceil((bounds.t - bounds.b) * scale)) + margin * 2;

    // Translate is in shape units: pixel = scale * (p + translate)
    msdfgen::Bitmap<float, 1> sdf(width, height);
    msdfgen::Vector2 translate(
        margin / scale - bounds.l + shift / scale,
        margin / scale - bounds.b
    );
    msdfgen::generateSDF(sdf, shape, config.pixelRange / scale, scale, translate);

    // 8-bit with Y-flip
    image.width = static_cast<uint32_t>(width);
    image.height = static_cast<uint32_t>(height);
    image.pixels.resize(static_cast<size_t>(width) * height);
    for (int y = 0; y < height; ++y) {
        int srcY = height - 1 - y;
        for (int x = 0; x < width; ++x) {
            float d = *sdf(x, srcY);
            if (key.stroke > 0) {
                const float distance = (d - 0.5f) * config.pixelRange;
                d = 0.5f + (strokeHalf - std::abs(distance)) / config.pixelRange;
            }
            image.pixels[static_cast<size_t>(y) * width + x] =
                static_cast<uint8_t>(std::clamp(d * 255.0f, 0.0f, 255.0f));
        }
    }

    image.bearingX = static_cast<float>(bounds.l * scale - margin - shift);
    image.bearingY = static_cast<float>(height - margin + bounds.b * scale);
    return Ok(std::move(image));
}

// Faces opened by one worker thread, closed when it finishes
class WorkerFonts {
public:
    explicit WorkerFonts(const font::FontLibrary& fonts) : _fonts(fonts) {}

    struct Open {
        font::ScopedFace face;
        std::unique_ptr<MsdfFont> msdf;     // Released before the face
    };

    Result<const Open*> open(FontId id) {
        auto it = _open.find(id);
        if (it != _open.end()) return Ok<const Open*>(&it->second);

        auto face = _fonts.face(id);
        if (!face) {
            return Err<const Open*>("unknown font " + std::to_string(id), ErrorCode::Font);
        }
        auto opened = font::openMemoryFace(face->data().data(), face->data().size());
        if (!opened) {
            return Err<const Open*>("worker cannot open font " + std::to_string(id), opened);
        }

        Open entry;
        entry.face = font::ScopedFace(*opened);
        entry.msdf = std::make_unique<MsdfFont>(entry.face.get());
        if (!entry.msdf->handle) {
            return Err<const Open*>("msdfgen cannot adopt font " + std::to_string(id),
                                    ErrorCode::Raster);
        }
        auto inserted = _open.emplace(id, std::move(entry)).first;
        return Ok<const Open*>(&inserted->second);
    }

private:
    const font::FontLibrary& _fonts;
    std::unordered_map<FontId, Open> _open;
};

} // namespace

//=============================================================================
// GlyphRasterizer
//=============================================================================

std::vector<Result<SdfImage>> GlyphRasterizer::rasterizeBatch(const std::vector<AtlasKey>& keys) {
    std::vector<Result<SdfImage>> results;
    results.reserve(keys.size());
    for (const auto& key : keys) {
        results.push_back(rasterize(key));
    }
    return results;
}

//=============================================================================
// SdfRasterizer
//=============================================================================

SdfConfig SdfConfig::fromConfig(const Config& config) {
    SdfConfig out;
    out.pixelRange = config.get<float>(Config::KEY_SDF_PIXEL_RANGE, out.pixelRange);
    out.margin = config.get<uint32_t>(Config::KEY_SDF_MARGIN, out.margin);
    out.subpixelBuckets = config.get<uint32_t>(Config::KEY_ATLAS_SUBPIXEL_BUCKETS, out.subpixelBuckets);
    return out;
}

SdfRasterizer::SdfRasterizer(font::FontLibrary::Ptr fonts, const SdfConfig& config) noexcept
    : _fonts(std::move(fonts)), _config(config) {}

Result<SdfRasterizer::Ptr> SdfRasterizer::create(font::FontLibrary::Ptr fonts,
                                                 const SdfConfig& config) noexcept {
    auto rasterizer = Ptr(new SdfRasterizer(std::move(fonts), config));
    if (auto res = rasterizer->init(); !res) {
        return Err<Ptr>("Failed to create SdfRasterizer", res);
    }
    return Ok(std::move(rasterizer));
}

Result<void> SdfRasterizer::init() noexcept {
    if (!_fonts) {
        return Err("no font library", ErrorCode::InvalidArgument);
    }
    if (!(_config.pixelRange > 0.0f)) {
        return Err("sdf pixel range must be positive", ErrorCode::InvalidArgument);
    }
    if (_config.subpixelBuckets == 0) {
        _config.subpixelBuckets = 1;
    }
    const auto minMargin = static_cast<uint32_t>(std::ceil(_config.pixelRange));
    if (_config.margin < minMargin) {
        ywarn("SdfRasterizer: margin {} below pixel range {}, using {}",
              _config.margin, _config.pixelRange, minMargin);
        _config.margin = minMargin;
    }
    ydebug("SdfRasterizer: range {} margin {} buckets {}",
           _config.pixelRange, _config.margin, _config.subpixelBuckets);
    return Ok();
}

Result<SdfImage> SdfRasterizer::rasterize(uint32_t glyphId, FontId fontId, float pixelSize) {
    AtlasKey key;
    key.font = fontId;
    key.glyph = glyphId;
    key.size26_6 = static_cast<uint32_t>(std::lround(std::max(pixelSize, 0.0f) * 64.0f));
    return rasterize(key);
}

Result<SdfImage> SdfRasterizer::rasterize(const AtlasKey& key) {
    auto face = _fonts->face(key.font);
    if (!face) {
        return Err<SdfImage>("cannot rasterize " + describe(key) + ": unknown font",
                             ErrorCode::Font);
    }

    MsdfFont msdf(face->face());
    if (!msdf.handle) {
        return Err<SdfImage>("msdfgen cannot adopt font " + std::to_string(key.font),
                             ErrorCode::Raster);
    }
    return generateGlyph(face->face(), msdf.handle, key, _config);
}

std::vector<Result<SdfImage>> SdfRasterizer::rasterizeBatch(const std::vector<AtlasKey>& keys) {
    const size_t hw = std::max(1u, std::thread::hardware_concurrency());
    const size_t workers = std::min(hw, keys.size() / MIN_KEYS_PER_WORKER);
    if (workers <= 1) {
        return GlyphRasterizer::rasterizeBatch(keys);
    }

    std::vector<Result<SdfImage>> results(keys.size());
    const size_t chunk = (keys.size() + workers - 1) / workers;
    const font::FontLibrary& fonts = *_fonts;
    const SdfConfig config = _config;

    std::vector<std::future<void>> futures;
    for (size_t begin = 0; begin < keys.size(); begin += chunk) {
        const size_t end = std::min(keys.size(), begin + chunk);
        futures.push_back(std::async(std::launch::async, [&, begin, end] {
            WorkerFonts workerFonts(fonts);
            for (size_t i = begin; i < end; ++i) {
                auto opened = workerFonts.open(keys[i].font);
                if (!opened) {
                    results[i] = std::unexpected(opened.error());
                    continue;
                }
                results[i] = generateGlyph((*opened)->face.get(), (*opened)->msdf->handle,
                                           keys[i], config);
            }
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    ydebug("SdfRasterizer: batch of {} glyphs on {} workers", keys.size(), futures.size());
    return results;
}

} // namespace richsdf
