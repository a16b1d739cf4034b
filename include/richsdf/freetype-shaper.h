#pragma once

#include <richsdf/font/font-library.h>
#include <richsdf/shaping.h>

#include <memory>

namespace richsdf {

//=============================================================================
// FreetypeShaper - left-to-right reference shaper over a FontLibrary
//
// One glyph per codepoint, FreeType kerning between neighbours of the same
// face and size, greedy wrapping at spaces when maxWidth is set, per-line
// alignment. No ligatures, no bidi. A run's "size" attribute overrides the
// pixel size.
//=============================================================================
class FreetypeShaper : public ShapingEngine {
public:
    using Ptr = std::shared_ptr<FreetypeShaper>;

    static Result<Ptr> create(font::FontLibrary::Ptr fonts) noexcept;

    ~FreetypeShaper() override = default;

    Result<ShapedText> shape(const std::vector<StyledRun>& runs,
                             const TextStyling& styling) override;

private:
    explicit FreetypeShaper(font::FontLibrary::Ptr fonts) noexcept : _fonts(std::move(fonts)) {}

    font::FontLibrary::Ptr _fonts;
};

} // namespace richsdf
