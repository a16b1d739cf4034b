#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <string_view>

namespace richsdf {

// Parse a CSS color name ("red", "rebeccapurple") or a hex color with 3, 4,
// 6 or 8 digits ("#f0a", "#ff00aa80"). Names are case-insensitive.
// Returns sRGB components in [0, 1].
std::optional<glm::vec4> parseColor(std::string_view text);

// sRGB -> linear, alpha untouched
glm::vec4 srgbToLinear(const glm::vec4& color);

} // namespace richsdf
