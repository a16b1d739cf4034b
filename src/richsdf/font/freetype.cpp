#include <richsdf/font/freetype.h>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <string>

namespace richsdf::font {

FT_Library ftLibrary() {
    thread_local struct FTLib {
        FT_Library lib = nullptr;
        FTLib()  { FT_Init_FreeType(&lib); }
        ~FTLib() { if (lib) FT_Done_FreeType(lib); }
    } instance;
    return instance.lib;
}

Result<FT_Face> openMemoryFace(const uint8_t* data, size_t size) {
    FT_Library lib = ftLibrary();
    if (!lib) {
        return Err<FT_Face>("FreeType initialization failed", ErrorCode::Font);
    }
    FT_Face face = nullptr;
    FT_Error err = FT_New_Memory_Face(lib, data, static_cast<FT_Long>(size), 0, &face);
    if (err) {
        return Err<FT_Face>("FreeType error " + std::to_string(err) + " opening face",
                            ErrorCode::Font);
    }
    return Ok(face);
}

ScopedFace::~ScopedFace() {
    if (_face) FT_Done_Face(_face);
}

ScopedFace& ScopedFace::operator=(ScopedFace&& other) noexcept {
    if (this != &other) {
        if (_face) FT_Done_Face(_face);
        _face = other._face;
        other._face = nullptr;
    }
    return *this;
}

} // namespace richsdf::font
