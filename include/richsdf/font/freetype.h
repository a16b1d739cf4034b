#pragma once

#include <richsdf/result.hpp>

#include <cstddef>
#include <cstdint>

typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;

namespace richsdf::font {

/// Thread-local FreeType library singleton.
/// FT_Library is not thread-safe, so one instance per thread.
FT_Library ftLibrary();

/// Open a face over caller-owned bytes with this thread's library.
/// The bytes must outlive the face.
Result<FT_Face> openMemoryFace(const uint8_t* data, size_t size);

/// Owns an FT_Face, closes it on destruction.
class ScopedFace {
public:
    ScopedFace() = default;
    explicit ScopedFace(FT_Face face) : _face(face) {}
    ~ScopedFace();

    ScopedFace(const ScopedFace&) = delete;
    ScopedFace& operator=(const ScopedFace&) = delete;
    ScopedFace(ScopedFace&& other) noexcept : _face(other._face) { other._face = nullptr; }
    ScopedFace& operator=(ScopedFace&& other) noexcept;

    FT_Face get() const { return _face; }
    explicit operator bool() const { return _face != nullptr; }

private:
    FT_Face _face = nullptr;
};

} // namespace richsdf::font
