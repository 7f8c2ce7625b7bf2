#ifndef PIXELOID_TEXTURE_VISUAL_VERSION_H
#define PIXELOID_TEXTURE_VISUAL_VERSION_H

#include <cstdint>

namespace pixeloid::texture {

enum class ShapeKind : std::uint8_t {
    Point = 0,
    Line = 1,
    Rectangle = 2,
    Circle = 3,
    Diamond = 4,
};

// Appearance of an object, without its position. Sizes are explicit fields
// rather than being derived from bounds, so a pure move never alters them.
struct VisualAttributes {
    ShapeKind kind = ShapeKind::Rectangle;
    std::uint32_t strokeColor = 0x000000FFu; // 0xRRGGBBAA
    std::uint32_t fillColor = 0x00000000u;   // 0xRRGGBBAA
    bool fillEnabled = false;
    float strokeWidth = 1.0f;
    float width = 0.0f;
    float height = 0.0f;
    float radius = 0.0f;
    std::uint32_t createdAt = 0;             // creation stamp, distinguishes re-created ids
};

// FNV-1a fingerprint of the visual attributes. Never 0.
std::uint64_t computeVisualVersion(const VisualAttributes& visual);

} // namespace pixeloid::texture

#endif // PIXELOID_TEXTURE_VISUAL_VERSION_H
