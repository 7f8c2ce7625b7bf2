#include "pixeloid/texture/visual_version.h"

#include "pixeloid/core/util.h"

namespace pixeloid::texture {

std::uint64_t computeVisualVersion(const VisualAttributes& visual) {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, 0x56495356u); // "VSIV" marker
    h = hashU32(h, static_cast<std::uint32_t>(visual.kind));
    h = hashU32(h, visual.strokeColor);
    h = hashU32(h, visual.fillColor);
    h = hashU32(h, visual.fillEnabled ? 1u : 0u);
    h = hashF32(h, visual.strokeWidth);
    h = hashF32(h, visual.width);
    h = hashF32(h, visual.height);
    h = hashF32(h, visual.radius);
    h = hashU32(h, visual.createdAt);
    // 0 is reserved for "no texture captured yet".
    return h == 0 ? 1 : h;
}

} // namespace pixeloid::texture
