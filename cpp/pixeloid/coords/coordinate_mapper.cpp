#include "pixeloid/coords/coordinate_mapper.h"

namespace pixeloid {

void CoordinateMapper::setOffset(const WorldPoint& offset) noexcept {
    if (offset.x == offset_.x && offset.y == offset_.y) return;
    offset_ = offset;
    ++revision_;
}

void CoordinateMapper::panBy(double dx, double dy) noexcept {
    if (dx == 0.0 && dy == 0.0) return;
    offset_.x += dx;
    offset_.y += dy;
    ++revision_;
}

WorldBounds CoordinateMapper::viewportWorldBounds(const ViewportSize& viewport, Scale scale) const noexcept {
    const WorldPoint topLeft = screenToWorld(ScreenPoint{0.0f, 0.0f}, scale);
    return WorldBounds{
        topLeft.x,
        topLeft.y,
        topLeft.x + static_cast<double>(viewport.width) / static_cast<double>(scale),
        topLeft.y + static_cast<double>(viewport.height) / static_cast<double>(scale),
    };
}

} // namespace pixeloid
