#ifndef PIXELOID_COORDS_COORDINATE_MAPPER_H
#define PIXELOID_COORDS_COORDINATE_MAPPER_H

#include "pixeloid/core/types.h"

namespace pixeloid {

/**
 * CoordinateMapper: the single affine relation between vertex and world space.
 *
 *   world  = vertex + offset
 *   screen = vertex * scale
 *
 * Vertex coordinates are float (what the GPU consumes), world coordinates and
 * the offset are double. No rounding is applied at this layer, and
 * toVertex(toWorld(v)) == v bit for bit as long as v + offset is exact in
 * double, i.e. |offset| stays below about 2^29 * |v| (v == 0 is always exact).
 * Mesh coordinates are 0 or at least one grid step, which keeps any offset up
 * to ~1e7 world units inside that limit. A nonzero v much smaller than the
 * offset loses its low bits (v = 0.1 at offset 1e12 comes back as 0.0999756).
 *
 * setOffset/panBy must be applied before any draw that depends on the new
 * viewport position.
 */
class CoordinateMapper {
public:
    CoordinateMapper() = default;
    explicit CoordinateMapper(const WorldPoint& offset) : offset_(offset) {}

    void setOffset(const WorldPoint& offset) noexcept;
    void panBy(double dx, double dy) noexcept;
    const WorldPoint& offset() const noexcept { return offset_; }

    // Incremented whenever the offset actually changes.
    std::uint32_t revision() const noexcept { return revision_; }

    WorldPoint toWorld(const VertexPoint& v) const noexcept {
        return WorldPoint{static_cast<double>(v.x) + offset_.x, static_cast<double>(v.y) + offset_.y};
    }

    VertexPoint toVertex(const WorldPoint& w) const noexcept {
        return VertexPoint{static_cast<float>(w.x - offset_.x), static_cast<float>(w.y - offset_.y)};
    }

    static ScreenPoint vertexToScreen(const VertexPoint& v, Scale scale) noexcept {
        return ScreenPoint{v.x * scale, v.y * scale};
    }

    static VertexPoint screenToVertex(const ScreenPoint& s, Scale scale) noexcept {
        return VertexPoint{s.x / scale, s.y / scale};
    }

    WorldPoint screenToWorld(const ScreenPoint& s, Scale scale) const noexcept {
        return toWorld(screenToVertex(s, scale));
    }

    ScreenPoint worldToScreen(const WorldPoint& w, Scale scale) const noexcept {
        return vertexToScreen(toVertex(w), scale);
    }

    // World rectangle covered by a viewport of the given pixel size at `scale`.
    WorldBounds viewportWorldBounds(const ViewportSize& viewport, Scale scale) const noexcept;

private:
    WorldPoint offset_{0.0, 0.0};
    std::uint32_t revision_ = 0;
};

} // namespace pixeloid

#endif // PIXELOID_COORDS_COORDINATE_MAPPER_H
