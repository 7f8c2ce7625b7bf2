#include <gtest/gtest.h>
#include "pixeloid/coords/coordinate_mapper.h"

#include <vector>

using namespace pixeloid;

TEST(CoordinateMapperTest, WorldIsVertexPlusOffset) {
    CoordinateMapper mapper(WorldPoint{100.0, -50.0});
    const WorldPoint w = mapper.toWorld(VertexPoint{10.0f, 20.0f});
    EXPECT_DOUBLE_EQ(w.x, 110.0);
    EXPECT_DOUBLE_EQ(w.y, -30.0);

    const VertexPoint v = mapper.toVertex(WorldPoint{110.0, -30.0});
    EXPECT_FLOAT_EQ(v.x, 10.0f);
    EXPECT_FLOAT_EQ(v.y, 20.0f);
}

TEST(CoordinateMapperTest, RoundTripIsExact) {
    const std::vector<WorldPoint> offsets = {
        {0.0, 0.0}, {123.456, -987.25}, {-0.1, 0.3}, {1.0e6 + 0.7, -3.0e5}};
    const std::vector<float> coords = {0.0f, 1.0f, 0.5f, 3.14159f, 17.25f, 1199.0f, 2400.0f, 0.1f, 999.999f};

    for (const WorldPoint& offset : offsets) {
        CoordinateMapper mapper(offset);
        for (float x : coords) {
            for (float y : coords) {
                const VertexPoint v{x, y};
                const VertexPoint back = mapper.toVertex(mapper.toWorld(v));
                EXPECT_EQ(back.x, v.x) << "offset " << offset.x << " x " << x;
                EXPECT_EQ(back.y, v.y) << "offset " << offset.y << " y " << y;
            }
        }
    }
}

TEST(CoordinateMapperTest, RoundTripHoldsAtMeshEdgeWithLargeOffset) {
    // Grid coordinates from the first to the last vertex of a 1200-unit mesh,
    // plus a small fractional one, against an offset far from the origin.
    CoordinateMapper mapper(WorldPoint{1.0e7 + 0.25, -1.0e7 - 0.75});
    const std::vector<float> coords = {0.0f, 12.0f, 1188.0f, 1200.0f, 0.01f * 12.0f};
    for (float x : coords) {
        const VertexPoint v{x, x};
        const VertexPoint back = mapper.toVertex(mapper.toWorld(v));
        EXPECT_EQ(back.x, v.x) << "x " << x;
        EXPECT_EQ(back.y, v.y) << "y " << x;
    }
}

TEST(CoordinateMapperTest, RoundTripLosesBitsFarBeyondOffsetRatio) {
    // |offset| / |v| around 1e13, well past the ~2^29 limit.
    CoordinateMapper mapper(WorldPoint{1.0e12, 0.0});
    const VertexPoint v{0.1f, 0.1f};
    const VertexPoint back = mapper.toVertex(mapper.toWorld(v));
    EXPECT_NE(back.x, v.x);
    EXPECT_EQ(back.y, v.y);
}

TEST(CoordinateMapperTest, OffsetChangesBumpRevision) {
    CoordinateMapper mapper;
    EXPECT_EQ(mapper.revision(), 0u);

    mapper.setOffset(WorldPoint{0.0, 0.0});
    EXPECT_EQ(mapper.revision(), 0u);

    mapper.setOffset(WorldPoint{5.0, 5.0});
    EXPECT_EQ(mapper.revision(), 1u);

    mapper.panBy(0.0, 0.0);
    EXPECT_EQ(mapper.revision(), 1u);

    mapper.panBy(2.5, -1.0);
    EXPECT_EQ(mapper.revision(), 2u);
    EXPECT_DOUBLE_EQ(mapper.offset().x, 7.5);
    EXPECT_DOUBLE_EQ(mapper.offset().y, 4.0);
}

TEST(CoordinateMapperTest, ScreenConversions) {
    CoordinateMapper mapper(WorldPoint{100.0, 50.0});

    const ScreenPoint s = CoordinateMapper::vertexToScreen(VertexPoint{3.0f, 4.0f}, 8.0f);
    EXPECT_FLOAT_EQ(s.x, 24.0f);
    EXPECT_FLOAT_EQ(s.y, 32.0f);

    const VertexPoint v = CoordinateMapper::screenToVertex(ScreenPoint{24.0f, 32.0f}, 8.0f);
    EXPECT_FLOAT_EQ(v.x, 3.0f);
    EXPECT_FLOAT_EQ(v.y, 4.0f);

    const ScreenPoint fromWorld = mapper.worldToScreen(WorldPoint{110.0, 55.0}, 4.0f);
    EXPECT_FLOAT_EQ(fromWorld.x, 40.0f);
    EXPECT_FLOAT_EQ(fromWorld.y, 20.0f);

    const WorldPoint back = mapper.screenToWorld(fromWorld, 4.0f);
    EXPECT_DOUBLE_EQ(back.x, 110.0);
    EXPECT_DOUBLE_EQ(back.y, 55.0);
}

TEST(CoordinateMapperTest, ViewportWorldBoundsStartsAtOffset) {
    CoordinateMapper mapper(WorldPoint{100.0, 50.0});
    const WorldBounds b = mapper.viewportWorldBounds(ViewportSize{800.0f, 600.0f}, 4.0f);
    EXPECT_DOUBLE_EQ(b.minX, 100.0);
    EXPECT_DOUBLE_EQ(b.minY, 50.0);
    EXPECT_DOUBLE_EQ(b.maxX, 300.0);
    EXPECT_DOUBLE_EQ(b.maxY, 200.0);
}
