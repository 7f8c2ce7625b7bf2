#include "tests/engine_test_common.h"

using namespace pixeloid;
using namespace pixeloid::texture;
using pixeloid_test::rectVisual;

TEST(VisibilityTest, FullyInsideIsOnScreen) {
    const ObjectVisibilityState s = classifyVisibility(WorldBounds{0, 0, 10, 10}, WorldBounds{0, 0, 100, 100});
    EXPECT_EQ(s.visibility, Visibility::OnScreen);
    EXPECT_EQ(s.onScreenBounds, (WorldBounds{0, 0, 10, 10}));
}

TEST(VisibilityTest, ClippedIsPartial) {
    const ObjectVisibilityState s = classifyVisibility(WorldBounds{0, 0, 10, 10}, WorldBounds{0, 0, 5, 100});
    EXPECT_EQ(s.visibility, Visibility::PartiallyOnScreen);
    EXPECT_EQ(s.onScreenBounds, (WorldBounds{0, 0, 5, 10}));
}

TEST(VisibilityTest, OutsideIsOffScreen) {
    const ObjectVisibilityState s = classifyVisibility(WorldBounds{200, 200, 210, 210}, WorldBounds{0, 0, 100, 100});
    EXPECT_EQ(s.visibility, Visibility::OffScreen);

    const ObjectVisibilityState edge = classifyVisibility(WorldBounds{100, 0, 110, 10}, WorldBounds{0, 0, 100, 100});
    EXPECT_EQ(edge.visibility, Visibility::OffScreen);
}

TEST(VisibilityTest, ObjectLargerThanViewport) {
    const ObjectVisibilityState s = classifyVisibility(WorldBounds{-50, -50, 150, 150}, WorldBounds{0, 0, 100, 100});
    EXPECT_EQ(s.visibility, Visibility::PartiallyOnScreen);
    EXPECT_EQ(s.onScreenBounds, (WorldBounds{0, 0, 100, 100}));
}

TEST(VisibilityCacheTest, ReusedUntilViewportOrBoundsChange) {
    ObjectTable table;
    table.upsert(1, WorldBounds{0, 0, 10, 10}, rectVisual(10, 10));
    VisibilityCache cache;

    const WorldBounds viewport{0, 0, 100, 100};
    EXPECT_EQ(cache.get(*table.find(1), 1.0f, viewport, 0).visibility, Visibility::OnScreen);
    EXPECT_EQ(cache.get(*table.find(1), 1.0f, viewport, 0).visibility, Visibility::OnScreen);
    EXPECT_EQ(cache.recomputeCount(), 1u);

    // New viewport revision.
    const WorldBounds narrow{0, 0, 5, 100};
    EXPECT_EQ(cache.get(*table.find(1), 1.0f, narrow, 1).visibility, Visibility::PartiallyOnScreen);
    EXPECT_EQ(cache.recomputeCount(), 2u);

    // Object moved.
    table.upsert(1, WorldBounds{1, 1, 4, 4}, rectVisual(10, 10));
    EXPECT_EQ(cache.get(*table.find(1), 1.0f, narrow, 1).visibility, Visibility::OnScreen);
    EXPECT_EQ(cache.recomputeCount(), 3u);

    // Another scale is a separate entry.
    cache.get(*table.find(1), 2.0f, narrow, 1);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(VisibilityCacheTest, RemoveByObjectAndScale) {
    ObjectTable table;
    table.upsert(1, WorldBounds{0, 0, 10, 10}, rectVisual(10, 10));
    table.upsert(2, WorldBounds{0, 0, 10, 10}, rectVisual(10, 10));
    VisibilityCache cache;

    const WorldBounds viewport{0, 0, 100, 100};
    cache.get(*table.find(1), 1.0f, viewport, 0);
    cache.get(*table.find(1), 2.0f, viewport, 0);
    cache.get(*table.find(2), 2.0f, viewport, 0);
    ASSERT_EQ(cache.size(), 3u);

    cache.removeObject(1);
    EXPECT_EQ(cache.size(), 1u);
    cache.removeScale(2.0f);
    EXPECT_EQ(cache.size(), 0u);
}
