#include <gtest/gtest.h>
#include "pixeloid/cache/cache_service.h"
#include "pixeloid/mesh/resolution_planner.h"

#include <cmath>
#include <limits>

using namespace pixeloid;
using pixeloid::mesh::MeshResolution;
using pixeloid::mesh::ResolutionPlanner;

TEST(ResolutionPlannerTest, ScaleTenWithDefaults) {
    CacheService service{EngineConfig{}};
    ResolutionPlanner planner(service);

    MeshResolution res{};
    ASSERT_EQ(planner.plan(10.0f, res), CacheError::Ok);
    EXPECT_FLOAT_EQ(res.scale, 10.0f);
    EXPECT_FLOAT_EQ(res.oversizePercent, 20.0f);
    EXPECT_EQ(res.vertexGridWidth, 120u);
    EXPECT_EQ(res.vertexGridHeight, 120u);
    EXPECT_EQ(res.vertexCount(), 14400u);
    EXPECT_EQ(res.indexCount(), 84966u);
}

TEST(ResolutionPlannerTest, FootprintIncludesOversize) {
    CacheService service{EngineConfig{}};
    ResolutionPlanner planner(service);
    EXPECT_DOUBLE_EQ(planner.footprintWorldSize(), 1200.0);
}

TEST(ResolutionPlannerTest, GridRoundsUp) {
    CacheService service{EngineConfig{}};
    ResolutionPlanner planner(service);

    MeshResolution res{};
    ASSERT_EQ(planner.plan(7.0f, res), CacheError::Ok);
    EXPECT_EQ(res.vertexGridWidth, 172u); // ceil(1200 / 7)
}

TEST(ResolutionPlannerTest, HigherScaleUsesFewerVertices) {
    CacheService service{EngineConfig{}};
    ResolutionPlanner planner(service);

    MeshResolution low{};
    MeshResolution high{};
    ASSERT_EQ(planner.plan(2.0f, low), CacheError::Ok);
    ASSERT_EQ(planner.plan(20.0f, high), CacheError::Ok);
    EXPECT_GT(low.vertexCount(), high.vertexCount());
}

TEST(ResolutionPlannerTest, HugeScaleKeepsOneQuad) {
    CacheService service{EngineConfig{}};
    ResolutionPlanner planner(service);

    MeshResolution res{};
    ASSERT_EQ(planner.plan(5000.0f, res), CacheError::Ok);
    EXPECT_EQ(res.vertexGridWidth, 2u);
    EXPECT_EQ(res.vertexGridHeight, 2u);
    EXPECT_EQ(res.indexCount(), 6u);
}

TEST(ResolutionPlannerTest, RejectsInvalidScales) {
    CacheService service{EngineConfig{}};
    ResolutionPlanner planner(service);

    MeshResolution res{};
    EXPECT_EQ(planner.plan(0.0f, res), CacheError::InvalidScale);
    EXPECT_EQ(planner.plan(-1.0f, res), CacheError::InvalidScale);
    EXPECT_EQ(planner.plan(std::numeric_limits<float>::quiet_NaN(), res), CacheError::InvalidScale);
    EXPECT_EQ(planner.plan(std::numeric_limits<float>::infinity(), res), CacheError::InvalidScale);
}

TEST(ResolutionPlannerTest, VertexLimitFailsInsteadOfAllocating) {
    CacheService service{EngineConfig{}};
    ResolutionPlanner planner(service);

    MeshResolution res{};
    // 2400 x 2400 vertices is above the default 4M limit.
    EXPECT_EQ(planner.plan(0.5f, res), CacheError::ResourceCreationFailed);
}

TEST(ResolutionPlannerTest, Deterministic) {
    EngineConfig config;
    config.mesh.oversizePercent = 0.0f;
    CacheService service{config};
    ResolutionPlanner planner(service);

    MeshResolution a{};
    MeshResolution b{};
    ASSERT_EQ(planner.plan(10.0f, a), CacheError::Ok);
    ASSERT_EQ(planner.plan(10.0f, b), CacheError::Ok);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.vertexGridWidth, 100u);
}
