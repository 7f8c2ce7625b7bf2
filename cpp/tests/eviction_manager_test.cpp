#include "tests/engine_test_common.h"

using namespace pixeloid;
using pixeloid::cache::EvictionManager;
using pixeloid::cache::SweepResult;
using pixeloid_test::FakeRasterizer;
using pixeloid_test::ManualClock;
using pixeloid_test::MeshReleaseLog;
using pixeloid_test::rectVisual;

class EvictionManagerTest : public ::testing::Test {
protected:
    ManualClock clock;
    FakeRasterizer raster;
    MeshReleaseLog meshReleases;
    CacheService service{pixeloid_test::smallConfig(), clock.source()};
    mesh::ResolutionPlanner planner{service};
    mesh::MeshCache meshes{service, planner};
    ObjectTable objects;
    texture::VisibilityCache visibility;
    texture::DerivedTextureCache textures{service, objects, visibility};
    EvictionManager eviction{service, meshes, textures, visibility};

    void SetUp() override {
        meshes.setReleaseHook(&meshReleases, &MeshReleaseLog::record);
        textures.setReleaseHook(&raster, &FakeRasterizer::release);
        service.setViewportSize(ViewportSize{100.0f, 100.0f});
    }

    void build(Scale scale) {
        mesh::MeshHandle mesh;
        ASSERT_EQ(meshes.getOrCreate(scale, mesh), CacheError::Ok);
    }
};

TEST_F(EvictionManagerTest, AdjacentScalesStayInRange) {
    eviction.setCurrentScale(5.0f);
    EXPECT_EQ(eviction.adjacentScales(), std::vector<Scale>({3.0f, 4.0f, 6.0f, 7.0f}));

    eviction.setCurrentScale(1.0f);
    EXPECT_EQ(eviction.adjacentScales(), std::vector<Scale>({2.0f, 3.0f}));

    eviction.setCurrentScale(100.0f);
    EXPECT_EQ(eviction.adjacentScales(), std::vector<Scale>({98.0f, 99.0f}));
}

TEST_F(EvictionManagerTest, DesiredScalesNearestFirstThenCritical) {
    eviction.setCurrentScale(5.0f);
    EXPECT_EQ(eviction.desiredScales(), std::vector<Scale>({5.0f, 4.0f, 6.0f, 3.0f, 7.0f, 1.0f, 2.0f}));

    eviction.setCurrentScale(2.0f);
    EXPECT_EQ(eviction.desiredScales(), std::vector<Scale>({2.0f, 1.0f, 3.0f, 4.0f}));
}

TEST_F(EvictionManagerTest, ClassifiesEntries) {
    eviction.setCurrentScale(10.0f);
    EXPECT_TRUE(eviction.isCritical(1.0f));
    EXPECT_TRUE(eviction.isCritical(2.0f));
    EXPECT_FALSE(eviction.isCritical(3.0f));
    EXPECT_TRUE(eviction.isAdjacent(12.0f));
    EXPECT_FALSE(eviction.isAdjacent(13.0f));

    EXPECT_EQ(eviction.classify(10.0f, 0.0, 1.0e9), EntryState::Fresh);
    EXPECT_EQ(eviction.classify(8.0f, 0.0, 1.0e9), EntryState::Fresh);
    EXPECT_EQ(eviction.classify(1.0f, 0.0, 1.0e9), EntryState::Idle);
    EXPECT_EQ(eviction.classify(20.0f, 0.0, 60000.0), EntryState::Idle);
    EXPECT_EQ(eviction.classify(20.0f, 0.0, 60001.0), EntryState::Evictable);
}

TEST_F(EvictionManagerTest, CriticalScalesSurviveEverything) {
    build(1.0f);
    build(2.0f);
    build(30.0f);

    const Scale walk[] = {10.0f, 40.0f, 70.0f, 5.0f, 90.0f};
    for (Scale s : walk) {
        eviction.setCurrentScale(s);
        clock.advance(120000.0);
        eviction.sweep();
        EXPECT_TRUE(meshes.isCached(1.0f));
        EXPECT_TRUE(meshes.isCached(2.0f));
    }
    EXPECT_FALSE(meshes.isCached(30.0f));
}

TEST_F(EvictionManagerTest, IdleScaleEvictedOnlyAfterThreshold) {
    build(3.0f);
    build(20.0f);
    eviction.setCurrentScale(20.0f);
    EXPECT_EQ(meshes.slots().at(3.0f).state, EntryState::Idle);

    clock.advance(59000.0);
    SweepResult early = eviction.sweep();
    EXPECT_EQ(early.evictedMeshes, 0u);
    EXPECT_TRUE(meshes.isCached(3.0f));

    clock.advance(2000.0);
    const std::size_t before = meshes.size();
    SweepResult late = eviction.sweep();
    EXPECT_EQ(late.evictedMeshes, 1u);
    EXPECT_LT(meshes.size(), before);
    EXPECT_FALSE(meshes.isCached(3.0f));
    EXPECT_TRUE(meshes.isCached(20.0f));

    // Resource released before the entry went away.
    EXPECT_EQ(meshReleases.scales, std::vector<float>({3.0f}));
    EXPECT_EQ(service.counters().evictedMeshes, 1u);
    EXPECT_EQ(service.counters().sweepCount, 2u);
}

TEST_F(EvictionManagerTest, ScaleChangeReinstatesWindow) {
    build(5.0f);
    eviction.setCurrentScale(20.0f);
    clock.advance(70000.0);

    // Zooming back near 5 reinstates it before any sweep can run.
    eviction.setCurrentScale(6.0f);
    EXPECT_EQ(meshes.slots().at(5.0f).state, EntryState::Fresh);
    EXPECT_DOUBLE_EQ(meshes.slots().at(5.0f).lastAccessedAt, 70000.0);

    eviction.setCurrentScale(20.0f);
    eviction.sweep();
    EXPECT_TRUE(meshes.isCached(5.0f));

    clock.advance(61000.0);
    eviction.sweep();
    EXPECT_FALSE(meshes.isCached(5.0f));
}

TEST_F(EvictionManagerTest, TexturesFollowTheSameRules) {
    objects.upsert(1, WorldBounds{0, 0, 10, 10}, rectVisual(10, 10));
    texture::TextureLookup lookup{};
    ASSERT_EQ(textures.getOrCreate(1, 2.0f, raster.callback(), lookup), CacheError::Ok);
    ASSERT_EQ(textures.getOrCreate(1, 30.0f, raster.callback(), lookup), CacheError::Ok);
    ASSERT_EQ(textures.getOrCreate(1, 11.0f, raster.callback(), lookup), CacheError::Ok);
    const std::uint32_t farTexture = lookup.texture.id - 1; // scale 30

    eviction.setCurrentScale(10.0f);
    clock.advance(61000.0);
    SweepResult result = eviction.sweep();

    EXPECT_EQ(result.evictedTextures, 1u);
    EXPECT_TRUE(textures.isCached(1, 2.0f));   // critical
    EXPECT_TRUE(textures.isCached(1, 11.0f));  // adjacent
    EXPECT_FALSE(textures.isCached(1, 30.0f));
    EXPECT_EQ(raster.released, std::vector<std::uint32_t>({farTexture}));
    EXPECT_EQ(service.counters().evictedTextures, 1u);
}

TEST_F(EvictionManagerTest, GetOrCreateNeverEvicts) {
    eviction.setCurrentScale(50.0f);
    build(10.0f);
    build(20.0f);
    clock.advance(1.0e6);

    build(30.0f);
    build(10.0f);
    EXPECT_EQ(meshes.size(), 3u);
    EXPECT_EQ(service.counters().evictedMeshes, 0u);
}

TEST_F(EvictionManagerTest, TextureSweepDropsVisibilityEntries) {
    objects.upsert(1, WorldBounds{0, 0, 10, 10}, rectVisual(10, 10));
    texture::TextureLookup lookup{};
    // None of these scales has a mesh.
    ASSERT_EQ(textures.getOrCreate(1, 30.0f, raster.callback(), lookup), CacheError::Ok);
    ASSERT_EQ(textures.getOrCreate(1, 45.0f, raster.callback(), lookup), CacheError::Ok);
    ASSERT_EQ(textures.getOrCreate(1, 11.0f, raster.callback(), lookup), CacheError::Ok);
    ASSERT_EQ(visibility.size(), 3u);

    eviction.setCurrentScale(10.0f);
    clock.advance(61000.0);
    SweepResult result = eviction.sweep();

    EXPECT_EQ(result.evictedMeshes, 0u);
    EXPECT_EQ(result.evictedTextures, 2u);
    EXPECT_EQ(visibility.size(), 1u);
}

TEST(EvictionGridTest, FractionalStepNeighboursMatchHostScales) {
    EngineConfig config = pixeloid_test::smallConfig();
    config.eviction.minScale = 0.1f;
    config.eviction.maxScale = 10.0f;
    config.eviction.scaleStep = 0.1f;
    config.eviction.criticalScales = {1.0f};
    CacheService service{config};
    mesh::ResolutionPlanner planner{service};
    mesh::MeshCache meshes{service, planner};
    ObjectTable objects;
    texture::VisibilityCache visibility;
    texture::DerivedTextureCache textures{service, objects, visibility};
    EvictionManager eviction{service, meshes, textures, visibility};

    eviction.setCurrentScale(1.3f);
    // Bit-equal to the float literals a host passes when zooming by 0.1.
    EXPECT_EQ(eviction.adjacentScales(), std::vector<Scale>({1.1f, 1.2f, 1.4f, 1.5f}));

    eviction.setCurrentScale(0.2f);
    EXPECT_EQ(eviction.adjacentScales(), std::vector<Scale>({0.1f, 0.3f, 0.4f}));
}
