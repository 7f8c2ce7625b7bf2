#include "tests/engine_test_common.h"

using namespace pixeloid;

TEST(EngineConfigTest, DefaultsAreValid) {
    const EngineConfig config;
    EXPECT_EQ(validateConfig(config), CacheError::Ok);
    EXPECT_FLOAT_EQ(config.mesh.baseViewportSize, 1000.0f);
    EXPECT_FLOAT_EQ(config.mesh.oversizePercent, 20.0f);
    EXPECT_EQ(config.eviction.criticalScales, std::vector<Scale>({1.0f, 2.0f}));
    EXPECT_EQ(config.eviction.adjacencyRadius, 2u);
    EXPECT_DOUBLE_EQ(config.eviction.idleThresholdMs, 60000.0);
    EXPECT_DOUBLE_EQ(config.eviction.sweepIntervalMs, 30000.0);
    EXPECT_EQ(config.eviction.maxCachedScalesHint, 15u);
}

TEST(EngineConfigTest, RejectsUnusableValues) {
    EngineConfig base;

    EngineConfig c = base;
    c.mesh.baseViewportSize = 0.0f;
    EXPECT_EQ(validateConfig(c), CacheError::InvalidConfig);

    c = base;
    c.mesh.oversizePercent = -5.0f;
    EXPECT_EQ(validateConfig(c), CacheError::InvalidConfig);

    c = base;
    c.eviction.idleThresholdMs = 0.0;
    EXPECT_EQ(validateConfig(c), CacheError::InvalidConfig);

    c = base;
    c.eviction.scaleStep = 0.0f;
    EXPECT_EQ(validateConfig(c), CacheError::InvalidConfig);

    c = base;
    c.eviction.minScale = 10.0f;
    c.eviction.maxScale = 5.0f;
    EXPECT_EQ(validateConfig(c), CacheError::InvalidConfig);

    c = base;
    c.eviction.criticalScales = {1.0f, -2.0f};
    EXPECT_EQ(validateConfig(c), CacheError::InvalidConfig);

    c = base;
    c.idle.maxTasksPerSlice = 0;
    EXPECT_EQ(validateConfig(c), CacheError::InvalidConfig);
}

TEST(EngineConfigTest, ZeroOversizeAndRadiusAreAllowed) {
    EngineConfig c;
    c.mesh.oversizePercent = 0.0f;
    c.eviction.adjacencyRadius = 0;
    EXPECT_EQ(validateConfig(c), CacheError::Ok);
}

TEST(EngineConfigTest, EngineFallsBackToDefaults) {
    EngineConfig bad;
    bad.mesh.baseViewportSize = -1.0f;
    CanvasEngine engine(bad);
    EXPECT_EQ(engine.lastError(), CacheError::InvalidConfig);
    EXPECT_FLOAT_EQ(engine.service().meshConfig().baseViewportSize, 1000.0f);
}

TEST(EngineConfigTest, ErrorNamesAreStable) {
    EXPECT_STREQ(cacheErrorName(CacheError::Ok), "Ok");
    EXPECT_STREQ(cacheErrorName(CacheError::StaleEvictionRace), "StaleEvictionRace");
    EXPECT_STREQ(cacheErrorName(CacheError::InvalidConfig), "InvalidConfig");
}
