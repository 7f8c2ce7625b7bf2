#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "pixeloid/engine.h"

#ifdef EMSCRIPTEN
using namespace pixeloid;

namespace {

struct MeshBufferMeta {
    std::uint32_t generation;
    std::uint32_t vertexCount;
    std::uint32_t indexCount;
    std::uintptr_t vertexPtr; // byte offset in WASM linear memory
    std::uintptr_t indexPtr;
    bool valid;
};

struct TextureResult {
    std::uint32_t error;     // CacheError
    std::uint32_t textureId;
    std::uint32_t textureWidth;
    std::uint32_t textureHeight;
    float frameX, frameY, frameWidth, frameHeight;
    std::uint32_t visibility;
    double drawMinX, drawMinY, drawMaxX, drawMaxY;
    bool captured;
};

struct PointResult {
    double x;
    double y;
};

// JS-facing owner: routes the engine's render/release callbacks to JS functions.
class CanvasEngineJs {
public:
    CanvasEngineJs() {
        engine_.setTextureReleaseHook(this, &CanvasEngineJs::releaseThunk);
    }

    // Release textures while the JS callbacks are still alive.
    ~CanvasEngineJs() { engine_.clear(); }

    CanvasEngineJs(const CanvasEngineJs&) = delete;
    CanvasEngineJs& operator=(const CanvasEngineJs&) = delete;

    void setRenderCallback(emscripten::val fn) { renderFn_ = fn; }
    void setReleaseCallback(emscripten::val fn) { releaseFn_ = fn; }

    std::uint32_t initialize(float scale, float width, float height) {
        return static_cast<std::uint32_t>(engine_.initialize(scale, ViewportSize{width, height}));
    }

    std::uint32_t beginFrame(float scale, float width, float height) {
        return static_cast<std::uint32_t>(engine_.beginFrame(scale, ViewportSize{width, height}));
    }

    MeshBufferMeta getActiveMesh() const {
        return metaFor(engine_.activeMesh());
    }

    MeshBufferMeta getMesh(float scale) {
        mesh::MeshHandle mesh;
        if (engine_.meshFor(scale, mesh) != CacheError::Ok) {
            return MeshBufferMeta{0, 0, 0, 0, 0, false};
        }
        // Keep the buffers alive for the JS side until the next call.
        pinned_ = mesh;
        return metaFor(mesh);
    }

    void setViewportOffset(double x, double y) { engine_.setViewportOffset(WorldPoint{x, y}); }
    void panBy(double dx, double dy) { engine_.panBy(dx, dy); }

    PointResult toWorld(float x, float y) const {
        const WorldPoint w = engine_.toWorld(VertexPoint{x, y});
        return PointResult{w.x, w.y};
    }

    PointResult toVertex(double x, double y) const {
        const VertexPoint v = engine_.toVertex(WorldPoint{x, y});
        return PointResult{v.x, v.y};
    }

    bool upsertObject(std::uint32_t id, double minX, double minY, double maxX, double maxY,
                      std::uint32_t kind, std::uint32_t strokeColor, std::uint32_t fillColor,
                      bool fillEnabled, float strokeWidth, float width, float height, float radius,
                      std::uint32_t createdAt) {
        texture::VisualAttributes visual;
        visual.kind = static_cast<texture::ShapeKind>(kind);
        visual.strokeColor = strokeColor;
        visual.fillColor = fillColor;
        visual.fillEnabled = fillEnabled;
        visual.strokeWidth = strokeWidth;
        visual.width = width;
        visual.height = height;
        visual.radius = radius;
        visual.createdAt = createdAt;
        return engine_.upsertObject(id, WorldBounds{minX, minY, maxX, maxY}, visual);
    }

    bool removeObject(std::uint32_t id) { return engine_.removeObject(id); }

    std::vector<std::uint32_t> queryVisible() const {
        std::vector<ObjectId> ids;
        engine_.queryVisible(ids);
        return ids;
    }

    TextureResult getOrCreateTexture(std::uint32_t id, float scale) {
        texture::TextureLookup lookup{};
        const texture::RenderCallback render{this, &CanvasEngineJs::renderThunk};
        return toResult(engine_.getOrCreateTexture(id, scale, render, lookup), lookup);
    }

    TextureResult textureFor(std::uint32_t id, float scale) {
        texture::TextureLookup lookup{};
        return toResult(engine_.textureFor(id, scale, lookup), lookup);
    }

    std::uint32_t onIdle(double budgetMs) { return engine_.onIdle(budgetMs); }
    void requestSweep() { engine_.requestSweep(); }
    void clear() { pinned_.reset(); engine_.clear(); }

    EngineStats getStats() const { return engine_.getStats(); }
    std::uint32_t getLastError() const { return static_cast<std::uint32_t>(engine_.lastError()); }

private:
    static MeshBufferMeta metaFor(const mesh::MeshHandle& mesh) {
        if (!mesh) return MeshBufferMeta{0, 0, 0, 0, 0, false};
        return MeshBufferMeta{
            mesh->generation,
            static_cast<std::uint32_t>(mesh->vertexBuffer.size() / meshFloatsPerVertex),
            static_cast<std::uint32_t>(mesh->indexBuffer.size()),
            reinterpret_cast<std::uintptr_t>(mesh->vertexBuffer.data()),
            reinterpret_cast<std::uintptr_t>(mesh->indexBuffer.data()),
            true,
        };
    }

    static TextureResult toResult(CacheError err, const texture::TextureLookup& lookup) {
        TextureResult r{};
        r.error = static_cast<std::uint32_t>(err);
        if (err != CacheError::Ok) return r;
        r.textureId = lookup.texture.id;
        r.textureWidth = lookup.texture.width;
        r.textureHeight = lookup.texture.height;
        r.frameX = lookup.frame.x;
        r.frameY = lookup.frame.y;
        r.frameWidth = lookup.frame.width;
        r.frameHeight = lookup.frame.height;
        r.visibility = static_cast<std::uint32_t>(lookup.visibility);
        r.drawMinX = lookup.drawBounds.minX;
        r.drawMinY = lookup.drawBounds.minY;
        r.drawMaxX = lookup.drawBounds.maxX;
        r.drawMaxY = lookup.drawBounds.maxY;
        r.captured = lookup.captured;
        return r;
    }

    // JS returns a texture id (0 on failure) for the requested capture.
    static bool renderThunk(void* ctx, const texture::RasterRequest& request, TextureHandle& out) {
        auto* self = static_cast<CanvasEngineJs*>(ctx);
        if (self->renderFn_.isUndefined() || self->renderFn_.isNull()) return false;
        const emscripten::val result = self->renderFn_(
            request.objectId, request.scale,
            request.screenOrigin.x, request.screenOrigin.y,
            request.pixelWidth, request.pixelHeight);
        const std::uint32_t id = result.isNumber() ? result.as<std::uint32_t>() : 0u;
        out = TextureHandle{id, request.pixelWidth, request.pixelHeight};
        return id != 0;
    }

    static void releaseThunk(void* ctx, const TextureHandle& texture) {
        auto* self = static_cast<CanvasEngineJs*>(ctx);
        if (self->releaseFn_.isUndefined() || self->releaseFn_.isNull()) return;
        self->releaseFn_(texture.id);
    }

    CanvasEngine engine_;
    mesh::MeshHandle pinned_;
    emscripten::val renderFn_ = emscripten::val::undefined();
    emscripten::val releaseFn_ = emscripten::val::undefined();
};

} // namespace

EMSCRIPTEN_BINDINGS(pixeloid_module) {
    emscripten::register_vector<std::uint32_t>("VectorUInt32");

    emscripten::enum_<CacheError>("CacheError")
        .value("Ok", CacheError::Ok)
        .value("InvalidScale", CacheError::InvalidScale)
        .value("DegenerateBounds", CacheError::DegenerateBounds)
        .value("ResourceCreationFailed", CacheError::ResourceCreationFailed)
        .value("StaleEvictionRace", CacheError::StaleEvictionRace)
        .value("UnknownObject", CacheError::UnknownObject)
        .value("ReentrantRender", CacheError::ReentrantRender)
        .value("CacheMiss", CacheError::CacheMiss)
        .value("InvalidConfig", CacheError::InvalidConfig);

    emscripten::value_object<MeshBufferMeta>("MeshBufferMeta")
        .field("generation", &MeshBufferMeta::generation)
        .field("vertexCount", &MeshBufferMeta::vertexCount)
        .field("indexCount", &MeshBufferMeta::indexCount)
        .field("vertexPtr", &MeshBufferMeta::vertexPtr)
        .field("indexPtr", &MeshBufferMeta::indexPtr)
        .field("valid", &MeshBufferMeta::valid);

    emscripten::value_object<TextureResult>("TextureResult")
        .field("error", &TextureResult::error)
        .field("textureId", &TextureResult::textureId)
        .field("textureWidth", &TextureResult::textureWidth)
        .field("textureHeight", &TextureResult::textureHeight)
        .field("frameX", &TextureResult::frameX)
        .field("frameY", &TextureResult::frameY)
        .field("frameWidth", &TextureResult::frameWidth)
        .field("frameHeight", &TextureResult::frameHeight)
        .field("visibility", &TextureResult::visibility)
        .field("drawMinX", &TextureResult::drawMinX)
        .field("drawMinY", &TextureResult::drawMinY)
        .field("drawMaxX", &TextureResult::drawMaxX)
        .field("drawMaxY", &TextureResult::drawMaxY)
        .field("captured", &TextureResult::captured);

    emscripten::value_object<PointResult>("PointResult")
        .field("x", &PointResult::x)
        .field("y", &PointResult::y);

    emscripten::value_object<CacheCounters>("CacheCounters")
        .field("meshGenerations", &CacheCounters::meshGenerations)
        .field("meshCacheHits", &CacheCounters::meshCacheHits)
        .field("meshCacheMisses", &CacheCounters::meshCacheMisses)
        .field("evictedMeshes", &CacheCounters::evictedMeshes)
        .field("textureCaptures", &CacheCounters::textureCaptures)
        .field("textureCacheHits", &CacheCounters::textureCacheHits)
        .field("evictedTextures", &CacheCounters::evictedTextures)
        .field("releasedTextures", &CacheCounters::releasedTextures)
        .field("largeTextureAllocations", &CacheCounters::largeTextureAllocations)
        .field("skippedObjects", &CacheCounters::skippedObjects)
        .field("completedPregenerations", &CacheCounters::completedPregenerations)
        .field("droppedPregenerations", &CacheCounters::droppedPregenerations)
        .field("sweepCount", &CacheCounters::sweepCount);

    emscripten::value_object<EngineStats>("EngineStats")
        .field("cachedScaleCount", &EngineStats::cachedScaleCount)
        .field("cachedTextureCount", &EngineStats::cachedTextureCount)
        .field("visibilityEntryCount", &EngineStats::visibilityEntryCount)
        .field("pendingIdleTasks", &EngineStats::pendingIdleTasks)
        .field("adjacentCachedCount", &EngineStats::adjacentCachedCount)
        .field("criticalCached", &EngineStats::criticalCached)
        .field("memoryEfficient", &EngineStats::memoryEfficient)
        .field("counters", &EngineStats::counters);

    emscripten::class_<CanvasEngineJs>("CanvasEngine")
        .constructor<>()
        .function("setRenderCallback", &CanvasEngineJs::setRenderCallback)
        .function("setReleaseCallback", &CanvasEngineJs::setReleaseCallback)
        .function("initialize", &CanvasEngineJs::initialize)
        .function("beginFrame", &CanvasEngineJs::beginFrame)
        .function("getActiveMesh", &CanvasEngineJs::getActiveMesh)
        .function("getMesh", &CanvasEngineJs::getMesh)
        .function("setViewportOffset", &CanvasEngineJs::setViewportOffset)
        .function("panBy", &CanvasEngineJs::panBy)
        .function("toWorld", &CanvasEngineJs::toWorld)
        .function("toVertex", &CanvasEngineJs::toVertex)
        .function("upsertObject", &CanvasEngineJs::upsertObject)
        .function("removeObject", &CanvasEngineJs::removeObject)
        .function("queryVisible", &CanvasEngineJs::queryVisible)
        .function("getOrCreateTexture", &CanvasEngineJs::getOrCreateTexture)
        .function("textureFor", &CanvasEngineJs::textureFor)
        .function("onIdle", &CanvasEngineJs::onIdle)
        .function("requestSweep", &CanvasEngineJs::requestSweep)
        .function("clear", &CanvasEngineJs::clear)
        .function("getStats", &CanvasEngineJs::getStats)
        .function("getLastError", &CanvasEngineJs::getLastError);
}
#endif
