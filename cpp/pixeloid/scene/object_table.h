#ifndef PIXELOID_SCENE_OBJECT_TABLE_H
#define PIXELOID_SCENE_OBJECT_TABLE_H

#include "pixeloid/core/types.h"
#include "pixeloid/texture/visual_version.h"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace pixeloid {

// Uniform grid over world space. Objects spanning too many cells are kept in
// a side list that every query returns, so neither insertion nor lookup
// degenerates for huge objects.
class SpatialHashGrid {
public:
    explicit SpatialHashGrid(double cellSize);
    void insert(ObjectId id, const WorldBounds& bounds);
    void remove(ObjectId id);
    void clear();
    // Appends candidate ids (may contain duplicates); callers test exact bounds.
    void query(const WorldBounds& bounds, std::vector<ObjectId>& results) const;
    std::uint64_t cellSpan(const WorldBounds& bounds) const;

    static constexpr std::uint64_t kMaxCellsPerQuery = 4096;

private:
    double cellSize_;
    std::unordered_map<std::int64_t, std::vector<ObjectId>> cells_;
    std::unordered_map<ObjectId, std::vector<std::int64_t>> entityCells_;
    std::vector<ObjectId> oversized_;

    std::int64_t hash(std::int64_t x, std::int64_t y) const;
    std::int64_t cellOf(double v) const;
};

struct ObjectRecord {
    ObjectId id;
    WorldBounds bounds;
    texture::VisualAttributes visual;
    std::uint64_t visualVersion;
    std::uint32_t boundsRevision; // bumped whenever bounds change
};

// Objects supplied by shape management: id, world bounds, appearance.
class ObjectTable {
public:
    ObjectTable();

    // Inserts or updates. Returns true when the visual version changed.
    bool upsert(ObjectId id, const WorldBounds& bounds, const texture::VisualAttributes& visual);
    bool remove(ObjectId id);
    void clear();

    const ObjectRecord* find(ObjectId id) const;
    std::size_t size() const { return records_.size(); }

    // Ids whose bounds intersect `area`, ascending.
    void queryIntersecting(const WorldBounds& area, std::vector<ObjectId>& out) const;

    const std::unordered_map<ObjectId, ObjectRecord>& records() const { return records_; }

    static constexpr double kIndexCellSize = 64.0;

private:
    std::unordered_map<ObjectId, ObjectRecord> records_;
    SpatialHashGrid index_;
};

bool intersects(const WorldBounds& a, const WorldBounds& b);

} // namespace pixeloid

#endif // PIXELOID_SCENE_OBJECT_TABLE_H
