#include "pixeloid/scene/object_table.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pixeloid {

namespace {

constexpr std::uint64_t kMaxCellsPerObject = 1024;

} // namespace

bool intersects(const WorldBounds& a, const WorldBounds& b) {
    return a.minX < b.maxX && a.maxX > b.minX && a.minY < b.maxY && a.maxY > b.minY;
}

// =============================================================================
// SpatialHashGrid
// =============================================================================

SpatialHashGrid::SpatialHashGrid(double cellSize) : cellSize_(cellSize) {}

std::int64_t SpatialHashGrid::hash(std::int64_t ix, std::int64_t iy) const {
    return (ix * 73856093) ^ (iy * 19349663);
}

std::int64_t SpatialHashGrid::cellOf(double v) const {
    const double c = std::floor(v / cellSize_);
    constexpr double kLimit = static_cast<double>(std::numeric_limits<std::int32_t>::max());
    return static_cast<std::int64_t>(std::max(-kLimit, std::min(kLimit, c)));
}

std::uint64_t SpatialHashGrid::cellSpan(const WorldBounds& bounds) const {
    const std::uint64_t nx = static_cast<std::uint64_t>(cellOf(bounds.maxX) - cellOf(bounds.minX) + 1);
    const std::uint64_t ny = static_cast<std::uint64_t>(cellOf(bounds.maxY) - cellOf(bounds.minY) + 1);
    return nx * ny;
}

void SpatialHashGrid::insert(ObjectId id, const WorldBounds& bounds) {
    if (cellSpan(bounds) > kMaxCellsPerObject) {
        oversized_.push_back(id);
        entityCells_[id] = {};
        return;
    }

    const std::int64_t minX = cellOf(bounds.minX);
    const std::int64_t maxX = cellOf(bounds.maxX);
    const std::int64_t minY = cellOf(bounds.minY);
    const std::int64_t maxY = cellOf(bounds.maxY);

    std::vector<std::int64_t> cellKeys;
    for (std::int64_t x = minX; x <= maxX; ++x) {
        for (std::int64_t y = minY; y <= maxY; ++y) {
            const std::int64_t key = hash(x, y);
            cells_[key].push_back(id);
            cellKeys.push_back(key);
        }
    }
    entityCells_[id] = std::move(cellKeys);
}

void SpatialHashGrid::remove(ObjectId id) {
    auto it = entityCells_.find(id);
    if (it == entityCells_.end()) return;

    if (it->second.empty()) {
        oversized_.erase(std::remove(oversized_.begin(), oversized_.end(), id), oversized_.end());
    }
    for (const std::int64_t key : it->second) {
        auto cell = cells_.find(key);
        if (cell == cells_.end()) continue;
        auto& list = cell->second;
        // Swap-remove
        for (std::size_t i = 0; i < list.size(); ++i) {
            if (list[i] == id) {
                list[i] = list.back();
                list.pop_back();
                break;
            }
        }
        if (list.empty()) {
            cells_.erase(cell);
        }
    }
    entityCells_.erase(it);
}

void SpatialHashGrid::clear() {
    cells_.clear();
    entityCells_.clear();
    oversized_.clear();
}

void SpatialHashGrid::query(const WorldBounds& bounds, std::vector<ObjectId>& results) const {
    results.insert(results.end(), oversized_.begin(), oversized_.end());

    const std::int64_t minX = cellOf(bounds.minX);
    const std::int64_t maxX = cellOf(bounds.maxX);
    const std::int64_t minY = cellOf(bounds.minY);
    const std::int64_t maxY = cellOf(bounds.maxY);

    for (std::int64_t x = minX; x <= maxX; ++x) {
        for (std::int64_t y = minY; y <= maxY; ++y) {
            auto it = cells_.find(hash(x, y));
            if (it != cells_.end()) {
                results.insert(results.end(), it->second.begin(), it->second.end());
            }
        }
    }
}

// =============================================================================
// ObjectTable
// =============================================================================

ObjectTable::ObjectTable() : index_(kIndexCellSize) {}

bool ObjectTable::upsert(ObjectId id, const WorldBounds& bounds, const texture::VisualAttributes& visual) {
    const std::uint64_t version = texture::computeVisualVersion(visual);

    auto it = records_.find(id);
    if (it == records_.end()) {
        records_.emplace(id, ObjectRecord{id, bounds, visual, version, 1});
        index_.insert(id, bounds);
        return true;
    }

    ObjectRecord& rec = it->second;
    if (rec.bounds != bounds) {
        index_.remove(id); // re-insert strategy
        index_.insert(id, bounds);
        rec.bounds = bounds;
        rec.boundsRevision++;
    }
    const bool visualChanged = rec.visualVersion != version;
    rec.visual = visual;
    rec.visualVersion = version;
    return visualChanged;
}

bool ObjectTable::remove(ObjectId id) {
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    index_.remove(id);
    records_.erase(it);
    return true;
}

void ObjectTable::clear() {
    records_.clear();
    index_.clear();
}

const ObjectRecord* ObjectTable::find(ObjectId id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

void ObjectTable::queryIntersecting(const WorldBounds& area, std::vector<ObjectId>& out) const {
    out.clear();
    if (index_.cellSpan(area) > SpatialHashGrid::kMaxCellsPerQuery) {
        // Zoomed far out: scanning every record is cheaper than walking the cells.
        for (const auto& kv : records_) {
            if (intersects(kv.second.bounds, area)) out.push_back(kv.first);
        }
        std::sort(out.begin(), out.end());
        return;
    }

    index_.query(area, out);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    out.erase(std::remove_if(out.begin(), out.end(), [&](ObjectId id) {
        const ObjectRecord* rec = find(id);
        return rec == nullptr || !intersects(rec->bounds, area);
    }), out.end());
}

} // namespace pixeloid
