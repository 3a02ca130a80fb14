#pragma once

#include "roomflow/core/Grid.hpp"

namespace roomflow {

// Axis-aligned box in world coordinates (metres). position is the minimum
// corner; a zero extent along an axis describes a face.
struct Box {
    Vector3 position = Vector3::Zero();
    Vector3 size = Vector3::Zero();

    Box() = default;
    Box(const Vector3& pos, const Vector3& extent) : position(pos), size(extent) {}

    Vector3 min() const { return position.cwiseMin(position + size); }
    Vector3 max() const { return position.cwiseMax(position + size); }
    Real volume() const { return size.cwiseAbs().prod(); }
    bool isFinite() const { return position.allFinite() && size.allFinite(); }
};

// Inclusive range of grid indices
struct CellRange {
    Vector3i lower = Vector3i::Zero();
    Vector3i upper = Vector3i::Constant(-1);

    bool empty() const { return (upper.array() < lower.array()).any(); }

    Index count() const {
        if (empty()) return 0;
        return (upper - lower + Vector3i::Ones()).prod();
    }

    bool contains(Index i, Index j, Index k) const {
        return !empty() &&
               i >= lower.x() && i <= upper.x() &&
               j >= lower.y() && j <= upper.y() &&
               k >= lower.z() && k <= upper.z();
    }

    // Visit every (i, j, k) in the range, x fastest
    template<typename Func>
    void forEach(Func&& func) const {
        if (empty()) return;
        for (Index k = lower.z(); k <= upper.z(); ++k) {
            for (Index j = lower.y(); j <= upper.y(); ++j) {
                for (Index i = lower.x(); i <= upper.x(); ++i) {
                    func(i, j, k);
                }
            }
        }
    }
};

// Map a world box onto the cells it overlaps. The lower bound is
// floor(min / h), the upper bound ceil(max / h) - 1 (never below the lower
// bound), both clamped into the grid. Boxes entirely outside the domain, or
// with a non-finite corner, give an empty range.
CellRange toCellRange(const Box& box, const GridDimensions& dims, Real cellSize);

} // namespace roomflow
