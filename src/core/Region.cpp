#include "roomflow/core/Region.hpp"
#include <algorithm>
#include <cmath>

namespace roomflow {

CellRange toCellRange(const Box& box, const GridDimensions& dims, Real cellSize) {
    CellRange range;
    if (!box.isFinite()) {
        return range;
    }

    const Vector3 lo = box.min();
    const Vector3 hi = box.max();
    const Index n[3] = {dims.nx, dims.ny, dims.nz};

    for (int axis = 0; axis < 3; ++axis) {
        const Real extent = n[axis] * cellSize;
        if (hi[axis] < Real(0) || lo[axis] > extent) {
            return CellRange{};
        }

        // Clamp in floating point before narrowing to Index
        const Real top = Real(n[axis] - 1);
        const Real first = std::floor(lo[axis] / cellSize);
        const Real last = std::max(first, std::ceil(hi[axis] / cellSize) - 1);

        range.lower[axis] = static_cast<Index>(std::clamp(first, Real(0), top));
        range.upper[axis] = static_cast<Index>(std::clamp(last, Real(0), top));
    }

    return range;
}

} // namespace roomflow
