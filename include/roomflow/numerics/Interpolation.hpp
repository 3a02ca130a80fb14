#pragma once

#include "roomflow/core/Grid.hpp"

namespace roomflow::numerics {

// Trilinear interpolation of a cell-centred field at a fractional grid-index
// coordinate. Coordinates are clamped to [0, n-1] on each axis; at integer
// coordinates the stored value is returned exactly.
Real trilinear(const ScalarField3D& field, Real x, Real y, Real z);

inline Real trilinear(const ScalarField3D& field, const Vector3& point) {
    return trilinear(field, point.x(), point.y(), point.z());
}

} // namespace roomflow::numerics
