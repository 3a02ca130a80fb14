#include "roomflow/numerics/Interpolation.hpp"
#include <algorithm>
#include <cmath>

namespace roomflow::numerics {

namespace {

// Split a clamped coordinate into a base index and a weight in [0, 1).
// The base never exceeds n-2 so base+1 stays inside the grid.
inline void locate(Real x, Index n, Index& base, Real& weight) {
    if (n <= 1) {
        base = 0;
        weight = 0.0;
        return;
    }

    x = std::clamp(x, Real(0), Real(n - 1));
    base = std::min(static_cast<Index>(std::floor(x)), n - 2);
    weight = x - base;
}

} // namespace

Real trilinear(const ScalarField3D& field, Real x, Real y, Real z) {
    const GridDimensions& dims = field.dims();

    Index i0, j0, k0;
    Real sx, sy, sz;
    locate(x, dims.nx, i0, sx);
    locate(y, dims.ny, j0, sy);
    locate(z, dims.nz, k0, sz);

    const Index i1 = std::min(i0 + 1, dims.nx - 1);
    const Index j1 = std::min(j0 + 1, dims.ny - 1);
    const Index k1 = std::min(k0 + 1, dims.nz - 1);

    // Exact at sample points
    if (sx == 0 && sy == 0 && sz == 0) {
        return field(i0, j0, k0);
    }

    const Real c00 = field(i0, j0, k0) * (1 - sx) + field(i1, j0, k0) * sx;
    const Real c10 = field(i0, j1, k0) * (1 - sx) + field(i1, j1, k0) * sx;
    const Real c01 = field(i0, j0, k1) * (1 - sx) + field(i1, j0, k1) * sx;
    const Real c11 = field(i0, j1, k1) * (1 - sx) + field(i1, j1, k1) * sx;

    const Real c0 = c00 * (1 - sy) + c10 * sy;
    const Real c1 = c01 * (1 - sy) + c11 * sy;

    return c0 * (1 - sz) + c1 * sz;
}

} // namespace roomflow::numerics
