#include "roomflow/numerics/Advection.hpp"
#include "roomflow/numerics/Interpolation.hpp"
#include "roomflow/core/Errors.hpp"

namespace roomflow::numerics {

void SemiLagrangianAdvection::advect(ScalarField3D& dst, const ScalarField3D& src,
                                     const ScalarField3D& u0, const ScalarField3D& v0,
                                     const ScalarField3D& w0) const {
    const GridDimensions& dims = dst.dims();
    if (src.dims() != dims || u0.dims() != dims || v0.dims() != dims || w0.dims() != dims) {
        throw RoomflowError("Advection of '" + src.name() + "' with mismatched fields");
    }
    if (&dst == &src) {
        throw RoomflowError("Advection of '" + src.name() + "' cannot run in place");
    }

    for (Index k = 1; k < dims.nz - 1; ++k) {
        for (Index j = 1; j < dims.ny - 1; ++j) {
            for (Index i = 1; i < dims.nx - 1; ++i) {
                const Index n = dims.idx(i, j, k);

                // Departure point
                const Real x = i - dt_ * u0[n];
                const Real y = j - dt_ * v0[n];
                const Real z = k - dt_ * w0[n];

                dst[n] = trilinear(src, x, y, z);
            }
        }
    }
}

void SemiLagrangianAdvection::advectVelocity(Grid& grid) const {
    const ScalarField3D& u0 = grid.u0();
    const ScalarField3D& v0 = grid.v0();
    const ScalarField3D& w0 = grid.w0();

    advect(grid.u(), u0, u0, v0, w0);
    advect(grid.v(), v0, u0, v0, w0);
    advect(grid.w(), w0, u0, v0, w0);
}

void SemiLagrangianAdvection::advectTemperature(Grid& grid) const {
    advect(grid.temperature(), grid.temperature0(), grid.u0(), grid.v0(), grid.w0());
}

} // namespace roomflow::numerics
