#include "roomflow/physics/Buoyancy.hpp"

namespace roomflow::physics {

void BoussinesqBuoyancy::apply(Grid& grid, Real dt) const {
    const GridDimensions& dims = grid.dims();
    const ScalarField3D& T = grid.temperature();
    ScalarField3D& w = grid.w();

    for (Index k = 1; k < dims.nz - 1; ++k) {
        for (Index j = 1; j < dims.ny - 1; ++j) {
            for (Index i = 1; i < dims.nx - 1; ++i) {
                const Index n = dims.idx(i, j, k);
                w[n] += dt * acceleration(T[n]);
            }
        }
    }
}

} // namespace roomflow::physics
