#include "roomflow/numerics/Diffusion.hpp"
#include "roomflow/core/Errors.hpp"

namespace roomflow::numerics {

DiffusionSolver::DiffusionSolver(const GridDimensions& dims, const Settings& settings)
    : settings_(settings), source_("diffusionSource", dims) {
    if (settings_.sweeps <= 0) {
        throw ConfigurationError("diffusion sweeps must be positive");
    }
}

void DiffusionSolver::sweep(ScalarField3D& field, const ScalarField3D& source, Real a) {
    const GridDimensions& dims = field.dims();
    const Index sx = 1;
    const Index sy = dims.nx;
    const Index sz = dims.nx * dims.ny;
    const Real denom = 1 + 6 * a;

    for (Index k = 1; k < dims.nz - 1; ++k) {
        for (Index j = 1; j < dims.ny - 1; ++j) {
            for (Index i = 1; i < dims.nx - 1; ++i) {
                const Index n = dims.idx(i, j, k);
                const Real neighbours = field[n - sx] + field[n + sx] +
                                        field[n - sy] + field[n + sy] +
                                        field[n - sz] + field[n + sz];
                field[n] = (source[n] + a * neighbours) / denom;
            }
        }
    }
}

bool DiffusionSolver::diffuse(ScalarField3D& field, Real a, const CancellationToken* token) {
    if (field.dims() != source_.dims()) {
        throw RoomflowError("Diffusion of '" + field.name() + "' on a different grid");
    }

    source_.copyFrom(field);
    for (int s = 0; s < settings_.sweeps; ++s) {
        if (isCancelled(token)) {
            return false;
        }
        sweep(field, source_, a);
    }
    return true;
}

bool DiffusionSolver::diffuseVelocity(Grid& grid, Real dt, Real kinematicViscosity,
                                      const CancellationToken* token) {
    const Real a = dt * kinematicViscosity;
    for (int axis = 0; axis < 3; ++axis) {
        if (!diffuse(grid.velocity(axis), a, token)) {
            return false;
        }
    }
    return true;
}

bool DiffusionSolver::diffuseTemperature(Grid& grid, Real dt, Real thermalDiffusivity,
                                         const CancellationToken* token) {
    return diffuse(grid.temperature(), dt * thermalDiffusivity, token);
}

} // namespace roomflow::numerics
