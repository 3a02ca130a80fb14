#include "roomflow/solvers/PressureProjection.hpp"
#include "roomflow/core/Errors.hpp"
#include <cmath>

namespace roomflow::solvers {

PressureProjection::PressureProjection(UniquePtr<PoissonSolver> poisson)
    : poisson_(std::move(poisson)) {
    if (!poisson_) {
        throw ConfigurationError("pressure projection requires a Poisson solver");
    }
}

void PressureProjection::computeDivergence(Grid& grid) {
    const GridDimensions& dims = grid.dims();
    const ScalarField3D& u = grid.u();
    const ScalarField3D& v = grid.v();
    const ScalarField3D& w = grid.w();
    ScalarField3D& div = grid.divergence();
    const Index sy = dims.nx;
    const Index sz = dims.nx * dims.ny;

    for (Index k = 1; k < dims.nz - 1; ++k) {
        for (Index j = 1; j < dims.ny - 1; ++j) {
            for (Index i = 1; i < dims.nx - 1; ++i) {
                const Index n = dims.idx(i, j, k);
                div[n] = -0.5 * ((u[n + 1] - u[n - 1]) +
                                 (v[n + sy] - v[n - sy]) +
                                 (w[n + sz] - w[n - sz]));
            }
        }
    }

    grid.pressure().fill(0.0);
}

void PressureProjection::subtractGradient(Grid& grid) {
    const GridDimensions& dims = grid.dims();
    const ScalarField3D& p = grid.pressure();
    ScalarField3D& u = grid.u();
    ScalarField3D& v = grid.v();
    ScalarField3D& w = grid.w();
    const Index sy = dims.nx;
    const Index sz = dims.nx * dims.ny;

    for (Index k = 1; k < dims.nz - 1; ++k) {
        for (Index j = 1; j < dims.ny - 1; ++j) {
            for (Index i = 1; i < dims.nx - 1; ++i) {
                const Index n = dims.idx(i, j, k);
                u[n] -= 0.5 * (p[n + 1] - p[n - 1]);
                v[n] -= 0.5 * (p[n + sy] - p[n - sy]);
                w[n] -= 0.5 * (p[n + sz] - p[n - sz]);
            }
        }
    }
}

PoissonResult PressureProjection::project(Grid& grid, const CancellationToken* token) {
    computeDivergence(grid);

    PoissonResult result = poisson_->solve(grid.pressure(), grid.divergence(), token);
    if (result.cancelled) {
        return result;
    }

    subtractGradient(grid);
    return result;
}

Real PressureProjection::meanAbsDivergence(const Grid& grid) {
    const GridDimensions& dims = grid.dims();
    const ScalarField3D& u = grid.u();
    const ScalarField3D& v = grid.v();
    const ScalarField3D& w = grid.w();
    const Index sy = dims.nx;
    const Index sz = dims.nx * dims.ny;

    Real sum = 0.0;
    Index count = 0;
    for (Index k = 1; k < dims.nz - 1; ++k) {
        for (Index j = 1; j < dims.ny - 1; ++j) {
            for (Index i = 1; i < dims.nx - 1; ++i) {
                const Index n = dims.idx(i, j, k);
                sum += std::abs(0.5 * ((u[n + 1] - u[n - 1]) +
                                       (v[n + sy] - v[n - sy]) +
                                       (w[n + sz] - w[n - sz])));
                ++count;
            }
        }
    }
    return count > 0 ? sum / count : Real(0);
}

} // namespace roomflow::solvers
