#pragma once

#include "roomflow/solvers/PoissonSolver.hpp"

namespace roomflow::solvers {

// Stable-fluids projection of the velocity field towards zero divergence.
// All differences are central and in grid-index units; only interior cells
// are touched.
class PressureProjection {
public:
    explicit PressureProjection(UniquePtr<PoissonSolver> poisson);

    // div = -0.5 * (du/dx + dv/dy + dw/dz), pressure reset to zero
    static void computeDivergence(Grid& grid);

    // Subtract 0.5 * central pressure difference from each component
    static void subtractGradient(Grid& grid);

    // Full projection. Returns the Poisson outcome; when cancelled the
    // gradient is not applied.
    PoissonResult project(Grid& grid, const CancellationToken* token = nullptr);

    // Mean |du/dx + dv/dy + dw/dz| over interior cells
    static Real meanAbsDivergence(const Grid& grid);

private:
    UniquePtr<PoissonSolver> poisson_;
};

} // namespace roomflow::solvers
