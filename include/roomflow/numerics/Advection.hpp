#pragma once

#include "roomflow/core/Grid.hpp"

namespace roomflow::numerics {

// Semi-Lagrangian transport. Each interior cell traces back along the
// previous velocity by one timestep, in grid-index units, and samples the
// source field there. Unconditionally stable; border cells are left alone.
class SemiLagrangianAdvection {
public:
    explicit SemiLagrangianAdvection(Real dt) : dt_(dt) {}

    // dst(i,j,k) = src(i - dt*u0, j - dt*v0, k - dt*w0)
    void advect(ScalarField3D& dst, const ScalarField3D& src,
                const ScalarField3D& u0, const ScalarField3D& v0,
                const ScalarField3D& w0) const;

    // u, v, w from u0, v0, w0
    void advectVelocity(Grid& grid) const;

    // T from T0
    void advectTemperature(Grid& grid) const;

private:
    Real dt_;
};

} // namespace roomflow::numerics
