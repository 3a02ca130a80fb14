#pragma once

#include "roomflow/core/CancellationToken.hpp"
#include "roomflow/core/Grid.hpp"

namespace roomflow::numerics {

// Implicit diffusion solved approximately by Gauss-Seidel relaxation:
//   phi = (phi* + a * sum of six neighbours) / (1 + 6a),  a = dt * diffusivity
// where phi* is the field on entry. Interior cells only.
class DiffusionSolver {
public:
    struct Settings {
        int sweeps = 20;
    };

    DiffusionSolver(const GridDimensions& dims) : DiffusionSolver(dims, Settings()) {}
    DiffusionSolver(const GridDimensions& dims, const Settings& settings);

    const Settings& settings() const { return settings_; }

    // Relax field in place with coefficient a. Returns false if the token
    // was cancelled between sweeps, leaving the field partially relaxed.
    bool diffuse(ScalarField3D& field, Real a,
                 const CancellationToken* token = nullptr);

    // One Gauss-Seidel sweep against a fixed source
    static void sweep(ScalarField3D& field, const ScalarField3D& source, Real a);

    // Velocity components with the kinematic viscosity
    bool diffuseVelocity(Grid& grid, Real dt, Real kinematicViscosity,
                         const CancellationToken* token = nullptr);

    bool diffuseTemperature(Grid& grid, Real dt, Real thermalDiffusivity,
                            const CancellationToken* token = nullptr);

private:
    Settings settings_;
    ScalarField3D source_;  // Entry values, reused across calls
};

} // namespace roomflow::numerics
