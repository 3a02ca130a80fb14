#pragma once

#include "roomflow/core/Grid.hpp"

namespace roomflow::physics {

// Boussinesq body force on the vertical (z) velocity component:
//   w += dt * g * beta * (T - T_ambient)
// Interior cells only.
class BoussinesqBuoyancy {
public:
    BoussinesqBuoyancy(Real gravity, Real thermalExpansion, Real referenceTemperature)
        : gravity_(gravity), beta_(thermalExpansion), Tref_(referenceTemperature) {}

    void apply(Grid& grid, Real dt) const;

    // Vertical acceleration for a given temperature, m/s^2
    Real acceleration(Real temperature) const {
        return gravity_ * beta_ * (temperature - Tref_);
    }

private:
    Real gravity_;
    Real beta_;
    Real Tref_;
};

} // namespace roomflow::physics
