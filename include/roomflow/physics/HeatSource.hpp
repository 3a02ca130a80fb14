#pragma once

#include "roomflow/core/Region.hpp"
#include <vector>

namespace roomflow {
struct SimulationConfig;
}

namespace roomflow::physics {

// Volumetric heat release over a box, e.g. a light fixture or a rack of plants
struct HeatSource {
    HeatSourceKind kind = HeatSourceKind::EQUIPMENT;
    Box box;
    Real power = 0.0;   // W

    HeatSource() = default;
    HeatSource(HeatSourceKind k, const Box& b, Real p) : kind(k), box(b), power(p) {}
};

// Explicit Euler injection of source power into the temperature field.
// Each source spreads its power evenly over the cells its box overlaps:
//   dT = (P / N) * dt / (rho * h^3 * cp)
// Overlapping sources add.
class HeatSourceIntegrator {
public:
    explicit HeatSourceIntegrator(const SimulationConfig& config);

    void add(const HeatSource& source);
    void clear() { sources_.clear(); }

    std::size_t size() const { return sources_.size(); }
    bool empty() const { return sources_.empty(); }
    const std::vector<HeatSource>& sources() const { return sources_; }

    CellRange cellRange(const HeatSource& source) const {
        return toCellRange(source.box, dims_, cellSize_);
    }

    // Per-cell temperature increment of one source for one timestep,
    // zero when the box misses the grid
    Real temperatureIncrement(const HeatSource& source) const;

    void apply(Grid& grid) const;

    // Sum of source powers that land on the grid, W
    Real totalPower() const;

private:
    GridDimensions dims_;
    Real cellSize_;
    Real dt_;
    Real cellHeatCapacity_;   // rho * h^3 * cp, J/K
    std::vector<HeatSource> sources_;
};

} // namespace roomflow::physics
