#pragma once

#include "roomflow/core/SimulationConfig.hpp"
#include "roomflow/postprocess/SimulationResult.hpp"

namespace roomflow::postprocess {

struct TemperatureStatistics {
    Real min = 0.0;
    Real max = 0.0;
    Real mean = 0.0;
    Real stddev = 0.0;
    Index cells = 0;
};

// Builds SimulationResult values from a grid state. Every division is
// guarded; degenerate inputs give defined values instead of NaN.
class ResultExtractor {
public:
    explicit ResultExtractor(const SimulationConfig& config,
                             const physics::ComfortConditions& comfort = physics::ComfortConditions());

    static Real maxVelocityMagnitude(const Grid& grid);
    static Real averageVelocityMagnitude(const Grid& grid);

    // Cells holding exactly zero are treated as unmeasured and skipped
    static TemperatureStatistics temperatureStatistics(const ScalarField3D& T);

    // clamp(1 - sigma/mean, 0, 1); exactly 1 only for identical values,
    // 0 when the mean is not positive
    static Real uniformityIndex(const TemperatureStatistics& stats);

    // clamp(1 - 10 sigma/mean, 0, 1)
    static Real mixingEfficiency(const TemperatureStatistics& stats);

    // |p(nx-2, ny/2, nz/2) - p(1, ny/2, nz/2)|. The border planes hold the
    // zero Dirichlet value, so the drop is taken between the outermost
    // interior cells; 0 when the grid has fewer than three cells along x.
    static Real pressureDrop(const ScalarField3D& p);

    // Air changes per hour for a supply flow in m^3/s
    Real airChangeRate(Real inletFlow) const;

    FlowStatistics computeStatistics(const Grid& grid, Real inletFlow) const;

    SimulationResult extract(const Grid& grid, std::vector<Real> history,
                             int iterations, RunStatus status, Real inletFlow) const;

private:
    Real roomVolume_;
    physics::ComfortConditions comfort_;
};

} // namespace roomflow::postprocess
