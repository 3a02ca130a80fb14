#include "roomflow/physics/HeatSource.hpp"
#include "roomflow/core/Errors.hpp"
#include "roomflow/core/SimulationConfig.hpp"
#include "roomflow/io/Logger.hpp"
#include <cmath>

namespace roomflow::physics {

HeatSourceIntegrator::HeatSourceIntegrator(const SimulationConfig& config)
    : dims_(config.dimensions()),
      cellSize_(config.cellSize),
      dt_(config.timeStep),
      cellHeatCapacity_(config.density * config.cellVolume() * config.specificHeat) {
}

void HeatSourceIntegrator::add(const HeatSource& source) {
    if (!std::isfinite(source.power)) {
        throw ConfigurationError(std::string("heat source '") + toString(source.kind) +
                                 "' has a non-finite power");
    }
    if (!source.box.isFinite()) {
        throw ConfigurationError(std::string("heat source '") + toString(source.kind) +
                                 "' has a non-finite position or size");
    }

    const CellRange range = cellRange(source);
    if (range.empty()) {
        LOG_WARN("Heat source '{}' ({} W) lies outside the domain and has no effect",
                 toString(source.kind), source.power);
    } else {
        LOG_DEBUG("Registered {} heat source of {} W over {} cells, dT = {:.4e} K/step",
                  toString(source.kind), source.power, range.count(),
                  temperatureIncrement(source));
    }

    sources_.push_back(source);
}

Real HeatSourceIntegrator::temperatureIncrement(const HeatSource& source) const {
    const Index cells = cellRange(source).count();
    if (cells == 0) {
        return 0.0;
    }

    const Real powerPerCell = source.power / cells;
    return powerPerCell * dt_ / cellHeatCapacity_;
}

void HeatSourceIntegrator::apply(Grid& grid) const {
    if (grid.dims() != dims_) {
        throw RoomflowError("Heat source integrator built for a different grid");
    }

    ScalarField3D& T = grid.temperature();
    for (const auto& source : sources_) {
        const Real dT = temperatureIncrement(source);
        if (dT == 0) continue;

        cellRange(source).forEach([&](Index i, Index j, Index k) {
            T(i, j, k) += dT;
        });
    }
}

Real HeatSourceIntegrator::totalPower() const {
    Real total = 0.0;
    for (const auto& source : sources_) {
        if (!cellRange(source).empty()) {
            total += source.power;
        }
    }
    return total;
}

} // namespace roomflow::physics
