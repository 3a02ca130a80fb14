#include "roomflow/core/SimulationConfig.hpp"
#include "roomflow/core/Errors.hpp"
#include <cmath>
#include <sstream>

namespace roomflow {

namespace {

void requirePositive(Real value, const char* name) {
    if (!std::isfinite(value) || value <= Real(0)) {
        std::ostringstream ss;
        ss << name << " must be positive (got " << value << ")";
        throw ConfigurationError(ss.str());
    }
}

void requirePositive(long long value, const char* name) {
    if (value <= 0) {
        std::ostringstream ss;
        ss << name << " must be positive (got " << value << ")";
        throw ConfigurationError(ss.str());
    }
}

} // namespace

void SimulationConfig::validate() const {
    requirePositive(static_cast<long long>(nx), "nx");
    requirePositive(static_cast<long long>(ny), "ny");
    requirePositive(static_cast<long long>(nz), "nz");
    requirePositive(cellSize, "cellSize");
    requirePositive(density, "density");
    requirePositive(viscosity, "viscosity");
    requirePositive(thermalDiffusivity, "thermalDiffusivity");
    requirePositive(specificHeat, "specificHeat");
    requirePositive(timeStep, "timeStep");
    requirePositive(static_cast<long long>(maxIterations), "maxIterations");
    requirePositive(tolerance, "tolerance");
    requirePositive(ambientTemperature, "ambientTemperature");
    requirePositive(ambientPressure, "ambientPressure");
    requirePositive(static_cast<long long>(diffusionSweeps), "diffusionSweeps");
    requirePositive(static_cast<long long>(pressureSweeps), "pressureSweeps");

    if (buoyancy) {
        requirePositive(gravity, "gravity");
        requirePositive(thermalExpansion, "thermalExpansion");
    }

    // Index arithmetic is 32-bit
    const long long cells = static_cast<long long>(nx) * ny * nz;
    if (cells > static_cast<long long>(std::numeric_limits<Index>::max())) {
        throw ConfigurationError("grid of " + std::to_string(cells) +
                                 " cells exceeds the index range");
    }
}

std::string SimulationConfig::summary() const {
    std::ostringstream ss;
    ss << nx << "x" << ny << "x" << nz << " cells, h = " << cellSize
       << " m, dt = " << timeStep << " s, " << maxIterations
       << " iterations, tol = " << tolerance
       << ", sweeps (diffusion/pressure) = " << diffusionSweeps << "/" << pressureSweeps
       << ", poisson = " << toString(poissonSolver)
       << ", outlet = " << toString(outletTreatment)
       << (buoyancy ? ", buoyancy on" : "");
    return ss.str();
}

} // namespace roomflow
