#include "roomflow/postprocess/ResultExtractor.hpp"
#include "roomflow/io/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace roomflow::postprocess {

ResultExtractor::ResultExtractor(const SimulationConfig& config,
                                 const physics::ComfortConditions& comfort)
    : roomVolume_(config.domainSize().prod()), comfort_(comfort) {
}

Real ResultExtractor::maxVelocityMagnitude(const Grid& grid) {
    const ScalarField3D& u = grid.u();
    const ScalarField3D& v = grid.v();
    const ScalarField3D& w = grid.w();

    Real maxSq = 0.0;
    for (Index n = 0; n < grid.numCells(); ++n) {
        maxSq = std::max(maxSq, u[n] * u[n] + v[n] * v[n] + w[n] * w[n]);
    }
    return std::sqrt(maxSq);
}

Real ResultExtractor::averageVelocityMagnitude(const Grid& grid) {
    const ScalarField3D& u = grid.u();
    const ScalarField3D& v = grid.v();
    const ScalarField3D& w = grid.w();

    Real sum = 0.0;
    for (Index n = 0; n < grid.numCells(); ++n) {
        sum += std::sqrt(u[n] * u[n] + v[n] * v[n] + w[n] * w[n]);
    }
    return grid.numCells() > 0 ? sum / grid.numCells() : Real(0);
}

TemperatureStatistics ResultExtractor::temperatureStatistics(const ScalarField3D& T) {
    TemperatureStatistics stats;
    stats.min = std::numeric_limits<Real>::max();
    stats.max = std::numeric_limits<Real>::lowest();

    Real sum = 0.0;
    for (Index n = 0; n < T.size(); ++n) {
        const Real value = T[n];
        if (value == 0) continue;

        stats.min = std::min(stats.min, value);
        stats.max = std::max(stats.max, value);
        sum += value;
        ++stats.cells;
    }

    if (stats.cells == 0) {
        return TemperatureStatistics();
    }
    stats.mean = sum / stats.cells;

    // Second pass for the deviation
    if (stats.max > stats.min) {
        Real sq = 0.0;
        for (Index n = 0; n < T.size(); ++n) {
            if (T[n] == 0) continue;
            sq += sqr(T[n] - stats.mean);
        }
        stats.stddev = std::sqrt(sq / stats.cells);
    }
    return stats;
}

Real ResultExtractor::uniformityIndex(const TemperatureStatistics& stats) {
    if (stats.cells == 0 || stats.mean <= EPSILON) {
        LOG_WARN("Uniformity undefined for mean temperature {} over {} cells, reporting 0",
                 stats.mean, stats.cells);
        return 0.0;
    }
    if (stats.max == stats.min) {
        return 1.0;
    }

    const Real index = clamp01(1 - stats.stddev / stats.mean);

    // Distinct values never reach 1
    return index < 1 ? index : std::nextafter(Real(1), Real(0));
}

Real ResultExtractor::mixingEfficiency(const TemperatureStatistics& stats) {
    if (stats.cells == 0 || stats.mean <= EPSILON) {
        return 0.0;
    }
    return clamp01(1 - 10 * stats.stddev / stats.mean);
}

Real ResultExtractor::airChangeRate(Real inletFlow) const {
    if (roomVolume_ <= EPSILON) {
        return 0.0;
    }
    return inletFlow * 3600 / roomVolume_;
}

Real ResultExtractor::pressureDrop(const ScalarField3D& p) {
    const GridDimensions& dims = p.dims();
    if (dims.nx < 3) {
        return 0.0;
    }
    const Index j = dims.ny / 2;
    const Index k = dims.nz / 2;
    return std::abs(p(dims.nx - 2, j, k) - p(1, j, k));
}

FlowStatistics ResultExtractor::computeStatistics(const Grid& grid, Real inletFlow) const {
    FlowStatistics s;
    s.maxVelocity = maxVelocityMagnitude(grid);
    s.avgVelocity = averageVelocityMagnitude(grid);

    const TemperatureStatistics T = temperatureStatistics(grid.temperature());
    s.minTemperature = T.min;
    s.maxTemperature = T.max;
    s.avgTemperature = T.mean;
    s.stdTemperature = T.stddev;
    s.measuredCells = T.cells;
    s.uniformity = uniformityIndex(T);
    s.mixingEfficiency = mixingEfficiency(T);

    s.airChangeRate = airChangeRate(inletFlow);
    s.pressureDrop = pressureDrop(grid.pressure());
    s.comfort = physics::evaluateComfort(s.avgTemperature, s.avgVelocity, comfort_);
    return s;
}

SimulationResult ResultExtractor::extract(const Grid& grid, std::vector<Real> history,
                                          int iterations, RunStatus status,
                                          Real inletFlow) const {
    SimulationResult result(grid.u(), grid.v(), grid.w(), grid.pressure(), grid.temperature());
    result.convergenceHistory = std::move(history);
    result.iterations = iterations;
    result.status = status;
    result.statistics = computeStatistics(grid, inletFlow);
    return result;
}

} // namespace roomflow::postprocess
