#pragma once

#include "roomflow/core/Grid.hpp"
#include "roomflow/physics/ThermalComfort.hpp"
#include <string>
#include <vector>

namespace roomflow {

// Summary statistics of a final state
struct FlowStatistics {
    Real maxVelocity = 0.0;         // m/s
    Real avgVelocity = 0.0;         // m/s

    // Over cells with non-zero temperature
    Real minTemperature = 0.0;
    Real maxTemperature = 0.0;
    Real avgTemperature = 0.0;
    Real stdTemperature = 0.0;
    Index measuredCells = 0;

    Real uniformity = 0.0;          // clamp(1 - sigma/mean, 0, 1)
    Real mixingEfficiency = 0.0;    // clamp(1 - 10 sigma/mean, 0, 1)

    Real airChangeRate = 0.0;       // 1/h
    Real pressureDrop = 0.0;        // solver units, along x through the room centre
    physics::ThermalComfortIndex comfort;
};

// Outcome of one simulate() call. Built once, never modified.
struct SimulationResult {
    SimulationResult(ScalarField3D uField, ScalarField3D vField, ScalarField3D wField,
                     ScalarField3D pField, ScalarField3D TField)
        : u(std::move(uField)), v(std::move(vField)), w(std::move(wField)),
          pressure(std::move(pField)), temperature(std::move(TField)) {}

    ScalarField3D u, v, w;
    ScalarField3D pressure;
    ScalarField3D temperature;

    // One residual per completed iteration
    std::vector<Real> convergenceHistory;
    int iterations = 0;
    RunStatus status = RunStatus::IDLE;

    FlowStatistics statistics;

    bool converged() const { return status == RunStatus::CONVERGED; }
    Real finalResidual() const {
        return convergenceHistory.empty() ? Real(0) : convergenceHistory.back();
    }

    std::string summary() const;
};

} // namespace roomflow
