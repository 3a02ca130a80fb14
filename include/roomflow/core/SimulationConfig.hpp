#pragma once

#include "roomflow/core/Grid.hpp"
#include <string>

namespace roomflow {

// Solver configuration. Copied into the solver at construction and never
// modified afterwards.
struct SimulationConfig {
    // Grid
    Index nx = 10;
    Index ny = 10;
    Index nz = 10;
    Real cellSize = 0.5;                // m

    // Fluid properties
    Real density = 1.2;                 // kg/m^3
    Real viscosity = 1.8e-5;            // Pa s
    Real thermalDiffusivity = 2.2e-5;   // m^2/s
    Real specificHeat = 1005.0;         // J/(kg K)

    // Time and iteration control
    Real timeStep = 0.1;                // s
    int maxIterations = 100;
    Real tolerance = 1e-4;

    // Ambient state
    Real ambientTemperature = 20.0;     // deg C
    Real ambientPressure = 101325.0;    // Pa

    // Relaxation budgets
    int diffusionSweeps = 20;
    int pressureSweeps = 20;
    PoissonSolverType poissonSolver = PoissonSolverType::GAUSS_SEIDEL;

    // Boundary treatment
    OutletTreatment outletTreatment = OutletTreatment::PASSIVE;

    // Boussinesq buoyancy on the vertical (z) velocity
    bool buoyancy = false;
    Real gravity = 9.81;                // m/s^2
    Real thermalExpansion = 0.00343;    // 1/K

    // Throws ConfigurationError on the first invalid entry
    void validate() const;

    GridDimensions dimensions() const { return GridDimensions{nx, ny, nz}; }
    Index numCells() const { return nx * ny * nz; }
    Real cellVolume() const { return cellSize * cellSize * cellSize; }
    Real kinematicViscosity() const { return viscosity / density; }
    Vector3 domainSize() const { return Vector3(nx * cellSize, ny * cellSize, nz * cellSize); }

    std::string summary() const;
};

} // namespace roomflow
