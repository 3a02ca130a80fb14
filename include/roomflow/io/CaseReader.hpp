#pragma once

#include "roomflow/core/BoundaryCondition.hpp"
#include "roomflow/core/SimulationConfig.hpp"
#include "roomflow/physics/HeatSource.hpp"
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace roomflow {
class RoomSolver;
}

namespace roomflow::io {

// One boundary entry of a case file
struct BoundarySpec {
    BoundaryKind kind = BoundaryKind::WALL;
    Box box;
    BoundaryProperties properties;
};

// Everything needed to set up a RoomSolver
struct SimulationCase {
    SimulationConfig config;
    std::vector<BoundarySpec> boundaries;
    std::vector<physics::HeatSource> heatSources;

    // Register boundaries and heat sources in file order
    void populate(RoomSolver& solver) const;
};

// YAML case reader. Layout:
//
//   simulation:
//     grid: [nx, ny, nz]
//     cellSize, density, viscosity, thermalDiffusivity, timeStep,
//     maxIterations, tolerance, ambientTemperature, ambientPressure
//     diffusionSweeps, pressureSweeps, specificHeat, poissonSolver,
//     outlet, buoyancy                                     (optional)
//   boundaries:
//     - { type: inlet, position: [x, y, z], size: [x, y, z],
//         velocity: [x, y, z], temperature, pressure, flowRate }
//   heatSources:
//     - { type: fixture, position: [x, y, z], size: [x, y, z], power }
//
// Malformed input raises ConfigurationError.
class CaseReader {
public:
    explicit CaseReader(const std::string& filename);

    SimulationCase read() const;

    // Parse a case from YAML text
    static SimulationCase fromString(const std::string& yaml);

    static SimulationCase parse(const YAML::Node& root);

    const std::string& filename() const { return filename_; }

private:
    std::string filename_;

    // Section readers
    static SimulationConfig readSimulation(const YAML::Node& node);
    static BoundarySpec readBoundary(const YAML::Node& node);
    static physics::HeatSource readHeatSource(const YAML::Node& node);

    // Utility functions
    static Vector3 parseVector3(const YAML::Node& node, const std::string& key);
    static BoundaryKind parseBoundaryKind(const std::string& name);
    static HeatSourceKind parseHeatSourceKind(const std::string& name);
    static PoissonSolverType parsePoissonSolver(const std::string& name);
    static OutletTreatment parseOutletTreatment(const std::string& name);
};

} // namespace roomflow::io
