#include "roomflow/io/CaseReader.hpp"
#include "roomflow/RoomSolver.hpp"
#include "roomflow/core/Errors.hpp"
#include "roomflow/io/Logger.hpp"
#include <filesystem>
#include <optional>

namespace roomflow::io {

namespace fs = std::filesystem;

namespace {

template<typename T>
T require(const YAML::Node& node, const std::string& key) {
    const YAML::Node value = node[key];
    if (!value) {
        throw ConfigurationError("missing required key '" + key + "'");
    }
    return value.as<T>();
}

template<typename T>
std::optional<T> optionalValue(const YAML::Node& node, const std::string& key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    return value.as<T>();
}

} // namespace

void SimulationCase::populate(RoomSolver& solver) const {
    for (const auto& spec : boundaries) {
        solver.addBoundary(spec.kind, spec.box, spec.properties);
    }
    for (const auto& source : heatSources) {
        solver.addHeatSource(source);
    }
}

CaseReader::CaseReader(const std::string& filename)
    : filename_(filename) {
    if (!fs::exists(filename_)) {
        throw ConfigurationError("case file does not exist: " + filename_);
    }
}

SimulationCase CaseReader::read() const {
    LOG_INFO("Reading case {}", filename_);

    YAML::Node root;
    try {
        root = YAML::LoadFile(filename_);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("cannot parse " + filename_ + ": " + e.what());
    }
    return parse(root);
}

SimulationCase CaseReader::fromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("cannot parse case: ") + e.what());
    }
    return parse(root);
}

SimulationCase CaseReader::parse(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigurationError("case root must be a mapping");
    }

    SimulationCase result;
    try {
        const YAML::Node simulation = root["simulation"];
        if (!simulation || !simulation.IsMap()) {
            throw ConfigurationError("missing 'simulation' section");
        }
        result.config = readSimulation(simulation);

        if (const YAML::Node boundaries = root["boundaries"]) {
            if (!boundaries.IsSequence()) {
                throw ConfigurationError("'boundaries' must be a list");
            }
            for (const auto& entry : boundaries) {
                result.boundaries.push_back(readBoundary(entry));
            }
        }

        if (const YAML::Node sources = root["heatSources"]) {
            if (!sources.IsSequence()) {
                throw ConfigurationError("'heatSources' must be a list");
            }
            for (const auto& entry : sources) {
                result.heatSources.push_back(readHeatSource(entry));
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("malformed case: ") + e.what());
    }

    result.config.validate();

    LOG_DEBUG("Case: {} boundaries, {} heat sources",
              result.boundaries.size(), result.heatSources.size());
    return result;
}

SimulationConfig CaseReader::readSimulation(const YAML::Node& node) {
    SimulationConfig config;

    const YAML::Node grid = node["grid"];
    if (!grid || !grid.IsSequence() || grid.size() != 3) {
        throw ConfigurationError("'grid' must be [nx, ny, nz]");
    }
    config.nx = grid[0].as<Index>();
    config.ny = grid[1].as<Index>();
    config.nz = grid[2].as<Index>();

    config.cellSize = require<Real>(node, "cellSize");
    config.density = require<Real>(node, "density");
    config.viscosity = require<Real>(node, "viscosity");
    config.thermalDiffusivity = require<Real>(node, "thermalDiffusivity");
    config.timeStep = require<Real>(node, "timeStep");
    config.maxIterations = require<int>(node, "maxIterations");
    config.tolerance = require<Real>(node, "tolerance");
    config.ambientTemperature = require<Real>(node, "ambientTemperature");
    config.ambientPressure = require<Real>(node, "ambientPressure");

    // Tunables
    config.diffusionSweeps = node["diffusionSweeps"].as<int>(config.diffusionSweeps);
    config.pressureSweeps = node["pressureSweeps"].as<int>(config.pressureSweeps);
    config.specificHeat = node["specificHeat"].as<Real>(config.specificHeat);

    if (node["poissonSolver"]) {
        config.poissonSolver = parsePoissonSolver(node["poissonSolver"].as<std::string>());
    }
    if (node["outlet"]) {
        config.outletTreatment = parseOutletTreatment(node["outlet"].as<std::string>());
    }

    // buoyancy: true | { gravity, thermalExpansion }
    if (const YAML::Node buoyancy = node["buoyancy"]) {
        if (buoyancy.IsMap()) {
            config.buoyancy = buoyancy["enabled"].as<bool>(true);
            config.gravity = buoyancy["gravity"].as<Real>(config.gravity);
            config.thermalExpansion = buoyancy["thermalExpansion"].as<Real>(config.thermalExpansion);
        } else {
            config.buoyancy = buoyancy.as<bool>();
        }
    }

    return config;
}

BoundarySpec CaseReader::readBoundary(const YAML::Node& node) {
    BoundarySpec spec;
    spec.kind = parseBoundaryKind(require<std::string>(node, "type"));
    spec.box = Box(parseVector3(node["position"], "position"),
                   parseVector3(node["size"], "size"));

    if (node["velocity"]) {
        spec.properties.velocity = parseVector3(node["velocity"], "velocity");
    }
    spec.properties.temperature = optionalValue<Real>(node, "temperature");
    spec.properties.pressure = optionalValue<Real>(node, "pressure");
    spec.properties.flowRate = optionalValue<Real>(node, "flowRate");

    return spec;
}

physics::HeatSource CaseReader::readHeatSource(const YAML::Node& node) {
    physics::HeatSource source;
    source.kind = parseHeatSourceKind(require<std::string>(node, "type"));
    source.box = Box(parseVector3(node["position"], "position"),
                     parseVector3(node["size"], "size"));
    source.power = require<Real>(node, "power");
    return source;
}

// Accepts [x, y, z] or {x, y, z}
Vector3 CaseReader::parseVector3(const YAML::Node& node, const std::string& key) {
    if (!node) {
        throw ConfigurationError("missing required key '" + key + "'");
    }

    Vector3 value;
    if (node.IsSequence() && node.size() == 3) {
        value = Vector3(node[0].as<Real>(), node[1].as<Real>(), node[2].as<Real>());
    } else if (node.IsMap()) {
        value = Vector3(require<Real>(node, "x"), require<Real>(node, "y"), require<Real>(node, "z"));
    } else {
        throw ConfigurationError("'" + key + "' must be a 3-vector");
    }

    if (!value.allFinite()) {
        throw ConfigurationError("'" + key + "' must be finite");
    }
    return value;
}

BoundaryKind CaseReader::parseBoundaryKind(const std::string& name) {
    if (name == "wall") return BoundaryKind::WALL;
    if (name == "inlet") return BoundaryKind::INLET;
    if (name == "outlet") return BoundaryKind::OUTLET;
    if (name == "obstacle") return BoundaryKind::OBSTACLE;
    throw ConfigurationError("unknown boundary type '" + name + "'");
}

HeatSourceKind CaseReader::parseHeatSourceKind(const std::string& name) {
    if (name == "fixture") return HeatSourceKind::FIXTURE;
    if (name == "equipment") return HeatSourceKind::EQUIPMENT;
    if (name == "plant") return HeatSourceKind::PLANT;
    throw ConfigurationError("unknown heat source type '" + name + "'");
}

PoissonSolverType CaseReader::parsePoissonSolver(const std::string& name) {
    if (name == "GaussSeidel" || name == "gaussSeidel") return PoissonSolverType::GAUSS_SEIDEL;
    if (name == "CG" || name == "conjugateGradient") return PoissonSolverType::CONJUGATE_GRADIENT;
    throw ConfigurationError("unknown Poisson solver '" + name + "'");
}

OutletTreatment CaseReader::parseOutletTreatment(const std::string& name) {
    if (name == "passive") return OutletTreatment::PASSIVE;
    if (name == "zeroGradient") return OutletTreatment::ZERO_GRADIENT;
    throw ConfigurationError("unknown outlet treatment '" + name + "'");
}

} // namespace roomflow::io
