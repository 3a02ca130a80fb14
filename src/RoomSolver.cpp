#include "roomflow/RoomSolver.hpp"
#include "roomflow/core/Errors.hpp"
#include "roomflow/io/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace roomflow {

namespace {

const SimulationConfig& validated(const SimulationConfig& config) {
    config.validate();
    return config;
}

} // namespace

RoomSolver::RoomSolver(const SimulationConfig& config)
    : config_(validated(config)),
      grid_(config_.dimensions(), config_.ambientTemperature),
      pressureBackup_("pressureBackup", config_.dimensions()),
      boundaries_(config_.dimensions(), config_.cellSize),
      heatSources_(config_),
      advection_(config_.timeStep),
      diffusion_(config_.dimensions(), numerics::DiffusionSolver::Settings{config_.diffusionSweeps}),
      projection_(solvers::PoissonSolver::create(config_)),
      buoyancy_(config_.gravity, config_.thermalExpansion, config_.ambientTemperature),
      extractor_(config_) {
    LOG_DEBUG("Room solver created: {}", config_.summary());
}

RoomSolver::~RoomSolver() = default;

void RoomSolver::addBoundary(SharedPtr<BoundaryCondition> bc) {
    boundaries_.add(std::move(bc));
}

void RoomSolver::addBoundary(BoundaryKind kind, const Box& box,
                             const BoundaryProperties& properties) {
    boundaries_.add(createBC(kind, box, properties, config_.outletTreatment));
}

void RoomSolver::addHeatSource(const physics::HeatSource& source) {
    heatSources_.add(source);
}

void RoomSolver::clearBoundaries() {
    boundaries_.clear();
}

void RoomSolver::clearHeatSources() {
    heatSources_.clear();
}

SimulationResult RoomSolver::simulate(const CancellationToken* token) {
    LOG_TIMER("simulate");
    LOG_INFO("Starting simulation: {}", config_.summary());
    LOG_INFO("{} boundary regions, {} heat sources ({} W)",
             boundaries_.size(), heatSources_.size(), heatSources_.totalPower());

    grid_.reset(config_.ambientTemperature);
    status_ = RunStatus::ITERATING;

    std::vector<Real> history;
    history.reserve(static_cast<std::size_t>(config_.maxIterations));

    const Real inletFlow = boundaries_.totalInletFlow();
    auto progress = io::Logger::getInstance()->createProgress("Simulation", config_.maxIterations);

    int completed = 0;
    for (int iter = 1; iter <= config_.maxIterations; ++iter) {
        if (isCancelled(token)) {
            status_ = RunStatus::CANCELLED;
            break;
        }

        saveState();

        if (!iterate(token)) {
            rollback();
            status_ = RunStatus::CANCELLED;
            break;
        }

        const Real residual = velocityResidual();
        const std::string bad = grid_.firstNonFiniteField();
        if (!bad.empty() || !std::isfinite(residual)) {
            const std::string reason = bad.empty() ? "non-finite residual"
                                                   : "field '" + bad + "' is not finite";
            LOG_ERROR("Iteration {}: {}, rolling back to iteration {}", iter, reason, completed);

            rollback();
            status_ = RunStatus::FAILED;
            auto partial = std::make_shared<const SimulationResult>(
                extractor_.extract(grid_, history, completed, status_, inletFlow));
            throw NumericInstability(reason, iter, partial);
        }

        history.push_back(residual);
        completed = iter;
        io::Logger::getInstance()->logResidual("velocity", iter, residual, history.front());
        progress->update(iter);

        if (residual < config_.tolerance) {
            status_ = RunStatus::CONVERGED;
            break;
        }
    }

    if (status_ == RunStatus::ITERATING) {
        status_ = RunStatus::EXHAUSTED;
    }
    progress->finish();

    switch (status_) {
        case RunStatus::CONVERGED:
            LOG_INFO("Converged after {} iterations (residual {:.3e})", completed, history.back());
            break;
        case RunStatus::CANCELLED:
            LOG_WARN("Simulation cancelled after {} completed iterations", completed);
            break;
        default:
            LOG_INFO("Iteration budget of {} spent, final residual {:.3e}",
                     completed, history.empty() ? Real(0) : history.back());
            break;
    }

    return extractor_.extract(grid_, std::move(history), completed, status_, inletFlow);
}

bool RoomSolver::iterate(const CancellationToken* token) {
    boundaries_.apply(grid_);

    return velocityStep(token) && temperatureStep(token);
}

bool RoomSolver::velocityStep(const CancellationToken* token) {
    advection_.advectVelocity(grid_);

    if (!diffusion_.diffuseVelocity(grid_, config_.timeStep, config_.kinematicViscosity(), token)) {
        return false;
    }

    if (config_.buoyancy) {
        buoyancy_.apply(grid_, config_.timeStep);
    }

    const solvers::PoissonResult pressure = projection_.project(grid_, token);
    if (pressure.cancelled) {
        return false;
    }
    LOG_TRACE("Pressure solve: {} iterations, residual {:.3e}",
              pressure.iterations, pressure.residual);
    return true;
}

bool RoomSolver::temperatureStep(const CancellationToken* token) {
    advection_.advectTemperature(grid_);

    if (!diffusion_.diffuseTemperature(grid_, config_.timeStep, config_.thermalDiffusivity, token)) {
        return false;
    }

    heatSources_.apply(grid_);
    return true;
}

Real RoomSolver::velocityResidual() const {
    return std::max({grid_.u().maxAbsDifference(grid_.u0()),
                     grid_.v().maxAbsDifference(grid_.v0()),
                     grid_.w().maxAbsDifference(grid_.w0())});
}

void RoomSolver::saveState() {
    grid_.snapshotPrevious();
    pressureBackup_.copyFrom(grid_.pressure());
}

void RoomSolver::rollback() {
    grid_.restorePrevious();
    grid_.pressure().copyFrom(pressureBackup_);
}

} // namespace roomflow
