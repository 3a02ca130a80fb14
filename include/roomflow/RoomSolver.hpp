#pragma once

#include "roomflow/core/BoundaryCondition.hpp"
#include "roomflow/core/CancellationToken.hpp"
#include "roomflow/core/SimulationConfig.hpp"
#include "roomflow/numerics/Advection.hpp"
#include "roomflow/numerics/Diffusion.hpp"
#include "roomflow/physics/Buoyancy.hpp"
#include "roomflow/physics/HeatSource.hpp"
#include "roomflow/postprocess/ResultExtractor.hpp"
#include "roomflow/solvers/PressureProjection.hpp"
#include <vector>

namespace roomflow {

// Airflow and heat transport in a closed room by operator splitting.
// Each iteration:
//   snapshot -> boundaries -> velocity: advect, diffuse, (buoyancy), project
//            -> temperature: advect, diffuse, heat sources -> residual
// The grid is sized once at construction; simulate() does not allocate
// inside the iteration loop.
class RoomSolver {
public:
    // Throws ConfigurationError before any field is allocated
    explicit RoomSolver(const SimulationConfig& config);
    ~RoomSolver();

    RoomSolver(const RoomSolver&) = delete;
    RoomSolver& operator=(const RoomSolver&) = delete;

    // Registration, applied in insertion order
    void addBoundary(SharedPtr<BoundaryCondition> bc);
    void addBoundary(BoundaryKind kind, const Box& box,
                     const BoundaryProperties& properties = BoundaryProperties());
    void addHeatSource(const physics::HeatSource& source);
    void clearBoundaries();
    void clearHeatSources();

    // Run from the ambient state until convergence, the iteration budget,
    // or cancellation. Throws NumericInstability with the partial result of
    // the last completed iteration when a field turns non-finite.
    SimulationResult simulate(const CancellationToken* token = nullptr);

    // Access functions
    const SimulationConfig& config() const { return config_; }
    const Grid& grid() const { return grid_; }
    RunStatus status() const { return status_; }
    const BoundaryApplicator& boundaries() const { return boundaries_; }
    const physics::HeatSourceIntegrator& heatSources() const { return heatSources_; }

private:
    SimulationConfig config_;
    Grid grid_;
    ScalarField3D pressureBackup_;

    BoundaryApplicator boundaries_;
    physics::HeatSourceIntegrator heatSources_;

    numerics::SemiLagrangianAdvection advection_;
    numerics::DiffusionSolver diffusion_;
    solvers::PressureProjection projection_;
    physics::BoussinesqBuoyancy buoyancy_;
    postprocess::ResultExtractor extractor_;

    RunStatus status_ = RunStatus::IDLE;

    // One full iteration; false when cancelled part way
    bool iterate(const CancellationToken* token);

    bool velocityStep(const CancellationToken* token);
    bool temperatureStep(const CancellationToken* token);

    // Max per-cell change of any velocity component since the snapshot
    Real velocityResidual() const;

    void saveState();
    void rollback();
};

} // namespace roomflow
