// tests/integration/test_solver_control.cpp
#include <gtest/gtest.h>
#include "roomflow/RoomSolver.hpp"
#include "roomflow/core/Errors.hpp"
#include "roomflow/solvers/PressureProjection.hpp"

using namespace roomflow;

namespace {

// Boundary that touches nothing but cancels a token on its n-th application,
// i.e. at the start of iteration n
class CancelOnApply : public BoundaryCondition {
public:
    CancelOnApply(CancellationToken* token, int trigger)
        : BoundaryCondition(BoundaryKind::OBSTACLE, Box()), token_(token), trigger_(trigger) {}

    void apply(Grid&, const CellRange&) const override {
        if (++calls_ == trigger_ && token_) {
            token_->cancel();
        }
    }

    SharedPtr<BoundaryCondition> clone() const override {
        return std::make_shared<CancelOnApply>(token_, trigger_);
    }

private:
    CancellationToken* token_;
    int trigger_;
    mutable int calls_ = 0;
};

} // namespace

class SolverControlTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.nx = 10;
        config.ny = 10;
        config.nz = 10;
        config.cellSize = 0.5;
        config.timeStep = 0.1;
        config.maxIterations = 20;
    }

    void addSupply(RoomSolver& solver) const {
        BoundaryProperties props;
        props.velocity = Vector3(1.0, 0.0, 0.0);
        props.temperature = 18.0;
        solver.addBoundary(BoundaryKind::INLET, Box(Vector3(0, 0, 0), Vector3(0, 5, 5)), props);
    }

    SimulationConfig config;
};

TEST_F(SolverControlTest, InvalidConfigRejectedAtConstruction) {
    config.timeStep = 0.0;
    EXPECT_THROW({ RoomSolver solver(config); }, ConfigurationError);

    config.timeStep = 0.1;
    config.nz = 0;
    EXPECT_THROW({ RoomSolver solver(config); }, ConfigurationError);
}

TEST_F(SolverControlTest, StatusTransitions) {
    RoomSolver solver(config);
    EXPECT_EQ(solver.status(), RunStatus::IDLE);

    addSupply(solver);
    SimulationResult result = solver.simulate();

    EXPECT_EQ(solver.status(), RunStatus::EXHAUSTED);
    EXPECT_EQ(result.status, RunStatus::EXHAUSTED);
    EXPECT_EQ(result.iterations, 20);
    EXPECT_FALSE(result.converged());
}

TEST_F(SolverControlTest, RepeatedRunsStartFromAmbient) {
    RoomSolver solver(config);
    addSupply(solver);

    SimulationResult first = solver.simulate();
    SimulationResult second = solver.simulate();

    ASSERT_EQ(first.iterations, second.iterations);
    EXPECT_EQ(first.convergenceHistory, second.convergenceHistory);
    EXPECT_EQ(first.u.values(), second.u.values());
    EXPECT_EQ(first.temperature.values(), second.temperature.values());
}

TEST_F(SolverControlTest, CancelledBeforeStart) {
    RoomSolver solver(config);
    addSupply(solver);

    CancellationToken token;
    token.cancel();
    SimulationResult result = solver.simulate(&token);

    EXPECT_EQ(result.status, RunStatus::CANCELLED);
    EXPECT_EQ(solver.status(), RunStatus::CANCELLED);
    EXPECT_EQ(result.iterations, 0);
    EXPECT_TRUE(result.convergenceHistory.empty());
    EXPECT_EQ(result.u.maxAbs(), 0.0);
    EXPECT_DOUBLE_EQ(result.temperature.max(), config.ambientTemperature);
}

TEST_F(SolverControlTest, CancelledMidRunKeepsLastCompletedIteration) {
    CancellationToken token;

    RoomSolver cancelled(config);
    addSupply(cancelled);
    cancelled.addBoundary(std::make_shared<CancelOnApply>(&token, 3));
    SimulationResult partial = cancelled.simulate(&token);

    EXPECT_EQ(partial.status, RunStatus::CANCELLED);
    EXPECT_EQ(partial.iterations, 2);
    EXPECT_EQ(partial.convergenceHistory.size(), 2u);

    // Same setup stopped by the budget after two iterations
    SimulationConfig shortRun = config;
    shortRun.maxIterations = 2;
    RoomSolver reference(shortRun);
    addSupply(reference);
    SimulationResult expected = reference.simulate();

    EXPECT_EQ(expected.status, RunStatus::EXHAUSTED);
    EXPECT_EQ(partial.convergenceHistory, expected.convergenceHistory);
    EXPECT_EQ(partial.u.values(), expected.u.values());
    EXPECT_EQ(partial.w.values(), expected.w.values());
    EXPECT_EQ(partial.pressure.values(), expected.pressure.values());
    EXPECT_EQ(partial.temperature.values(), expected.temperature.values());
}

TEST_F(SolverControlTest, NonFiniteFieldRaisesWithPartialResult) {
    config.timeStep = 1e3;
    RoomSolver solver(config);
    solver.addHeatSource(physics::HeatSource(
        HeatSourceKind::EQUIPMENT, Box(Vector3(2.0, 2.0, 2.0), Vector3(0.5, 0.5, 0.5)), 1e308));

    try {
        solver.simulate();
        FAIL() << "expected NumericInstability";
    } catch (const NumericInstability& e) {
        EXPECT_EQ(e.iteration(), 1);
        ASSERT_TRUE(e.hasPartialResult());

        const SimulationResult& partial = e.partialResult();
        EXPECT_EQ(partial.status, RunStatus::FAILED);
        EXPECT_EQ(partial.iterations, 0);
        EXPECT_TRUE(partial.convergenceHistory.empty());
        EXPECT_TRUE(partial.temperature.allFinite());
        EXPECT_DOUBLE_EQ(partial.temperature.max(), config.ambientTemperature);
    }

    EXPECT_EQ(solver.status(), RunStatus::FAILED);
    EXPECT_TRUE(solver.grid().temperature().allFinite());
}

TEST_F(SolverControlTest, ClearedRegistrationsHaveNoEffect) {
    RoomSolver solver(config);
    addSupply(solver);
    solver.addHeatSource(physics::HeatSource(
        HeatSourceKind::PLANT, Box(Vector3(1, 1, 1), Vector3(1, 1, 1)), 400.0));

    solver.clearBoundaries();
    solver.clearHeatSources();
    EXPECT_TRUE(solver.boundaries().empty());
    EXPECT_TRUE(solver.heatSources().empty());

    SimulationResult result = solver.simulate();
    EXPECT_EQ(result.status, RunStatus::CONVERGED);
    EXPECT_EQ(result.u.maxAbs(), 0.0);
    EXPECT_NEAR(result.statistics.maxTemperature, config.ambientTemperature, 1e-12);
}

TEST_F(SolverControlTest, ConjugateGradientBackend) {
    config.poissonSolver = PoissonSolverType::CONJUGATE_GRADIENT;
    RoomSolver solver(config);
    addSupply(solver);

    SimulationResult result = solver.simulate();

    EXPECT_EQ(result.status, RunStatus::EXHAUSTED);
    EXPECT_EQ(result.convergenceHistory.size(), static_cast<std::size_t>(result.iterations));
    EXPECT_TRUE(result.u.allFinite());
    EXPECT_TRUE(result.pressure.allFinite());
    EXPECT_DOUBLE_EQ(result.statistics.maxVelocity, 1.0);
    EXPECT_DOUBLE_EQ(result.statistics.minTemperature, 18.0);
}

TEST_F(SolverControlTest, ProjectionKeepsDivergenceSmall) {
    RoomSolver solver(config);
    addSupply(solver);
    solver.simulate();

    // Only the inlet face injects divergence; a unit jump over the first
    // interior layer bounds the mean
    EXPECT_LT(solvers::PressureProjection::meanAbsDivergence(solver.grid()), 0.5);
}
