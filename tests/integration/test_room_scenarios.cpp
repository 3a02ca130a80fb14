// tests/integration/test_room_scenarios.cpp
#include <gtest/gtest.h>
#include "roomflow/RoomSolver.hpp"

using namespace roomflow;

class RoomScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 5 m cube at 0.5 m resolution
        config.nx = 10;
        config.ny = 10;
        config.nz = 10;
        config.cellSize = 0.5;
        config.density = 1.2;
        config.specificHeat = 1005.0;
        config.ambientTemperature = 20.0;
    }

    void addEnclosure(RoomSolver& solver) const {
        const Vector3 L = config.domainSize();
        solver.addBoundary(BoundaryKind::WALL, Box(Vector3(0, 0, 0), Vector3(L.x(), L.y(), 0)));
        solver.addBoundary(BoundaryKind::WALL, Box(Vector3(0, 0, L.z()), Vector3(L.x(), L.y(), 0)));
        solver.addBoundary(BoundaryKind::WALL, Box(Vector3(0, 0, 0), Vector3(L.x(), 0, L.z())));
        solver.addBoundary(BoundaryKind::WALL, Box(Vector3(0, L.y(), 0), Vector3(L.x(), 0, L.z())));
        solver.addBoundary(BoundaryKind::WALL, Box(Vector3(0, 0, 0), Vector3(0, L.y(), L.z())));
        solver.addBoundary(BoundaryKind::WALL, Box(Vector3(L.x(), 0, 0), Vector3(0, L.y(), L.z())));
    }

    static BoundaryProperties supply(const Vector3& velocity) {
        BoundaryProperties props;
        props.velocity = velocity;
        return props;
    }

    SimulationConfig config;
};

TEST_F(RoomScenarioTest, EmptyRoomStaysAtRest) {
    config.maxIterations = 10;
    RoomSolver solver(config);

    SimulationResult result = solver.simulate();

    // Nothing moves, so the first residual is already below tolerance
    EXPECT_EQ(result.status, RunStatus::CONVERGED);
    EXPECT_EQ(result.iterations, 1);
    ASSERT_EQ(result.convergenceHistory.size(), 1u);
    EXPECT_EQ(result.convergenceHistory[0], 0.0);

    EXPECT_EQ(result.u.maxAbs(), 0.0);
    EXPECT_EQ(result.v.maxAbs(), 0.0);
    EXPECT_EQ(result.w.maxAbs(), 0.0);
    EXPECT_NEAR(result.temperature.min(), 20.0, 1e-12);
    EXPECT_NEAR(result.temperature.max(), 20.0, 1e-12);
    EXPECT_EQ(result.statistics.maxVelocity, 0.0);
    EXPECT_NEAR(result.statistics.avgTemperature, 20.0, 1e-12);
}

TEST_F(RoomScenarioTest, InletFlowReachesMidRoom) {
    config.timeStep = 0.1;
    config.maxIterations = 50;
    RoomSolver solver(config);
    solver.addBoundary(BoundaryKind::INLET, Box(Vector3(0, 0, 0), Vector3(0, 5, 5)),
                       supply(Vector3(1.0, 0.0, 0.0)));

    SimulationResult result = solver.simulate();

    EXPECT_EQ(result.status, RunStatus::EXHAUSTED);
    EXPECT_EQ(result.iterations, 50);
    EXPECT_EQ(result.convergenceHistory.size(), 50u);
    EXPECT_DOUBLE_EQ(result.convergenceHistory.front(), 1.0);

    // Mean streamwise velocity over the mid plane
    Real sum = 0.0;
    for (Index k = 0; k < config.nz; ++k) {
        for (Index j = 0; j < config.ny; ++j) {
            sum += result.u(5, j, k);
        }
    }
    EXPECT_GT(sum / (config.ny * config.nz), 0.0);

    EXPECT_DOUBLE_EQ(result.statistics.maxVelocity, 1.0);
    // 25 m^2 face at 1 m/s in a 125 m^3 room
    EXPECT_NEAR(result.statistics.airChangeRate, 25.0 * 3600 / 125.0, 1e-9);
}

TEST_F(RoomScenarioTest, SealedBoxHeating) {
    config.timeStep = 1.0;
    config.maxIterations = 60;
    RoomSolver solver(config);
    addEnclosure(solver);

    const Real power = 100.0;
    solver.addHeatSource(physics::HeatSource(
        HeatSourceKind::EQUIPMENT, Box(Vector3(2.0, 2.0, 1.0), Vector3(0.5, 0.5, 0.5)), power));

    SimulationResult result = solver.simulate();
    ASSERT_GE(result.iterations, 1);

    // Joules injected over the completed iterations against the air's heat capacity
    const Real airHeatCapacity = config.density * config.domainSize().prod() * config.specificHeat;
    const Real expectedRise = result.iterations * power * config.timeStep / airHeatCapacity;

    Real sum = 0.0;
    for (Index n = 0; n < result.temperature.size(); ++n) {
        sum += result.temperature[n];
    }
    const Real averageRise = sum / result.temperature.size() - config.ambientTemperature;

    EXPECT_GT(averageRise, 0.0);
    EXPECT_GE(averageRise, 0.9 * expectedRise);
    EXPECT_LE(averageRise, 1.01 * expectedRise);

    // One cell of air per iteration
    const Real cellRise = power * config.timeStep /
                          (config.density * config.cellVolume() * config.specificHeat);
    EXPECT_LE(result.statistics.maxTemperature - 20.0, result.iterations * cellRise * (1 + 1e-9));
    EXPECT_GT(result.statistics.maxTemperature, 20.0);
}

// simulate() stops a still room after one iteration, so the sixty-step
// heat balance is driven through the temperature pipeline directly.
TEST_F(RoomScenarioTest, SealedBoxHeatBalanceOverSixtySteps) {
    config.timeStep = 1.0;
    const int steps = 60;
    const Real power = 100.0;

    Grid grid(config.dimensions(), config.ambientTemperature);
    numerics::SemiLagrangianAdvection advection(config.timeStep);
    numerics::DiffusionSolver diffusion(config.dimensions());
    physics::HeatSourceIntegrator heat(config);
    heat.add(physics::HeatSource(
        HeatSourceKind::EQUIPMENT, Box(Vector3(2.0, 2.0, 1.0), Vector3(0.5, 0.5, 0.5)), power));

    for (int step = 0; step < steps; ++step) {
        grid.snapshotPrevious();
        advection.advectTemperature(grid);
        ASSERT_TRUE(diffusion.diffuseTemperature(grid, config.timeStep, config.thermalDiffusivity));
        heat.apply(grid);
    }

    const Real joules = steps * power * config.timeStep;
    const Real airHeatCapacity = config.density * config.domainSize().prod() * config.specificHeat;

    Real sum = 0.0;
    for (Index n = 0; n < grid.numCells(); ++n) {
        sum += grid.temperature()[n];
    }
    const Real averageRise = sum / grid.numCells() - config.ambientTemperature;

    // Only a trace leaks into the fixed border cells
    EXPECT_GE(averageRise, 0.999 * joules / airHeatCapacity);
    EXPECT_LE(averageRise, joules / airHeatCapacity * (1 + 1e-9));

    const Real cellRise = joules / (config.density * config.cellVolume() * config.specificHeat);
    EXPECT_LE(grid.temperature().max() - config.ambientTemperature, cellRise * (1 + 1e-9));
    EXPECT_GT(grid.temperature().max() - config.ambientTemperature, 0.99 * cellRise);
}

TEST_F(RoomScenarioTest, LooseToleranceStopsAfterOneIteration) {
    config.maxIterations = 40;
    config.tolerance = 10.0;
    RoomSolver solver(config);
    solver.addBoundary(BoundaryKind::INLET, Box(Vector3(0, 0, 0), Vector3(0, 5, 5)),
                       supply(Vector3(1.0, 0.0, 0.0)));

    SimulationResult result = solver.simulate();

    EXPECT_EQ(result.status, RunStatus::CONVERGED);
    EXPECT_TRUE(result.converged());
    EXPECT_EQ(result.iterations, 1);
    EXPECT_EQ(result.convergenceHistory.size(), 1u);
}

TEST_F(RoomScenarioTest, ZeroGradientOutletCarriesFlowOut) {
    config.maxIterations = 30;

    auto outletFaceVelocity = [this](OutletTreatment treatment) {
        SimulationConfig cfg = config;
        cfg.outletTreatment = treatment;
        RoomSolver solver(cfg);
        solver.addBoundary(BoundaryKind::INLET, Box(Vector3(0, 0, 0), Vector3(0, 5, 5)),
                           supply(Vector3(1.0, 0.0, 0.0)));
        solver.addBoundary(BoundaryKind::OUTLET, Box(Vector3(5, 0, 0), Vector3(0, 5, 5)));

        SimulationResult result = solver.simulate();
        EXPECT_EQ(result.iterations, 30);

        Real sum = 0.0;
        for (Index k = 1; k < cfg.nz - 1; ++k) {
            for (Index j = 1; j < cfg.ny - 1; ++j) {
                sum += result.u(cfg.nx - 1, j, k);
            }
        }
        return sum / ((cfg.ny - 2) * (cfg.nz - 2));
    };

    EXPECT_EQ(outletFaceVelocity(OutletTreatment::PASSIVE), 0.0);
    EXPECT_GT(outletFaceVelocity(OutletTreatment::ZERO_GRADIENT), 0.0);
}

TEST_F(RoomScenarioTest, BuoyancyLiftsAirAboveSource) {
    config.timeStep = 0.5;
    config.maxIterations = 30;
    config.tolerance = 1e-6;

    auto run = [this](bool buoyancy) {
        SimulationConfig cfg = config;
        cfg.buoyancy = buoyancy;
        RoomSolver solver(cfg);
        // Small low-speed supply keeps the run iterating
        solver.addBoundary(BoundaryKind::INLET, Box(Vector3(0, 1, 1), Vector3(0, 1, 1)),
                           supply(Vector3(0.2, 0.0, 0.0)));
        solver.addHeatSource(physics::HeatSource(
            HeatSourceKind::FIXTURE, Box(Vector3(2.5, 2.5, 1.5), Vector3(0.5, 0.5, 0.5)), 1000.0));
        return solver.simulate();
    };

    SimulationResult still = run(false);
    SimulationResult rising = run(true);

    EXPECT_EQ(rising.iterations, 30);
    EXPECT_GT(rising.w(5, 5, 3), 0.1);
    EXPECT_GT(rising.w(5, 5, 4), 0.0);
    EXPECT_GT(rising.w(5, 5, 4), still.w(5, 5, 4));

    // Rising air carries heat away from the source
    EXPECT_LT(rising.statistics.maxTemperature, still.statistics.maxTemperature);
}
