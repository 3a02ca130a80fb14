// tests/unit/test_diffusion.cpp
#include <gtest/gtest.h>
#include "roomflow/numerics/Diffusion.hpp"
#include "roomflow/core/Errors.hpp"
#include <algorithm>
#include <cmath>

using namespace roomflow;
using numerics::DiffusionSolver;

class DiffusionTest : public ::testing::Test {
protected:
    GridDimensions dims{9, 9, 9};
    ScalarField3D field{"phi", dims};
};

TEST_F(DiffusionTest, UniformFieldIsSteady) {
    field.fill(20.0);
    DiffusionSolver solver(dims);
    ASSERT_TRUE(solver.diffuse(field, 0.7));

    EXPECT_NEAR(field.min(), 20.0, 1e-12);
    EXPECT_NEAR(field.max(), 20.0, 1e-12);
}

TEST_F(DiffusionTest, ZeroCoefficientIsIdentity) {
    field(4, 4, 4) = 3.0;
    field(2, 5, 1) = -1.0;
    DiffusionSolver solver(dims);
    ASSERT_TRUE(solver.diffuse(field, 0.0));

    EXPECT_EQ(field(4, 4, 4), 3.0);
    EXPECT_EQ(field(2, 5, 1), -1.0);
    EXPECT_EQ(field(3, 3, 3), 0.0);
}

TEST_F(DiffusionTest, SpikeSpreadsToNeighbours) {
    field(4, 4, 4) = 1.0;
    field(0, 0, 0) = 5.0;
    DiffusionSolver solver(dims);
    ASSERT_TRUE(solver.diffuse(field, 0.1));

    EXPECT_LT(field(4, 4, 4), 1.0);
    EXPECT_GT(field(4, 4, 4), 0.0);
    EXPECT_GT(field(3, 4, 4), 0.0);
    EXPECT_GT(field(4, 4, 5), 0.0);
    EXPECT_NEAR(field(3, 4, 4), field(5, 4, 4), 1e-3);

    // Border is never relaxed
    EXPECT_EQ(field(0, 0, 0), 5.0);
    EXPECT_EQ(field(0, 4, 4), 0.0);
}

TEST_F(DiffusionTest, ManySweepsSolveTheImplicitSystem) {
    field(4, 4, 4) = 1.0;
    ScalarField3D source("source", dims);
    source.copyFrom(field);

    DiffusionSolver solver(dims, DiffusionSolver::Settings{200});
    const Real a = 0.5;
    ASSERT_TRUE(solver.diffuse(field, a));

    // (1 + 6a) phi - a * sum(neighbours) = source on interior cells
    Real worst = 0.0;
    for (Index k = 1; k < 8; ++k)
        for (Index j = 1; j < 8; ++j)
            for (Index i = 1; i < 8; ++i) {
                const Real sum = field(i - 1, j, k) + field(i + 1, j, k) +
                                 field(i, j - 1, k) + field(i, j + 1, k) +
                                 field(i, j, k - 1) + field(i, j, k + 1);
                worst = std::max(worst, std::abs((1 + 6 * a) * field(i, j, k) - a * sum - source(i, j, k)));
            }
    EXPECT_LT(worst, 1e-10);
}

TEST_F(DiffusionTest, SweepCountIsConfigurable) {
    field(4, 4, 4) = 1.0;
    ScalarField3D once("once", dims);
    once.copyFrom(field);

    DiffusionSolver oneSweep(dims, DiffusionSolver::Settings{1});
    DiffusionSolver twenty(dims);
    ASSERT_TRUE(oneSweep.diffuse(once, 1.0));
    ASSERT_TRUE(twenty.diffuse(field, 1.0));

    EXPECT_EQ(twenty.settings().sweeps, 20);
    EXPECT_NE(once(4, 4, 4), field(4, 4, 4));
    EXPECT_THROW({ DiffusionSolver bad(dims, DiffusionSolver::Settings{0}); }, ConfigurationError);
}

TEST_F(DiffusionTest, CancelledBeforeFirstSweep) {
    field(4, 4, 4) = 1.0;
    CancellationToken token;
    token.cancel();

    DiffusionSolver solver(dims);
    EXPECT_FALSE(solver.diffuse(field, 1.0, &token));
    EXPECT_EQ(field(4, 4, 4), 1.0);
}

TEST_F(DiffusionTest, VelocityAndTemperaturePasses) {
    Grid grid(dims, 20.0);
    grid.u()(4, 4, 4) = 1.0;
    grid.w()(4, 4, 4) = -1.0;
    grid.temperature()(4, 4, 4) = 30.0;

    DiffusionSolver solver(dims);
    ASSERT_TRUE(solver.diffuseVelocity(grid, 1.0, 0.2));
    ASSERT_TRUE(solver.diffuseTemperature(grid, 1.0, 0.2));

    EXPECT_LT(grid.u()(4, 4, 4), 1.0);
    EXPECT_GT(grid.w()(4, 4, 4), -1.0);
    EXPECT_NEAR(grid.u()(4, 4, 4), -grid.w()(4, 4, 4), 1e-12);
    EXPECT_LT(grid.temperature()(4, 4, 4), 30.0);
    EXPECT_GT(grid.temperature()(4, 5, 4), 20.0);

    Grid other(GridDimensions{3, 3, 3}, 20.0);
    EXPECT_THROW(solver.diffuseTemperature(other, 1.0, 0.2), RoomflowError);
}
