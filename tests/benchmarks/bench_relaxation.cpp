// tests/benchmarks/bench_relaxation.cpp
#include <benchmark/benchmark.h>
#include "roomflow/RoomSolver.hpp"
#include "roomflow/io/Logger.hpp"
#include <random>

using namespace roomflow;

namespace {

void fillRandom(ScalarField3D& field, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<> dis(-1.0, 1.0);
    for (Index n = 0; n < field.size(); ++n) {
        field[n] = dis(gen);
    }
}

} // namespace

static void BM_DiffusionSweeps(benchmark::State& state) {
    const Index n = static_cast<Index>(state.range(0));
    const GridDimensions dims{n, n, n};

    ScalarField3D field("T", dims);
    numerics::DiffusionSolver solver(dims);

    for (auto _ : state) {
        state.PauseTiming();
        fillRandom(field, 42);
        state.ResumeTiming();

        solver.diffuse(field, 0.1);
        benchmark::DoNotOptimize(field.data());
    }

    state.SetItemsProcessed(state.iterations() * dims.numCells() * solver.settings().sweeps);
}

BENCHMARK(BM_DiffusionSweeps)->RangeMultiplier(2)->Range(16, 64);

static void BM_GaussSeidelPoisson(benchmark::State& state) {
    const Index n = static_cast<Index>(state.range(0));
    const GridDimensions dims{n, n, n};

    ScalarField3D p("p", dims);
    ScalarField3D rhs("div", dims);
    fillRandom(rhs, 7);

    solvers::GaussSeidelPoisson solver;

    for (auto _ : state) {
        p.fill(0.0);
        solver.solve(p, rhs);
        benchmark::DoNotOptimize(p.data());
    }

    state.SetItemsProcessed(state.iterations() * dims.numCells());
}

BENCHMARK(BM_GaussSeidelPoisson)->RangeMultiplier(2)->Range(16, 64);

static void BM_ConjugateGradientPoisson(benchmark::State& state) {
    const Index n = static_cast<Index>(state.range(0));
    const GridDimensions dims{n, n, n};

    ScalarField3D p("p", dims);
    ScalarField3D rhs("div", dims);
    fillRandom(rhs, 7);

    solvers::PoissonSolver::Settings settings;
    settings.maxIterations = 200;
    solvers::ConjugateGradientPoisson solver(dims, settings);

    for (auto _ : state) {
        p.fill(0.0);
        solver.solve(p, rhs);
        benchmark::DoNotOptimize(p.data());
    }

    state.SetItemsProcessed(state.iterations() * dims.numCells());
}

BENCHMARK(BM_ConjugateGradientPoisson)->RangeMultiplier(2)->Range(16, 64);

static void BM_RoomIteration(benchmark::State& state) {
    io::Logger::getInstance()->setLevel(io::Logger::Level::WARN);

    SimulationConfig config;
    config.nx = static_cast<Index>(state.range(0));
    config.ny = static_cast<Index>(state.range(0));
    config.nz = static_cast<Index>(state.range(0) / 2);
    config.cellSize = 0.25;
    config.maxIterations = 5;
    config.tolerance = 1e-12;

    RoomSolver solver(config);
    BoundaryProperties supply;
    supply.velocity = Vector3(1.0, 0.0, 0.0);
    supply.temperature = 18.0;
    solver.addBoundary(BoundaryKind::INLET,
                       Box(Vector3(0, 0, 0), Vector3(0, config.ny * 0.25, config.nz * 0.25)), supply);
    solver.addHeatSource(physics::HeatSource(
        HeatSourceKind::FIXTURE, Box(Vector3(1, 1, 1), Vector3(1, 1, 0.25)), 500.0));

    for (auto _ : state) {
        SimulationResult result = solver.simulate();
        benchmark::DoNotOptimize(result.statistics.maxVelocity);
    }

    state.SetItemsProcessed(state.iterations() * config.maxIterations * config.numCells());
}

BENCHMARK(BM_RoomIteration)->Arg(16)->Arg(32)->Arg(48)->Unit(benchmark::kMillisecond);
