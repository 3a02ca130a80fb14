#include "roomflow/solvers/PoissonSolver.hpp"
#include "roomflow/core/Errors.hpp"
#include "roomflow/core/SimulationConfig.hpp"
#include "roomflow/io/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace roomflow::solvers {

Real PoissonSolver::residual(const ScalarField3D& p, const ScalarField3D& rhs) {
    const GridDimensions& dims = p.dims();
    const Index sy = dims.nx;
    const Index sz = dims.nx * dims.ny;

    Real result = 0.0;
    for (Index k = 1; k < dims.nz - 1; ++k) {
        for (Index j = 1; j < dims.ny - 1; ++j) {
            for (Index i = 1; i < dims.nx - 1; ++i) {
                const Index n = dims.idx(i, j, k);
                const Real r = rhs[n] - 6 * p[n] +
                               p[n - 1] + p[n + 1] + p[n - sy] + p[n + sy] + p[n - sz] + p[n + sz];
                result = std::max(result, std::abs(r));
            }
        }
    }
    return result;
}

UniquePtr<PoissonSolver> PoissonSolver::create(const SimulationConfig& config) {
    Settings settings;
    settings.maxIterations = config.pressureSweeps;

    switch (config.poissonSolver) {
        case PoissonSolverType::GAUSS_SEIDEL:
            return std::make_unique<GaussSeidelPoisson>(settings);
        case PoissonSolverType::CONJUGATE_GRADIENT:
            settings.maxIterations = config.pressureSweeps * 10;
            return std::make_unique<ConjugateGradientPoisson>(config.dimensions(), settings);
    }
    throw ConfigurationError("Unknown Poisson solver type");
}

// Gauss-Seidel

GaussSeidelPoisson::GaussSeidelPoisson(const Settings& settings)
    : PoissonSolver(settings) {
    if (settings_.maxIterations <= 0) {
        throw ConfigurationError("pressure sweeps must be positive");
    }
}

void GaussSeidelPoisson::sweep(ScalarField3D& p, const ScalarField3D& rhs) {
    const GridDimensions& dims = p.dims();
    const Index sy = dims.nx;
    const Index sz = dims.nx * dims.ny;

    for (Index k = 1; k < dims.nz - 1; ++k) {
        for (Index j = 1; j < dims.ny - 1; ++j) {
            for (Index i = 1; i < dims.nx - 1; ++i) {
                const Index n = dims.idx(i, j, k);
                p[n] = (rhs[n] + p[n - 1] + p[n + 1] +
                        p[n - sy] + p[n + sy] + p[n - sz] + p[n + sz]) / 6;
            }
        }
    }
}

PoissonResult GaussSeidelPoisson::solve(ScalarField3D& p, const ScalarField3D& rhs,
                                        const CancellationToken* token) {
    if (p.dims() != rhs.dims()) {
        throw RoomflowError("Poisson solve with mismatched fields");
    }

    PoissonResult result;
    for (int s = 0; s < settings_.maxIterations; ++s) {
        if (isCancelled(token)) {
            result.cancelled = true;
            return result;
        }
        sweep(p, rhs);
        result.iterations++;
    }

    result.residual = residual(p, rhs);
    return result;
}

// Conjugate gradient

ConjugateGradientPoisson::ConjugateGradientPoisson(const GridDimensions& dims,
                                                   const Settings& settings)
    : PoissonSolver(settings), dims_(dims) {
    if (settings_.maxIterations <= 0) {
        throw ConfigurationError("CG iteration cap must be positive");
    }
    if (settings_.tolerance <= 0) {
        throw ConfigurationError("CG tolerance must be positive");
    }
    assemble();
}

void ConjugateGradientPoisson::assemble() {
    const Index mx = std::max<Index>(dims_.nx - 2, 0);
    const Index my = std::max<Index>(dims_.ny - 2, 0);
    const Index mz = std::max<Index>(dims_.nz - 2, 0);
    const Index n = mx * my * mz;

    std::vector<Triplet> triplets;
    triplets.reserve(static_cast<std::size_t>(n) * 7);

    for (Index k = 1; k < dims_.nz - 1; ++k) {
        for (Index j = 1; j < dims_.ny - 1; ++j) {
            for (Index i = 1; i < dims_.nx - 1; ++i) {
                const Index row = unknown(i, j, k);
                triplets.emplace_back(row, row, Real(6));

                // Border neighbours are the zero Dirichlet value
                if (i > 1) triplets.emplace_back(row, unknown(i - 1, j, k), Real(-1));
                if (i < dims_.nx - 2) triplets.emplace_back(row, unknown(i + 1, j, k), Real(-1));
                if (j > 1) triplets.emplace_back(row, unknown(i, j - 1, k), Real(-1));
                if (j < dims_.ny - 2) triplets.emplace_back(row, unknown(i, j + 1, k), Real(-1));
                if (k > 1) triplets.emplace_back(row, unknown(i, j, k - 1), Real(-1));
                if (k < dims_.nz - 2) triplets.emplace_back(row, unknown(i, j, k + 1), Real(-1));
            }
        }
    }

    A_.resize(n, n);
    A_.setFromTriplets(triplets.begin(), triplets.end());
    A_.makeCompressed();

    x_.setZero(n);
    b_.setZero(n);
    r_.setZero(n);
    d_.setZero(n);
    q_.setZero(n);

    LOG_DEBUG("Assembled pressure matrix: {} unknowns, {} nonzeros", n, A_.nonZeros());
}

PoissonResult ConjugateGradientPoisson::solve(ScalarField3D& p, const ScalarField3D& rhs,
                                              const CancellationToken* token) {
    if (p.dims() != dims_ || rhs.dims() != dims_) {
        throw RoomflowError("Poisson solve on a different grid");
    }

    PoissonResult result;
    if (numUnknowns() == 0) {
        return result;
    }

    // Gather
    for (Index k = 1; k < dims_.nz - 1; ++k) {
        for (Index j = 1; j < dims_.ny - 1; ++j) {
            for (Index i = 1; i < dims_.nx - 1; ++i) {
                const Index row = unknown(i, j, k);
                x_[row] = p(i, j, k);
                b_[row] = rhs(i, j, k);
            }
        }
    }

    r_.noalias() = b_ - A_ * x_;
    d_ = r_;

    Real rr = r_.squaredNorm();
    const Real bnorm = std::max(b_.norm(), SMALL);
    const Real threshold = settings_.tolerance * bnorm;

    while (result.iterations < settings_.maxIterations && std::sqrt(rr) > threshold) {
        if (isCancelled(token)) {
            result.cancelled = true;
            return result;
        }

        q_.noalias() = A_ * d_;
        const Real dq = d_.dot(q_);
        // A is SPD, so (d, Ad) vanishes only with d itself
        if (dq <= std::numeric_limits<Real>::min()) {
            LOG_WARN("CG breakdown: (d, Ad) = {}", dq);
            break;
        }

        const Real alpha = rr / dq;
        x_ += alpha * d_;
        r_ -= alpha * q_;

        const Real rrNew = r_.squaredNorm();
        d_ = r_ + (rrNew / rr) * d_;
        rr = rrNew;

        result.iterations++;
    }

    if (std::sqrt(rr) > threshold) {
        LOG_DEBUG("CG stopped after {} iterations, relative residual {:.3e}",
                  result.iterations, std::sqrt(rr) / bnorm);
    }

    // Scatter
    for (Index k = 1; k < dims_.nz - 1; ++k) {
        for (Index j = 1; j < dims_.ny - 1; ++j) {
            for (Index i = 1; i < dims_.nx - 1; ++i) {
                p(i, j, k) = x_[unknown(i, j, k)];
            }
        }
    }

    result.residual = residual(p, rhs);
    return result;
}

} // namespace roomflow::solvers
