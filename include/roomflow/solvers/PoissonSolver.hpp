#pragma once

#include "roomflow/core/CancellationToken.hpp"
#include "roomflow/core/Grid.hpp"
#include <Eigen/Sparse>

namespace roomflow {
struct SimulationConfig;
}

namespace roomflow::solvers {

using SparseMatrix = Eigen::SparseMatrix<Real, Eigen::RowMajor>;
using Triplet = Eigen::Triplet<Real>;

// Outcome of one pressure solve
struct PoissonResult {
    int iterations = 0;
    Real residual = 0.0;    // max |6p - sum(neighbours) - rhs| over interior cells
    bool cancelled = false;
};

// Solves the 6-point discrete Poisson problem
//   6 p(i,j,k) - sum of neighbours = rhs(i,j,k)
// on interior cells with p = 0 held on the one-cell border.
class PoissonSolver {
public:
    struct Settings {
        int maxIterations = 20;
        Real tolerance = 1e-6;  // Relative, CG only
    };

    PoissonSolver() : settings_() {}
    explicit PoissonSolver(const Settings& settings)
        : settings_(settings) {}
    virtual ~PoissonSolver() = default;

    // p is used as the initial guess
    virtual PoissonResult solve(ScalarField3D& p, const ScalarField3D& rhs,
                                const CancellationToken* token = nullptr) = 0;

    virtual PoissonSolverType type() const = 0;

    const Settings& settings() const { return settings_; }

    // Max interior residual of the discrete equation
    static Real residual(const ScalarField3D& p, const ScalarField3D& rhs);

    static UniquePtr<PoissonSolver> create(const SimulationConfig& config);

protected:
    Settings settings_;
};

// Fixed number of in-place Gauss-Seidel sweeps, no convergence test
class GaussSeidelPoisson : public PoissonSolver {
public:
    GaussSeidelPoisson() : GaussSeidelPoisson(Settings()) {}
    explicit GaussSeidelPoisson(const Settings& settings);

    PoissonResult solve(ScalarField3D& p, const ScalarField3D& rhs,
                        const CancellationToken* token = nullptr) override;

    PoissonSolverType type() const override { return PoissonSolverType::GAUSS_SEIDEL; }

    static void sweep(ScalarField3D& p, const ScalarField3D& rhs);
};

// Conjugate gradient on the assembled interior system. The matrix is
// symmetric positive definite, so CG converges; it is assembled once.
class ConjugateGradientPoisson : public PoissonSolver {
public:
    ConjugateGradientPoisson(const GridDimensions& dims) : ConjugateGradientPoisson(dims, Settings()) {}
    ConjugateGradientPoisson(const GridDimensions& dims, const Settings& settings);

    PoissonResult solve(ScalarField3D& p, const ScalarField3D& rhs,
                        const CancellationToken* token = nullptr) override;

    PoissonSolverType type() const override { return PoissonSolverType::CONJUGATE_GRADIENT; }

    Index numUnknowns() const { return static_cast<Index>(A_.rows()); }
    const SparseMatrix& matrix() const { return A_; }

private:
    GridDimensions dims_;
    SparseMatrix A_;

    // Work vectors
    VectorX x_, b_, r_, d_, q_;

    Index unknown(Index i, Index j, Index k) const {
        return (i - 1) + (dims_.nx - 2) * ((j - 1) + (dims_.ny - 2) * (k - 1));
    }

    void assemble();
};

} // namespace roomflow::solvers
