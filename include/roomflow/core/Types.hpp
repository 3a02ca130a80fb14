#pragma once

#include <Eigen/Core>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace roomflow {

// Precision configuration
#ifdef ROOMFLOW_DOUBLE_PRECISION
using Real = double;
#else
using Real = float;
#endif

// Integer types
using Index = std::int32_t;

// Numerical tolerances
inline constexpr Real EPSILON = std::numeric_limits<Real>::epsilon();
inline constexpr Real SMALL = Real(1e-12);

// Vector types
using Vector3 = Eigen::Matrix<Real, 3, 1>;
using Vector3i = Eigen::Matrix<Index, 3, 1>;
using VectorX = Eigen::Matrix<Real, Eigen::Dynamic, 1>;

// Aligned storage for field buffers
template<typename T>
using AlignedVector = std::vector<T, Eigen::aligned_allocator<T>>;

// Smart pointers
template<typename T>
using UniquePtr = std::unique_ptr<T>;

template<typename T>
using SharedPtr = std::shared_ptr<T>;

// Boundary region kinds
enum class BoundaryKind {
    WALL,
    INLET,
    OUTLET,
    OBSTACLE
};

// Heat source kinds
enum class HeatSourceKind {
    FIXTURE,
    EQUIPMENT,
    PLANT
};

// Pressure equation backends
enum class PoissonSolverType {
    GAUSS_SEIDEL,
    CONJUGATE_GRADIENT
};

// How outlet regions are treated by the boundary pass
enum class OutletTreatment {
    PASSIVE,
    ZERO_GRADIENT
};

// Terminal state of a simulation run
enum class RunStatus {
    IDLE,
    ITERATING,
    CONVERGED,
    EXHAUSTED,
    CANCELLED,
    FAILED
};

const char* toString(BoundaryKind kind);
const char* toString(HeatSourceKind kind);
const char* toString(PoissonSolverType type);
const char* toString(OutletTreatment treatment);
const char* toString(RunStatus status);

// Utility functions
template<typename T>
inline T sqr(T x) { return x * x; }

template<typename T>
inline T clamp01(T x) { return x < T(0) ? T(0) : (x > T(1) ? T(1) : x); }

} // namespace roomflow
