#include "roomflow/core/Types.hpp"

namespace roomflow {

const char* toString(BoundaryKind kind) {
    switch (kind) {
        case BoundaryKind::WALL:     return "wall";
        case BoundaryKind::INLET:    return "inlet";
        case BoundaryKind::OUTLET:   return "outlet";
        case BoundaryKind::OBSTACLE: return "obstacle";
    }
    return "unknown";
}

const char* toString(HeatSourceKind kind) {
    switch (kind) {
        case HeatSourceKind::FIXTURE:   return "fixture";
        case HeatSourceKind::EQUIPMENT: return "equipment";
        case HeatSourceKind::PLANT:     return "plant";
    }
    return "unknown";
}

const char* toString(PoissonSolverType type) {
    switch (type) {
        case PoissonSolverType::GAUSS_SEIDEL:       return "GaussSeidel";
        case PoissonSolverType::CONJUGATE_GRADIENT: return "CG";
    }
    return "unknown";
}

const char* toString(OutletTreatment treatment) {
    switch (treatment) {
        case OutletTreatment::PASSIVE:       return "passive";
        case OutletTreatment::ZERO_GRADIENT: return "zeroGradient";
    }
    return "unknown";
}

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::IDLE:      return "idle";
        case RunStatus::ITERATING: return "iterating";
        case RunStatus::CONVERGED: return "converged";
        case RunStatus::EXHAUSTED: return "exhausted";
        case RunStatus::CANCELLED: return "cancelled";
        case RunStatus::FAILED:    return "failed";
    }
    return "unknown";
}

} // namespace roomflow
