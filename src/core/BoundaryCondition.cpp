#include "roomflow/core/BoundaryCondition.hpp"
#include "roomflow/core/Errors.hpp"
#include "roomflow/io/Logger.hpp"
#include <algorithm>

namespace roomflow {

// No-slip wall / obstacle
NoSlipBC::NoSlipBC(BoundaryKind kind, const Box& box)
    : BoundaryCondition(kind, box) {
    if (kind != BoundaryKind::WALL && kind != BoundaryKind::OBSTACLE) {
        throw ConfigurationError(std::string("no-slip region cannot be of kind ") + toString(kind));
    }
}

void NoSlipBC::apply(Grid& grid, const CellRange& range) const {
    ScalarField3D& u = grid.u();
    ScalarField3D& v = grid.v();
    ScalarField3D& w = grid.w();

    range.forEach([&](Index i, Index j, Index k) {
        const Index n = grid.idx(i, j, k);
        u[n] = 0.0;
        v[n] = 0.0;
        w[n] = 0.0;
    });
}

// Inlet
InletBC::InletBC(const Box& box, const BoundaryProperties& properties)
    : BoundaryCondition(BoundaryKind::INLET, box, properties) {
}

void InletBC::apply(Grid& grid, const CellRange& range) const {
    if (properties_.velocity) {
        const Vector3 velocity = *properties_.velocity;
        ScalarField3D& u = grid.u();
        ScalarField3D& v = grid.v();
        ScalarField3D& w = grid.w();

        range.forEach([&](Index i, Index j, Index k) {
            const Index n = grid.idx(i, j, k);
            u[n] = velocity.x();
            v[n] = velocity.y();
            w[n] = velocity.z();
        });
    }

    if (properties_.temperature) {
        const Real temperature = *properties_.temperature;
        ScalarField3D& T = grid.temperature();

        range.forEach([&](Index i, Index j, Index k) {
            T(i, j, k) = temperature;
        });
    }
}

Real InletBC::volumetricFlow(const CellRange& range, Real cellSize) const {
    if (properties_.flowRate) {
        return *properties_.flowRate;
    }
    if (!properties_.velocity || range.empty()) {
        return 0.0;
    }

    const Vector3i extent = range.upper - range.lower + Vector3i::Ones();
    const Index faceCells = std::max({extent.x() * extent.y(),
                                      extent.y() * extent.z(),
                                      extent.x() * extent.z()});
    return properties_.velocity->norm() * faceCells * cellSize * cellSize;
}

// Outlet
OutletBC::OutletBC(const Box& box, OutletTreatment treatment,
                   const BoundaryProperties& properties)
    : BoundaryCondition(BoundaryKind::OUTLET, box, properties), treatment_(treatment) {
}

void OutletBC::apply(Grid& grid, const CellRange& range) const {
    if (treatment_ == OutletTreatment::PASSIVE) {
        return;
    }

    const GridDimensions& dims = grid.dims();
    ScalarField3D& u = grid.u();
    ScalarField3D& v = grid.v();
    ScalarField3D& w = grid.w();
    ScalarField3D& T = grid.temperature();

    range.forEach([&](Index i, Index j, Index k) {
        // Inward neighbour across the first domain face the cell lies on
        Index ni = i, nj = j, nk = k;
        if (i == 0 && dims.nx > 1) ni = 1;
        else if (i == dims.nx - 1 && dims.nx > 1) ni = dims.nx - 2;
        else if (j == 0 && dims.ny > 1) nj = 1;
        else if (j == dims.ny - 1 && dims.ny > 1) nj = dims.ny - 2;
        else if (k == 0 && dims.nz > 1) nk = 1;
        else if (k == dims.nz - 1 && dims.nz > 1) nk = dims.nz - 2;
        else return;

        const Index n = dims.idx(i, j, k);
        const Index m = dims.idx(ni, nj, nk);
        u[n] = u[m];
        v[n] = v[m];
        w[n] = w[m];
        T[n] = T[m];
    });
}

// Factory
SharedPtr<BoundaryCondition> createBC(BoundaryKind kind, const Box& box,
                                      const BoundaryProperties& properties,
                                      OutletTreatment outletTreatment) {
    switch (kind) {
        case BoundaryKind::WALL:
        case BoundaryKind::OBSTACLE:
            return std::make_shared<NoSlipBC>(kind, box);
        case BoundaryKind::INLET:
            return std::make_shared<InletBC>(box, properties);
        case BoundaryKind::OUTLET:
            return std::make_shared<OutletBC>(box, outletTreatment, properties);
    }
    throw ConfigurationError("Unsupported boundary kind");
}

// Applicator
void BoundaryApplicator::add(SharedPtr<BoundaryCondition> bc) {
    if (!bc) {
        throw ConfigurationError("null boundary condition");
    }
    if (!bc->box().isFinite()) {
        throw ConfigurationError(std::string("boundary region '") + toString(bc->kind()) +
                                 "' has a non-finite position or size");
    }

    const CellRange range = cellRange(*bc);
    if (range.empty()) {
        LOG_WARN("Boundary region '{}' lies outside the domain and has no effect",
                 toString(bc->kind()));
    } else {
        LOG_DEBUG("Registered {} boundary over cells [{},{},{}]..[{},{},{}]",
                  toString(bc->kind()),
                  range.lower.x(), range.lower.y(), range.lower.z(),
                  range.upper.x(), range.upper.y(), range.upper.z());
    }

    conditions_.push_back(std::move(bc));
}

void BoundaryApplicator::apply(Grid& grid) const {
    if (grid.dims() != dims_) {
        throw RoomflowError("Boundary applicator built for a different grid");
    }

    for (const auto& bc : conditions_) {
        bc->apply(grid, cellRange(*bc));
    }
}

Real BoundaryApplicator::totalInletFlow() const {
    Real flow = 0.0;
    for (const auto& bc : conditions_) {
        if (bc->kind() != BoundaryKind::INLET) continue;

        if (auto inlet = std::dynamic_pointer_cast<const InletBC>(bc)) {
            flow += inlet->volumetricFlow(cellRange(*inlet), cellSize_);
        }
    }
    return flow;
}

} // namespace roomflow
