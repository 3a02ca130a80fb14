#pragma once

#include "roomflow/core/Region.hpp"
#include <optional>
#include <string>
#include <vector>

namespace roomflow {

// Prescribed values of a boundary region. Only inlets read them.
struct BoundaryProperties {
    std::optional<Vector3> velocity;    // m/s
    std::optional<Real> temperature;    // deg C
    std::optional<Real> pressure;       // Pa
    std::optional<Real> flowRate;       // m^3/s
};

// Boundary prescription over an axis-aligned box of cells
class BoundaryCondition {
public:
    BoundaryCondition(BoundaryKind kind, const Box& box,
                      const BoundaryProperties& properties = BoundaryProperties())
        : kind_(kind), box_(box), properties_(properties) {}
    virtual ~BoundaryCondition() = default;

    BoundaryKind kind() const { return kind_; }
    const Box& box() const { return box_; }
    const BoundaryProperties& properties() const { return properties_; }

    // Stamp the prescription onto the cells of range
    virtual void apply(Grid& grid, const CellRange& range) const = 0;

    // Clone for deep copy
    virtual SharedPtr<BoundaryCondition> clone() const = 0;

protected:
    BoundaryKind kind_;
    Box box_;
    BoundaryProperties properties_;
};

// No-slip: wall and obstacle regions
class NoSlipBC : public BoundaryCondition {
public:
    NoSlipBC(BoundaryKind kind, const Box& box);

    void apply(Grid& grid, const CellRange& range) const override;

    SharedPtr<BoundaryCondition> clone() const override {
        return std::make_shared<NoSlipBC>(*this);
    }
};

// Fixed supply velocity and optional supply temperature
class InletBC : public BoundaryCondition {
public:
    InletBC(const Box& box, const BoundaryProperties& properties);

    void apply(Grid& grid, const CellRange& range) const override;

    // Volumetric supply flow in m^3/s: flowRate when given, otherwise the
    // velocity magnitude times the largest face area of the region
    Real volumetricFlow(const CellRange& range, Real cellSize) const;

    SharedPtr<BoundaryCondition> clone() const override {
        return std::make_shared<InletBC>(*this);
    }
};

// Exhaust region. PASSIVE leaves the fields untouched; ZERO_GRADIENT copies
// velocity and temperature from the inward neighbour of cells lying on a
// domain face.
class OutletBC : public BoundaryCondition {
public:
    OutletBC(const Box& box, OutletTreatment treatment = OutletTreatment::PASSIVE,
             const BoundaryProperties& properties = BoundaryProperties());

    OutletTreatment treatment() const { return treatment_; }

    void apply(Grid& grid, const CellRange& range) const override;

    SharedPtr<BoundaryCondition> clone() const override {
        return std::make_shared<OutletBC>(*this);
    }

private:
    OutletTreatment treatment_;
};

// Factory function
SharedPtr<BoundaryCondition> createBC(BoundaryKind kind, const Box& box,
                                      const BoundaryProperties& properties = BoundaryProperties(),
                                      OutletTreatment outletTreatment = OutletTreatment::PASSIVE);

// Ordered list of boundary regions applied once per iteration. Later entries
// overwrite earlier ones on shared cells.
class BoundaryApplicator {
public:
    BoundaryApplicator(const GridDimensions& dims, Real cellSize)
        : dims_(dims), cellSize_(cellSize) {}

    void add(SharedPtr<BoundaryCondition> bc);
    void clear() { conditions_.clear(); }

    std::size_t size() const { return conditions_.size(); }
    bool empty() const { return conditions_.empty(); }
    const std::vector<SharedPtr<BoundaryCondition>>& conditions() const { return conditions_; }

    CellRange cellRange(const BoundaryCondition& bc) const {
        return toCellRange(bc.box(), dims_, cellSize_);
    }

    void apply(Grid& grid) const;

    // Sum of inlet supply flows in m^3/s
    Real totalInletFlow() const;

private:
    GridDimensions dims_;
    Real cellSize_;
    std::vector<SharedPtr<BoundaryCondition>> conditions_;
};

} // namespace roomflow
