#include "roomflow/core/Grid.hpp"
#include "roomflow/core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace roomflow {

Index GridDimensions::index(Index i, Index j, Index k) const {
    if (!isValid(i, j, k)) {
        throw IndexOutOfBounds(i, j, k, nx, ny, nz);
    }
    return idx(i, j, k);
}

// ScalarField3D

ScalarField3D::ScalarField3D(const std::string& name, const GridDimensions& dims,
                             Real initialValue)
    : name_(name), dims_(dims) {
    if (dims.nx <= 0 || dims.ny <= 0 || dims.nz <= 0) {
        throw ConfigurationError("field '" + name + "' requires positive dimensions");
    }
    data_.assign(static_cast<std::size_t>(dims.numCells()), initialValue);
}

void ScalarField3D::fill(Real value) {
    std::fill(data_.begin(), data_.end(), value);
}

void ScalarField3D::copyFrom(const ScalarField3D& other) {
    if (other.dims_ != dims_) {
        throw RoomflowError("Field size mismatch copying '" + other.name_ +
                            "' into '" + name_ + "'");
    }
    std::copy(other.data_.begin(), other.data_.end(), data_.begin());
}

Real ScalarField3D::min() const {
    if (data_.empty()) return 0.0;
    return *std::min_element(data_.begin(), data_.end());
}

Real ScalarField3D::max() const {
    if (data_.empty()) return 0.0;
    return *std::max_element(data_.begin(), data_.end());
}

Real ScalarField3D::maxAbs() const {
    Real result = 0.0;
    for (Real value : data_) {
        result = std::max(result, std::abs(value));
    }
    return result;
}

Real ScalarField3D::maxAbsDifference(const ScalarField3D& other) const {
    if (other.dims_ != dims_) {
        throw RoomflowError("Field size mismatch comparing '" + name_ +
                            "' with '" + other.name_ + "'");
    }

    Real result = 0.0;
    for (std::size_t n = 0; n < data_.size(); ++n) {
        result = std::max(result, std::abs(data_[n] - other.data_[n]));
    }
    return result;
}

bool ScalarField3D::allFinite() const {
    return std::all_of(data_.begin(), data_.end(),
                       [](Real value) { return std::isfinite(value); });
}

// Grid

Grid::Grid(const GridDimensions& dims, Real ambientTemperature)
    : dims_(dims),
      u_("u", dims), v_("v", dims), w_("w", dims),
      p_("p", dims),
      T_("T", dims, ambientTemperature),
      div_("div", dims),
      u0_("u0", dims), v0_("v0", dims), w0_("w0", dims),
      T0_("T0", dims, ambientTemperature) {
}

ScalarField3D& Grid::velocity(int axis) {
    switch (axis) {
        case 0: return u_;
        case 1: return v_;
        case 2: return w_;
        default:
            throw RoomflowError("Invalid velocity component " + std::to_string(axis));
    }
}

const ScalarField3D& Grid::velocity(int axis) const {
    return const_cast<Grid*>(this)->velocity(axis);
}

ScalarField3D& Grid::velocityPrevious(int axis) {
    switch (axis) {
        case 0: return u0_;
        case 1: return v0_;
        case 2: return w0_;
        default:
            throw RoomflowError("Invalid velocity component " + std::to_string(axis));
    }
}

const ScalarField3D& Grid::velocityPrevious(int axis) const {
    return const_cast<Grid*>(this)->velocityPrevious(axis);
}

Vector3 Grid::velocityAt(Index i, Index j, Index k) const {
    const Index n = dims_.index(i, j, k);
    return Vector3(u_[n], v_[n], w_[n]);
}

void Grid::setVelocity(Index i, Index j, Index k, const Vector3& value) {
    const Index n = dims_.index(i, j, k);
    u_[n] = value.x();
    v_[n] = value.y();
    w_[n] = value.z();
}

void Grid::snapshotPrevious() {
    u0_.copyFrom(u_);
    v0_.copyFrom(v_);
    w0_.copyFrom(w_);
    T0_.copyFrom(T_);
}

void Grid::restorePrevious() {
    u_.copyFrom(u0_);
    v_.copyFrom(v0_);
    w_.copyFrom(w0_);
    T_.copyFrom(T0_);
}

void Grid::reset(Real ambientTemperature) {
    for (ScalarField3D* field : {&u_, &v_, &w_, &p_, &div_, &u0_, &v0_, &w0_}) {
        field->fill(0.0);
    }
    T_.fill(ambientTemperature);
    T0_.fill(ambientTemperature);
}

std::string Grid::firstNonFiniteField() const {
    for (const ScalarField3D* field : {&u_, &v_, &w_, &p_, &T_, &div_}) {
        if (!field->allFinite()) {
            return field->name();
        }
    }
    return {};
}

} // namespace roomflow
