#pragma once

#include "roomflow/core/Types.hpp"
#include <string>

namespace roomflow {

// Structured grid extents with x fastest-varying, then y, then z
struct GridDimensions {
    Index nx = 0;
    Index ny = 0;
    Index nz = 0;

    Index numCells() const { return nx * ny * nz; }

    bool isValid(Index i, Index j, Index k) const {
        return i >= 0 && i < nx && j >= 0 && j < ny && k >= 0 && k < nz;
    }

    bool isInterior(Index i, Index j, Index k) const {
        return i > 0 && i < nx - 1 && j > 0 && j < ny - 1 && k > 0 && k < nz - 1;
    }

    // Unchecked linear index for inner loops
    Index idx(Index i, Index j, Index k) const {
        return i + nx * (j + ny * k);
    }

    // Checked linear index, throws IndexOutOfBounds
    Index index(Index i, Index j, Index k) const;

    bool operator==(const GridDimensions& other) const {
        return nx == other.nx && ny == other.ny && nz == other.nz;
    }
    bool operator!=(const GridDimensions& other) const { return !(*this == other); }
};

// Cell-centred scalar field on a structured grid
class ScalarField3D {
public:
    ScalarField3D() = default;
    ScalarField3D(const std::string& name, const GridDimensions& dims,
                  Real initialValue = 0.0);

    const std::string& name() const { return name_; }
    const GridDimensions& dims() const { return dims_; }
    Index size() const { return static_cast<Index>(data_.size()); }

    // Checked access
    Real get(Index i, Index j, Index k) const { return data_[dims_.index(i, j, k)]; }
    void set(Index i, Index j, Index k, Real value) { data_[dims_.index(i, j, k)] = value; }

    // Unchecked access
    Real& operator()(Index i, Index j, Index k) { return data_[dims_.idx(i, j, k)]; }
    Real operator()(Index i, Index j, Index k) const { return data_[dims_.idx(i, j, k)]; }
    Real& operator[](Index n) { return data_[n]; }
    Real operator[](Index n) const { return data_[n]; }

    Real* data() { return data_.data(); }
    const Real* data() const { return data_.data(); }
    const AlignedVector<Real>& values() const { return data_; }

    void fill(Real value);
    void copyFrom(const ScalarField3D& other);

    // Statistics
    Real min() const;
    Real max() const;
    Real maxAbs() const;
    Real maxAbsDifference(const ScalarField3D& other) const;
    bool allFinite() const;

private:
    std::string name_;
    GridDimensions dims_;
    AlignedVector<Real> data_;
};

// All solution buffers of one solver instance. Dimensions are fixed at
// construction.
class Grid {
public:
    Grid(const GridDimensions& dims, Real ambientTemperature);

    const GridDimensions& dims() const { return dims_; }
    Index nx() const { return dims_.nx; }
    Index ny() const { return dims_.ny; }
    Index nz() const { return dims_.nz; }
    Index numCells() const { return dims_.numCells(); }

    Index index(Index i, Index j, Index k) const { return dims_.index(i, j, k); }
    Index idx(Index i, Index j, Index k) const { return dims_.idx(i, j, k); }
    bool isValid(Index i, Index j, Index k) const { return dims_.isValid(i, j, k); }
    bool isInterior(Index i, Index j, Index k) const { return dims_.isInterior(i, j, k); }

    // Current fields
    ScalarField3D& u() { return u_; }
    ScalarField3D& v() { return v_; }
    ScalarField3D& w() { return w_; }
    ScalarField3D& pressure() { return p_; }
    ScalarField3D& temperature() { return T_; }
    ScalarField3D& divergence() { return div_; }
    const ScalarField3D& u() const { return u_; }
    const ScalarField3D& v() const { return v_; }
    const ScalarField3D& w() const { return w_; }
    const ScalarField3D& pressure() const { return p_; }
    const ScalarField3D& temperature() const { return T_; }
    const ScalarField3D& divergence() const { return div_; }

    // Previous timestep fields
    ScalarField3D& u0() { return u0_; }
    ScalarField3D& v0() { return v0_; }
    ScalarField3D& w0() { return w0_; }
    ScalarField3D& temperature0() { return T0_; }
    const ScalarField3D& u0() const { return u0_; }
    const ScalarField3D& v0() const { return v0_; }
    const ScalarField3D& w0() const { return w0_; }
    const ScalarField3D& temperature0() const { return T0_; }

    // Velocity component by axis (0 = x, 1 = y, 2 = z)
    ScalarField3D& velocity(int axis);
    const ScalarField3D& velocity(int axis) const;
    ScalarField3D& velocityPrevious(int axis);
    const ScalarField3D& velocityPrevious(int axis) const;

    // Checked vector access
    Vector3 velocityAt(Index i, Index j, Index k) const;
    void setVelocity(Index i, Index j, Index k, const Vector3& value);

    // Copy u, v, w, T into the previous timestep buffers
    void snapshotPrevious();

    // Restore u, v, w, T from the previous timestep buffers
    void restorePrevious();

    // Zero velocity/pressure/divergence, ambient temperature
    void reset(Real ambientTemperature);

    // Name of the first field holding a NaN or Inf, empty if none
    std::string firstNonFiniteField() const;
    bool isFinite() const { return firstNonFiniteField().empty(); }

private:
    GridDimensions dims_;

    ScalarField3D u_, v_, w_;
    ScalarField3D p_;
    ScalarField3D T_;
    ScalarField3D div_;

    ScalarField3D u0_, v0_, w0_;
    ScalarField3D T0_;
};

} // namespace roomflow
