#pragma once

#include "roomflow/postprocess/SimulationResult.hpp"
#include <fstream>
#include <string>
#include <type_traits>

namespace roomflow::io {

// Legacy VTK writer for final room states. The grid is written as
// STRUCTURED_POINTS with one cell per solver cell, so ParaView shows the
// fields as cell data without interpolation.
class VTKWriter {
public:
    explicit VTKWriter(Real cellSize, const std::string& title = "roomflow result")
        : cellSize_(cellSize), title_(title) {}

    // velocity (vector), pressure and temperature as CELL_DATA
    void write(const std::string& filename, const SimulationResult& result) const;

    // VTK data type tag matching Real
    static const char* dataType() {
        return std::is_same<Real, double>::value ? "double" : "float";
    }

    // Two-column "iteration residual" text file
    static void writeConvergenceHistory(const std::string& filename,
                                        const SimulationResult& result);

private:
    Real cellSize_;
    std::string title_;

    void writeHeader(std::ofstream& file, const GridDimensions& dims) const;
    static void writeScalarField(std::ofstream& file, const std::string& name,
                                 const ScalarField3D& field);
    static void writeVelocity(std::ofstream& file, const SimulationResult& result);
};

} // namespace roomflow::io
