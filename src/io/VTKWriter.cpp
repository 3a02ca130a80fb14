#include "roomflow/io/VTKWriter.hpp"
#include "roomflow/core/Errors.hpp"
#include "roomflow/io/Logger.hpp"
#include <iomanip>

namespace roomflow::io {

void VTKWriter::write(const std::string& filename, const SimulationResult& result) const {
    const GridDimensions& dims = result.temperature.dims();
    if (result.u.dims() != dims || result.v.dims() != dims ||
        result.w.dims() != dims || result.pressure.dims() != dims) {
        throw RoomflowError("Cannot write " + filename + ": result fields differ in size");
    }

    std::ofstream file(filename);
    if (!file) {
        throw RoomflowError("Cannot open file for writing: " + filename);
    }

    writeHeader(file, dims);

    file << "\nCELL_DATA " << dims.numCells() << "\n";
    writeVelocity(file, result);
    writeScalarField(file, "pressure", result.pressure);
    writeScalarField(file, "temperature", result.temperature);

    if (!file) {
        throw RoomflowError("Write failed: " + filename);
    }
    LOG_DEBUG("Wrote VTK file: {}", filename);
}

void VTKWriter::writeHeader(std::ofstream& file, const GridDimensions& dims) const {
    file << "# vtk DataFile Version 3.0\n";
    file << title_ << "\n";
    file << "ASCII\n";
    file << "DATASET STRUCTURED_POINTS\n";
    file << "DIMENSIONS " << dims.nx + 1 << " " << dims.ny + 1 << " " << dims.nz + 1 << "\n";
    file << "ORIGIN 0 0 0\n";
    file << "SPACING " << cellSize_ << " " << cellSize_ << " " << cellSize_ << "\n";
}

void VTKWriter::writeScalarField(std::ofstream& file, const std::string& name,
                                 const ScalarField3D& field) {
    file << "\nSCALARS " << name << " " << dataType() << " 1\n";
    file << "LOOKUP_TABLE default\n";

    for (Index n = 0; n < field.size(); ++n) {
        file << std::scientific << std::setprecision(6) << field[n] << "\n";
    }
}

void VTKWriter::writeVelocity(std::ofstream& file, const SimulationResult& result) {
    file << "\nVECTORS velocity " << dataType() << "\n";

    for (Index n = 0; n < result.u.size(); ++n) {
        file << std::scientific << std::setprecision(6)
             << result.u[n] << " " << result.v[n] << " " << result.w[n] << "\n";
    }
}

void VTKWriter::writeConvergenceHistory(const std::string& filename,
                                        const SimulationResult& result) {
    std::ofstream file(filename);
    if (!file) {
        throw RoomflowError("Cannot open file for writing: " + filename);
    }

    file << "# iteration residual\n";
    for (std::size_t i = 0; i < result.convergenceHistory.size(); ++i) {
        file << i + 1 << " " << std::scientific << std::setprecision(6)
             << result.convergenceHistory[i] << "\n";
    }
    LOG_DEBUG("Wrote convergence history: {}", filename);
}

} // namespace roomflow::io
