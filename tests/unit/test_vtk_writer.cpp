// tests/unit/test_vtk_writer.cpp
#include <gtest/gtest.h>
#include "roomflow/io/VTKWriter.hpp"
#include "roomflow/core/Errors.hpp"
#include <fstream>
#include <sstream>
#include <vector>
#include <string>

using namespace roomflow;
using io::VTKWriter;

class VTKWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        const GridDimensions dims{3, 2, 2};
        result = std::make_unique<SimulationResult>(
            ScalarField3D("u", dims), ScalarField3D("v", dims), ScalarField3D("w", dims),
            ScalarField3D("p", dims), ScalarField3D("T", dims, 21.0));
        result->u(2, 1, 1) = 0.5;
        result->temperature(0, 0, 0) = 30.0;
        result->convergenceHistory = {1.0, 0.25, 0.0625};
        result->iterations = 3;
    }

    static std::vector<std::string> readLines(const std::string& path) {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::unique_ptr<SimulationResult> result;
};

TEST_F(VTKWriterTest, WritesStructuredPointsWithCellData) {
    const std::string path = ::testing::TempDir() + "roomflow_vtk_writer.vtk";
    VTKWriter(0.25).write(path, *result);

    const auto lines = readLines(path);
    ASSERT_GT(lines.size(), 8u);
    EXPECT_EQ(lines[0], "# vtk DataFile Version 3.0");
    EXPECT_EQ(lines[2], "ASCII");
    EXPECT_EQ(lines[3], "DATASET STRUCTURED_POINTS");
    EXPECT_EQ(lines[4], "DIMENSIONS 4 3 3");
    EXPECT_EQ(lines[6], "SPACING 0.25 0.25 0.25");

    auto find = [&](const std::string& text) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (lines[i] == text) return static_cast<long>(i);
        }
        return -1L;
    };

    EXPECT_GE(find("CELL_DATA 12"), 0);
    const std::string type = VTKWriter::dataType();
    const long velocity = find("VECTORS velocity " + type);
    const long pressure = find("SCALARS pressure " + type + " 1");
    const long temperature = find("SCALARS temperature " + type + " 1");
    ASSERT_GE(velocity, 0);
    ASSERT_GE(pressure, 0);
    ASSERT_GE(temperature, 0);

    // x fastest: cell (2,1,1) is the last one
    double u = 0.0, v = 0.0, w = 0.0;
    std::istringstream(lines[velocity + 12]) >> u >> v >> w;
    EXPECT_DOUBLE_EQ(u, 0.5);

    double first = 0.0;
    std::istringstream(lines[temperature + 2]) >> first;
    EXPECT_DOUBLE_EQ(first, 30.0);
}

TEST(VTKWriterTypeTest, DataTypeFollowsPrecision) {
#ifdef ROOMFLOW_DOUBLE_PRECISION
    EXPECT_STREQ(VTKWriter::dataType(), "double");
#else
    EXPECT_STREQ(VTKWriter::dataType(), "float");
#endif
    EXPECT_EQ(sizeof(Real) == sizeof(double), std::string(VTKWriter::dataType()) == "double");
}

TEST_F(VTKWriterTest, WritesConvergenceHistory) {
    const std::string path = ::testing::TempDir() + "roomflow_residuals.dat";
    VTKWriter::writeConvergenceHistory(path, *result);

    const auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);

    int iteration = 0;
    double residual = 0.0;
    std::istringstream(lines[3]) >> iteration >> residual;
    EXPECT_EQ(iteration, 3);
    EXPECT_DOUBLE_EQ(residual, 0.0625);
}

TEST_F(VTKWriterTest, UnwritablePathThrows) {
    EXPECT_THROW(VTKWriter(0.25).write("/nonexistent/dir/out.vtk", *result), RoomflowError);
}
