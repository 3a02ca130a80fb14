#include "roomflow/core/Errors.hpp"
#include "roomflow/postprocess/SimulationResult.hpp"
#include <sstream>

namespace roomflow {

namespace {

std::string describeIndex(int i, int j, int k, int nx, int ny, int nz) {
    std::ostringstream ss;
    ss << "Grid index (" << i << ", " << j << ", " << k << ") outside "
       << nx << " x " << ny << " x " << nz;
    return ss.str();
}

} // namespace

IndexOutOfBounds::IndexOutOfBounds(int i, int j, int k, int nx, int ny, int nz)
    : RoomflowError(describeIndex(i, j, k, nx, ny, nz)), i_(i), j_(j), k_(k) {
}

NumericInstability::NumericInstability(const std::string& message, int iteration,
                                       std::shared_ptr<const SimulationResult> partial)
    : RoomflowError("Numeric instability at iteration " + std::to_string(iteration) +
                    ": " + message),
      iteration_(iteration), partial_(std::move(partial)) {
}

const SimulationResult& NumericInstability::partialResult() const {
    if (!partial_) {
        throw RoomflowError("No partial result available");
    }
    return *partial_;
}

} // namespace roomflow
