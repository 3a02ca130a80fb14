#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace roomflow {

struct SimulationResult;

// Base class for all solver errors
class RoomflowError : public std::runtime_error {
public:
    explicit RoomflowError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid configuration or case description, raised before any allocation
class ConfigurationError : public RoomflowError {
public:
    explicit ConfigurationError(const std::string& message)
        : RoomflowError("Configuration error: " + message) {}
};

// Checked grid access outside [0,nx) x [0,ny) x [0,nz)
class IndexOutOfBounds : public RoomflowError {
public:
    IndexOutOfBounds(int i, int j, int k, int nx, int ny, int nz);

    int i() const { return i_; }
    int j() const { return j_; }
    int k() const { return k_; }

private:
    int i_, j_, k_;
};

// A field became non-finite during iteration. Carries the result assembled
// from the last valid iteration.
class NumericInstability : public RoomflowError {
public:
    NumericInstability(const std::string& message, int iteration,
                       std::shared_ptr<const SimulationResult> partial);

    int iteration() const { return iteration_; }
    bool hasPartialResult() const { return partial_ != nullptr; }
    const SimulationResult& partialResult() const;

private:
    int iteration_;
    std::shared_ptr<const SimulationResult> partial_;
};

} // namespace roomflow
