#pragma once

#include <atomic>

namespace roomflow {

// Cooperative cancellation flag. Another thread calls cancel(); the solver
// polls between iterations and between relaxation sweeps.
class CancellationToken {
public:
    CancellationToken() = default;

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
};

inline bool isCancelled(const CancellationToken* token) {
    return token != nullptr && token->isCancelled();
}

} // namespace roomflow
