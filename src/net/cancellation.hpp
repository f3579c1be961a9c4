#pragma once

#include <atomic>

#include "core/errors.hpp"

namespace kbengine {

// Cooperative cancellation flag shared between a caller and the work it started.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

inline void throw_if_cancelled(const CancellationToken* token) {
    if (token != nullptr && token->cancelled()) {
        throw OperationCancelled();
    }
}

}  // namespace kbengine
