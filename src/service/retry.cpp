#include "service/retry.hpp"

#include <algorithm>
#include <thread>

namespace kbengine {

Sleeper default_sleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt) {
    auto delay = policy.initial_backoff;
    for (int i = 0; i < attempt && delay < policy.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy.max_backoff);
}

bool is_retryable(const std::exception& error) {
    if (dynamic_cast<const ProviderUnavailable*>(&error) != nullptr) {
        return true;
    }
    if (const auto* provider = dynamic_cast<const ProviderError*>(&error)) {
        return provider->retryable();
    }
    return false;
}

}  // namespace kbengine
