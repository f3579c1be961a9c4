#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <string>

#include "core/errors.hpp"
#include "net/cancellation.hpp"
#include "util/log.hpp"

namespace kbengine {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{8000};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper default_sleeper();

// Delay before retry number `attempt` (0-based): initial * 2^attempt, capped at max.
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt);

// ProviderUnavailable and ProviderError with status 429 or 5xx.
bool is_retryable(const std::exception& error);

// Runs fn until it succeeds, a non-retryable error escapes, or the attempts run out
// (the last error is rethrown).
template <typename Fn>
auto with_retry(const RetryPolicy& policy,
                const Sleeper& sleep,
                const CancellationToken* cancellation,
                const std::string& label,
                Fn&& fn) -> decltype(fn()) {
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
    for (int attempt = 0;; ++attempt) {
        throw_if_cancelled(cancellation);
        try {
            return fn();
        } catch (const Error& ex) {
            if (!is_retryable(ex) || attempt + 1 >= attempts) {
                throw;
            }
            const auto delay = backoff_delay(policy, attempt);
            log::warn(label + " failed (attempt " + std::to_string(attempt + 1) + "/" + std::to_string(attempts) +
                      "), retrying in " + std::to_string(delay.count()) + "ms: " + ex.what());
            sleep(delay);
        }
    }
}

}  // namespace kbengine
