#pragma once

#include "agenttreasury/config.hpp"
#include "agenttreasury/exceptions.hpp"

#include <chrono>
#include <thread>

namespace agenttreasury {

// Exponential backoff with jitter.
// attempt: 0-based number of the attempt that just failed
// jitter_pct: e.g. 20 for +/-20%
std::chrono::milliseconds calculate_backoff_with_jitter(int attempt,
                                                        std::chrono::milliseconds base,
                                                        std::chrono::milliseconds max,
                                                        int jitter_pct = 20);

inline std::chrono::milliseconds backoff_delay(const RetryConfig& config, int attempt) {
    return calculate_backoff_with_jitter(attempt, config.base_delay, config.max_delay,
                                         config.jitter_pct);
}

// Runs `fn` until it returns without a TransientException, sleeping between
// attempts. The last TransientException is rethrown once max_attempts is used up.
// Any other exception propagates immediately.
template<typename Fn>
auto retry_transient(const RetryConfig& config, Fn&& fn) -> decltype(fn()) {
    for (int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const TransientException&) {
            if (attempt + 1 >= config.max_attempts) {
                throw;
            }
        }
        std::this_thread::sleep_for(backoff_delay(config, attempt));
    }
}

} // namespace agenttreasury
