#include "agenttreasury/retry.hpp"

#include <algorithm>
#include <random>

namespace agenttreasury {

std::chrono::milliseconds calculate_backoff_with_jitter(int attempt,
                                                        std::chrono::milliseconds base,
                                                        std::chrono::milliseconds max,
                                                        int jitter_pct) {
    // Exponential backoff, shift bounded so large attempt counts cannot overflow
    int shift = std::clamp(attempt, 0, 30);
    std::int64_t exponential = base.count() * (std::int64_t{1} << shift);
    std::int64_t capped = std::min<std::int64_t>(exponential, max.count());
    if (capped < 0) capped = max.count();

    // Add jitter
    thread_local std::mt19937 gen{std::random_device{}()};
    int pct = std::max(jitter_pct, 0);
    std::uniform_int_distribution<int> dis(-pct, pct);
    std::int64_t jitter = capped * dis(gen) / 100;

    return std::chrono::milliseconds(std::max<std::int64_t>(capped + jitter, 0));
}

} // namespace agenttreasury
