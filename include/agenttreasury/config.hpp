#pragma once

#include "agenttreasury/types.hpp"
#include <cstddef>

namespace agenttreasury {

// Bounded exponential backoff with jitter
struct RetryConfig {
    int max_attempts = 8;
    std::chrono::milliseconds base_delay = std::chrono::milliseconds(1);
    std::chrono::milliseconds max_delay = std::chrono::milliseconds(50);
    int jitter_pct = 20;
};

// Transaction ledger and write-behind queue
struct AuditConfig {
    // Most recent transactions kept per agent in the cache index
    std::size_t recent_index_size = 1000;
    Duration recent_index_ttl = std::chrono::hours(24 * 30);

    // Synchronous durable attempts before a record is buffered
    RetryConfig durable_retry{3, std::chrono::milliseconds(5),
                              std::chrono::milliseconds(100), 20};

    // Background retry of buffered writes
    Duration flush_interval = std::chrono::milliseconds(200);
    std::chrono::milliseconds flush_max_backoff = std::chrono::seconds(30);
};

// ROI-driven limit rescaling
struct ScalerConfig {
    Duration roi_window = std::chrono::hours(24 * 7);
    std::size_t max_window_transactions = 500;

    double excellent_threshold = 2.0;
    double good_threshold = 1.5;
    double neutral_threshold = 0.8;
    double poor_threshold = 0.4;

    double excellent_multiplier = 1.5;
    double good_multiplier = 1.2;
    double poor_multiplier = 0.8;
    double critical_multiplier = 0.5;

    MinorUnits daily_limit_floor = 1000;
    MinorUnits daily_limit_ceiling = 50000;
    MinorUnits per_action_limit_floor = 100;
    MinorUnits per_action_limit_ceiling = 10000;
};

struct ResetSchedulerConfig {
    bool enabled = false;
    Duration check_interval = std::chrono::minutes(1);
};

struct CircuitBreakerConfig {
    // In-process reuse of the last read flag (0 = read the store every time)
    Duration local_cache_ttl = Duration::zero();
};

// Defaults for agents provisioned without explicit values
struct ProvisioningDefaults {
    MinorUnits initial_balance = 5000;
    MinorUnits daily_limit = 10000;
    MinorUnits per_action_limit = 1000;
};

struct Config {
    // Optimistic CAS loop on budget updates
    RetryConfig cas_retry;

    AuditConfig audit;
    ScalerConfig scaler;
    ResetSchedulerConfig reset_scheduler;
    CircuitBreakerConfig circuit_breaker;
    ProvisioningDefaults defaults;

    // Key prefix shared by every cache entry the treasury owns
    std::string key_prefix = "treasury:";
};

} // namespace agenttreasury
