#pragma once

#include "agenttreasury/config.hpp"
#include <string>

namespace agenttreasury {

// Reads a YAML configuration file. Keys that are absent keep their defaults;
// malformed or out-of-range values throw ConfigException.
//
//   key_prefix: "treasury:"
//   cas_retry: { max_attempts: 8, base_delay_ms: 1, max_delay_ms: 50, jitter_pct: 20 }
//   audit:
//     recent_index_size: 1000
//     recent_index_ttl_hours: 720
//     durable_retry: { max_attempts: 3, base_delay_ms: 5, max_delay_ms: 100 }
//     flush_interval_ms: 200
//     flush_max_backoff_ms: 30000
//   scaler:
//     roi_window_hours: 168
//     max_window_transactions: 500
//     thresholds: { excellent: 2.0, good: 1.5, neutral: 0.8, poor: 0.4 }
//     multipliers: { excellent: 1.5, good: 1.2, poor: 0.8, critical: 0.5 }
//     daily_limit: { floor: 1000, ceiling: 50000 }
//     per_action_limit: { floor: 100, ceiling: 10000 }
//   reset_scheduler: { enabled: true, check_interval_ms: 60000 }
//   circuit_breaker: { local_cache_ttl_ms: 0 }
//   defaults: { initial_balance: 5000, daily_limit: 10000, per_action_limit: 1000 }
Config load_config(const std::string& path);
Config load_config_from_string(const std::string& yaml);

// Throws ConfigException on inconsistent values
void validate_config(const Config& config);

} // namespace agenttreasury
