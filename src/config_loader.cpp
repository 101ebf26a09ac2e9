#include "agenttreasury/config_loader.hpp"
#include "agenttreasury/exceptions.hpp"

#include <yaml-cpp/yaml.h>

namespace agenttreasury {

namespace {

std::string qualify(const std::string& path, const char* key) {
    return path.empty() ? std::string(key) : path + "." + key;
}

// Overwrites `out` if `key` is present under `node`
template<typename T>
void read(const YAML::Node& node, const char* key, const std::string& path, T& out) {
    const YAML::Node field = node[key];
    if (!field) return;
    try {
        out = field.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigException(qualify(path, key), e.what());
    }
}

template<typename DurationT>
void read_duration(const YAML::Node& node, const char* key, const std::string& path,
                   DurationT& out, std::int64_t unit_ms) {
    const YAML::Node field = node[key];
    if (!field) return;
    std::int64_t value = 0;
    try {
        value = field.as<std::int64_t>();
    } catch (const YAML::Exception& e) {
        throw ConfigException(qualify(path, key), e.what());
    }
    if (value < 0) {
        throw ConfigException(qualify(path, key), "must not be negative");
    }
    out = std::chrono::duration_cast<DurationT>(std::chrono::milliseconds(value * unit_ms));
}

YAML::Node section(const YAML::Node& parent, const char* key, const std::string& path) {
    YAML::Node node = parent[key];
    if (node && !node.IsMap()) {
        throw ConfigException(qualify(path, key), "expected a map");
    }
    return node;
}

constexpr std::int64_t MS = 1;
constexpr std::int64_t HOUR_MS = 3600 * 1000;

void read_retry(const YAML::Node& node, const std::string& path, RetryConfig& retry) {
    if (!node) return;
    read(node, "max_attempts", path, retry.max_attempts);
    read_duration(node, "base_delay_ms", path, retry.base_delay, MS);
    read_duration(node, "max_delay_ms", path, retry.max_delay, MS);
    read(node, "jitter_pct", path, retry.jitter_pct);
}

void validate_retry(const RetryConfig& retry, const std::string& path) {
    if (retry.max_attempts < 1) {
        throw ConfigException(path + ".max_attempts", "must be at least 1");
    }
    if (retry.base_delay > retry.max_delay) {
        throw ConfigException(path + ".base_delay_ms", "must not exceed max_delay_ms");
    }
    if (retry.jitter_pct < 0 || retry.jitter_pct > 100) {
        throw ConfigException(path + ".jitter_pct", "must be within 0..100");
    }
}

Config parse(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigException("<root>", "expected a map");
    }

    read(root, "key_prefix", "", config.key_prefix);
    read_retry(section(root, "cas_retry", ""), "cas_retry", config.cas_retry);

    if (auto audit = section(root, "audit", "")) {
        read(audit, "recent_index_size", "audit", config.audit.recent_index_size);
        read_duration(audit, "recent_index_ttl_hours", "audit",
                      config.audit.recent_index_ttl, HOUR_MS);
        read_retry(section(audit, "durable_retry", "audit"), "audit.durable_retry",
                   config.audit.durable_retry);
        read_duration(audit, "flush_interval_ms", "audit", config.audit.flush_interval, MS);
        read_duration(audit, "flush_max_backoff_ms", "audit",
                      config.audit.flush_max_backoff, MS);
    }

    if (auto scaler = section(root, "scaler", "")) {
        auto& s = config.scaler;
        read_duration(scaler, "roi_window_hours", "scaler", s.roi_window, HOUR_MS);
        read(scaler, "max_window_transactions", "scaler", s.max_window_transactions);

        if (auto t = section(scaler, "thresholds", "scaler")) {
            read(t, "excellent", "scaler.thresholds", s.excellent_threshold);
            read(t, "good", "scaler.thresholds", s.good_threshold);
            read(t, "neutral", "scaler.thresholds", s.neutral_threshold);
            read(t, "poor", "scaler.thresholds", s.poor_threshold);
        }
        if (auto m = section(scaler, "multipliers", "scaler")) {
            read(m, "excellent", "scaler.multipliers", s.excellent_multiplier);
            read(m, "good", "scaler.multipliers", s.good_multiplier);
            read(m, "poor", "scaler.multipliers", s.poor_multiplier);
            read(m, "critical", "scaler.multipliers", s.critical_multiplier);
        }
        if (auto d = section(scaler, "daily_limit", "scaler")) {
            read(d, "floor", "scaler.daily_limit", s.daily_limit_floor);
            read(d, "ceiling", "scaler.daily_limit", s.daily_limit_ceiling);
        }
        if (auto p = section(scaler, "per_action_limit", "scaler")) {
            read(p, "floor", "scaler.per_action_limit", s.per_action_limit_floor);
            read(p, "ceiling", "scaler.per_action_limit", s.per_action_limit_ceiling);
        }
    }

    if (auto sched = section(root, "reset_scheduler", "")) {
        read(sched, "enabled", "reset_scheduler", config.reset_scheduler.enabled);
        read_duration(sched, "check_interval_ms", "reset_scheduler",
                      config.reset_scheduler.check_interval, MS);
    }

    if (auto breaker = section(root, "circuit_breaker", "")) {
        read_duration(breaker, "local_cache_ttl_ms", "circuit_breaker",
                      config.circuit_breaker.local_cache_ttl, MS);
    }

    if (auto defaults = section(root, "defaults", "")) {
        read(defaults, "initial_balance", "defaults", config.defaults.initial_balance);
        read(defaults, "daily_limit", "defaults", config.defaults.daily_limit);
        read(defaults, "per_action_limit", "defaults", config.defaults.per_action_limit);
    }

    validate_config(config);
    return config;
}

} // anonymous namespace

void validate_config(const Config& config) {
    validate_retry(config.cas_retry, "cas_retry");
    validate_retry(config.audit.durable_retry, "audit.durable_retry");

    if (config.key_prefix.empty()) {
        throw ConfigException("key_prefix", "must not be empty");
    }
    if (config.audit.recent_index_size == 0) {
        throw ConfigException("audit.recent_index_size", "must be positive");
    }
    if (config.audit.flush_interval <= Duration::zero()) {
        throw ConfigException("audit.flush_interval_ms", "must be positive");
    }

    const auto& s = config.scaler;
    if (!(s.excellent_threshold > s.good_threshold &&
          s.good_threshold > s.neutral_threshold &&
          s.neutral_threshold > s.poor_threshold &&
          s.poor_threshold >= 0.0)) {
        throw ConfigException("scaler.thresholds",
                              "must be strictly descending from excellent to poor");
    }
    if (s.excellent_multiplier <= 0.0 || s.good_multiplier <= 0.0 ||
        s.poor_multiplier <= 0.0 || s.critical_multiplier <= 0.0) {
        throw ConfigException("scaler.multipliers", "must be positive");
    }
    if (s.daily_limit_floor <= 0 || s.daily_limit_floor > s.daily_limit_ceiling) {
        throw ConfigException("scaler.daily_limit", "need 0 < floor <= ceiling");
    }
    if (s.per_action_limit_floor <= 0 || s.per_action_limit_floor > s.per_action_limit_ceiling) {
        throw ConfigException("scaler.per_action_limit", "need 0 < floor <= ceiling");
    }
    if (s.roi_window <= Duration::zero()) {
        throw ConfigException("scaler.roi_window_hours", "must be positive");
    }

    if (config.reset_scheduler.check_interval <= Duration::zero()) {
        throw ConfigException("reset_scheduler.check_interval_ms", "must be positive");
    }

    const auto& d = config.defaults;
    if (d.initial_balance < 0) {
        throw ConfigException("defaults.initial_balance", "must not be negative");
    }
    if (d.daily_limit <= 0 || d.per_action_limit <= 0) {
        throw ConfigException("defaults", "limits must be positive");
    }
}

Config load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        throw ConfigException(path, std::string("cannot read file: ") + e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigException(path, e.what());
    }
    return parse(root);
}

Config load_config_from_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigException("<string>", e.what());
    }
    return parse(root);
}

} // namespace agenttreasury
