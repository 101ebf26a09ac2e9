#pragma once

#include "agenttreasury/types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agenttreasury {

enum class EventType {
    // Spending
    SpendAuthorized,
    SpendDenied,
    FundsCredited,
    // Budget lifecycle
    BudgetProvisioned,
    BudgetStatusChanged,
    DailyRollover,
    LimitsRescaled,
    // Concurrency
    CasConflict,
    ContentionExceeded,
    // Audit trail and durable mirror
    AuditWriteDegraded,
    AuditWriteRecovered,
    AuditRecordsAbandoned,
    MirrorWriteFailed,
    CacheIndexWriteFailed,
    // Circuit breaker
    CircuitBreakerFrozen,
    CircuitBreakerUnfrozen
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<AgentId> agent_id;
    std::optional<TransactionId> transaction_id;
    std::optional<MinorUnits> amount;
    std::optional<DenialReason> denial_reason;
    std::optional<std::string> actor;

    // CAS attempts, durable write attempts so far, or abandoned write count
    std::optional<int> attempts;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t total_authorizations{0};
        std::uint64_t successful_authorizations{0};
        std::uint64_t denied_authorizations{0};
        std::map<std::string, std::uint64_t> denials_by_reason;
        MinorUnits    amount_authorized{0};
        MinorUnits    amount_credited{0};
        std::uint64_t cas_conflicts{0};
        std::uint64_t contention_failures{0};
        std::uint64_t audit_degradations{0};
        std::uint64_t audit_recoveries{0};
        std::uint64_t audit_records_abandoned{0};
        std::uint64_t mirror_failures{0};
        std::uint64_t freezes{0};
        std::uint64_t rescales{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

    // Escalation hook for audit degradation and abandoned writes (compliance risk)
    using AlertCallback = std::function<void(const std::string&)>;
    void set_audit_alert(AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;
    AlertCallback audit_alert_cb_;
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace agenttreasury
