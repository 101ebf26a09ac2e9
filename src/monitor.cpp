#include "agenttreasury/monitor.hpp"

#include <iostream>

namespace agenttreasury {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::SpendAuthorized:        return "SpendAuthorized";
        case EventType::SpendDenied:            return "SpendDenied";
        case EventType::FundsCredited:          return "FundsCredited";
        case EventType::BudgetProvisioned:      return "BudgetProvisioned";
        case EventType::BudgetStatusChanged:    return "BudgetStatusChanged";
        case EventType::DailyRollover:          return "DailyRollover";
        case EventType::LimitsRescaled:         return "LimitsRescaled";
        case EventType::CasConflict:            return "CasConflict";
        case EventType::ContentionExceeded:     return "ContentionExceeded";
        case EventType::AuditWriteDegraded:     return "AuditWriteDegraded";
        case EventType::AuditWriteRecovered:    return "AuditWriteRecovered";
        case EventType::AuditRecordsAbandoned:  return "AuditRecordsAbandoned";
        case EventType::MirrorWriteFailed:      return "MirrorWriteFailed";
        case EventType::CacheIndexWriteFailed:  return "CacheIndexWriteFailed";
        case EventType::CircuitBreakerFrozen:   return "CircuitBreakerFrozen";
        case EventType::CircuitBreakerUnfrozen: return "CircuitBreakerUnfrozen";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::ContentionExceeded:
        case EventType::AuditWriteDegraded:
        case EventType::AuditWriteRecovered:
        case EventType::AuditRecordsAbandoned:
        case EventType::MirrorWriteFailed:
        case EventType::CircuitBreakerFrozen:
        case EventType::CircuitBreakerUnfrozen:
        case EventType::BudgetProvisioned:
        case EventType::BudgetStatusChanged:
        case EventType::LimitsRescaled:
            return true;
        default:
            return false;
    }
}

bool is_debug_event(EventType t) {
    return t == EventType::CasConflict;
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_debug_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::ostream& out = (event.type == EventType::AuditWriteDegraded ||
                         event.type == EventType::AuditRecordsAbandoned ||
                         event.type == EventType::ContentionExceeded ||
                         event.type == EventType::MirrorWriteFailed)
                        ? std::cerr : std::cout;

    out << "[AgentTreasury] " << to_string(event.type);

    if (event.agent_id.has_value()) {
        out << " agent=" << event.agent_id.value();
    }
    if (event.transaction_id.has_value()) {
        out << " txn=" << event.transaction_id.value();
    }
    if (event.amount.has_value()) {
        out << " amount=" << event.amount.value();
    }
    if (event.denial_reason.has_value()) {
        out << " reason=" << to_string(event.denial_reason.value());
    }
    if (event.actor.has_value()) {
        out << " actor=" << event.actor.value();
    }
    if (event.attempts.has_value()) {
        out << " attempts=" << event.attempts.value();
    }

    if (!event.message.empty()) {
        out << " | " << event.message;
    }

    out << "\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback alert;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::SpendAuthorized:
                metrics_.total_authorizations++;
                metrics_.successful_authorizations++;
                metrics_.amount_authorized += event.amount.value_or(0);
                break;
            case EventType::SpendDenied:
                metrics_.total_authorizations++;
                metrics_.denied_authorizations++;
                if (event.denial_reason.has_value()) {
                    metrics_.denials_by_reason[to_string(event.denial_reason.value())]++;
                }
                break;
            case EventType::FundsCredited:
                metrics_.amount_credited += event.amount.value_or(0);
                break;
            case EventType::CasConflict:
                metrics_.cas_conflicts++;
                break;
            case EventType::ContentionExceeded:
                metrics_.contention_failures++;
                break;
            case EventType::AuditWriteDegraded:
                metrics_.audit_degradations++;
                alert = audit_alert_cb_;
                break;
            case EventType::AuditWriteRecovered:
                metrics_.audit_recoveries++;
                break;
            case EventType::AuditRecordsAbandoned:
                metrics_.audit_records_abandoned += static_cast<std::uint64_t>(
                    event.attempts.value_or(0));
                alert = audit_alert_cb_;
                break;
            case EventType::MirrorWriteFailed:
                metrics_.mirror_failures++;
                break;
            case EventType::CircuitBreakerFrozen:
                metrics_.freezes++;
                break;
            case EventType::LimitsRescaled:
                metrics_.rescales++;
                break;
            default:
                break;
        }
    }

    // Outside the lock: the callback may call back into get_metrics()
    if (alert) {
        alert(event.message);
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
}

void MetricsMonitor::set_audit_alert(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    audit_alert_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    std::vector<std::shared_ptr<Monitor>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = monitors_;
    }
    for (auto& m : targets) {
        m->on_event(event);
    }
}

} // namespace agenttreasury
