#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <agenttreasury/agenttreasury.hpp>

using namespace agenttreasury;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_agenttreasury, m) {
    m.doc() = "AgentTreasury: budget enforcement and audit trail for autonomous agents";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_stores(m);
    bind_monitors(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<BudgetStatus>(m, "BudgetStatus")
        .value("Active",         BudgetStatus::Active)
        .value("Suspended",      BudgetStatus::Suspended)
        .value("Decommissioned", BudgetStatus::Decommissioned)
        .export_values();

    py::enum_<TransactionKind>(m, "TransactionKind")
        .value("Spending", TransactionKind::Spending)
        .value("Earning",  TransactionKind::Earning)
        .export_values();

    py::enum_<TransactionOutcome>(m, "TransactionOutcome")
        .value("Success", TransactionOutcome::Success)
        .value("Denied",  TransactionOutcome::Denied)
        .export_values();

    py::enum_<DenialReason>(m, "DenialReason")
        .value("EmergencyFreeze",   DenialReason::EmergencyFreeze)
        .value("PerActionLimit",    DenialReason::PerActionLimit)
        .value("DailyLimit",        DenialReason::DailyLimit)
        .value("InsufficientFunds", DenialReason::InsufficientFunds)
        .value("AgentSuspended",    DenialReason::AgentSuspended)
        .value("BudgetNotFound",    DenialReason::BudgetNotFound)
        .value("InvalidAmount",     DenialReason::InvalidAmount)
        .value("Contention",        DenialReason::Contention)
        .value("StoreUnavailable",  DenialReason::StoreUnavailable)
        .value("Cancelled",         DenialReason::Cancelled)
        .export_values();

    py::enum_<LimitKind>(m, "LimitKind")
        .value("PerAction", LimitKind::PerAction)
        .value("Daily",     LimitKind::Daily)
        .export_values();

    py::enum_<PerformanceTier>(m, "PerformanceTier")
        .value("Excellent", PerformanceTier::Excellent)
        .value("Good",      PerformanceTier::Good)
        .value("Neutral",   PerformanceTier::Neutral)
        .value("Poor",      PerformanceTier::Poor)
        .value("Critical",  PerformanceTier::Critical)
        .export_values();

    py::enum_<AdminEventKind>(m, "AdminEventKind")
        .value("Freeze",       AdminEventKind::Freeze)
        .value("Unfreeze",     AdminEventKind::Unfreeze)
        .value("Provision",    AdminEventKind::Provision)
        .value("StatusChange", AdminEventKind::StatusChange)
        .value("LimitRescale", AdminEventKind::LimitRescale)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("SpendAuthorized",        EventType::SpendAuthorized)
        .value("SpendDenied",            EventType::SpendDenied)
        .value("FundsCredited",          EventType::FundsCredited)
        .value("BudgetProvisioned",      EventType::BudgetProvisioned)
        .value("BudgetStatusChanged",    EventType::BudgetStatusChanged)
        .value("DailyRollover",          EventType::DailyRollover)
        .value("LimitsRescaled",         EventType::LimitsRescaled)
        .value("CasConflict",            EventType::CasConflict)
        .value("ContentionExceeded",     EventType::ContentionExceeded)
        .value("AuditWriteDegraded",     EventType::AuditWriteDegraded)
        .value("AuditWriteRecovered",    EventType::AuditWriteRecovered)
        .value("AuditRecordsAbandoned",  EventType::AuditRecordsAbandoned)
        .value("MirrorWriteFailed",      EventType::MirrorWriteFailed)
        .value("CacheIndexWriteFailed",  EventType::CacheIndexWriteFailed)
        .value("CircuitBreakerFrozen",   EventType::CircuitBreakerFrozen)
        .value("CircuitBreakerUnfrozen", EventType::CircuitBreakerUnfrozen)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<RetryConfig>(m, "RetryConfig")
        .def(py::init<>())
        .def_readwrite("max_attempts", &RetryConfig::max_attempts)
        .def_readwrite("base_delay",   &RetryConfig::base_delay)
        .def_readwrite("max_delay",    &RetryConfig::max_delay)
        .def_readwrite("jitter_pct",   &RetryConfig::jitter_pct);

    py::class_<AuditConfig>(m, "AuditConfig")
        .def(py::init<>())
        .def_readwrite("recent_index_size", &AuditConfig::recent_index_size)
        .def_readwrite("recent_index_ttl",  &AuditConfig::recent_index_ttl)
        .def_readwrite("durable_retry",     &AuditConfig::durable_retry)
        .def_readwrite("flush_interval",    &AuditConfig::flush_interval)
        .def_readwrite("flush_max_backoff", &AuditConfig::flush_max_backoff);

    py::class_<ScalerConfig>(m, "ScalerConfig")
        .def(py::init<>())
        .def_readwrite("roi_window",              &ScalerConfig::roi_window)
        .def_readwrite("max_window_transactions", &ScalerConfig::max_window_transactions)
        .def_readwrite("excellent_threshold",     &ScalerConfig::excellent_threshold)
        .def_readwrite("good_threshold",          &ScalerConfig::good_threshold)
        .def_readwrite("neutral_threshold",       &ScalerConfig::neutral_threshold)
        .def_readwrite("poor_threshold",          &ScalerConfig::poor_threshold)
        .def_readwrite("excellent_multiplier",    &ScalerConfig::excellent_multiplier)
        .def_readwrite("good_multiplier",         &ScalerConfig::good_multiplier)
        .def_readwrite("poor_multiplier",         &ScalerConfig::poor_multiplier)
        .def_readwrite("critical_multiplier",     &ScalerConfig::critical_multiplier)
        .def_readwrite("daily_limit_floor",       &ScalerConfig::daily_limit_floor)
        .def_readwrite("daily_limit_ceiling",     &ScalerConfig::daily_limit_ceiling)
        .def_readwrite("per_action_limit_floor",  &ScalerConfig::per_action_limit_floor)
        .def_readwrite("per_action_limit_ceiling", &ScalerConfig::per_action_limit_ceiling);

    py::class_<ResetSchedulerConfig>(m, "ResetSchedulerConfig")
        .def(py::init<>())
        .def_readwrite("enabled",        &ResetSchedulerConfig::enabled)
        .def_readwrite("check_interval", &ResetSchedulerConfig::check_interval);

    py::class_<CircuitBreakerConfig>(m, "CircuitBreakerConfig")
        .def(py::init<>())
        .def_readwrite("local_cache_ttl", &CircuitBreakerConfig::local_cache_ttl);

    py::class_<ProvisioningDefaults>(m, "ProvisioningDefaults")
        .def(py::init<>())
        .def_readwrite("initial_balance",  &ProvisioningDefaults::initial_balance)
        .def_readwrite("daily_limit",      &ProvisioningDefaults::daily_limit)
        .def_readwrite("per_action_limit", &ProvisioningDefaults::per_action_limit);

    // Config (top-level, embeds the sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("cas_retry",       &Config::cas_retry)
        .def_readwrite("audit",           &Config::audit)
        .def_readwrite("scaler",          &Config::scaler)
        .def_readwrite("reset_scheduler", &Config::reset_scheduler)
        .def_readwrite("circuit_breaker", &Config::circuit_breaker)
        .def_readwrite("defaults",        &Config::defaults)
        .def_readwrite("key_prefix",      &Config::key_prefix);

    m.def("load_config", &load_config, py::arg("path"));
    m.def("load_config_from_string", &load_config_from_string, py::arg("yaml"));

    // ---- Records ----------------------------------------------------------

    py::class_<RoiData>(m, "RoiData")
        .def(py::init<>())
        .def_readwrite("tool",           &RoiData::tool)
        .def_readwrite("expected_value", &RoiData::expected_value)
        .def_readwrite("realized_value", &RoiData::realized_value);

    py::class_<AgentBudget>(m, "AgentBudget")
        .def(py::init<>())
        .def_readwrite("agent_id",           &AgentBudget::agent_id)
        .def_readwrite("current_balance",    &AgentBudget::current_balance)
        .def_readwrite("daily_limit",        &AgentBudget::daily_limit)
        .def_readwrite("per_action_limit",   &AgentBudget::per_action_limit)
        .def_readwrite("spent_today",        &AgentBudget::spent_today)
        .def_readwrite("total_spent",        &AgentBudget::total_spent)
        .def_readwrite("total_earned",       &AgentBudget::total_earned)
        .def_readwrite("last_reset_date",    &AgentBudget::last_reset_date)
        .def_readwrite("utc_offset_minutes", &AgentBudget::utc_offset_minutes)
        .def_readwrite("status",             &AgentBudget::status)
        .def_readwrite("roi_score",          &AgentBudget::roi_score)
        .def_readwrite("created_at",         &AgentBudget::created_at)
        .def_readwrite("updated_at",         &AgentBudget::updated_at)
        .def_readonly("revision",            &AgentBudget::revision)
        .def("available_daily_budget", &AgentBudget::available_daily_budget)
        .def("net_worth",              &AgentBudget::net_worth)
        .def("__repr__", [](const AgentBudget& b) {
            return "<AgentBudget agent_id='" + b.agent_id
                 + "' balance=" + std::to_string(b.current_balance)
                 + " spent_today=" + std::to_string(b.spent_today)
                 + " status=" + std::string(to_string(b.status)) + ">";
        });

    py::class_<Transaction>(m, "Transaction")
        .def(py::init<>())
        .def_readwrite("transaction_id", &Transaction::transaction_id)
        .def_readwrite("agent_id",       &Transaction::agent_id)
        .def_readwrite("amount",         &Transaction::amount)
        .def_readwrite("kind",           &Transaction::kind)
        .def_readwrite("description",    &Transaction::description)
        .def_readwrite("timestamp",      &Transaction::timestamp)
        .def_readwrite("outcome",        &Transaction::outcome)
        .def_readwrite("denial_reason",  &Transaction::denial_reason)
        .def_readwrite("balance_before", &Transaction::balance_before)
        .def_readwrite("balance_after",  &Transaction::balance_after)
        .def_readwrite("roi_data",       &Transaction::roi_data)
        .def_readwrite("metadata",       &Transaction::metadata)
        .def("succeeded", &Transaction::succeeded);

    py::class_<CircuitBreakerState>(m, "CircuitBreakerState")
        .def(py::init<>())
        .def_readwrite("frozen",    &CircuitBreakerState::frozen)
        .def_readwrite("reason",    &CircuitBreakerState::reason)
        .def_readwrite("actor",     &CircuitBreakerState::actor)
        .def_readwrite("timestamp", &CircuitBreakerState::timestamp);

    py::class_<AdminEvent>(m, "AdminEvent")
        .def(py::init<>())
        .def_readwrite("event_id",  &AdminEvent::event_id)
        .def_readwrite("kind",      &AdminEvent::kind)
        .def_readwrite("agent_id",  &AdminEvent::agent_id)
        .def_readwrite("actor",     &AdminEvent::actor)
        .def_readwrite("reason",    &AdminEvent::reason)
        .def_readwrite("detail",    &AdminEvent::detail)
        .def_readwrite("timestamp", &AdminEvent::timestamp);

    py::class_<BudgetLimits>(m, "BudgetLimits")
        .def(py::init<>())
        .def_readwrite("daily_limit",      &BudgetLimits::daily_limit)
        .def_readwrite("per_action_limit", &BudgetLimits::per_action_limit);

    py::class_<PerformanceSnapshot>(m, "PerformanceSnapshot")
        .def(py::init<>())
        .def_readwrite("agent_id",              &PerformanceSnapshot::agent_id)
        .def_readwrite("window_start",          &PerformanceSnapshot::window_start)
        .def_readwrite("window_end",            &PerformanceSnapshot::window_end)
        .def_readwrite("transaction_count",     &PerformanceSnapshot::transaction_count)
        .def_readwrite("total_spent",           &PerformanceSnapshot::total_spent)
        .def_readwrite("total_value_generated", &PerformanceSnapshot::total_value_generated)
        .def_readwrite("roi",                   &PerformanceSnapshot::roi)
        .def_readwrite("tier",                  &PerformanceSnapshot::tier);

    py::class_<RescaleResult>(m, "RescaleResult")
        .def(py::init<>())
        .def_readwrite("agent_id",   &RescaleResult::agent_id)
        .def_readwrite("old_limits", &RescaleResult::old_limits)
        .def_readwrite("new_limits", &RescaleResult::new_limits)
        .def_readwrite("multiplier", &RescaleResult::multiplier)
        .def_readwrite("snapshot",   &RescaleResult::snapshot)
        .def_readwrite("applied",    &RescaleResult::applied)
        .def_readwrite("reason",     &RescaleResult::reason);

    py::class_<TimeRange>(m, "TimeRange")
        .def(py::init<>())
        .def_readwrite("start", &TimeRange::from)
        .def_readwrite("end",   &TimeRange::to)
        .def("contains", &TimeRange::contains)
        .def_static("all", &TimeRange::all);

    py::class_<CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel",       &CancellationToken::cancel)
        .def("is_cancelled", &CancellationToken::is_cancelled);

    py::class_<SpendRequest>(m, "SpendRequest")
        .def(py::init<>())
        .def_readwrite("agent_id",     &SpendRequest::agent_id)
        .def_readwrite("amount",       &SpendRequest::amount)
        .def_readwrite("description",  &SpendRequest::description)
        .def_readwrite("metadata",     &SpendRequest::metadata)
        .def_readwrite("roi_data",     &SpendRequest::roi_data)
        .def_readwrite("cancel_token", &SpendRequest::cancel_token);

    py::class_<AuthorizationResult>(m, "AuthorizationResult")
        .def(py::init<>())
        .def_readwrite("transaction_id", &AuthorizationResult::transaction_id)
        .def_readwrite("budget",         &AuthorizationResult::budget)
        .def_readwrite("audit_degraded", &AuthorizationResult::audit_degraded);

    py::class_<BudgetSeed>(m, "BudgetSeed")
        .def(py::init<>())
        .def_readwrite("initial_balance",    &BudgetSeed::initial_balance)
        .def_readwrite("daily_limit",        &BudgetSeed::daily_limit)
        .def_readwrite("per_action_limit",   &BudgetSeed::per_action_limit)
        .def_readwrite("utc_offset_minutes", &BudgetSeed::utc_offset_minutes);

    py::class_<AgentTotals>(m, "AgentTotals")
        .def(py::init<>())
        .def_readwrite("agent_id",          &AgentTotals::agent_id)
        .def_readwrite("total_revenue",     &AgentTotals::total_revenue)
        .def_readwrite("total_expenses",    &AgentTotals::total_expenses)
        .def_readwrite("net_earnings",      &AgentTotals::net_earnings)
        .def_readwrite("transaction_count", &AgentTotals::transaction_count)
        .def_readwrite("denied_count",      &AgentTotals::denied_count);

    py::class_<EconomicSummary>(m, "EconomicSummary")
        .def(py::init<>())
        .def_readwrite("total_agents",     &EconomicSummary::total_agents)
        .def_readwrite("active_agents",    &EconomicSummary::active_agents)
        .def_readwrite("suspended_agents", &EconomicSummary::suspended_agents)
        .def_readwrite("total_balance",    &EconomicSummary::total_balance)
        .def_readwrite("total_spent",      &EconomicSummary::total_spent)
        .def_readwrite("total_earned",     &EconomicSummary::total_earned)
        .def_readwrite("system_roi",       &EconomicSummary::system_roi)
        .def_readwrite("top_performer",    &EconomicSummary::top_performer);

    py::class_<TreasuryStatus>(m, "TreasuryStatus")
        .def(py::init<>())
        .def_readwrite("frozen",                 &TreasuryStatus::frozen)
        .def_readwrite("breaker",                &TreasuryStatus::breaker)
        .def_readwrite("agent_count",            &TreasuryStatus::agent_count)
        .def_readwrite("pending_durable_writes", &TreasuryStatus::pending_durable_writes)
        .def_readwrite("unwritten_at_stop", &TreasuryStatus::unwritten_at_stop)
        .def_readwrite("scheduler_running",      &TreasuryStatus::scheduler_running);

    py::class_<DailyResetScheduler::RunReport>(m, "ResetReport")
        .def(py::init<>())
        .def_readwrite("checked",     &DailyResetScheduler::RunReport::checked)
        .def_readwrite("rolled_over", &DailyResetScheduler::RunReport::rolled_over)
        .def_readwrite("failed",      &DailyResetScheduler::RunReport::failed);

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",           &MonitorEvent::type)
        .def_readwrite("timestamp",      &MonitorEvent::timestamp)
        .def_readwrite("message",        &MonitorEvent::message)
        .def_readwrite("agent_id",       &MonitorEvent::agent_id)
        .def_readwrite("transaction_id", &MonitorEvent::transaction_id)
        .def_readwrite("amount",         &MonitorEvent::amount)
        .def_readwrite("denial_reason",  &MonitorEvent::denial_reason)
        .def_readwrite("actor",          &MonitorEvent::actor)
        .def_readwrite("attempts",       &MonitorEvent::attempts);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("total_authorizations",      &MetricsMonitor::Metrics::total_authorizations)
        .def_readwrite("successful_authorizations", &MetricsMonitor::Metrics::successful_authorizations)
        .def_readwrite("denied_authorizations",     &MetricsMonitor::Metrics::denied_authorizations)
        .def_readwrite("denials_by_reason",         &MetricsMonitor::Metrics::denials_by_reason)
        .def_readwrite("amount_authorized",         &MetricsMonitor::Metrics::amount_authorized)
        .def_readwrite("amount_credited",           &MetricsMonitor::Metrics::amount_credited)
        .def_readwrite("cas_conflicts",             &MetricsMonitor::Metrics::cas_conflicts)
        .def_readwrite("contention_failures",       &MetricsMonitor::Metrics::contention_failures)
        .def_readwrite("audit_degradations",        &MetricsMonitor::Metrics::audit_degradations)
        .def_readwrite("audit_recoveries",          &MetricsMonitor::Metrics::audit_recoveries)
        .def_readwrite("audit_records_abandoned",   &MetricsMonitor::Metrics::audit_records_abandoned)
        .def_readwrite("mirror_failures",           &MetricsMonitor::Metrics::mirror_failures)
        .def_readwrite("freezes",                   &MetricsMonitor::Metrics::freezes)
        .def_readwrite("rescales",                  &MetricsMonitor::Metrics::rescales);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_TreasuryError =
        py::register_exception<TreasuryException>(m, "TreasuryError", PyExc_RuntimeError);

    // Policy denials
    static auto py_PolicyDenialError =
        py::register_exception<PolicyDenialException>(m, "PolicyDenialError", py_TreasuryError.ptr());
    static auto py_EmergencyFreezeError =
        py::register_exception<EmergencyFreezeException>(m, "EmergencyFreezeError", py_PolicyDenialError.ptr());
    static auto py_UsageLimitExceededError =
        py::register_exception<UsageLimitExceededException>(m, "UsageLimitExceededError", py_PolicyDenialError.ptr());
    static auto py_InsufficientFundsError =
        py::register_exception<InsufficientFundsException>(m, "InsufficientFundsError", py_PolicyDenialError.ptr());
    static auto py_AgentSuspendedError =
        py::register_exception<AgentSuspendedException>(m, "AgentSuspendedError", py_PolicyDenialError.ptr());

    // Transient infrastructure errors
    static auto py_TransientError =
        py::register_exception<TransientException>(m, "TransientError", py_TreasuryError.ptr());
    static auto py_ContentionExceededError =
        py::register_exception<ContentionExceededException>(m, "ContentionExceededError", py_TransientError.ptr());
    static auto py_StoreUnavailableError =
        py::register_exception<StoreUnavailableException>(m, "StoreUnavailableError", py_TransientError.ptr());

    static auto py_CorruptRecordError =
        py::register_exception<CorruptRecordException>(m, "CorruptRecordError", py_TreasuryError.ptr());
    static auto py_AuditWriteDegradedError =
        py::register_exception<AuditWriteDegradedException>(m, "AuditWriteDegradedError", py_TreasuryError.ptr());

    // Request errors
    static auto py_InvalidRequestError =
        py::register_exception<InvalidRequestException>(m, "InvalidRequestError", py_TreasuryError.ptr());
    static auto py_InvalidAmountError =
        py::register_exception<InvalidAmountException>(m, "InvalidAmountError", py_InvalidRequestError.ptr());
    static auto py_InvalidAgentIdError =
        py::register_exception<InvalidAgentIdException>(m, "InvalidAgentIdError", py_InvalidRequestError.ptr());

    static auto py_BudgetNotFoundError =
        py::register_exception<BudgetNotFoundException>(m, "BudgetNotFoundError", py_TreasuryError.ptr());
    static auto py_AuthorizationCancelledError =
        py::register_exception<AuthorizationCancelledException>(m, "AuthorizationCancelledError", py_TreasuryError.ptr());
    static auto py_ConfigError =
        py::register_exception<ConfigException>(m, "ConfigError", py_TreasuryError.ptr());
}
