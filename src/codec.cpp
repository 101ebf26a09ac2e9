#include "agenttreasury/codec.hpp"
#include "agenttreasury/exceptions.hpp"
#include "agenttreasury/time_util.hpp"

#include <yaml-cpp/yaml.h>

#include <initializer_list>

namespace agenttreasury {

namespace {

template<typename Enum>
Enum parse_enum(const std::string& s, std::initializer_list<Enum> values,
                const char* what) {
    for (Enum v : values) {
        if (s == to_string(v)) return v;
    }
    throw CorruptRecordException(what, "unknown value '" + s + "'");
}

YAML::Node load_map(const std::string& text, const char* what) {
    YAML::Node node;
    try {
        node = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw CorruptRecordException(what, e.what());
    }
    if (!node.IsMap()) {
        throw CorruptRecordException(what, "expected a map");
    }
    return node;
}

template<typename T>
T required(const YAML::Node& node, const char* key, const char* what) {
    const YAML::Node field = node[key];
    if (!field) {
        throw CorruptRecordException(what, std::string("missing field '") + key + "'");
    }
    try {
        return field.as<T>();
    } catch (const YAML::Exception& e) {
        throw CorruptRecordException(what, std::string("field '") + key + "': " + e.what());
    }
}

template<typename T>
std::optional<T> optional_field(const YAML::Node& node, const char* key, const char* what) {
    const YAML::Node field = node[key];
    if (!field || field.IsNull()) return std::nullopt;
    try {
        return field.as<T>();
    } catch (const YAML::Exception& e) {
        throw CorruptRecordException(what, std::string("field '") + key + "': " + e.what());
    }
}

void begin_record(YAML::Emitter& out) {
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetDoublePrecision(17);
    out << YAML::BeginMap;
}

void emit_roi(YAML::Emitter& out, const RoiData& roi) {
    out << YAML::BeginMap;
    out << YAML::Key << "tool" << YAML::Value << roi.tool;
    out << YAML::Key << "expected_value" << YAML::Value << roi.expected_value;
    if (roi.realized_value.has_value()) {
        out << YAML::Key << "realized_value" << YAML::Value << *roi.realized_value;
    }
    out << YAML::EndMap;
}

RoiData read_roi(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw CorruptRecordException("roi_data", "expected a map");
    }
    RoiData roi;
    roi.tool = required<std::string>(node, "tool", "roi_data");
    roi.expected_value = required<MinorUnits>(node, "expected_value", "roi_data");
    roi.realized_value = optional_field<MinorUnits>(node, "realized_value", "roi_data");
    return roi;
}

void emit_metadata(YAML::Emitter& out, const Metadata& metadata) {
    out << YAML::BeginMap;
    for (const auto& [key, value] : metadata) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;
}

Metadata read_metadata(const YAML::Node& node) {
    Metadata metadata;
    if (!node || node.IsNull()) return metadata;
    if (!node.IsMap()) {
        throw CorruptRecordException("metadata", "expected a map");
    }
    try {
        for (const auto& kv : node) {
            metadata[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw CorruptRecordException("metadata", e.what());
    }
    return metadata;
}

std::string finish(YAML::Emitter& out, const char* what) {
    out << YAML::EndMap;
    if (!out.good()) {
        throw CorruptRecordException(what, "encode failed: " + out.GetLastError());
    }
    return out.c_str();
}

} // anonymous namespace

// ========== Enum parsing ==========

BudgetStatus parse_budget_status(const std::string& s) {
    return parse_enum(s, {BudgetStatus::Active, BudgetStatus::Suspended,
                          BudgetStatus::Decommissioned}, "budget status");
}

TransactionKind parse_transaction_kind(const std::string& s) {
    return parse_enum(s, {TransactionKind::Spending, TransactionKind::Earning},
                      "transaction kind");
}

TransactionOutcome parse_transaction_outcome(const std::string& s) {
    return parse_enum(s, {TransactionOutcome::Success, TransactionOutcome::Denied},
                      "transaction outcome");
}

DenialReason parse_denial_reason(const std::string& s) {
    return parse_enum(s, {DenialReason::EmergencyFreeze, DenialReason::PerActionLimit,
                          DenialReason::DailyLimit, DenialReason::InsufficientFunds,
                          DenialReason::AgentSuspended, DenialReason::BudgetNotFound,
                          DenialReason::InvalidAmount, DenialReason::Contention,
                          DenialReason::StoreUnavailable, DenialReason::Cancelled},
                      "denial reason");
}

AdminEventKind parse_admin_event_kind(const std::string& s) {
    return parse_enum(s, {AdminEventKind::Freeze, AdminEventKind::Unfreeze,
                          AdminEventKind::Provision, AdminEventKind::StatusChange,
                          AdminEventKind::LimitRescale}, "admin event kind");
}

// ========== AgentBudget ==========

std::string encode_budget(const AgentBudget& b) {
    YAML::Emitter out;
    begin_record(out);
    out << YAML::Key << "agent_id" << YAML::Value << b.agent_id;
    out << YAML::Key << "current_balance" << YAML::Value << b.current_balance;
    out << YAML::Key << "daily_limit" << YAML::Value << b.daily_limit;
    out << YAML::Key << "per_action_limit" << YAML::Value << b.per_action_limit;
    out << YAML::Key << "spent_today" << YAML::Value << b.spent_today;
    out << YAML::Key << "total_spent" << YAML::Value << b.total_spent;
    out << YAML::Key << "total_earned" << YAML::Value << b.total_earned;
    out << YAML::Key << "last_reset_date" << YAML::Value << b.last_reset_date;
    out << YAML::Key << "utc_offset_minutes" << YAML::Value << b.utc_offset_minutes;
    out << YAML::Key << "status" << YAML::Value << to_string(b.status);
    out << YAML::Key << "roi_score" << YAML::Value << b.roi_score;
    out << YAML::Key << "created_at" << YAML::Value << to_unix_millis(b.created_at);
    out << YAML::Key << "updated_at" << YAML::Value << to_unix_millis(b.updated_at);
    out << YAML::Key << "revision" << YAML::Value << b.revision;
    return finish(out, "budget");
}

AgentBudget decode_budget(const std::string& text) {
    const char* what = "budget";
    YAML::Node node = load_map(text, what);

    AgentBudget b;
    b.agent_id = required<std::string>(node, "agent_id", what);
    b.current_balance = required<MinorUnits>(node, "current_balance", what);
    b.daily_limit = required<MinorUnits>(node, "daily_limit", what);
    b.per_action_limit = required<MinorUnits>(node, "per_action_limit", what);
    b.spent_today = required<MinorUnits>(node, "spent_today", what);
    b.total_spent = optional_field<MinorUnits>(node, "total_spent", what).value_or(0);
    b.total_earned = optional_field<MinorUnits>(node, "total_earned", what).value_or(0);
    b.last_reset_date = required<LocalDate>(node, "last_reset_date", what);
    b.utc_offset_minutes =
        optional_field<std::int32_t>(node, "utc_offset_minutes", what).value_or(0);
    b.status = parse_budget_status(required<std::string>(node, "status", what));
    b.roi_score = optional_field<double>(node, "roi_score", what).value_or(0.0);
    b.created_at = from_unix_millis(required<std::int64_t>(node, "created_at", what));
    b.updated_at = from_unix_millis(required<std::int64_t>(node, "updated_at", what));
    b.revision = optional_field<std::uint64_t>(node, "revision", what).value_or(0);
    return b;
}

// ========== Transaction ==========

std::string encode_transaction(const Transaction& t) {
    YAML::Emitter out;
    begin_record(out);
    out << YAML::Key << "transaction_id" << YAML::Value << t.transaction_id;
    out << YAML::Key << "agent_id" << YAML::Value << t.agent_id;
    out << YAML::Key << "amount" << YAML::Value << t.amount;
    out << YAML::Key << "kind" << YAML::Value << to_string(t.kind);
    out << YAML::Key << "description" << YAML::Value << t.description;
    out << YAML::Key << "timestamp" << YAML::Value << to_unix_millis(t.timestamp);
    out << YAML::Key << "outcome" << YAML::Value << to_string(t.outcome);
    if (t.denial_reason.has_value()) {
        out << YAML::Key << "denial_reason" << YAML::Value << to_string(*t.denial_reason);
    }
    if (t.balance_before.has_value()) {
        out << YAML::Key << "balance_before" << YAML::Value << *t.balance_before;
    }
    if (t.balance_after.has_value()) {
        out << YAML::Key << "balance_after" << YAML::Value << *t.balance_after;
    }
    if (t.roi_data.has_value()) {
        out << YAML::Key << "roi_data" << YAML::Value;
        emit_roi(out, *t.roi_data);
    }
    if (!t.metadata.empty()) {
        out << YAML::Key << "metadata" << YAML::Value;
        emit_metadata(out, t.metadata);
    }
    return finish(out, "transaction");
}

Transaction decode_transaction(const std::string& text) {
    const char* what = "transaction";
    YAML::Node node = load_map(text, what);

    Transaction t;
    t.transaction_id = required<std::string>(node, "transaction_id", what);
    t.agent_id = required<std::string>(node, "agent_id", what);
    t.amount = required<MinorUnits>(node, "amount", what);
    t.kind = parse_transaction_kind(required<std::string>(node, "kind", what));
    t.description = optional_field<std::string>(node, "description", what).value_or("");
    t.timestamp = from_unix_millis(required<std::int64_t>(node, "timestamp", what));
    t.outcome = parse_transaction_outcome(required<std::string>(node, "outcome", what));
    if (auto reason = optional_field<std::string>(node, "denial_reason", what)) {
        t.denial_reason = parse_denial_reason(*reason);
    }
    t.balance_before = optional_field<MinorUnits>(node, "balance_before", what);
    t.balance_after = optional_field<MinorUnits>(node, "balance_after", what);
    if (node["roi_data"] && !node["roi_data"].IsNull()) {
        t.roi_data = read_roi(node["roi_data"]);
    }
    t.metadata = read_metadata(node["metadata"]);
    return t;
}

// ========== AdminEvent ==========

std::string encode_admin_event(const AdminEvent& e) {
    YAML::Emitter out;
    begin_record(out);
    out << YAML::Key << "event_id" << YAML::Value << e.event_id;
    out << YAML::Key << "kind" << YAML::Value << to_string(e.kind);
    if (e.agent_id.has_value()) {
        out << YAML::Key << "agent_id" << YAML::Value << *e.agent_id;
    }
    out << YAML::Key << "actor" << YAML::Value << e.actor;
    out << YAML::Key << "reason" << YAML::Value << e.reason;
    out << YAML::Key << "detail" << YAML::Value << e.detail;
    out << YAML::Key << "timestamp" << YAML::Value << to_unix_millis(e.timestamp);
    return finish(out, "admin event");
}

AdminEvent decode_admin_event(const std::string& text) {
    const char* what = "admin event";
    YAML::Node node = load_map(text, what);

    AdminEvent e;
    e.event_id = required<std::string>(node, "event_id", what);
    e.kind = parse_admin_event_kind(required<std::string>(node, "kind", what));
    e.agent_id = optional_field<std::string>(node, "agent_id", what);
    e.actor = optional_field<std::string>(node, "actor", what).value_or("");
    e.reason = optional_field<std::string>(node, "reason", what).value_or("");
    e.detail = optional_field<std::string>(node, "detail", what).value_or("");
    e.timestamp = from_unix_millis(required<std::int64_t>(node, "timestamp", what));
    return e;
}

// ========== CircuitBreakerState ==========

std::string encode_breaker_state(const CircuitBreakerState& s) {
    YAML::Emitter out;
    begin_record(out);
    out << YAML::Key << "frozen" << YAML::Value << s.frozen;
    out << YAML::Key << "reason" << YAML::Value << s.reason;
    out << YAML::Key << "actor" << YAML::Value << s.actor;
    out << YAML::Key << "timestamp" << YAML::Value << to_unix_millis(s.timestamp);
    return finish(out, "circuit breaker");
}

CircuitBreakerState decode_breaker_state(const std::string& text) {
    const char* what = "circuit breaker";
    YAML::Node node = load_map(text, what);

    CircuitBreakerState s;
    s.frozen = required<bool>(node, "frozen", what);
    s.reason = optional_field<std::string>(node, "reason", what).value_or("");
    s.actor = optional_field<std::string>(node, "actor", what).value_or("");
    s.timestamp = from_unix_millis(required<std::int64_t>(node, "timestamp", what));
    return s;
}

// ========== Structured columns ==========

std::string encode_roi_data(const RoiData& roi) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    emit_roi(out, roi);
    return out.c_str();
}

RoiData decode_roi_data(const std::string& text) {
    return read_roi(load_map(text, "roi_data"));
}

std::string encode_metadata(const Metadata& metadata) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    emit_metadata(out, metadata);
    return out.c_str();
}

Metadata decode_metadata(const std::string& text) {
    if (text.empty()) return Metadata{};
    YAML::Node node;
    try {
        node = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw CorruptRecordException("metadata", e.what());
    }
    return read_metadata(node);
}

} // namespace agenttreasury
