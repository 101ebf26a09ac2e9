#pragma once

#include "agenttreasury/types.hpp"
#include <string>

namespace agenttreasury {

// Record <-> string encoding for cache values and structured store columns.
// Records are single-line YAML flow maps; money as integers, times as unix ms.
// Decoders throw CorruptRecordException on malformed input.

std::string encode_budget(const AgentBudget& budget);
AgentBudget decode_budget(const std::string& text);

std::string encode_transaction(const Transaction& txn);
Transaction decode_transaction(const std::string& text);

std::string encode_admin_event(const AdminEvent& event);
AdminEvent decode_admin_event(const std::string& text);

std::string encode_breaker_state(const CircuitBreakerState& state);
CircuitBreakerState decode_breaker_state(const std::string& text);

std::string encode_roi_data(const RoiData& roi);
RoiData decode_roi_data(const std::string& text);

std::string encode_metadata(const Metadata& metadata);
Metadata decode_metadata(const std::string& text);

// Inverse of the to_string() overloads in types.hpp
BudgetStatus parse_budget_status(const std::string& s);
TransactionKind parse_transaction_kind(const std::string& s);
TransactionOutcome parse_transaction_outcome(const std::string& s);
DenialReason parse_denial_reason(const std::string& s);
AdminEventKind parse_admin_event_kind(const std::string& s);

} // namespace agenttreasury
