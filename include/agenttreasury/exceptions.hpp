#pragma once

#include "agenttreasury/types.hpp"
#include <stdexcept>
#include <string>

namespace agenttreasury {

class TreasuryException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    // Set when the failed call was recorded as a denied Transaction
    const TransactionId& transaction_id() const noexcept { return transaction_id_; }
    void set_transaction_id(TransactionId id) { transaction_id_ = std::move(id); }

private:
    TransactionId transaction_id_;
};

// ==================== Policy denials ====================
// Expected business outcomes. Each one is recorded as a denied Transaction.

class PolicyDenialException : public TreasuryException {
public:
    PolicyDenialException(DenialReason reason, const std::string& message)
        : TreasuryException(message)
        , reason_(reason) {}

    DenialReason reason() const noexcept { return reason_; }

private:
    DenialReason reason_;
};

class EmergencyFreezeException : public PolicyDenialException {
public:
    explicit EmergencyFreezeException(const std::string& freeze_reason)
        : PolicyDenialException(DenialReason::EmergencyFreeze,
            "Operation blocked: emergency freeze active (" + freeze_reason + ")") {}
};

class UsageLimitExceededException : public PolicyDenialException {
public:
    UsageLimitExceededException(const AgentId& agent, LimitKind kind,
                                MinorUnits requested, MinorUnits limit)
        : PolicyDenialException(
            kind == LimitKind::PerAction ? DenialReason::PerActionLimit
                                         : DenialReason::DailyLimit,
            "Agent '" + agent + "' exceeded " + to_string(kind) +
            " limit: requested " + std::to_string(requested) +
            ", limit " + std::to_string(limit))
        , kind_(kind) {}

    LimitKind kind() const noexcept { return kind_; }

private:
    LimitKind kind_;
};

class InsufficientFundsException : public PolicyDenialException {
public:
    InsufficientFundsException(const AgentId& agent, MinorUnits required,
                               MinorUnits available)
        : PolicyDenialException(DenialReason::InsufficientFunds,
            "Agent '" + agent + "' has insufficient funds: required " +
            std::to_string(required) + ", available " + std::to_string(available))
        , required_(required)
        , available_(available) {}

    MinorUnits required() const noexcept { return required_; }
    MinorUnits available() const noexcept { return available_; }

private:
    MinorUnits required_;
    MinorUnits available_;
};

class AgentSuspendedException : public PolicyDenialException {
public:
    AgentSuspendedException(const AgentId& agent, BudgetStatus status)
        : PolicyDenialException(DenialReason::AgentSuspended,
            "Agent '" + agent + "' cannot spend while " + to_string(status)) {}
};

// ==================== Transient infrastructure errors ====================
// "Try again", as opposed to "not allowed".

class TransientException : public TreasuryException {
public:
    using TreasuryException::TreasuryException;
};

class ContentionExceededException : public TransientException {
public:
    ContentionExceededException(const std::string& key, int attempts)
        : TransientException("Gave up on '" + key + "' after " +
                             std::to_string(attempts) + " conflicting updates") {}
};

class StoreUnavailableException : public TransientException {
public:
    StoreUnavailableException(const std::string& store, const std::string& details)
        : TransientException("Store '" + store + "' unavailable: " + details) {}
};

class CorruptRecordException : public TreasuryException {
public:
    CorruptRecordException(const std::string& what_record, const std::string& details)
        : TreasuryException("Corrupt " + what_record + " record: " + details) {}
};

// ==================== Audit degradation ====================
// Compliance risk, not a correctness risk. Never blocks a committed spend.

class AuditWriteDegradedException : public TreasuryException {
public:
    AuditWriteDegradedException(const std::string& record_id, const std::string& details)
        : TreasuryException("Audit record " + record_id +
                            " buffered for retry: " + details)
        , record_id_(record_id) {}

    const std::string& record_id() const noexcept { return record_id_; }

private:
    std::string record_id_;
};

// ==================== Request errors ====================

class InvalidRequestException : public TreasuryException {
public:
    using TreasuryException::TreasuryException;
};

class InvalidAmountException : public InvalidRequestException {
public:
    explicit InvalidAmountException(MinorUnits amount)
        : InvalidRequestException("Invalid amount " + std::to_string(amount) +
                                  ": must be positive") {}
    InvalidAmountException(MinorUnits amount, const std::string& why)
        : InvalidRequestException("Invalid amount " + std::to_string(amount) + ": " + why) {}
};

class InvalidAgentIdException : public InvalidRequestException {
public:
    explicit InvalidAgentIdException(const std::string& raw)
        : InvalidRequestException("Invalid agent id '" + raw +
                                  "': must be at least 3 characters") {}
};

class BudgetNotFoundException : public TreasuryException {
public:
    explicit BudgetNotFoundException(const AgentId& agent)
        : TreasuryException("Budget for agent '" + agent + "' not found")
        , agent_id_(agent) {}

    const AgentId& agent_id() const noexcept { return agent_id_; }

private:
    AgentId agent_id_;
};

class AuthorizationCancelledException : public TreasuryException {
public:
    explicit AuthorizationCancelledException(const AgentId& agent)
        : TreasuryException("Authorization for agent '" + agent +
                            "' cancelled before commit") {}
};

class ConfigException : public TreasuryException {
public:
    ConfigException(const std::string& parameter, const std::string& issue)
        : TreasuryException("Configuration error in '" + parameter + "': " + issue) {}
};

} // namespace agenttreasury
