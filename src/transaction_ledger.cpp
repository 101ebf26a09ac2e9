#include "agenttreasury/transaction_ledger.hpp"
#include "agenttreasury/codec.hpp"
#include "agenttreasury/exceptions.hpp"
#include "agenttreasury/retry.hpp"

namespace agenttreasury {

TransactionLedger::TransactionLedger(std::shared_ptr<CacheStore> cache,
                                     std::shared_ptr<LedgerStore> store,
                                     std::shared_ptr<WriteBehindQueue> queue,
                                     AuditConfig config,
                                     std::string key_prefix,
                                     std::shared_ptr<Monitor> monitor)
    : cache_(std::move(cache))
    , store_(std::move(store))
    , queue_(std::move(queue))
    , config_(std::move(config))
    , recent_prefix_(std::move(key_prefix) + "recent:")
    , monitor_(std::move(monitor)) {}

void TransactionLedger::index_recent(const Transaction& txn) {
    try {
        cache_->list_push_front(recent_prefix_ + txn.agent_id, encode_transaction(txn),
                                config_.recent_index_size, config_.recent_index_ttl);
    } catch (const StoreUnavailableException& e) {
        // The index is a convenience view; the durable append below is the record
        emit_event(EventType::CacheIndexWriteFailed,
                   std::string("Recent-activity index not updated: ") + e.what(),
                   txn.agent_id, txn.transaction_id);
    }
}

void TransactionLedger::record(const Transaction& txn) {
    index_recent(txn);

    auto store = store_;
    try {
        retry_transient(config_.durable_retry, [&] { store->append_transaction(txn); });
        return;
    } catch (const TransientException& e) {
        queue_->enqueue("txn:" + txn.transaction_id,
                        "transaction " + txn.transaction_id,
                        [store, txn] { store->append_transaction(txn); });
        emit_event(EventType::AuditWriteDegraded,
                   std::string("Transaction buffered for retry: ") + e.what(),
                   txn.agent_id, txn.transaction_id);
        throw AuditWriteDegradedException(txn.transaction_id, e.what());
    }
}

void TransactionLedger::record_admin_event(const AdminEvent& event) {
    auto store = store_;
    try {
        retry_transient(config_.durable_retry, [&] { store->append_admin_event(event); });
        return;
    } catch (const TransientException& e) {
        queue_->enqueue("admin:" + event.event_id,
                        "admin event " + event.event_id,
                        [store, event] { store->append_admin_event(event); });
        emit_event(EventType::AuditWriteDegraded,
                   std::string("Admin event (") + to_string(event.kind) +
                   ") buffered for retry: " + e.what(),
                   event.agent_id, event.event_id);
        throw AuditWriteDegradedException(event.event_id, e.what());
    }
}

std::vector<Transaction> TransactionLedger::get_transactions(const AgentId& agent_id,
                                                             const TimeRange& range,
                                                             std::size_t limit) {
    return retry_transient(config_.durable_retry, [&] {
        return store_->query_transactions(agent_id, range, limit);
    });
}

std::vector<AdminEvent> TransactionLedger::get_admin_events(const TimeRange& range,
                                                            std::size_t limit) {
    return retry_transient(config_.durable_retry, [&] {
        return store_->query_admin_events(range, limit);
    });
}

std::vector<Transaction> TransactionLedger::recent_activity(const AgentId& agent_id,
                                                            std::size_t limit) {
    std::vector<Transaction> result;
    for (const auto& encoded : cache_->list_range(recent_prefix_ + agent_id, 0, limit)) {
        result.push_back(decode_transaction(encoded));
    }
    return result;
}

AgentTotals TransactionLedger::agent_totals(const AgentId& agent_id) {
    AgentTotals totals;
    totals.agent_id = agent_id;

    for (const auto& txn : get_transactions(agent_id)) {
        totals.transaction_count++;
        if (!txn.succeeded()) {
            totals.denied_count++;
            continue;
        }
        if (txn.is_credit()) {
            totals.total_revenue += txn.amount;
        } else {
            totals.total_expenses += -txn.amount;
        }
    }
    totals.net_earnings = totals.total_revenue - totals.total_expenses;
    return totals;
}

std::size_t TransactionLedger::pending_writes() const {
    return queue_->pending();
}

std::size_t TransactionLedger::flush() {
    return queue_->flush();
}

void TransactionLedger::emit_event(EventType type, const std::string& message,
                                   const std::optional<AgentId>& agent_id,
                                   const std::string& record_id) {
    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.agent_id = agent_id;
    event.transaction_id = record_id;

    if (monitor_) {
        monitor_->on_event(event);
    }
}

} // namespace agenttreasury
