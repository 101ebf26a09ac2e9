#include "agenttreasury/ledger_store.hpp"

#include <algorithm>

namespace agenttreasury {

void InMemoryLedgerStore::upsert_budget(const AgentBudget& budget) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(budget.agent_id);
    if (it != budgets_.end() && it->second.revision > budget.revision) {
        return;  // a newer snapshot already landed
    }
    budgets_[budget.agent_id] = budget;
}

std::optional<AgentBudget> InMemoryLedgerStore::get_budget(const AgentId& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = budgets_.find(agent_id);
    if (it == budgets_.end()) return std::nullopt;
    return it->second;
}

std::vector<AgentBudget> InMemoryLedgerStore::list_budgets() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentBudget> result;
    result.reserve(budgets_.size());
    for (const auto& [id, budget] : budgets_) {
        result.push_back(budget);
    }
    std::sort(result.begin(), result.end(),
              [](const AgentBudget& a, const AgentBudget& b) {
                  return a.agent_id < b.agent_id;
              });
    return result;
}

bool InMemoryLedgerStore::append_transaction(const Transaction& txn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transaction_ids_.insert(txn.transaction_id).second) {
        return false;
    }
    transactions_.push_back(txn);
    return true;
}

std::vector<Transaction> InMemoryLedgerStore::query_transactions(
    const AgentId& agent_id, const TimeRange& range, std::size_t limit)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transaction> result;
    // Newest insertion first, so equal timestamps come back newest first too
    for (auto it = transactions_.rbegin(); it != transactions_.rend(); ++it) {
        if (it->agent_id == agent_id && range.contains(it->timestamp)) {
            result.push_back(*it);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const Transaction& a, const Transaction& b) {
                         return a.timestamp > b.timestamp;
                     });
    if (limit > 0 && result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

bool InMemoryLedgerStore::append_admin_event(const AdminEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!admin_event_ids_.insert(event.event_id).second) {
        return false;
    }
    admin_events_.push_back(event);
    return true;
}

std::vector<AdminEvent> InMemoryLedgerStore::query_admin_events(const TimeRange& range,
                                                                std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AdminEvent> result;
    for (auto it = admin_events_.rbegin(); it != admin_events_.rend(); ++it) {
        if (range.contains(it->timestamp)) {
            result.push_back(*it);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const AdminEvent& a, const AdminEvent& b) {
                         return a.timestamp > b.timestamp;
                     });
    if (limit > 0 && result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::size_t InMemoryLedgerStore::transaction_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transactions_.size();
}

std::size_t InMemoryLedgerStore::admin_event_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_events_.size();
}

} // namespace agenttreasury
