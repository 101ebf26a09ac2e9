// 01_basic_usage.cpp
//
// Minimal AgentTreasury example: one agent, one day of spending.
//
// Scenario:
//   - A research agent starts with 100.00 (10000 cents), a daily limit of
//     50.00 and a per-action limit of 20.00.
//   - It pays for a few tool calls. One call is too large for a single
//     action, and the last one would overrun the daily limit.
//   - Every attempt, approved or denied, ends up in the audit trail.

#include <agenttreasury/agenttreasury.hpp>

#include <iostream>
#include <string>

using namespace agenttreasury;

namespace {

std::string cents(MinorUnits amount) {
    std::string sign = amount < 0 ? "-" : "";
    MinorUnits abs = amount < 0 ? -amount : amount;
    std::string frac = std::to_string(abs % 100);
    if (frac.size() < 2) frac = "0" + frac;
    return sign + std::to_string(abs / 100) + "." + frac;
}

void try_spend(Treasury& treasury, const std::string& agent, MinorUnits amount,
               const std::string& what) {
    std::cout << "--- " << agent << " spends " << cents(amount) << " on " << what << " ---\n";
    try {
        auto result = treasury.authorize(agent, amount, what);
        std::cout << "Approved. Balance " << cents(result.budget.current_balance)
                  << ", left today " << cents(result.budget.available_daily_budget())
                  << "\n\n";
    } catch (const PolicyDenialException& e) {
        std::cout << "Denied (" << to_string(e.reason()) << "): " << e.what() << "\n\n";
    }
}

} // anonymous namespace

int main() {
    std::cout << "=== AgentTreasury: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the treasury with in-memory stores.
    // ----------------------------------------------------------------
    Treasury treasury;

    // Attach a console monitor so we can see what happens internally.
    treasury.add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Provision the agent.
    // ----------------------------------------------------------------
    BudgetSeed seed;
    seed.initial_balance = 10000;
    seed.daily_limit = 5000;
    seed.per_action_limit = 2000;
    treasury.provision_agent("research_agent", seed, "admin");
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 3. Spend. Limits are checked in order: per-action, daily, funds.
    // ----------------------------------------------------------------
    try_spend(treasury, "research_agent", 1500, "web search");
    try_spend(treasury, "research_agent", 2500, "large model call");  // per-action
    try_spend(treasury, "research_agent", 1500, "summarization");
    try_spend(treasury, "research_agent", 1500, "summarization");
    try_spend(treasury, "research_agent", 1500, "one call too many");  // daily

    // Revenue the agent brought in
    treasury.credit("research_agent", 3000, "client invoice paid");
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 4. Inspect the audit trail (newest first).
    // ----------------------------------------------------------------
    std::cout << "=== Audit Trail ===\n";
    for (const auto& txn : treasury.get_transactions("research_agent")) {
        std::cout << "  " << txn.transaction_id.substr(0, 8) << "  "
                  << (txn.succeeded() ? "OK    " : "DENIED") << "  "
                  << cents(txn.amount) << "  " << txn.description;
        if (txn.denial_reason.has_value()) {
            std::cout << " (" << to_string(*txn.denial_reason) << ")";
        }
        std::cout << "\n";
    }

    auto totals = treasury.agent_totals("research_agent");
    std::cout << "\nRevenue " << cents(totals.total_revenue)
              << ", expenses " << cents(totals.total_expenses)
              << ", net " << cents(totals.net_earnings)
              << ", denied attempts " << totals.denied_count << "\n";

    auto budget = treasury.get_budget("research_agent");
    std::cout << "Final balance " << cents(budget.current_balance) << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
