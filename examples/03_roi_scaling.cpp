// 03_roi_scaling.cpp
//
// Performance-driven limits on a durable ledger.
//
// Scenario:
//   - Configuration comes from YAML (here an inline document; load_config
//     reads the same format from a file).
//   - Three agents spend on tool calls and report the value each call
//     produced. One pays for itself many times over, one breaks even,
//     one produces almost nothing.
//   - rescale_all() moves each agent's limits by its ROI tier, within the
//     configured floor and ceiling. Balances are never touched.
//   - The ledger lives in a SQLite file, so the audit trail outlives the
//     process.

#include <agenttreasury/agenttreasury.hpp>
#include <agenttreasury/sqlite_ledger_store.hpp>

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>

using namespace agenttreasury;

namespace {

constexpr const char* CONFIG_YAML = R"(
scaler:
  roi_window_hours: 168
  thresholds: { excellent: 2.0, good: 1.5, neutral: 0.8, poor: 0.4 }
  daily_limit: { floor: 1000, ceiling: 50000 }
  per_action_limit: { floor: 100, ceiling: 10000 }
defaults: { initial_balance: 100000, daily_limit: 10000, per_action_limit: 2000 }
)";

void work(Treasury& treasury, const std::string& agent, int calls, MinorUnits cost,
          MinorUnits value_per_call) {
    for (int i = 0; i < calls; ++i) {
        SpendRequest request;
        request.agent_id = agent;
        request.amount = cost;
        request.description = "tool call " + std::to_string(i + 1);
        request.roi_data = RoiData{"analysis", cost, value_per_call};
        treasury.authorize(request);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::cout << "=== AgentTreasury: ROI Scaling Example ===\n\n";

    std::string db_path = argc > 1 ? argv[1] : "agenttreasury_example.db";
    // Fresh ledger per run
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::remove((db_path + suffix).c_str());
    }

    try {
        Config config = load_config_from_string(CONFIG_YAML);
        auto ledger = std::make_shared<SqliteLedgerStore>(db_path);
        std::cout << "Ledger: " << ledger->path()
                  << " (schema v" << ledger->schema_version() << ")\n\n";

        Treasury treasury(config, nullptr, ledger);
        treasury.add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
        treasury.start();

        // Defaults come from the YAML document
        for (const char* id : {"star_agent", "steady_agent", "idle_agent"}) {
            treasury.provision_agent(id);
        }

        // ----------------------------------------------------------------
        // 1. A day of work with reported value.
        // ----------------------------------------------------------------
        work(treasury, "star_agent",   5, 1000, 3000);   // ROI 3.0
        work(treasury, "steady_agent", 5, 1000, 1000);   // ROI 1.0
        work(treasury, "idle_agent",   5, 1000, 100);    // ROI 0.1

        // ----------------------------------------------------------------
        // 2. Rescale every active agent.
        // ----------------------------------------------------------------
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "=== Rescale ===\n";
        for (const auto& r : treasury.rescale_all("nightly-review")) {
            std::cout << "  " << std::left << std::setw(14) << r.agent_id
                      << " ROI " << r.snapshot.roi
                      << " [" << to_string(r.snapshot.tier) << "] x" << r.multiplier
                      << "  daily " << r.old_limits.daily_limit << " -> "
                      << r.new_limits.daily_limit
                      << ", per action " << r.old_limits.per_action_limit << " -> "
                      << r.new_limits.per_action_limit
                      << (r.applied ? "" : "  (unchanged: " + r.reason + ")") << "\n";
        }

        // ----------------------------------------------------------------
        // 3. System view.
        // ----------------------------------------------------------------
        auto summary = treasury.economic_summary();
        std::cout << "\n=== Economy ===\n";
        std::cout << "  Agents: " << summary.total_agents
                  << " (active " << summary.active_agents << ")\n";
        std::cout << "  Total balance: " << summary.total_balance << "\n";
        std::cout << "  Total spent: " << summary.total_spent << "\n";
        if (summary.top_performer.has_value()) {
            std::cout << "  Top performer: " << *summary.top_performer << "\n";
        }

        treasury.stop();
        auto status = treasury.status();
        std::cout << "  Durable writes still pending: " << status.pending_durable_writes << "\n";
    } catch (const TreasuryException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
