// 02_emergency_freeze.cpp
//
// Several agents spend in parallel while an operator pulls the emergency
// brake.
//
// Scenario:
//   - Four agents spend small amounts in a tight loop, each on its own
//     thread.
//   - After a moment the operator freezes the treasury. From then on every
//     authorization is denied, whichever agent asks.
//   - The operator unfreezes, and spending resumes.
//   - MetricsMonitor counts what happened; the admin log shows who did what.

#include <agenttreasury/agenttreasury.hpp>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace agenttreasury;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== AgentTreasury: Emergency Freeze Example ===\n\n";

    Treasury treasury;
    auto metrics = std::make_shared<MetricsMonitor>();
    treasury.add_monitor(metrics);
    // Normal verbosity prints only the important events (freezes, degradation)
    treasury.add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    constexpr int NUM_AGENTS = 4;
    BudgetSeed seed;
    seed.initial_balance = 1000000;
    seed.daily_limit = 1000000;
    seed.per_action_limit = 500;
    for (int i = 0; i < NUM_AGENTS; ++i) {
        treasury.provision_agent("worker_" + std::to_string(i), seed, "admin");
    }

    // ----------------------------------------------------------------
    // 1. Agents spend on their own threads.
    // ----------------------------------------------------------------
    std::atomic<bool> stop{false};
    std::atomic<int> approved{0};
    std::atomic<int> frozen_denials{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < NUM_AGENTS; ++i) {
        workers.emplace_back([&, i] {
            const std::string id = "worker_" + std::to_string(i);
            while (!stop.load()) {
                try {
                    treasury.authorize(id, 25, "api call");
                    approved.fetch_add(1);
                } catch (const EmergencyFreezeException&) {
                    frozen_denials.fetch_add(1);
                } catch (const TransientException& e) {
                    std::cout << "  transient: " << e.what() << "\n";
                }
                std::this_thread::sleep_for(1ms);
            }
        });
    }

    std::this_thread::sleep_for(100ms);
    std::cout << "Approved before freeze: " << approved.load() << "\n\n";

    // ----------------------------------------------------------------
    // 2. Freeze. Takes effect for every agent at once.
    // ----------------------------------------------------------------
    treasury.freeze("unexpected spend spike", "oncall-engineer");
    int approved_at_freeze = approved.load();
    std::this_thread::sleep_for(100ms);

    std::cout << "\nApproved while frozen: " << (approved.load() - approved_at_freeze)
              << ", denied by the freeze: " << frozen_denials.load() << "\n\n";

    // ----------------------------------------------------------------
    // 3. Unfreeze and let spending resume briefly.
    // ----------------------------------------------------------------
    treasury.unfreeze("spike explained, limits reviewed", "oncall-engineer");
    std::this_thread::sleep_for(50ms);
    stop.store(true);
    for (auto& t : workers) t.join();

    // ----------------------------------------------------------------
    // 4. Report.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "\n=== Metrics ===\n";
    std::cout << "  Authorizations: " << m.total_authorizations
              << " (approved " << m.successful_authorizations
              << ", denied " << m.denied_authorizations << ")\n";
    for (const auto& [reason, count] : m.denials_by_reason) {
        std::cout << "    " << reason << ": " << count << "\n";
    }
    std::cout << "  Amount authorized: " << m.amount_authorized << " cents\n";
    std::cout << "  CAS conflicts: " << m.cas_conflicts << "\n";
    std::cout << "  Freezes: " << m.freezes << "\n";

    std::cout << "\n=== Admin Log (newest first) ===\n";
    for (const auto& event : treasury.get_admin_events(TimeRange::all(), 5)) {
        std::cout << "  " << to_string(event.kind) << " by " << event.actor
                  << ": " << event.reason << "\n";
    }

    auto summary = treasury.economic_summary();
    std::cout << "\nTotal spent across " << summary.total_agents << " agents: "
              << summary.total_spent << " cents\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
