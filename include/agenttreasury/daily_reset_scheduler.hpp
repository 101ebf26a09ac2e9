#pragma once

#include "agenttreasury/budget_registry.hpp"
#include "agenttreasury/config.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace agenttreasury {

// Proactive daily rollover so idle agents show a fresh spent_today.
// Correctness never depends on it: authorize rolls over lazily.
class DailyResetScheduler {
public:
    struct RunReport {
        std::size_t checked{0};
        std::size_t rolled_over{0};
        std::size_t failed{0};
    };

    DailyResetScheduler(std::shared_ptr<BudgetRegistry> registry, ResetSchedulerConfig config);
    ~DailyResetScheduler();

    // Non-copyable
    DailyResetScheduler(const DailyResetScheduler&) = delete;
    DailyResetScheduler& operator=(const DailyResetScheduler&) = delete;

    // One pass over every known agent. Per-agent failures are counted and
    // left for the next pass.
    RunReport run_once();

    // Lifecycle
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    RunReport last_report() const;

private:
    std::shared_ptr<BudgetRegistry> registry_;
    ResetSchedulerConfig config_;

    mutable std::mutex report_mutex_;
    RunReport last_report_;

    std::thread checker_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    void check_loop();
};

} // namespace agenttreasury
