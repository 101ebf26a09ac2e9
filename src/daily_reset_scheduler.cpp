#include "agenttreasury/daily_reset_scheduler.hpp"
#include "agenttreasury/exceptions.hpp"

namespace agenttreasury {

DailyResetScheduler::DailyResetScheduler(std::shared_ptr<BudgetRegistry> registry,
                                         ResetSchedulerConfig config)
    : registry_(std::move(registry))
    , config_(config) {}

DailyResetScheduler::~DailyResetScheduler() {
    if (running_.load()) {
        stop();
    }
}

DailyResetScheduler::RunReport DailyResetScheduler::run_once() {
    RunReport report;

    std::vector<AgentId> agents;
    try {
        agents = registry_->list_agent_ids();
    } catch (const TransientException&) {
        report.failed = 1;
    }

    for (const auto& id : agents) {
        report.checked++;
        try {
            if (registry_->rollover_if_due(id)) {
                report.rolled_over++;
            }
        } catch (const TransientException&) {
            report.failed++;
        } catch (const BudgetNotFoundException&) {
            report.failed++;
        } catch (const CorruptRecordException&) {
            report.failed++;
        }
    }

    std::lock_guard<std::mutex> lock(report_mutex_);
    last_report_ = report;
    return report;
}

DailyResetScheduler::RunReport DailyResetScheduler::last_report() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

void DailyResetScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    checker_thread_ = std::thread(&DailyResetScheduler::check_loop, this);
}

void DailyResetScheduler::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (checker_thread_.joinable()) {
        checker_thread_.join();
    }
}

void DailyResetScheduler::check_loop() {
    while (running_.load()) {
        run_once();

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.check_interval, [this] {
            return !running_.load();
        });
    }
}

} // namespace agenttreasury
