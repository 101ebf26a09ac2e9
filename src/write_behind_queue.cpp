#include "agenttreasury/write_behind_queue.hpp"
#include "agenttreasury/retry.hpp"

#include <algorithm>
#include <vector>

namespace agenttreasury {

WriteBehindQueue::WriteBehindQueue(AuditConfig config, std::shared_ptr<Monitor> monitor)
    : config_(std::move(config))
    , monitor_(std::move(monitor)) {}

WriteBehindQueue::~WriteBehindQueue() {
    if (running_.load()) {
        stop();
    } else {
        report_unwritten();
    }
}

bool WriteBehindQueue::replace_pending(const std::string& key,
                                       const std::string& description,
                                       WriteFn& write) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&](const PendingWrite& p) { return p.key == key; });
    if (it == queue_.end()) {
        return false;
    }
    it->description = description;
    it->write = std::move(write);
    return true;
}

void WriteBehindQueue::push(PendingWrite item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(queue_.begin(), queue_.end(),
                               [&](const PendingWrite& p) { return p.key == item.key; });
        if (it != queue_.end()) {
            // A newer write for the same key is already waiting
            return;
        }
        queue_.push_back(std::move(item));
    }
    std::lock_guard<std::mutex> lock(cv_mutex_);
    cv_.notify_all();
}

void WriteBehindQueue::submit(const std::string& key, const std::string& description,
                              WriteFn write) {
    if (replace_pending(key, description, write)) {
        return;
    }

    if (running_.load()) {
        PendingWrite item;
        item.key = key;
        item.description = description;
        item.write = std::move(write);
        item.next_attempt = Clock::now();
        push(std::move(item));
        return;
    }

    try {
        write();
        return;
    } catch (const std::exception& e) {
        emit_event(EventType::MirrorWriteFailed,
                   description + " failed, buffered for retry: " + e.what(), 1);
    }

    PendingWrite item;
    item.key = key;
    item.description = description;
    item.write = std::move(write);
    item.attempts = 1;
    item.next_attempt = Clock::now() + calculate_backoff_with_jitter(
        0, std::chrono::duration_cast<std::chrono::milliseconds>(config_.flush_interval),
        config_.flush_max_backoff);
    push(std::move(item));
}

void WriteBehindQueue::enqueue(const std::string& key, const std::string& description,
                               WriteFn write) {
    if (replace_pending(key, description, write)) {
        return;
    }
    PendingWrite item;
    item.key = key;
    item.description = description;
    item.write = std::move(write);
    item.attempts = config_.durable_retry.max_attempts;
    item.next_attempt = Clock::now() + config_.flush_interval;
    push(std::move(item));
}

std::size_t WriteBehindQueue::flush() {
    return process(false);
}

std::size_t WriteBehindQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t WriteBehindQueue::process(bool only_due) {
    std::vector<PendingWrite> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        for (auto it = queue_.begin(); it != queue_.end();) {
            if (!only_due || it->next_attempt <= now) {
                batch.push_back(std::move(*it));
                it = queue_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Outside the lock: run the writes
    std::size_t landed = 0;
    for (auto& item : batch) {
        bool ok = false;
        std::string error;
        try {
            item.write();
            ok = true;
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (ok) {
            ++landed;
            if (item.attempts > 0) {
                emit_event(EventType::AuditWriteRecovered,
                           item.description + " landed after retry", item.attempts + 1);
            }
            continue;
        }

        item.attempts++;
        if (item.attempts == 1 || item.attempts % 10 == 0) {
            emit_event(EventType::MirrorWriteFailed,
                       item.description + " still pending: " + error, item.attempts);
        }
        item.next_attempt = Clock::now() + calculate_backoff_with_jitter(
            item.attempts - 1,
            std::chrono::duration_cast<std::chrono::milliseconds>(config_.flush_interval),
            config_.flush_max_backoff);
        push(std::move(item));
    }
    return landed;
}

void WriteBehindQueue::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_thread_ = std::thread(&WriteBehindQueue::worker_loop, this);
}

void WriteBehindQueue::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    process(false);
    report_unwritten();
}

void WriteBehindQueue::report_unwritten() {
    std::size_t count = 0;
    std::string keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = queue_.size();
        for (const auto& item : queue_) {
            keys += (keys.empty() ? "" : ", ") + item.key;
        }
    }
    unwritten_at_stop_.store(count);
    if (count == 0) {
        return;
    }
    emit_event(EventType::AuditRecordsAbandoned,
               std::to_string(count) + " durable write(s) never landed: " + keys,
               static_cast<int>(count));
}

void WriteBehindQueue::worker_loop() {
    while (running_.load()) {
        process(true);

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.flush_interval, [this] {
            return !running_.load();
        });
    }
}

void WriteBehindQueue::emit_event(EventType type, const std::string& message, int attempts) {
    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.attempts = attempts;

    if (monitor_) {
        monitor_->on_event(event);
    }
}

} // namespace agenttreasury
