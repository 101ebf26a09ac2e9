#pragma once

#include "agenttreasury/config.hpp"
#include "agenttreasury/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace agenttreasury {

// Buffers durable-store writes and retries them until they land.
//
// Each write is identified by a key. Queuing a write whose key is already
// pending replaces the pending one, so only the latest budget snapshot is
// retried. Writes are idempotent by contract, so a retry never duplicates.
class WriteBehindQueue {
public:
    // Throws on failure (typically StoreUnavailableException)
    using WriteFn = std::function<void()>;

    explicit WriteBehindQueue(AuditConfig config, std::shared_ptr<Monitor> monitor = nullptr);
    ~WriteBehindQueue();

    // Non-copyable
    WriteBehindQueue(const WriteBehindQueue&) = delete;
    WriteBehindQueue& operator=(const WriteBehindQueue&) = delete;

    // Fire-and-forget write. With the worker running it is queued for the
    // worker; otherwise it is attempted once inline and queued on failure.
    void submit(const std::string& key, const std::string& description, WriteFn write);

    // Queue a write that already failed in the caller
    void enqueue(const std::string& key, const std::string& description, WriteFn write);

    // Attempt every pending write once, ignoring backoff. Returns how many landed.
    std::size_t flush();

    std::size_t pending() const;

    // Writes still pending when stop() last returned. They stay queued for a
    // later start() or flush(), and are reported with AuditRecordsAbandoned.
    std::size_t unwritten_at_stop() const { return unwritten_at_stop_.load(); }

    // Lifecycle
    void start();
    void stop();   // joins the worker, then makes one last flush attempt
    bool is_running() const { return running_.load(); }

private:
    struct PendingWrite {
        std::string key;
        std::string description;
        WriteFn     write;
        int         attempts{0};
        Timestamp   next_attempt{};
    };

    AuditConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex mutex_;
    std::deque<PendingWrite> queue_;

    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> unwritten_at_stop_{0};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    void worker_loop();
    std::size_t process(bool only_due);

    // True if the key was pending and its write was replaced
    bool replace_pending(const std::string& key, const std::string& description,
                         WriteFn& write);
    void push(PendingWrite item);
    void report_unwritten();

    void emit_event(EventType type, const std::string& message, int attempts);
};

} // namespace agenttreasury
