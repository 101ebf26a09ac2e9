#pragma once

#include "agenttreasury/types.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agenttreasury {

// A value read together with the version token needed to CAS it
struct VersionedValue {
    std::string value;
    std::uint64_t version{0};
};

// Fast key-value store boundary: versioned values, TTLs, atomic primitives.
//
// Version tokens are opaque and strictly increasing per key. A version of 0
// never identifies a live value, so compare_and_swap(key, 0, ...) means
// "create only if absent". Implementations throw StoreUnavailableException
// on infrastructure failure.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<VersionedValue> get(const std::string& key) = 0;

    // Unconditional write. Returns the new version.
    virtual std::uint64_t set(const std::string& key, std::string value,
                              std::optional<Duration> ttl = std::nullopt) = 0;

    // Write only if the key is still at `expected_version`.
    // Returns the new version, or nullopt if another writer got there first.
    virtual std::optional<std::uint64_t> compare_and_swap(
        const std::string& key, std::uint64_t expected_version, std::string value,
        std::optional<Duration> ttl = std::nullopt) = 0;

    // Atomic integer add; a missing key counts as 0. Returns the new value.
    virtual std::int64_t increment(const std::string& key, std::int64_t delta,
                                   std::optional<Duration> ttl = std::nullopt) = 0;

    virtual bool erase(const std::string& key) = 0;

    // Bounded list, newest first. `ttl` refreshes the expiry of the whole list.
    virtual void list_push_front(const std::string& key, std::string value,
                                 std::size_t max_length,
                                 std::optional<Duration> ttl = std::nullopt) = 0;
    virtual std::vector<std::string> list_range(const std::string& key,
                                                std::size_t offset,
                                                std::size_t count) = 0;

    virtual std::vector<std::string> keys_with_prefix(const std::string& prefix) = 0;
};

// Process-local CacheStore. Thread-safe; expiry is evaluated lazily on access.
class InMemoryCacheStore : public CacheStore {
public:
    explicit InMemoryCacheStore(TimeSource clock = nullptr);

    std::optional<VersionedValue> get(const std::string& key) override;
    std::uint64_t set(const std::string& key, std::string value,
                      std::optional<Duration> ttl = std::nullopt) override;
    std::optional<std::uint64_t> compare_and_swap(
        const std::string& key, std::uint64_t expected_version, std::string value,
        std::optional<Duration> ttl = std::nullopt) override;
    std::int64_t increment(const std::string& key, std::int64_t delta,
                           std::optional<Duration> ttl = std::nullopt) override;
    bool erase(const std::string& key) override;
    void list_push_front(const std::string& key, std::string value,
                         std::size_t max_length,
                         std::optional<Duration> ttl = std::nullopt) override;
    std::vector<std::string> list_range(const std::string& key,
                                        std::size_t offset,
                                        std::size_t count) override;
    std::vector<std::string> keys_with_prefix(const std::string& prefix) override;

    std::size_t size() const;

private:
    struct Entry {
        std::string value;
        std::deque<std::string> list;
        bool is_list{false};
        std::uint64_t version{0};
        std::optional<Timestamp> expires_at;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    TimeSource clock_;

    // Global counter so a deleted-then-recreated key never reuses a version
    std::uint64_t next_version_{1};

    Entry* find_live(const std::string& key);
    std::optional<Timestamp> expiry_for(std::optional<Duration> ttl) const;
};

} // namespace agenttreasury
