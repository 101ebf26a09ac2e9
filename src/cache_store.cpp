#include "agenttreasury/cache_store.hpp"
#include "agenttreasury/exceptions.hpp"

#include <algorithm>
#include <limits>

namespace agenttreasury {

InMemoryCacheStore::InMemoryCacheStore(TimeSource clock)
    : clock_(clock ? std::move(clock) : TimeSource([] { return Clock::now(); }))
{}

InMemoryCacheStore::Entry* InMemoryCacheStore::find_live(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    if (it->second.expires_at.has_value() && clock_() >= *it->second.expires_at) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<Timestamp> InMemoryCacheStore::expiry_for(std::optional<Duration> ttl) const {
    if (!ttl.has_value()) return std::nullopt;
    return clock_() + *ttl;
}

std::optional<VersionedValue> InMemoryCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_live(key);
    if (e == nullptr || e->is_list) return std::nullopt;
    return VersionedValue{e->value, e->version};
}

std::uint64_t InMemoryCacheStore::set(const std::string& key, std::string value,
                                      std::optional<Duration> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& e = entries_[key];
    e.value = std::move(value);
    e.list.clear();
    e.is_list = false;
    e.version = next_version_++;
    e.expires_at = expiry_for(ttl);
    return e.version;
}

std::optional<std::uint64_t> InMemoryCacheStore::compare_and_swap(
    const std::string& key, std::uint64_t expected_version, std::string value,
    std::optional<Duration> ttl)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_live(key);
    std::uint64_t current = (e != nullptr) ? e->version : 0;
    if (current != expected_version) {
        return std::nullopt;
    }

    Entry& target = (e != nullptr) ? *e : entries_[key];
    target.value = std::move(value);
    target.list.clear();
    target.is_list = false;
    target.version = next_version_++;
    target.expires_at = expiry_for(ttl);
    return target.version;
}

std::int64_t InMemoryCacheStore::increment(const std::string& key, std::int64_t delta,
                                           std::optional<Duration> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_live(key);
    std::int64_t current = 0;
    if (e != nullptr) {
        if (e->is_list) {
            throw InvalidRequestException("Key '" + key + "' holds a list, not a counter");
        }
        try {
            std::size_t pos = 0;
            current = std::stoll(e->value, &pos);
            if (pos != e->value.size()) {
                throw InvalidRequestException("Key '" + key + "' is not an integer");
            }
        } catch (const std::logic_error&) {
            throw InvalidRequestException("Key '" + key + "' is not an integer");
        }
    }

    std::int64_t next = current + delta;
    Entry& target = (e != nullptr) ? *e : entries_[key];
    target.value = std::to_string(next);
    target.version = next_version_++;
    if (ttl.has_value() || e == nullptr) {
        target.expires_at = expiry_for(ttl);
    }
    return next;
}

bool InMemoryCacheStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (find_live(key) == nullptr) return false;
    entries_.erase(key);
    return true;
}

void InMemoryCacheStore::list_push_front(const std::string& key, std::string value,
                                         std::size_t max_length,
                                         std::optional<Duration> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* e = find_live(key);
    Entry& target = (e != nullptr) ? *e : entries_[key];
    if (!target.is_list) {
        target.value.clear();
        target.list.clear();
        target.is_list = true;
    }
    target.list.push_front(std::move(value));
    if (max_length > 0 && target.list.size() > max_length) {
        target.list.resize(max_length);
    }
    target.version = next_version_++;
    if (ttl.has_value()) {
        target.expires_at = expiry_for(ttl);
    }
}

std::vector<std::string> InMemoryCacheStore::list_range(const std::string& key,
                                                        std::size_t offset,
                                                        std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    Entry* e = find_live(key);
    if (e == nullptr || !e->is_list || offset >= e->list.size()) {
        return result;
    }
    std::size_t end = (count == 0)
        ? e->list.size()
        : std::min(e->list.size(), offset + count);
    result.assign(e->list.begin() + static_cast<std::ptrdiff_t>(offset),
                  e->list.begin() + static_cast<std::ptrdiff_t>(end));
    return result;
}

std::vector<std::string> InMemoryCacheStore::keys_with_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    std::vector<std::string> keys;
    for (auto& [key, entry] : entries_) {
        if (entry.expires_at.has_value() && now >= *entry.expires_at) continue;
        if (key.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::size_t InMemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace agenttreasury
