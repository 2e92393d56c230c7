#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// String-keyed store whose entries expire after a per-entry TTL.
// Safe to share between threads.
template <typename V>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    TtlCache() : now([] { return Clock::now(); }) {}
    explicit TtlCache(NowFn now_fn) : now(std::move(now_fn)) {}

    void set(const std::string& key, V value, std::chrono::seconds ttl)
    {
        std::lock_guard<std::mutex> lock(mu);
        entries[key] = Entry{std::move(value), now() + ttl};
    }

    std::optional<V> get(const std::string& key)
    {
        std::lock_guard<std::mutex> lock(mu);
        auto it = entries.find(key);
        if (it == entries.end()) return std::nullopt;
        if (now() >= it->second.expires_at) {
            entries.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    bool erase(const std::string& key)
    {
        std::lock_guard<std::mutex> lock(mu);
        return entries.erase(key) > 0;
    }

    std::size_t purge_expired()
    {
        std::lock_guard<std::mutex> lock(mu);
        auto t = now();
        std::size_t removed = 0;
        for (auto it = entries.begin(); it != entries.end();) {
            if (t >= it->second.expires_at) {
                it = entries.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    // Includes expired entries that have not been purged yet.
    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mu);
        return entries.size();
    }

private:
    struct Entry {
        V value;
        Clock::time_point expires_at;
    };

    mutable std::mutex mu;
    std::unordered_map<std::string, Entry> entries;
    NowFn now;
};
