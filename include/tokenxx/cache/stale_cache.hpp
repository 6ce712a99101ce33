/*

stale_cache.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Last good upstream response per request key, served while the provider
cooldown blocks fresh reads. Bounded in size and age; the least recently
stored entry goes first.

*/

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tokenxx::cache
{

/**
 * Configuration for stale caches.
 */
struct stale_cache_config
{
    /// Entries kept before the oldest is evicted
    std::size_t max_entries = 256;

    /// Age after which an entry is no longer served
    std::chrono::milliseconds ttl{5 * 60 * 1000};
};

template<class Value, class Clock = std::chrono::steady_clock>
class stale_cache
{
public:
    using clock = Clock;

    explicit stale_cache(stale_cache_config config = {})
        : config_(config)
    {
    }

    stale_cache(const stale_cache&) = delete;
    stale_cache& operator=(const stale_cache&) = delete;

    void put(std::string key, Value value, typename clock::time_point now = clock::now())
    {
        if (config_.max_entries == 0)
            return;

        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end())
        {
            order_.erase(it->second.position);
            entries_.erase(it);
        }

        order_.push_back(key);
        auto position = std::prev(order_.end());
        entries_.emplace(std::move(key), entry{std::move(value), now, position});

        while (entries_.size() > config_.max_entries)
        {
            entries_.erase(order_.front());
            order_.pop_front();
        }
    }

    /// Copy of the entry when it is younger than the ttl; expired entries are dropped
    [[nodiscard]] std::optional<Value> get(std::string_view key, typename clock::time_point now = clock::now())
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;
        if (now - it->second.stored_at >= config_.ttl)
        {
            order_.erase(it->second.position);
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void erase(std::string_view key)
    {
        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end())
        {
            order_.erase(it->second.position);
            entries_.erase(it);
        }
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] const stale_cache_config& config() const noexcept { return config_; }

private:
    struct entry
    {
        Value value;
        typename clock::time_point stored_at;
        std::list<std::string>::iterator position;
    };

    stale_cache_config config_;
    mutable std::mutex mutex_;
    std::list<std::string> order_;
    std::map<std::string, entry, std::less<>> entries_;
};

} // namespace tokenxx::cache
