/*

memory_mutex.hpp
----------------

In-process distributed_mutex, for tests and single-process embedders.
A key belongs to the thread that acquired it; release from any other thread
leaves the key held.

*/

#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <tokenxx/lock/distributed_mutex.hpp>

namespace tokenxx::lock
{

class memory_mutex : public distributed_mutex
{
public:
    memory_mutex() = default;

    memory_mutex(const memory_mutex&) = delete;
    memory_mutex& operator=(const memory_mutex&) = delete;

    result<bool> try_acquire(std::string_view key) override
    {
        std::lock_guard guard(mutex_);
        return ok(held_.try_emplace(std::string(key), std::this_thread::get_id()).second);
    }

    result<void> release(std::string_view key) override
    {
        std::lock_guard guard(mutex_);
        if (auto it = held_.find(key); it != held_.end() && it->second == std::this_thread::get_id())
            held_.erase(it);
        return ok();
    }

    [[nodiscard]] bool held(std::string_view key) const
    {
        std::lock_guard guard(mutex_);
        return held_.find(key) != held_.end();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::thread::id, std::less<>> held_;
};

} // namespace tokenxx::lock
