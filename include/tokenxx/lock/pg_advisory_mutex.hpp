/*

pg_advisory_mutex.hpp
---------------------

distributed_mutex on PostgreSQL session-level advisory locks. The lock
lives on a dedicated session owned by this object: unlocking must happen on
the session that locked, and the server drops the lock when that session
ends, so a crashed holder never wedges the refresh.

Advisory locks are re-entrant per session, so threads of this process are
first arbitrated by a local registry of held keys.

*/

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tokenxx/pg/connection.hpp>
#include <tokenxx/lock/distributed_mutex.hpp>

namespace tokenxx::lock
{

/// First advisory key: constant namespace shared by all tokenxx refresh locks
inline constexpr std::int32_t advisory_namespace = 0x5A0;

/// Second advisory key: 32-bit FNV-1a of the lock name
[[nodiscard]] constexpr std::int32_t advisory_key(std::string_view name) noexcept
{
    std::uint32_t hash = 2166136261u;
    for (char ch : name)
    {
        hash ^= static_cast<std::uint8_t>(ch);
        hash *= 16777619u;
    }
    return static_cast<std::int32_t>(hash);
}

class pg_advisory_mutex : public distributed_mutex
{
public:
    explicit pg_advisory_mutex(std::string conninfo)
        : conn_(std::move(conninfo), detail::retry_policy::disabled())
    {
    }

    pg_advisory_mutex(const pg_advisory_mutex&) = delete;
    pg_advisory_mutex& operator=(const pg_advisory_mutex&) = delete;

    result<bool> try_acquire(std::string_view key) override
    {
        std::lock_guard guard(mutex_);
        if (held_.find(key) != held_.end())
            return ok(false);

        auto res = conn_.exec("select pg_try_advisory_lock($1::int4, $2::int4)", key_params(key));
        if (!res)
            return fail<bool>(as_lock_error(std::move(res).error()));

        const auto acquired = pg::cell_bool(*res, 0, 0);
        if (!acquired)
            return fail<bool>(errc::lock_failed, "pg_try_advisory_lock returned no value", std::string(key));
        if (*acquired)
            held_.emplace(key);
        return ok(*acquired);
    }

    result<void> release(std::string_view key) override
    {
        std::lock_guard guard(mutex_);
        auto it = held_.find(key);
        if (it == held_.end())
            return ok();
        held_.erase(it);

        auto res = conn_.exec("select pg_advisory_unlock($1::int4, $2::int4)", key_params(key));
        if (!res)
            return fail<void>(as_lock_error(std::move(res).error()));

        // false means the session was recycled and the server already dropped the lock
        if (const auto released = pg::cell_bool(*res, 0, 0); released && !*released)
            TOKENXX_DEBUG("advisory lock '" + std::string(key) + "' was no longer held by this session");
        return ok();
    }

private:
    [[nodiscard]] static std::vector<std::string> key_params(std::string_view key)
    {
        return {std::to_string(advisory_namespace), std::to_string(advisory_key(key))};
    }

    [[nodiscard]] static error_info as_lock_error(error_info info)
    {
        info.code = errc::lock_failed;
        return info;
    }

    std::mutex mutex_;
    pg::connection conn_;
    std::set<std::string, std::less<>> held_;
};

} // namespace tokenxx::lock
