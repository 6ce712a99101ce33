/*

memory_store.hpp
----------------

In-process token state store. Shared by reference between coordinators
running in one process; used by the tests.

*/

#pragma once

#include <algorithm>
#include <mutex>
#include <optional>
#include <string>

#include <tokenxx/state/token_state_store.hpp>

namespace tokenxx::state
{

class memory_store : public token_state_store
{
public:
    memory_store() = default;

    memory_store(const memory_store&) = delete;
    memory_store& operator=(const memory_store&) = delete;

    result<clock::time_point> read_cooldown() override
    {
        std::lock_guard lock(mutex_);
        return ok(backoff_until_);
    }

    result<void> write_cooldown(clock::time_point until) override
    {
        std::lock_guard lock(mutex_);
        backoff_until_ = std::max(backoff_until_, until);
        return ok();
    }

    result<std::optional<oauth2::cached_token>> read_token() override
    {
        std::lock_guard lock(mutex_);
        return ok(token_);
    }

    result<void> write_token(const std::string& access_token, clock::time_point expires_at) override
    {
        if (auto valid = check_token_write(access_token, expires_at); !valid)
            return valid;

        std::lock_guard lock(mutex_);
        token_ = oauth2::cached_token{access_token, expires_at};
        return ok();
    }

    result<void> invalidate_token() override
    {
        std::lock_guard lock(mutex_);
        if (token_)
            token_->expires_at = clock::now() - invalidation_offset;
        return ok();
    }

private:
    std::mutex mutex_;
    clock::time_point backoff_until_{};
    std::optional<oauth2::cached_token> token_;
};

} // namespace tokenxx::state
