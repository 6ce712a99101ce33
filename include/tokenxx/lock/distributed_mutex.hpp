/*

distributed_mutex.hpp
---------------------

Named, process-external exclusive lock with a non-blocking acquire. The
coordinator holds it around the only code path that talks to the token
endpoint.

*/

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tokenxx/detail/log.hpp>
#include <tokenxx/detail/result.hpp>

namespace tokenxx::lock
{

class distributed_mutex
{
public:
    virtual ~distributed_mutex() = default;

    /**
    Try to take the lock without blocking.

    @param key Lock name, fixed per upstream credential identity.
    @return    True iff the caller now holds the lock.
    **/
    virtual result<bool> try_acquire(std::string_view key) = 0;

    /**
    Release the lock. Releasing a lock this caller does not hold is a no-op
    success.
    **/
    virtual result<void> release(std::string_view key) = 0;
};

/**
Releases a held distributed_mutex key when it goes out of scope, whatever
path the holder leaves by. A failed release is logged; backends drop their
locks anyway when the holding session or process goes away.
**/
class [[nodiscard]] scoped_release
{
public:
    scoped_release(distributed_mutex& mutex, std::string key) noexcept
        : mutex_(&mutex), key_(std::move(key))
    {
    }

    scoped_release(const scoped_release&) = delete;
    scoped_release& operator=(const scoped_release&) = delete;

    scoped_release(scoped_release&& other) noexcept
        : mutex_(std::exchange(other.mutex_, nullptr)), key_(std::move(other.key_))
    {
    }

    scoped_release& operator=(scoped_release&&) = delete;

    ~scoped_release()
    {
        if (mutex_ == nullptr)
            return;
        auto released = mutex_->release(key_);
        if (!released)
            TOKENXX_WARN("releasing refresh lock '" + key_ + "' failed: " + released.error().to_string());
    }

private:
    distributed_mutex* mutex_;
    std::string key_;
};

} // namespace tokenxx::lock
