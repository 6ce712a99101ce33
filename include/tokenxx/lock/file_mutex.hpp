/*

file_mutex.hpp
--------------

distributed_mutex backed by advisory flock() locks on "<dir>/<key>.lock".
Processes on one host exclude each other through the kernel lock; threads
of one process go through a process-local registry first, so a key held by
one thread is reported busy to the others without touching the file.
The kernel drops the lock when the holding process dies.

*/

#pragma once

#include <cerrno>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <tokenxx/lock/distributed_mutex.hpp>

namespace tokenxx::lock
{

class file_mutex : public distributed_mutex
{
public:
    explicit file_mutex(std::filesystem::path directory)
        : directory_(std::move(directory))
    {
    }

    file_mutex(const file_mutex&) = delete;
    file_mutex& operator=(const file_mutex&) = delete;

    ~file_mutex() override
    {
        std::lock_guard guard(mutex_);
        for (auto& [key, fd] : held_)
        {
            ::flock(fd, LOCK_UN);
            ::close(fd);
        }
    }

    result<bool> try_acquire(std::string_view key) override
    {
        std::lock_guard guard(mutex_);
        if (held_.find(key) != held_.end())
            return ok(false);

        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec)
            return fail<bool>(errc::lock_failed, "cannot create lock directory", directory_.string(), ec);

        const std::filesystem::path path = lock_path(key);
        const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd < 0)
            return fail<bool>(errc::lock_failed, "cannot open lock file", path.string(),
                std::error_code(errno, std::generic_category()));

        int rc = 0;
        do
        {
            rc = ::flock(fd, LOCK_EX | LOCK_NB);
        } while (rc != 0 && errno == EINTR);

        if (rc != 0)
        {
            const int err = errno;
            ::close(fd);
            if (err == EWOULDBLOCK)
                return ok(false);
            return fail<bool>(errc::lock_failed, "flock failed", path.string(),
                std::error_code(err, std::generic_category()));
        }

        held_.emplace(std::string(key), fd);
        return ok(true);
    }

    result<void> release(std::string_view key) override
    {
        std::lock_guard guard(mutex_);
        auto it = held_.find(key);
        if (it == held_.end())
            return ok();

        const int fd = it->second;
        held_.erase(it);
        const int rc = ::flock(fd, LOCK_UN);
        const int err = errno;
        ::close(fd);
        if (rc != 0)
            return fail<void>(errc::lock_failed, "flock unlock failed", std::string(key),
                std::error_code(err, std::generic_category()));
        return ok();
    }

    /// Lock file used for a key; characters outside [A-Za-z0-9._-] become '_'
    [[nodiscard]] std::filesystem::path lock_path(std::string_view key) const
    {
        std::string name;
        name.reserve(key.size() + 5);
        for (char ch : key)
        {
            const bool safe = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')
                || (ch >= '0' && ch <= '9') || ch == '.' || ch == '_' || ch == '-';
            name.push_back(safe ? ch : '_');
        }
        if (name.empty() || name.front() == '.')
            name.insert(name.begin(), '_');
        name += ".lock";
        return directory_ / name;
    }

private:
    std::filesystem::path directory_;
    std::mutex mutex_;
    std::map<std::string, int, std::less<>> held_;
};

} // namespace tokenxx::lock
