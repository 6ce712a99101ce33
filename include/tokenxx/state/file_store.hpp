/*

file_store.hpp
--------------

Token state kept as one JSON document per provider inside a state directory.
Processes on the same host share it; every access holds an advisory flock on
a sibling ".lock" file and writes replace the document atomically through a
rename.

*/

#pragma once

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <boost/json.hpp>

#include <tokenxx/detail/log.hpp>
#include <tokenxx/state/token_state_store.hpp>

namespace tokenxx::state
{

class file_store : public token_state_store
{
public:
    file_store(std::filesystem::path directory, std::string provider)
        : path_(std::move(directory) / (provider + ".json")),
          lock_path_(path_.string() + ".lock"),
          provider_(std::move(provider))
    {
    }

    file_store(const file_store&) = delete;
    file_store& operator=(const file_store&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    result<clock::time_point> read_cooldown() override
    {
        auto doc = read_locked();
        if (!doc)
            return fail<clock::time_point>(std::move(doc).error());
        return ok(doc->backoff_until);
    }

    result<void> write_cooldown(clock::time_point until) override
    {
        return update([until](document& doc)
        {
            if (until > doc.backoff_until)
                doc.backoff_until = until;
        });
    }

    result<std::optional<oauth2::cached_token>> read_token() override
    {
        auto doc = read_locked();
        if (!doc)
            return fail<std::optional<oauth2::cached_token>>(std::move(doc).error());
        return ok(std::move(doc->token));
    }

    result<void> write_token(const std::string& access_token, clock::time_point expires_at) override
    {
        if (auto valid = check_token_write(access_token, expires_at); !valid)
            return valid;

        return update([&](document& doc)
        {
            doc.token = oauth2::cached_token{access_token, expires_at};
        });
    }

    result<void> invalidate_token() override
    {
        const auto past = clock::now() - invalidation_offset;
        return update([past](document& doc)
        {
            if (doc.token)
                doc.token->expires_at = past;
        });
    }

private:
    struct document
    {
        std::optional<oauth2::cached_token> token;
        clock::time_point backoff_until{};
    };

    /// RAII holder of an flock on the sibling lock file
    class flock_guard
    {
    public:
        flock_guard() noexcept = default;

        flock_guard(const flock_guard&) = delete;
        flock_guard& operator=(const flock_guard&) = delete;

        flock_guard(flock_guard&& other) noexcept
            : fd_(std::exchange(other.fd_, -1))
        {
        }

        flock_guard& operator=(flock_guard&&) = delete;

        ~flock_guard()
        {
            if (fd_ >= 0)
            {
                ::flock(fd_, LOCK_UN);
                ::close(fd_);
            }
        }

        static result<flock_guard> acquire(const std::filesystem::path& lock_path, int operation)
        {
            const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
            if (fd < 0)
                return fail<flock_guard>(errc::store_failed, "cannot open state lock file",
                    lock_path.string(), std::error_code(errno, std::generic_category()));

            int rc = 0;
            do
            {
                rc = ::flock(fd, operation);
            } while (rc != 0 && errno == EINTR);

            if (rc != 0)
            {
                const int err = errno;
                ::close(fd);
                return fail<flock_guard>(errc::store_failed, "cannot lock state file",
                    lock_path.string(), std::error_code(err, std::generic_category()));
            }

            flock_guard guard;
            guard.fd_ = fd;
            return ok(std::move(guard));
        }

    private:
        int fd_ = -1;
    };

    result<void> ensure_directory() const
    {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec)
            return fail<void>(errc::store_failed, "cannot create state directory", path_.parent_path().string(), ec);
        return ok();
    }

    result<document> read_locked() const
    {
        if (auto dir = ensure_directory(); !dir)
            return fail<document>(std::move(dir).error());
        auto guard = flock_guard::acquire(lock_path_, LOCK_SH);
        if (!guard)
            return fail<document>(std::move(guard).error());
        return load();
    }

    template<class Mutate>
    result<void> update(Mutate&& mutate)
    {
        if (auto dir = ensure_directory(); !dir)
            return dir;
        auto guard = flock_guard::acquire(lock_path_, LOCK_EX);
        if (!guard)
            return fail<void>(std::move(guard).error());

        auto doc = load();
        if (!doc)
            return fail<void>(std::move(doc).error());
        mutate(*doc);
        return save(*doc);
    }

    result<document> load() const
    {
        document doc;
        std::ifstream in(path_, std::ios::binary);
        if (!in)
            return ok(std::move(doc));

        std::ostringstream text;
        text << in.rdbuf();

        boost::system::error_code ec;
        boost::json::value root = boost::json::parse(text.str(), ec);
        if (ec || !root.is_object())
        {
            TOKENXX_WARN("token state file " + path_.string() + " is unreadable, treating it as empty");
            return ok(std::move(doc));
        }

        const auto& obj = root.as_object();
        if (const auto* until = obj.if_contains("backoff_until_ms"); until && until->is_int64())
            doc.backoff_until = from_epoch_ms(until->as_int64());

        const auto* token = obj.if_contains("access_token");
        const auto* expires = obj.if_contains("expires_at_ms");
        if (token && token->is_string() && expires && expires->is_int64())
        {
            doc.token = oauth2::cached_token{
                std::string(token->as_string()),
                from_epoch_ms(expires->as_int64())};
        }
        return ok(std::move(doc));
    }

    result<void> save(const document& doc) const
    {
        boost::json::object obj;
        obj["provider"] = provider_;
        obj["backoff_until_ms"] = to_epoch_ms(doc.backoff_until);
        if (doc.token)
        {
            obj["access_token"] = doc.token->access_token;
            obj["expires_at_ms"] = to_epoch_ms(doc.token->expires_at);
        }
        obj["updated_at_ms"] = to_epoch_ms(clock::now());

        const std::filesystem::path tmp = path_.string() + ".tmp." + std::to_string(::getpid());
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out)
                return fail<void>(errc::store_failed, "cannot write token state file", tmp.string(),
                    std::error_code(errno, std::generic_category()));
            out << boost::json::serialize(obj);
            out.flush();
            if (!out)
                return fail<void>(errc::store_failed, "short write on token state file", tmp.string());
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path_, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return fail<void>(errc::store_failed, "cannot replace token state file", path_.string(), ec);
        }
        return ok();
    }

    std::filesystem::path path_;
    std::filesystem::path lock_path_;
    std::string provider_;
};

} // namespace tokenxx::state
