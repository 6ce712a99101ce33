/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Process-wide logger of tokenxx. Messages go to stderr unless a callback is
installed; the token endpoint exchange can be traced at level::trace.
Trace data always passes the JSON secret filter before it is dispatched.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#include <tokenxx/detail/redact.hpp>

namespace tokenxx::log
{

enum class level : std::uint8_t
{
    trace = 0,   ///< Token endpoint exchange
    debug = 1,
    info = 2,    ///< Refreshes, invalidations
    warn = 3,    ///< Rate limiting, waits that gave up
    error = 4,   ///< Failed refreshes and backend errors
    fatal = 5,
    off = 6
};

enum class direction : std::uint8_t
{
    send,
    receive
};

struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;  // "HTTP"
        std::string data;
    };
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name (case-insensitive, "warning" accepted); nullopt for unknown names
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name) noexcept
{
    for (level lvl : {level::trace, level::debug, level::info, level::warn, level::error, level::fatal, level::off})
    {
        if (detail::iequals_ascii(name, level_to_string(lvl)))
            return lvl;
    }
    if (detail::iequals_ascii(name, "WARNING"))
        return level::warn;
    return std::nullopt;
}

class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Minimum level, with protocol tracing switched on exactly for level::trace
    void configure(level lvl) noexcept
    {
        set_level(lvl);
        set_trace_enabled(lvl == level::trace);
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Replace stderr output with cb
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view message, std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;
        dispatch(entry{lvl, std::chrono::system_clock::now(), std::string(message), loc, std::nullopt});
    }

    /// Trace one side of an exchange; form bodies must be redacted by the caller
    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;
        dispatch(entry{level::trace, std::chrono::system_clock::now(), {}, loc,
            entry::trace_info_t{dir, std::string(protocol), detail::redact_json_secrets(data)}});
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            write_stderr(e);
    }

    static void write_stderr(const entry& e)
    {
        const auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);
        const auto stamp = std::format("{:02}:{:02}:{:02}.{:03}", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count());

        if (e.trace_info)
        {
            std::cerr << std::format("[{}] tokenxx {} {} {}\n", stamp, e.trace_info->protocol,
                e.trace_info->dir == direction::send ? ">>>" : "<<<", printable(e.trace_info->data));
            return;
        }

        // warnings and errors point at the reporting line
        if (e.lvl >= level::warn)
            std::cerr << std::format("[{}] tokenxx [{}] {} ({}:{})\n", stamp, level_to_string(e.lvl), e.message,
                e.location.file_name(), e.location.line());
        else
            std::cerr << std::format("[{}] tokenxx [{}] {}\n", stamp, level_to_string(e.lvl), e.message);
    }

    /// Cap at 500 bytes, control characters shown as '.'
    [[nodiscard]] static std::string printable(std::string_view data)
    {
        constexpr std::size_t max_len = 500;
        std::string out(data.substr(0, max_len));
        while (!out.empty() && (out.back() == '\r' || out.back() == '\n'))
            out.pop_back();
        for (char& c : out)
        {
            if (static_cast<unsigned char>(c) < 32)
                c = '.';
        }
        if (data.size() > max_len)
            out += "... [truncated]";
        return out;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

#define TOKENXX_LOG(lvl, msg) \
    ::tokenxx::log::logger::instance().log(lvl, msg, std::source_location::current())

#define TOKENXX_TRACE(msg)  TOKENXX_LOG(::tokenxx::log::level::trace, msg)
#define TOKENXX_DEBUG(msg)  TOKENXX_LOG(::tokenxx::log::level::debug, msg)
#define TOKENXX_INFO(msg)   TOKENXX_LOG(::tokenxx::log::level::info, msg)
#define TOKENXX_WARN(msg)   TOKENXX_LOG(::tokenxx::log::level::warn, msg)
#define TOKENXX_ERROR(msg)  TOKENXX_LOG(::tokenxx::log::level::error, msg)
#define TOKENXX_FATAL(msg)  TOKENXX_LOG(::tokenxx::log::level::fatal, msg)

#define TOKENXX_TRACE_SEND(protocol, data) \
    ::tokenxx::log::logger::instance().trace_protocol(protocol, ::tokenxx::log::direction::send, data)

#define TOKENXX_TRACE_RECV(protocol, data) \
    ::tokenxx::log::logger::instance().trace_protocol(protocol, ::tokenxx::log::direction::receive, data)

} // namespace tokenxx::log
