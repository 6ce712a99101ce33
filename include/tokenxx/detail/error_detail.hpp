/*

error_detail.hpp
----------------

Builder for the detail string of error_info: one key=value line per entry,
in insertion order. Upstream bodies pass through redaction before they are
recorded, so a detail string is always safe to log.

*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <boost/system/error_code.hpp>

#include <tokenxx/detail/redact.hpp>

namespace tokenxx::detail
{

/// Upstream bodies are truncated to this many bytes inside error details
inline constexpr std::size_t max_detail_body = 1024;

class error_detail
{
public:
    error_detail& add(std::string_view key, std::string_view value)
    {
        std::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        return *this;
    }

    error_detail& add_int(std::string_view key, std::int64_t v)
    {
        std::format_to(std::back_inserter(out_), "{}={}\n", key, v);
        return *this;
    }

    error_detail& add_ms(std::string_view key, std::chrono::milliseconds v)
    {
        std::format_to(std::back_inserter(out_), "{}={}ms\n", key, v.count());
        return *this;
    }

    /// value followed by the category message, e.g. "error=111 Connection refused"
    error_detail& add_ec(std::string_view key, const std::error_code& ec)
    {
        return add_code(key, ec.value(), ec.message());
    }

    error_detail& add_ec(std::string_view key, const boost::system::error_code& ec)
    {
        return add_code(key, ec.value(), ec.message());
    }

    /// Provider body with secrets redacted, newlines flattened and length capped
    error_detail& add_body(std::string_view key, std::string_view body)
    {
        std::string clean = redact_json_secrets(body);
        if (clean.size() > max_detail_body)
        {
            clean.resize(max_detail_body);
            clean += "...";
        }
        std::replace(clean.begin(), clean.end(), '\n', ' ');
        std::replace(clean.begin(), clean.end(), '\r', ' ');
        return add(key, clean);
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

    /// First value recorded under key in a detail string
    [[nodiscard]] static std::optional<std::string_view> find(std::string_view detail, std::string_view key)
    {
        while (!detail.empty())
        {
            const auto eol = detail.find('\n');
            const std::string_view line = detail.substr(0, eol);
            if (line.size() > key.size() && line.starts_with(key) && line[key.size()] == '=')
                return line.substr(key.size() + 1);
            if (eol == std::string_view::npos)
                break;
            detail.remove_prefix(eol + 1);
        }
        return std::nullopt;
    }

private:
    error_detail& add_code(std::string_view key, int value, const std::string& message)
    {
        if (message.empty())
            std::format_to(std::back_inserter(out_), "{}={}\n", key, value);
        else
            std::format_to(std::back_inserter(out_), "{}={} {}\n", key, value, message);
        return *this;
    }

    std::string out_;
};

} // namespace tokenxx::detail
