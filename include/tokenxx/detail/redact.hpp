#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace tokenxx::detail
{

[[nodiscard]] inline char to_upper_ascii(char ch) noexcept
{
    if (ch >= 'a' && ch <= 'z')
        return static_cast<char>(ch - ('a' - 'A'));
    return ch;
}

[[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (to_upper_ascii(a[i]) != to_upper_ascii(b[i]))
            return false;
    }
    return true;
}

[[nodiscard]] inline bool contains_ci(std::string_view text, std::string_view needle) noexcept
{
    if (needle.empty())
        return true;
    if (text.size() < needle.size())
        return false;
    for (std::size_t i = 0; i + needle.size() <= text.size(); ++i)
    {
        if (iequals_ascii(text.substr(i, needle.size()), needle))
            return true;
    }
    return false;
}

/// Keys whose values must never appear in logs or error details
inline constexpr std::array<std::string_view, 6> secret_keys{
    "access_token", "refresh_token", "client_secret", "id_token", "password", "code"};

[[nodiscard]] inline bool is_secret_key(std::string_view key) noexcept
{
    for (std::string_view candidate : secret_keys)
    {
        if (iequals_ascii(key, candidate))
            return true;
    }
    return false;
}

/**
Short fingerprint of a secret: the first four characters followed by the
length, e.g. "1000...(70)". Short secrets are fully hidden.
**/
[[nodiscard]] inline std::string mask_secret(std::string_view secret)
{
    if (secret.empty())
        return "(empty)";
    if (secret.size() <= 8)
        return "<redacted>(" + std::to_string(secret.size()) + ")";
    std::string out(secret.substr(0, 4));
    out += "...(";
    out += std::to_string(secret.size());
    out += ')';
    return out;
}

/// Replace secret values in an application/x-www-form-urlencoded body
[[nodiscard]] inline std::string redact_form_body(std::string_view body)
{
    std::string out;
    out.reserve(body.size());
    while (!body.empty())
    {
        const auto amp = body.find('&');
        const std::string_view pair = body.substr(0, amp);
        const auto eq = pair.find('=');
        if (eq != std::string_view::npos && is_secret_key(pair.substr(0, eq)))
        {
            out.append(pair.substr(0, eq + 1));
            out.append("<redacted>");
        }
        else
        {
            out.append(pair);
        }

        if (amp == std::string_view::npos)
            break;
        out.push_back('&');
        body.remove_prefix(amp + 1);
    }
    return out;
}

/**
Replace string values of secret keys in a JSON text without parsing it, so
that malformed provider bodies can still be logged safely.
**/
[[nodiscard]] inline std::string redact_json_secrets(std::string_view json)
{
    std::string out;
    out.reserve(json.size());
    std::size_t i = 0;
    while (i < json.size())
    {
        if (json[i] != '"')
        {
            out.push_back(json[i++]);
            continue;
        }

        // Copy a quoted string and remember its contents.
        const std::size_t key_begin = i + 1;
        std::size_t j = key_begin;
        while (j < json.size() && json[j] != '"')
            j += (json[j] == '\\') ? 2 : 1;
        const std::size_t key_end = j < json.size() ? j : json.size();
        out.append(json.substr(i, key_end - i));
        if (j >= json.size())
            break;
        out.push_back('"');
        i = j + 1;

        const std::string_view key = json.substr(key_begin, key_end - key_begin);
        std::size_t k = i;
        while (k < json.size() && (json[k] == ' ' || json[k] == '\t' || json[k] == '\n' || json[k] == '\r'))
            ++k;
        if (k >= json.size() || json[k] != ':' || !is_secret_key(key))
            continue;

        ++k;
        while (k < json.size() && (json[k] == ' ' || json[k] == '\t' || json[k] == '\n' || json[k] == '\r'))
            ++k;
        if (k >= json.size() || json[k] != '"')
            continue;

        std::size_t v = k + 1;
        while (v < json.size() && json[v] != '"')
            v += (json[v] == '\\') ? 2 : 1;

        out.append(json.substr(i, k - i));
        out.append("\"<redacted>\"");
        i = v < json.size() ? v + 1 : json.size();
    }
    return out;
}

} // namespace tokenxx::detail
