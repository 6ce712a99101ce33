/*

form.hpp
--------

application/x-www-form-urlencoded body builder for the token request.

*/

#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace tokenxx::oauth2
{

/// Percent-encode one form component; space becomes '+'
[[nodiscard]] inline std::string form_escape(std::string_view text)
{
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        const auto uc = static_cast<unsigned char>(ch);
        if ((uc >= 'A' && uc <= 'Z') || (uc >= 'a' && uc <= 'z') || (uc >= '0' && uc <= '9')
            || uc == '-' || uc == '.' || uc == '_' || uc == '*')
        {
            out.push_back(ch);
        }
        else if (uc == ' ')
        {
            out.push_back('+');
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[uc >> 4]);
            out.push_back(hex[uc & 0x0F]);
        }
    }
    return out;
}

/// Join pairs as k1=v1&k2=v2 in the given order
[[nodiscard]] inline std::string form_urlencode(
    std::initializer_list<std::pair<std::string_view, std::string_view>> fields)
{
    std::string out;
    for (const auto& [key, value] : fields)
    {
        if (!out.empty())
            out.push_back('&');
        out += form_escape(key);
        out.push_back('=');
        out += form_escape(value);
    }
    return out;
}

} // namespace tokenxx::oauth2
