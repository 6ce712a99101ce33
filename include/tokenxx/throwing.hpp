/*

throwing.hpp
------------

Exception front-end for callers that prefer throwing over result<T>.
Rate limiting gets its own exception type so callers can catch it and back
off for retry_after() without inspecting the error code.

*/

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include <tokenxx/config.hpp>
#include <tokenxx/coordinator/token_coordinator.hpp>
#include <tokenxx/detail/result.hpp>

namespace tokenxx
{

#if !TOKENXX_THROWING_ENABLED
#error "TOKENXX_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(error_info info)
        : std::runtime_error(info.to_string()),
          info_(std::move(info))
    {
    }

    [[nodiscard]] errc code() const noexcept { return info_.code; }
    [[nodiscard]] const error_info& info() const noexcept { return info_; }

private:
    error_info info_;
};

/// Thrown for errc::rate_limited; the caller should not retry before retry_after()
class rate_limited_error : public exception
{
public:
    explicit rate_limited_error(error_info info)
        : exception(std::move(info))
    {
    }

    [[nodiscard]] std::chrono::milliseconds retry_after() const noexcept { return info().retry_after; }
};

[[noreturn]] inline void throw_error(error_info info)
{
    if (info.is(errc::rate_limited))
        throw rate_limited_error(std::move(info));
    throw exception(std::move(info));
}

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw_error(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw_error(std::move(r.error()));
}

/// get_shared_access_token() that throws instead of returning an error
[[nodiscard]] inline std::string shared_access_token(token_coordinator& coordinator)
{
    return unwrap(coordinator.get_shared_access_token());
}

} // namespace tokenxx
