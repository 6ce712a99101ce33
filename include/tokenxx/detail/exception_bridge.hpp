/*

exception_bridge.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Turns exceptions escaping refreshers, stores and Asio handlers into
error_info values. Allocation failures are never converted.

*/

#pragma once

#include <exception>
#include <functional>
#include <new>
#include <source_location>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <boost/system/system_error.hpp>

#include <tokenxx/detail/error_detail.hpp>
#include <tokenxx/detail/result.hpp>

namespace tokenxx
{

/**
Describe a captured exception.

@param eptr     Exception to inspect; null yields "unknown exception".
@param fallback Code given to the resulting error.
@return         error_info with the exception text as message, the system
                error code when there is one, and exception=<kind> in detail.
@throw std::bad_alloc Rethrown as is.
**/
[[nodiscard]] inline error_info from_exception(std::exception_ptr eptr, errc fallback,
    std::source_location where = std::source_location::current())
{
    auto describe = [&](std::string_view kind, std::string message, std::error_code sys)
    {
        return make_error(fallback, std::move(message), detail::error_detail().add("exception", kind).str(), sys, where);
    };

    if (!eptr)
        return describe("none", "unknown exception", {});
    try
    {
        std::rethrow_exception(eptr);
    }
    catch (const std::bad_alloc&)
    {
        throw;
    }
    catch (const boost::system::system_error& exc)
    {
        // Asio and Beast report through boost::system; the code converts losslessly
        return describe("boost_system_error", exc.what(), std::error_code(exc.code()));
    }
    catch (const std::system_error& exc)
    {
        return describe("system_error", exc.what(), exc.code());
    }
    catch (const std::exception& exc)
    {
        return describe("std_exception", exc.what(), {});
    }
    catch (...)
    {
        return describe("foreign", "unknown exception", {});
    }
}

/**
Invoke a result-returning callable; whatever it throws becomes an error
carrying the fallback code.
**/
template<class F>
[[nodiscard]] auto protect(F&& f, errc fallback,
    std::source_location where = std::source_location::current()) -> std::invoke_result_t<F>
{
    try
    {
        return std::invoke(std::forward<F>(f));
    }
    catch (const std::bad_alloc&)
    {
        throw;
    }
    catch (...)
    {
        return detail::make_unexpected(from_exception(std::current_exception(), fallback, where));
    }
}

} // namespace tokenxx
