/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Boost.Asio and Boost.Beast names used by the token endpoint client and the
awaitable retry wrapper.

*/

#pragma once

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 102100 // Boost.Asio 1.21.0
#error "tokenxx needs Boost.Asio 1.21.0 or newer (Boost 1.78+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#if !defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "tokenxx needs C++20 coroutine support in Boost.Asio"
#endif

#include <boost/asio/as_tuple.hpp>

namespace tokenxx::asio
{
    using boost::asio::awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    namespace this_coro = boost::asio::this_coro;

    using tcp = boost::asio::ip::tcp;
    namespace ssl = boost::asio::ssl;
    namespace error = boost::asio::error;

    /// Completion token yielding std::tuple<error_code, T...> instead of throwing
    inline constexpr auto use_nothrow_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

    using error_code = boost::system::error_code;
} // namespace tokenxx::asio

namespace tokenxx::beast
{
    using boost::beast::tcp_stream;
    using boost::beast::flat_buffer;
    using boost::beast::get_lowest_layer;

    namespace http = boost::beast::http;

    /// HTTPS to the token endpoint
    using tls_stream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    using form_request = http::request<http::string_body>;
    using json_response = http::response<http::string_body>;
} // namespace tokenxx::beast
