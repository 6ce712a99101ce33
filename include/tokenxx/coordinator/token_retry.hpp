/*

token_retry.hpp
---------------

Run an upstream operation with the shared token and retry it once with a
fresh token when the provider says the token is no longer valid.

*/

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <tokenxx/coordinator/token_coordinator.hpp>
#include <tokenxx/detail/asio_decl.hpp>
#include <tokenxx/detail/error_detail.hpp>
#include <tokenxx/detail/log.hpp>
#include <tokenxx/detail/redact.hpp>
#include <tokenxx/detail/result.hpp>

namespace tokenxx
{

namespace detail
{

/// result<T> produced by an operation op(const std::string& token)
template<class Op>
using token_op_result_t = std::invoke_result_t<Op&, const std::string&>;

template<class>
struct co_token_op_result;

template<class T, class Executor>
struct co_token_op_result<tokenxx::asio::awaitable<T, Executor>>
{
    using type = T;
};

/// result<T> produced by co_await op(token)
template<class Op>
using co_token_op_result_t = typename co_token_op_result<std::remove_cvref_t<token_op_result_t<Op>>>::type;

} // namespace detail

/// Provider error code reported for a revoked or superseded access token, matched ignoring case
inline constexpr std::string_view invalid_token_marker = "INVALID_OAUTHTOKEN";

/// Default retry predicate: errc::invalid_token, or a 401 mentioning the provider marker
[[nodiscard]] inline bool is_invalid_token(const error_info& err) noexcept
{
    if (err.is(errc::invalid_token))
        return true;
    return err.http_status == 401
        && (detail::contains_ci(err.detail, invalid_token_marker)
            || detail::contains_ci(err.message, invalid_token_marker));
}

/**
Error an operation should report for a failed upstream API response.

@param status HTTP status of the upstream response.
@param body   Upstream response body; its summary/error fields carry the marker.
@return       errc::invalid_token for a 401 carrying INVALID_OAUTHTOKEN,
              errc::upstream_failed otherwise. Both keep the status in http_status.
**/
[[nodiscard]] inline error_info classify_provider_response(int status, std::string_view body,
    std::source_location where = std::source_location::current())
{
    const bool invalid = status == 401 && detail::contains_ci(body, invalid_token_marker);
    error_info info = make_error(invalid ? errc::invalid_token : errc::upstream_failed,
        invalid ? "provider rejected the access token" : "upstream request failed",
        detail::error_detail().add_int("status", status).add_body("body", body).str(), {}, where);
    info.http_status = status;
    return info;
}

/**
Call op(token) with the shared token, retrying exactly once after
invalidating the token when the failure satisfies is_invalid.

@param coordinator Token source.
@param op          Callable taking const std::string& and returning result<T>.
@param is_invalid  Predicate on the first failure.
@return            The operation's result, or the coordinator's failure.
**/
template<class Op, class Pred>
auto with_token_retry(token_coordinator& coordinator, Op&& op, Pred&& is_invalid)
    -> detail::token_op_result_t<Op>
{
    using result_t = detail::token_op_result_t<Op>;
    using value_t = typename result_t::value_type;

    auto token = coordinator.get_shared_access_token();
    if (!token)
        return fail<value_t>(std::move(token).error());

    result_t first = std::invoke(op, std::as_const(*token));
    if (first || !std::invoke(is_invalid, std::as_const(first.error())))
        return first;

    TOKENXX_INFO("upstream rejected the shared access token, retrying once with a fresh one");
    if (auto invalidated = coordinator.invalidate_token(); !invalidated)
        return fail<value_t>(std::move(invalidated).error());

    auto fresh = coordinator.get_shared_access_token();
    if (!fresh)
        return fail<value_t>(std::move(fresh).error());
    return std::invoke(op, std::as_const(*fresh));
}

template<class Op>
auto with_token_retry(token_coordinator& coordinator, Op&& op)
    -> detail::token_op_result_t<Op>
{
    return with_token_retry(coordinator, std::forward<Op>(op),
        [](const error_info& err) { return is_invalid_token(err); });
}

/**
Awaitable form of with_token_retry for operations returning
asio::awaitable<result<T>>. Token acquisition itself is synchronous.
**/
template<class Op, class Pred>
tokenxx::asio::awaitable<detail::co_token_op_result_t<Op>>
co_with_token_retry(token_coordinator& coordinator, Op op, Pred is_invalid)
{
    using result_t = detail::co_token_op_result_t<Op>;
    using value_t = typename result_t::value_type;

    auto token_res = coordinator.get_shared_access_token();
    if (!token_res)
        co_return fail<value_t>(token_res.error());

    std::string token = std::move(token_res).value();
    result_t first = co_await op(token);
    if (first)
        co_return first;

    const error_info& err = first.error();
    if (!is_invalid(err))
        co_return first;

    TOKENXX_INFO("upstream rejected the shared access token, retrying once with a fresh one");
    if (auto invalidated = coordinator.invalidate_token(); !invalidated)
        co_return fail<value_t>(invalidated.error());

    auto refresh_res = coordinator.get_shared_access_token();
    if (!refresh_res)
        co_return fail<value_t>(refresh_res.error());

    std::string refreshed = std::move(refresh_res).value();
    co_return co_await op(refreshed);
}

template<class Op>
tokenxx::asio::awaitable<detail::co_token_op_result_t<Op>>
co_with_token_retry(token_coordinator& coordinator, Op op)
{
    co_return co_await co_with_token_retry(coordinator, std::move(op),
        [](const error_info& err) { return is_invalid_token(err); });
}

} // namespace tokenxx
