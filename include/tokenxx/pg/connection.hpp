/*

connection.hpp
--------------

Thin RAII wrapper over a libpq session. Queries use text parameters
and are retried on connection-class failures according to a retry_policy.
A connection is not thread safe; owners serialize access.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <libpq-fe.h>

#include <tokenxx/detail/error_detail.hpp>
#include <tokenxx/detail/log.hpp>
#include <tokenxx/detail/result.hpp>
#include <tokenxx/detail/retry_policy.hpp>

namespace tokenxx::pg
{

struct result_deleter
{
    void operator()(PGresult* res) const noexcept
    {
        PQclear(res);
    }
};

using query_result = std::unique_ptr<PGresult, result_deleter>;

/// SQLSTATE classes that mean the session is gone rather than the statement being wrong
[[nodiscard]] inline bool is_connection_sqlstate(std::string_view sqlstate) noexcept
{
    return sqlstate.starts_with("08") || sqlstate == "57P01" || sqlstate == "57P02" || sqlstate == "57P03";
}

/// Text value of a cell, nullopt for SQL NULL or out-of-range access
[[nodiscard]] inline std::optional<std::string_view> cell(const query_result& res, int row, int col) noexcept
{
    if (!res || row >= PQntuples(res.get()) || col >= PQnfields(res.get()))
        return std::nullopt;
    if (PQgetisnull(res.get(), row, col))
        return std::nullopt;
    return std::string_view(PQgetvalue(res.get(), row, col),
        static_cast<std::size_t>(PQgetlength(res.get(), row, col)));
}

[[nodiscard]] inline std::optional<std::int64_t> cell_int64(const query_result& res, int row, int col) noexcept
{
    auto text = cell(res, row, col);
    if (!text)
        return std::nullopt;
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size())
        return std::nullopt;
    return value;
}

[[nodiscard]] inline std::optional<bool> cell_bool(const query_result& res, int row, int col) noexcept
{
    auto text = cell(res, row, col);
    if (!text || text->empty())
        return std::nullopt;
    return (*text)[0] == 't';
}

class connection
{
public:
    explicit connection(std::string conninfo,
        detail::retry_policy policy = detail::retry_policy::exponential_backoff())
        : conninfo_(std::move(conninfo)),
          policy_(policy)
    {
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    ~connection()
    {
        if (conn_ != nullptr)
            PQfinish(conn_);
    }

    [[nodiscard]] bool connected() const noexcept
    {
        return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
    }

    /// Open the session if needed, resetting a broken one
    result<void> connect()
    {
        if (conn_ == nullptr)
        {
            conn_ = PQconnectdb(conninfo_.c_str());
            if (conn_ == nullptr)
                return fail<void>(errc::store_failed, "libpq could not allocate a connection");
        }
        else if (PQstatus(conn_) != CONNECTION_OK)
        {
            TOKENXX_INFO("resetting broken postgres session");
            PQreset(conn_);
        }

        if (PQstatus(conn_) != CONNECTION_OK)
        {
            detail::error_detail detail;
            detail.add("stage", "connect");
            detail.add("server", PQerrorMessage(conn_));
            return fail<void>(errc::store_failed, "cannot connect to postgres", detail.str());
        }
        return ok();
    }

    /**
    Run one statement with text parameters.

    @param sql    Statement with $1..$n placeholders.
    @param params Parameter values, all sent as text.
    @return       The libpq result on PGRES_COMMAND_OK / PGRES_TUPLES_OK.
    **/
    result<query_result> exec(std::string_view sql, const std::vector<std::string>& params = {})
    {
        const std::string statement(sql);
        for (unsigned int attempt = 1;; ++attempt)
        {
            bool connection_lost = false;
            auto res = exec_once(statement, params, connection_lost);
            if (res || !connection_lost || !policy_.allows_retry(attempt))
                return res;

            const auto delay = policy_.calculate_delay(attempt);
            TOKENXX_WARN("postgres attempt " + std::to_string(attempt) + " failed ("
                + res.error().message + "), retrying in " + std::to_string(delay.count()) + "ms");
            std::this_thread::sleep_for(delay);
        }
    }

private:
    result<query_result> exec_once(const std::string& sql, const std::vector<std::string>& params, bool& connection_lost)
    {
        if (auto opened = connect(); !opened)
        {
            connection_lost = true;
            return fail<query_result>(std::move(opened).error());
        }

        std::vector<const char*> values;
        values.reserve(params.size());
        for (const auto& p : params)
            values.push_back(p.c_str());

        // Parameterless statements go through the simple protocol so a script may hold several.
        query_result res(values.empty()
            ? PQexec(conn_, sql.c_str())
            : PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()), nullptr,
                values.data(), nullptr, nullptr, 0));

        if (!res)
        {
            connection_lost = PQstatus(conn_) != CONNECTION_OK;
            detail::error_detail detail;
            detail.add("server", PQerrorMessage(conn_));
            return fail<query_result>(errc::store_failed, "postgres query failed", detail.str());
        }

        const ExecStatusType status = PQresultStatus(res.get());
        if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK)
            return ok(std::move(res));

        const char* sqlstate_raw = PQresultErrorField(res.get(), PG_DIAG_SQLSTATE);
        const std::string_view sqlstate = sqlstate_raw != nullptr ? sqlstate_raw : "";
        connection_lost = PQstatus(conn_) != CONNECTION_OK || is_connection_sqlstate(sqlstate);

        detail::error_detail detail;
        detail.add("status", PQresStatus(status));
        detail.add("sqlstate", sqlstate);
        detail.add("server", PQresultErrorMessage(res.get()));
        return fail<query_result>(errc::store_failed, "postgres query failed", detail.str());
    }

    std::string conninfo_;
    detail::retry_policy policy_;
    PGconn* conn_ = nullptr;
};

} // namespace tokenxx::pg
