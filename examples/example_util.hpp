#pragma once

#include <iostream>
#include <tokenxx/coordinator/http_mapping.hpp>
#include <tokenxx/detail/result.hpp>

/// sysexits-style status: 2 configuration, 75 (EX_TEMPFAIL) rate limited, 1 anything else
inline int exit_code_for(const tokenxx::error_info& err)
{
    if (err.is(tokenxx::errc::config_missing) || err.is(tokenxx::errc::config_invalid))
        return 2;
    if (err.is(tokenxx::errc::rate_limited))
        return 75;
    return 1;
}

inline int report_error(const tokenxx::error_info& err)
{
    std::cerr << "error: " << err.to_string() << "\n";
    if (!err.detail.empty())
        std::cerr << err.detail;
    if (err.sys)
        std::cerr << "system: " << err.sys.message() << "\n";
    std::cerr << "at: " << err.where.file_name() << ":" << err.where.line() << "\n";

    const auto http = tokenxx::map_to_http(err);
    std::cerr << "as HTTP: " << http.status;
    if (http.retry_after_seconds)
        std::cerr << " Retry-After: " << *http.retry_after_seconds;
    std::cerr << " " << http.body << "\n";
    return exit_code_for(err);
}
