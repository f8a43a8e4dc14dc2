/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
The parser does not throw - all errors are returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace mimetree
{

/// Error categories for mimetree operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Input (100-199)
    io_error = 100,
    unexpected_eof = 101,

    // Header and media type grammar (200-299)
    header_parse_error = 200,
    media_type_parse_error = 201,
    missing_content_type = 202,
    empty_header = 203,

    // Multipart structure (300-399)
    boundary_error = 300,
    nesting_too_deep = 301,

    // Content decoding (400-499)
    unsupported_charset = 400,
    codec_error = 401,

    // Internal errors (900-999)
    invalid_argument = 900,
    internal_error = 901,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::io_error: return "I/O error";
        case errc::unexpected_eof: return "Unexpected end of input";
        case errc::header_parse_error: return "Header parse error";
        case errc::media_type_parse_error: return "Media type parse error";
        case errc::missing_content_type: return "Missing Content-Type";
        case errc::empty_header: return "Empty header";
        case errc::boundary_error: return "Boundary error";
        case errc::nesting_too_deep: return "Multipart nesting too deep";
        case errc::unsupported_charset: return "Unsupported charset";
        case errc::codec_error: return "Codec error";
        case errc::invalid_argument: return "Invalid argument";
        case errc::internal_error: return "Internal error";
    }
    return "Unknown error";
}

/// Error payload carried by every failed result
struct error_info
{
    errc code = errc::ok;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        if (detail.empty())
            return std::format("[{}] {}: {}", static_cast<int>(code), mimetree::to_string(code), message);
        return std::format("[{}] {}: {} ({})", static_cast<int>(code), mimetree::to_string(code), message, detail);
    }

    [[nodiscard]] bool is(errc ec) const noexcept { return code == ec; }
};

[[nodiscard]] inline error_info make_error(
    errc code,
    std::string message,
    std::string details = {},
    std::error_code sys = {},
    std::source_location where = std::source_location::current())
{
    if (message.empty())
        message = std::string(to_string(code));
    return error_info{code, std::move(message), std::move(details), sys, where};
}

/// Result type alias using std::expected
template<typename T>
using result = std::expected<T, error_info>;

/// Void result for operations that don't return a value
using result_void = std::expected<void, error_info>;

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info err)
{
    return std::unexpected(std::move(err));
}

} // namespace detail

/// Helper to create successful result
template<typename T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

/// Helper to create void success
[[nodiscard]] inline result_void ok()
{
    return result_void{};
}

/// Helper to create error result
template<typename T>
[[nodiscard]] result<T> fail(errc code, std::string message, std::string details = {},
    std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), std::move(details), {}, where));
}

[[nodiscard]] inline result_void fail_void(errc code, std::string message, std::string details = {},
    std::source_location where = std::source_location::current())
{
    return detail::make_unexpected(make_error(code, std::move(message), std::move(details), {}, where));
}

} // namespace mimetree
