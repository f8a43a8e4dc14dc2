/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Lightweight, header-only logging infrastructure for mimetree.
Supports multiple log levels, optional callbacks, and part tracing.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mimetree::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Part-level tracing (very verbose)
    debug = 1,   ///< Debug information
    info = 2,    ///< Informational messages
    warn = 3,    ///< Warnings (tolerated malformed input)
    error = 4,   ///< Errors (parse failures)
    fatal = 5,   ///< Fatal errors (unrecoverable)
    off = 6      ///< Logging disabled
};

/// Log entry structure passed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::source_location location;

    // Optional part trace info
    struct trace_info_t
    {
        std::size_t depth;         // Multipart nesting level
        std::string boundary;      // Enclosing boundary, empty for the root
        std::string content_type;  // Canonical media type of the part
    };
    std::optional<trace_info_t> trace_info;
};

/// Log callback signature
using callback_t = std::function<void(const entry&)>;

/// Convert level to string
[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Global logger configuration (thread-safe singleton)
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    /// Get current minimum log level
    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    /// Check if level is enabled
    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Set custom log callback (replaces default stderr output)
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    /// Clear custom callback (restore default stderr output)
    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    /// Enable/disable part tracing
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_enabled_.load(std::memory_order_relaxed);
    }

    /// Log a message
    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .message = std::string(message),
            .location = loc,
            .trace_info = std::nullopt
        };

        dispatch(e);
    }

    /// Trace a part as it is attached to the tree
    void trace_part(std::size_t depth, std::string_view boundary, std::string_view content_type,
                    std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;

        entry e{
            .lvl = level::trace,
            .timestamp = std::chrono::system_clock::now(),
            .message = {},
            .location = loc,
            .trace_info = entry::trace_info_t{
                .depth = depth,
                .boundary = std::string(boundary),
                .content_type = std::string(content_type)
            }
        };

        dispatch(e);
    }

private:
    logger() = default;

    void dispatch(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (callback_)
        {
            callback_(e);
        }
        else
        {
            default_output(e);
        }
    }

    void default_output(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        if (e.trace_info)
        {
            std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] PART {:>{}}{} [{}]\n",
                tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
                "", e.trace_info->depth * 2, e.trace_info->content_type,
                sanitize_trace(e.trace_info->boundary));
        }
        else
        {
            std::cerr << std::format("[{:02}:{:02}:{:02}.{:03}] [{}] {}\n",
                tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms.count(),
                level_to_string(e.lvl), e.message);
        }
    }

    /// Sanitize trace data (truncate long data, mask control characters)
    [[nodiscard]] static std::string sanitize_trace(std::string_view data)
    {
        std::string result(data);

        constexpr std::size_t max_len = 200;
        if (result.size() > max_len)
        {
            result.resize(max_len);
            result += "... [truncated]";
        }

        for (char& c : result)
        {
            if (static_cast<unsigned char>(c) < 32)
                c = '.';
        }

        return result;
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::atomic<bool> trace_enabled_{false};
    std::mutex mutex_;
    callback_t callback_;
};

// Convenience macros for logging with source location
#define MIMETREE_LOG(lvl, msg) \
    ::mimetree::log::logger::instance().log(lvl, msg, std::source_location::current())

#define MIMETREE_TRACE(msg)  MIMETREE_LOG(::mimetree::log::level::trace, msg)
#define MIMETREE_DEBUG(msg)  MIMETREE_LOG(::mimetree::log::level::debug, msg)
#define MIMETREE_INFO(msg)   MIMETREE_LOG(::mimetree::log::level::info, msg)
#define MIMETREE_WARN(msg)   MIMETREE_LOG(::mimetree::log::level::warn, msg)
#define MIMETREE_ERROR(msg)  MIMETREE_LOG(::mimetree::log::level::error, msg)
#define MIMETREE_FATAL(msg)  MIMETREE_LOG(::mimetree::log::level::fatal, msg)

/// Part trace helper
#define MIMETREE_TRACE_PART(depth, boundary, content_type) \
    ::mimetree::log::logger::instance().trace_part(depth, boundary, content_type, std::source_location::current())

} // namespace mimetree::log
