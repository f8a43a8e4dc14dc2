/*

error_detail.hpp
----------------

Header-only helper to build structured error_info::detail strings without
throwing (except potential allocation failures).

Each entry is formatted as key=value\n to ease parsing.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace mimetree::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        out_.append(value.data(), value.size());
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::uint64_t v)
    {
        append_key(key);
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
        out_.push_back('\n');
        return *this;
    }

    /// Append another detail block, prefixing each of its keys.
    error_detail& add_nested(std::string_view key_prefix, std::string_view nested)
    {
        std::size_t start = 0;
        while (start < nested.size())
        {
            auto end = nested.find('\n', start);
            if (end == std::string_view::npos)
                end = nested.size();
            out_.append(key_prefix.data(), key_prefix.size());
            out_.append(nested.substr(start, end - start));
            out_.push_back('\n');
            start = end + 1;
        }
        return *this;
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }
};

} // namespace mimetree::detail
