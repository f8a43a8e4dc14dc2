/*

byte_source.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Sequential, blocking byte input consumed by the parser.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <mimetree/detail/result.hpp>

namespace mimetree
{

/**
Sequentially readable source of bytes.

`read()` fills at most `buffer.size()` bytes and returns the number of bytes written. Zero means the end of input has been reached.
**/
struct byte_source
{
    virtual ~byte_source() = default;
    virtual result<std::size_t> read(std::span<char> buffer) = 0;
};

/**
Reads every remaining byte of a source into a string.

@param source Source to drain.
@return       Remaining bytes, or the first read error.
**/
[[nodiscard]] inline result<std::string> read_all(byte_source& source)
{
    std::string out;
    char buffer[4096];
    while (true)
    {
        auto n = source.read(std::span<char>(buffer, sizeof(buffer)));
        if (!n)
            return detail::make_unexpected(std::move(n.error()));
        if (*n == 0)
            break;
        out.append(buffer, *n);
    }
    return out;
}

/**
Source over an in-memory buffer. The buffer must outlive the source.
**/
class string_source : public byte_source
{
public:
    explicit string_source(std::string_view data) : data_(data) {}

    result<std::size_t> read(std::span<char> buffer) override
    {
        const std::size_t n = std::min(buffer.size(), data_.size() - pos_);
        std::copy_n(data_.data() + pos_, n, buffer.data());
        pos_ += n;
        return n;
    }

private:
    std::string_view data_;
    std::size_t pos_{0};
};

/**
Source over a standard input stream. A stream entering the bad state is reported as `errc::io_error`.
**/
class istream_source : public byte_source
{
public:
    explicit istream_source(std::istream& in) : in_(&in) {}

    result<std::size_t> read(std::span<char> buffer) override
    {
        if (buffer.empty() || in_->eof())
            return std::size_t{0};

        in_->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (in_->bad())
            return fail<std::size_t>(errc::io_error, "Stream read failure.", {},
                std::source_location::current());
        return static_cast<std::size_t>(in_->gcount());
    }

private:
    std::istream* in_;
};

} // namespace mimetree
