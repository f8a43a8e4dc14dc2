/*

line_reader.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Buffered line reading on top of a byte source.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <mimetree/detail/result.hpp>
#include <mimetree/io/byte_source.hpp>

namespace mimetree
{

/**
Splits a byte source into lines.

Lines are returned with their terminator (`\n` or `\r\n`) so that bodies can be reassembled byte for byte. The last line of the input may have
no terminator. The reader is itself a byte source: reading from it yields the bytes not yet consumed as lines, which lets a body be read
after its header.
**/
class line_reader : public byte_source
{
public:
    explicit line_reader(byte_source& source) : source_(&source) {}

    line_reader(const line_reader&) = delete;

    line_reader& operator=(const line_reader&) = delete;

    /**
    Reading the next line.

    @param line Receives the line including its terminator.
    @return     False at the end of input, true if a line was read.
    **/
    result<bool> read_line(std::string& line)
    {
        line.clear();
        while (true)
        {
            const auto nl = buffer_.find('\n', pos_);
            if (nl != std::string::npos)
            {
                line.append(buffer_, pos_, nl + 1 - pos_);
                pos_ = nl + 1;
                return true;
            }

            line.append(buffer_, pos_, std::string::npos);
            pos_ = buffer_.size();

            auto filled = fill();
            if (!filled)
                return detail::make_unexpected(std::move(filled.error()));
            if (!*filled)
                return !line.empty();
        }
    }

    result<std::size_t> read(std::span<char> buffer) override
    {
        if (pos_ < buffer_.size())
        {
            const std::size_t n = std::min(buffer.size(), buffer_.size() - pos_);
            std::copy_n(buffer_.data() + pos_, n, buffer.data());
            pos_ += n;
            return n;
        }
        return source_->read(buffer);
    }

    /**
    Removing the line terminator, if any.
    **/
    static std::string_view strip_eol(std::string_view line) noexcept
    {
        if (!line.empty() && line.back() == '\n')
            line.remove_suffix(1);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        return line;
    }

private:
    result<bool> fill()
    {
        buffer_.erase(0, pos_);
        pos_ = 0;
        char chunk[CHUNK_SIZE];
        auto n = source_->read(std::span<char>(chunk, sizeof(chunk)));
        if (!n)
            return detail::make_unexpected(std::move(n.error()));
        buffer_.append(chunk, *n);
        return *n > 0;
    }

    static constexpr std::size_t CHUNK_SIZE = 4096;

    byte_source* source_;
    std::string buffer_;
    std::size_t pos_{0};
};

} // namespace mimetree
