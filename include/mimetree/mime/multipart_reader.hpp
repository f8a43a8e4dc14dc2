/*

multipart_reader.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/error_detail.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/io/byte_source.hpp>
#include <mimetree/io/line_reader.hpp>
#include <mimetree/mime/header.hpp>
#include <mimetree/mime/header_reader.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
One undecoded body part, as delimited by its boundary.
**/
struct MIMETREE_EXPORT raw_part
{
    header_map header;

    /**
    Body octets, without the line break which precedes the next delimiter.
    **/
    std::string body;

    /**
    Source reading the body. The part must outlive it.
    **/
    [[nodiscard]] string_source source() const
    {
        return string_source(body);
    }
};


/**
Splits a multipart body into its parts, as defined by RFC 2046.

The preamble before the first delimiter and the epilogue after the closing delimiter are ignored. Whitespace after a delimiter is accepted
as transport padding. The sequence is lazy and can be read once.
**/
class MIMETREE_EXPORT multipart_reader
{
public:

    /**
    @param source   Multipart body; must outlive the reader.
    @param boundary Boundary parameter of the enclosing media type, without the leading dashes.
    **/
    multipart_reader(byte_source& source, std::string boundary)
        : reader_(source), boundary_(std::move(boundary)), dash_boundary_(DASHES + boundary_)
    {
    }

    multipart_reader(const multipart_reader&) = delete;

    multipart_reader& operator=(const multipart_reader&) = delete;

    /**
    Reading the next part.

    A delimiter followed by the end of input without any header line gives a part with an empty header, whatever body it holds; any
    later call then fails with `errc::unexpected_eof`.

    @return Next part, or no value once the closing delimiter has been read.
    @error  `errc::boundary_error` Empty boundary, or no delimiter line in the whole input.
    @error  `errc::unexpected_eof` Input ended inside a part, or before the closing delimiter.
    @error  `errc::header_parse_error` Malformed part header.
    @error  Any read error of the underlying source.
    **/
    result<std::optional<raw_part>> next()
    {
        if (finished_)
            return std::optional<raw_part>{};
        if (exhausted_)
            return failure(errc::unexpected_eof, "Input ended before the closing delimiter.");
        if (boundary_.empty())
            return failure(errc::boundary_error, "Empty boundary.");

        std::string line;
        if (!started_)
        {
            while (true)
            {
                auto got = reader_.read_line(line);
                if (!got)
                    return detail::make_unexpected(std::move(got.error()));
                if (!*got)
                    return failure(errc::boundary_error, "No delimiter line found.");

                const delimiter_t kind = classify(line);
                if (kind == delimiter_t::PART)
                    break;
                if (kind == delimiter_t::CLOSE)
                {
                    finished_ = true;
                    return std::optional<raw_part>{};
                }
            }
            started_ = true;
        }

        raw_part part;
        auto header = read_header(reader_);
        if (!header)
            return detail::make_unexpected(std::move(header.error()));
        part.header = std::move(*header);

        while (true)
        {
            auto got = reader_.read_line(line);
            if (!got)
                return detail::make_unexpected(std::move(got.error()));
            if (!*got)
            {
                if (part.header.empty())
                {
                    exhausted_ = true;
                    return std::optional<raw_part>{std::move(part)};
                }
                return failure(errc::unexpected_eof, "Input ended inside a part body.");
            }

            const delimiter_t kind = classify(line);
            if (kind == delimiter_t::NONE)
            {
                part.body += line;
                continue;
            }

            strip_last_eol(part.body);
            if (kind == delimiter_t::CLOSE)
                finished_ = true;
            return std::optional<raw_part>{std::move(part)};
        }
    }

    [[nodiscard]] const std::string& boundary() const noexcept
    {
        return boundary_;
    }

private:

    enum class delimiter_t {NONE, PART, CLOSE};

    delimiter_t classify(std::string_view line) const
    {
        line = line_reader::strip_eol(line);
        if (line.substr(0, dash_boundary_.size()) != dash_boundary_)
            return delimiter_t::NONE;
        std::string_view rest = line.substr(dash_boundary_.size());
        delimiter_t kind = delimiter_t::PART;
        if (rest.substr(0, DASHES.size()) == DASHES)
        {
            kind = delimiter_t::CLOSE;
            rest.remove_prefix(DASHES.size());
        }
        for (char ch : rest)
            if (!detail::is_wsp(ch))
                return delimiter_t::NONE;
        return kind;
    }

    static void strip_last_eol(std::string& body)
    {
        if (!body.empty() && body.back() == '\n')
            body.pop_back();
        if (!body.empty() && body.back() == '\r')
            body.pop_back();
    }

    result<std::optional<raw_part>> failure(errc code, std::string message,
        std::source_location where = std::source_location::current()) const
    {
        detail::error_detail det;
        det.add("boundary", boundary_);
        return detail::make_unexpected(make_error(code, std::move(message), det.str(), {}, where));
    }

    inline static const std::string DASHES{"--"};

    line_reader reader_;
    std::string boundary_;
    std::string dash_boundary_;
    bool started_{false};
    bool finished_{false};
    bool exhausted_{false};
};


} // namespace mimetree
