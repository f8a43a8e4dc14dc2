/*

header_reader.hpp
-----------------

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
#include <mimetree/io/line_reader.hpp>
#include <mimetree/mime/header.hpp>


namespace mimetree
{


/**
Reading an RFC 822 header block.

Folded lines are unfolded into a single value, joined by one space. The block ends at the first empty line, which is consumed, or at the end
of input.

@param reader Reader positioned at the first header line.
@return       Header fields in document order.
@error        `errc::header_parse_error` Continuation line before any field.
@error        `errc::header_parse_error` Line without a colon.
@error        `errc::header_parse_error` Invalid field name.
@error        Any read error of the underlying source.
**/
[[nodiscard]] inline result<header_map> read_header(line_reader& reader)
{
    header_map header;
    std::optional<std::pair<std::string, std::string>> pending;
    std::string line;
    std::size_t line_no = 0;

    auto flush = [&header, &pending]()
    {
        if (pending)
        {
            header.add(std::move(pending->first), std::move(pending->second));
            pending.reset();
        }
    };

    auto malformed = [&line_no](std::string message, std::string_view text)
    {
        detail::error_detail det;
        det.add_int("line", line_no).add("text", text);
        return fail<header_map>(errc::header_parse_error, std::move(message), det.str());
    };

    while (true)
    {
        auto got = reader.read_line(line);
        if (!got)
            return detail::make_unexpected(std::move(got.error()));
        if (!*got)
            break;
        ++line_no;

        const std::string_view text = line_reader::strip_eol(line);
        if (text.empty())
            break;

        if (detail::is_wsp(text.front()))
        {
            if (!pending)
                return malformed("Continuation line without a header field.", text);
            const std::string_view folded = detail::trim_view(text);
            if (!folded.empty())
            {
                if (!pending->second.empty())
                    pending->second += ' ';
                pending->second.append(folded);
            }
            continue;
        }

        const auto colon = text.find(':');
        if (colon == std::string_view::npos)
            return malformed("Header line without a colon.", text);

        std::string_view name = text.substr(0, colon);
        while (!name.empty() && detail::is_wsp(name.back()))
            name.remove_suffix(1);
        if (!detail::is_valid_header_name(name))
            return malformed("Invalid header field name.", name);

        flush();
        pending.emplace(std::string(name), detail::trim_copy(text.substr(colon + 1)));
    }

    flush();
    return header;
}


} // namespace mimetree
