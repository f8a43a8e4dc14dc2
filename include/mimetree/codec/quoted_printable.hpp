/*

quoted_printable.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <mimetree/codec/codec.hpp>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Quoted Printable codec.

The decoder treats the input as an extended single byte text: eight bit octets and control characters are copied as they are, since many
senders do not restrict themselves to seven bit. Line breaks are kept as found in the input.
**/
class MIMETREE_EXPORT quoted_printable : public codec
{
public:

    quoted_printable() : q_codec_mode_(false)
    {
    }

    quoted_printable(const quoted_printable&) = delete;

    quoted_printable(quoted_printable&&) = delete;

    /**
    Default destructor.
    **/
    ~quoted_printable() = default;

    void operator=(const quoted_printable&) = delete;

    void operator=(quoted_printable&&) = delete;

    /**
    Decoding a quoted printable text.

    Whitespace before a line break is transport padding and removed. An equal sign ending a line is a soft break which joins the line
    with the next one. An equal sign not followed by two hexadecimal digits is kept literally, unless in strict mode.

    @param text Quoted printable encoded text.
    @return     Decoded string.
    @error      `errc::codec_error` Bad escape sequence, in strict mode only.
    **/
    result<std::string> decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size());

        std::size_t start = 0;
        while (start < text.size())
        {
            std::size_t eol = text.find(LF_CHAR, start);
            std::string_view terminator;
            std::string_view line;
            if (eol == std::string_view::npos)
            {
                line = text.substr(start);
                start = text.size();
            }
            else
            {
                line = text.substr(start, eol - start);
                terminator = text.substr(eol, 1);
                if (!line.empty() && line.back() == CR_CHAR)
                {
                    line.remove_suffix(1);
                    terminator = text.substr(eol - 1, 2);
                }
                start = eol + 1;
            }

            if (!q_codec_mode_)
                while (!line.empty() && detail::is_wsp(line.back()))
                    line.remove_suffix(1);

            bool soft_break = false;
            if (!q_codec_mode_ && !line.empty() && line.back() == EQUAL_CHAR)
            {
                soft_break = true;
                line.remove_suffix(1);
            }

            auto decoded = decode_line(line, dec_text);
            if (!decoded)
                return detail::make_unexpected(std::move(decoded.error()));

            if (!soft_break)
                dec_text.append(terminator);
        }

        return dec_text;
    }

    /**
    Setting Q codec mode: underscore stands for space and line breaks have no meaning.

    @param mode True to set, false to unset.
    **/
    void q_codec_mode(bool mode)
    {
        q_codec_mode_ = mode;
    }

private:

    result_void decode_line(std::string_view line, std::string& dec_text) const
    {
        for (std::size_t i = 0; i < line.size(); ++i)
        {
            const char ch = line[i];
            if (ch == EQUAL_CHAR)
            {
                const bool has_hex = i + 2 < line.size()
                    && detail::is_hex_digit(line[i + 1]) && detail::is_hex_digit(line[i + 2]);
                if (has_hex)
                {
                    dec_text += static_cast<char>((detail::hex_value(line[i + 1]) << 4) | detail::hex_value(line[i + 2]));
                    i += 2;
                    continue;
                }
                if (strict_mode_)
                    return fail_void(errc::codec_error, "Bad hexadecimal digit.");
                dec_text += ch;
            }
            else if (q_codec_mode_ && ch == UNDERSCORE_CHAR)
                dec_text += SPACE_CHAR;
            else
                dec_text += ch;
        }
        return ok();
    }

    /**
    Flag for the Q codec mode.
    **/
    bool q_codec_mode_;
};


} // namespace mimetree
