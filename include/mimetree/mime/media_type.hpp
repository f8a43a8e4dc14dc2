/*

media_type.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/error_detail.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Parsed `Content-Type` or `Content-Disposition` value.
**/
struct MIMETREE_EXPORT media_type_t
{
    /**
    Parameter name in lowercase to its decoded value.
    **/
    using params_t = std::map<std::string, std::string>;

    /**
    Canonical value in lowercase, without parameters, e.g. `text/plain` or `attachment`.
    **/
    std::string value;

    params_t params;

    /**
    Value of the given parameter.

    @param name Parameter name in lowercase.
    @return     The value, or empty string if the parameter is missing.
    **/
    [[nodiscard]] std::string param(const std::string& name) const
    {
        auto it = params.find(name);
        return it == params.end() ? std::string{} : it->second;
    }

    [[nodiscard]] bool is_multipart() const
    {
        return detail::istarts_with_ascii(value, MULTIPART_PREFIX);
    }

    inline static const std::string MULTIPART_PREFIX{"multipart/"};
    inline static const std::string ATTR_BOUNDARY{"boundary"};
    inline static const std::string ATTR_CHARSET{"charset"};
    inline static const std::string ATTR_NAME{"name"};
    inline static const std::string ATTR_FILENAME{"filename"};
};


namespace detail
{

/**
Media type grammar helpers (RFC 2045 section 5.1, RFC 2183, RFC 2231).
**/
class media_type_parser
{
public:

    explicit media_type_parser(std::string_view text) : text_(text), rest_(text)
    {
    }

    result<media_type_t> parse()
    {
        media_type_t mt;

        const auto semi = rest_.find(';');
        std::string_view base = trim_view(rest_.substr(0, semi));
        rest_ = semi == std::string_view::npos ? std::string_view{} : rest_.substr(semi);

        auto checked = check_base(base);
        if (!checked)
            return make_unexpected(std::move(checked.error()));
        mt.value = to_lower_ascii(base);

        // Continuation sections `name*N` and `name*N*` collected before being joined.
        std::map<std::string, std::map<int, std::pair<std::string, bool>>> continuations;
        std::map<std::string, std::string> extended;

        while (true)
        {
            rest_ = trim_view(rest_);
            if (rest_.empty())
                break;

            std::string key, value;
            bool was_quoted = false;
            if (!consume_param(key, value, was_quoted))
            {
                // Tolerate a trailing semicolon.
                if (trim_view(rest_) == ";")
                    break;
                return malformed("Invalid media parameter.");
            }

            const auto star = key.find('*');
            if (star == std::string::npos)
            {
                if (mt.params.count(key) != 0)
                    return malformed("Duplicate parameter name `" + key + "`.");
                mt.params.emplace(std::move(key), std::move(value));
                continue;
            }

            const std::string base_key = key.substr(0, star);
            const std::string section = key.substr(star + 1);
            if (section.empty())
            {
                // `name*=charset'lang'value`
                if (was_quoted)
                    return malformed("Quoted extended parameter `" + key + "`.");
                extended[base_key] = value;
                continue;
            }

            bool encoded = false;
            std::string index_str = section;
            if (index_str.back() == '*')
            {
                encoded = true;
                index_str.pop_back();
            }
            if (index_str.empty() || index_str.size() > 3 || !std::all_of(index_str.begin(), index_str.end(), is_ascii_digit))
                return malformed("Invalid parameter section `" + key + "`.");
            if (index_str.size() > 1 && index_str.front() == '0')
                return malformed("Invalid parameter section `" + key + "`.");
            const int index = std::stoi(index_str);
            auto& sections = continuations[base_key];
            if (sections.count(index) != 0)
                return malformed("Duplicate parameter name `" + key + "`.");
            sections.emplace(index, std::make_pair(std::move(value), encoded));
        }

        for (auto& [name, value] : extended)
        {
            std::string decoded;
            if (decode_extended(value, decoded))
                mt.params[name] = std::move(decoded);
        }

        for (auto& [name, sections] : continuations)
        {
            if (mt.params.count(name) != 0)
                continue;
            std::string joined;
            int expected = 0;
            bool valid = true;
            for (auto& [index, sec] : sections)
            {
                if (index != expected++)
                    break;
                if (sec.second)
                {
                    if (index == 0)
                    {
                        if (!decode_extended(sec.first, joined))
                        {
                            valid = false;
                            break;
                        }
                    }
                    else
                    {
                        std::string raw;
                        if (!percent_decode(sec.first, raw))
                        {
                            valid = false;
                            break;
                        }
                        joined += raw;
                    }
                }
                else
                    joined += sec.first;
            }
            if (valid && expected > 0)
                mt.params[name] = std::move(joined);
        }

        return mt;
    }

private:

    result<void> check_base(std::string_view base) const
    {
        std::string_view rest = base;
        const std::string_view type = consume_token(rest);
        if (type.empty())
            return malformed_void("No media type.");
        if (rest.empty())
            return {};
        if (rest.front() != '/')
            return malformed_void("Expected slash after first token.");
        rest.remove_prefix(1);
        const std::string_view subtype = consume_token(rest);
        if (subtype.empty())
            return malformed_void("Expected token after slash.");
        if (!rest.empty())
            return malformed_void("Unexpected content after media subtype.");
        return {};
    }

    static std::string_view consume_token(std::string_view& text)
    {
        std::size_t n = 0;
        while (n < text.size() && is_token_char(text[n]))
            ++n;
        std::string_view token = text.substr(0, n);
        text.remove_prefix(n);
        return token;
    }

    /**
    Consuming `; key=value` from the remaining text.
    **/
    bool consume_param(std::string& key, std::string& value, bool& was_quoted)
    {
        std::string_view rest = rest_;
        if (rest.empty() || rest.front() != ';')
            return false;
        rest.remove_prefix(1);
        rest = trim_view(rest);
        const std::string_view name = consume_token(rest);
        if (name.empty())
            return false;
        rest = trim_view(rest);
        if (rest.empty() || rest.front() != '=')
            return false;
        rest.remove_prefix(1);
        rest = trim_view(rest);

        if (!rest.empty() && rest.front() == '"')
        {
            was_quoted = true;
            rest.remove_prefix(1);
            std::string unquoted;
            bool closed = false;
            while (!rest.empty())
            {
                const char ch = rest.front();
                rest.remove_prefix(1);
                if (ch == '"')
                {
                    closed = true;
                    break;
                }
                if (ch == '\r' || ch == '\n')
                    return false;
                if (ch == '\\' && !rest.empty())
                {
                    unquoted += rest.front();
                    rest.remove_prefix(1);
                    continue;
                }
                unquoted += ch;
            }
            if (!closed)
                return false;
            value = std::move(unquoted);
        }
        else
        {
            const std::string_view token = consume_token(rest);
            if (token.empty())
                return false;
            value.assign(token);
        }

        key = to_lower_ascii(name);
        rest_ = rest;
        return true;
    }

    /**
    Decoding `charset'language'percent-encoded` as defined by RFC 2231. Only UTF-8 and US-ASCII are accepted.
    **/
    static bool decode_extended(std::string_view value, std::string& out)
    {
        const auto first = value.find('\'');
        if (first == std::string_view::npos)
            return false;
        const auto second = value.find('\'', first + 1);
        if (second == std::string_view::npos)
            return false;
        const std::string_view charset = value.substr(0, first);
        if (!iequals_ascii(charset, "utf-8") && !iequals_ascii(charset, "us-ascii"))
            return false;
        std::string decoded;
        if (!percent_decode(value.substr(second + 1), decoded))
            return false;
        out += decoded;
        return true;
    }

    static bool percent_decode(std::string_view text, std::string& out)
    {
        out.reserve(out.size() + text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] != '%')
            {
                out += text[i];
                continue;
            }
            if (i + 2 >= text.size())
                return false;
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0)
                return false;
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        }
        return true;
    }

    result<media_type_t> malformed(std::string message) const
    {
        error_detail det;
        det.add("value", text_);
        return fail<media_type_t>(errc::media_type_parse_error, std::move(message), det.str());
    }

    result<void> malformed_void(std::string message) const
    {
        error_detail det;
        det.add("value", text_);
        return fail_void(errc::media_type_parse_error, std::move(message), det.str());
    }

    std::string_view text_;
    std::string_view rest_;
};

} // namespace detail


/**
Parsing a media type value with its parameters.

Both `Content-Type` and `Content-Disposition` follow this grammar; a value without slash is accepted for the latter. Parameter names are
lowercased, quoted values unquoted, RFC 2231 extended and continued parameters joined.

@param text Header value to parse.
@return     Canonical value and parameters.
@error      `errc::media_type_parse_error` The value does not follow the grammar.
**/
[[nodiscard]] inline result<media_type_t> parse_media_type(std::string_view text)
{
    return detail::media_type_parser(text).parse();
}


} // namespace mimetree
