#pragma once

#include <string>
#include <string_view>
#include <cctype>

namespace mimetree
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] inline std::string to_lower_ascii(std::string_view s)
    {
        std::string out(s);
        for (char& c : out)
            c = ascii_tolower(c);
        return out;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline bool istarts_with_ascii(std::string_view s, std::string_view prefix) noexcept
    {
        return s.size() >= prefix.size() && iequals_ascii(s.substr(0, prefix.size()), prefix);
    }

    [[nodiscard]] constexpr bool is_wsp(char c) noexcept
    {
        return c == ' ' || c == '\t';
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](unsigned char c) noexcept { return std::isspace(c) != 0; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline std::string trim_copy(std::string_view sv)
    {
        sv = trim_view(sv);
        return std::string(sv);
    }

    // RFC 5322: field-name = 1*ftext; ftext = %d33-57 / %d59-126 (printable US-ASCII except ":")
    [[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
    {
        if (name.empty())
            return false;

        for (char ch : name)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            const bool ok = ((c >= 33 && c <= 57) || (c >= 59 && c <= 126));
            if (!ok)
                return false;
        }
        return true;
    }

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    [[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
    {
        return is_ascii_alpha(c) || is_ascii_digit(c);
    }

    // RFC 2045 tspecials.
    inline constexpr std::string_view TSPECIALS = "()<>@,;:\\\"/[]?=";

    // RFC 2045 token character: any CHAR except SPACE, CTLs, or tspecials.
    [[nodiscard]] constexpr bool is_token_char(char ch) noexcept
    {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c <= 32 || c >= 127)
            return false;
        return TSPECIALS.find(ch) == std::string_view::npos;
    }

    [[nodiscard]] constexpr bool is_hex_digit(char c) noexcept
    {
        return is_ascii_digit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
    }

    [[nodiscard]] constexpr int hex_value(char c) noexcept
    {
        if (is_ascii_digit(c))
            return c - '0';
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        return -1;
    }
}
}
