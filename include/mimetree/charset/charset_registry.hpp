/*

charset_registry.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Charset name lookup and conversion to UTF-8.

*/

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/locale/encoding.hpp>

#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/error_detail.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>

namespace mimetree
{

/**
Converts text of one charset to UTF-8.
**/
class MIMETREE_EXPORT charset_decoder
{
public:
    virtual ~charset_decoder() = default;

    /// Canonical charset name as resolved by the registry.
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    [[nodiscard]] virtual result<std::string> to_utf8(std::string_view text) const = 0;
};

/**
Read-only lookup of charset decoders by name. Implementations must be safe to share between threads.
**/
class MIMETREE_EXPORT charset_registry
{
public:
    virtual ~charset_registry() = default;

    /**
    Finding the decoder of a charset.

    @param name Charset name, case insensitive.
    @return     The decoder, or null if the charset is unknown.
    **/
    [[nodiscard]] virtual std::shared_ptr<const charset_decoder> find(std::string_view name) const = 0;
};

namespace detail
{

/**
Lowercased, unquoted charset name with the RFC 2231 language suffix removed.
**/
[[nodiscard]] inline std::string normalize_charset_name(std::string_view name)
{
    name = trim_view(name);
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"')
        name = trim_view(name.substr(1, name.size() - 2));
    const auto star = name.find('*');
    if (star != std::string_view::npos)
        name = name.substr(0, star);

    std::string lower = to_lower_ascii(name);
    if (lower == "utf8")
        return "utf-8";
    if (lower == "ascii" || lower == "us_ascii" || lower == "ansi_x3.4-1968")
        return "us-ascii";
    if (lower == "latin1" || lower == "latin-1")
        return "iso-8859-1";
    return lower;
}

/**
Identity decoder for charsets already compatible with UTF-8 output.
**/
class passthrough_decoder : public charset_decoder
{
public:
    explicit passthrough_decoder(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    [[nodiscard]] result<std::string> to_utf8(std::string_view text) const override
    {
        return std::string(text);
    }

private:
    std::string name_;
};

/**
Decoder backed by the Boost.Locale conversion backends (iconv, ICU).
**/
class locale_decoder : public charset_decoder
{
public:
    explicit locale_decoder(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    [[nodiscard]] result<std::string> to_utf8(std::string_view text) const override
    {
        try
        {
            return boost::locale::conv::to_utf<char>(text.data(), text.data() + text.size(), name_, boost::locale::conv::skip);
        }
        catch (const boost::locale::conv::invalid_charset_error& exc)
        {
            error_detail det;
            det.add("charset", name_);
            return fail<std::string>(errc::unsupported_charset, exc.what(), det.str());
        }
        catch (const boost::locale::conv::conversion_error& exc)
        {
            error_detail det;
            det.add("charset", name_);
            return fail<std::string>(errc::codec_error, exc.what(), det.str());
        }
    }

private:
    std::string name_;
};

} // namespace detail

/**
Registry resolving names through Boost.Locale.

UTF-8 and US-ASCII are passed through unchanged; US-ASCII labelled text frequently carries eight bit octets which are kept rather than
dropped. Every other name is probed against the conversion backends.
**/
class MIMETREE_EXPORT locale_charset_registry : public charset_registry
{
public:
    [[nodiscard]] std::shared_ptr<const charset_decoder> find(std::string_view name) const override
    {
        std::string canonical = detail::normalize_charset_name(name);
        if (canonical.empty())
            return nullptr;
        if (canonical == "utf-8" || canonical == "us-ascii")
            return std::make_shared<detail::passthrough_decoder>(std::move(canonical));

        try
        {
            // Backends are opened before any byte is converted, so an empty probe tells whether the name is known.
            (void)boost::locale::conv::to_utf<char>("", canonical, boost::locale::conv::skip);
        }
        catch (const boost::locale::conv::invalid_charset_error&)
        {
            return nullptr;
        }
        return std::make_shared<detail::locale_decoder>(std::move(canonical));
    }
};

/**
Process wide default registry.
**/
[[nodiscard]] inline std::shared_ptr<const charset_registry> default_charset_registry()
{
    static const std::shared_ptr<const charset_registry> registry = std::make_shared<locale_charset_registry>();
    return registry;
}

} // namespace mimetree
