/*

decoder.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>

#include <mimetree/charset/charset_registry.hpp>
#include <mimetree/codec/base64.hpp>
#include <mimetree/codec/base64_cleaner.hpp>
#include <mimetree/codec/codec.hpp>
#include <mimetree/codec/quoted_printable.hpp>
#include <mimetree/detail/ascii.hpp>
#include <mimetree/detail/error_detail.hpp>
#include <mimetree/detail/output_sink.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/io/byte_source.hpp>


namespace mimetree
{

namespace detail
{

inline const std::string ENCODING_BASE64{"base64"};
inline const std::string ENCODING_QUOTED_PRINTABLE{"quoted-printable"};

/**
Transfer encoding named by a `Content-Transfer-Encoding` value. Unknown names, `7bit`, `8bit` and `binary` are identity.
**/
[[nodiscard]] inline codec::transfer_encoding_t transfer_encoding_of(std::string_view name)
{
    name = trim_view(name);
    if (iequals_ascii(name, ENCODING_BASE64))
        return codec::transfer_encoding_t::BASE64;
    if (iequals_ascii(name, ENCODING_QUOTED_PRINTABLE))
        return codec::transfer_encoding_t::QUOTED_PRINTABLE;
    return codec::transfer_encoding_t::IDENTITY;
}

inline result<std::string> decode_base64_source(byte_source& source)
{
    base64_cleaner cleaner(source);
    base64_stream_decoder decoder;
    std::string out;
    string_sink sink(out);
    std::array<char, 4096> buffer{};
    while (true)
    {
        auto n = cleaner.read(buffer);
        if (!n)
            return make_unexpected(std::move(n.error()));
        if (*n == 0)
            break;
        auto upd = decoder.update(std::string_view(buffer.data(), *n), sink);
        if (!upd)
            return make_unexpected(std::move(upd.error()));
    }
    auto fin = decoder.finalize(sink);
    if (!fin)
        return make_unexpected(std::move(fin.error()));
    return out;
}

} // namespace detail


/**
Decoding the body of a leaf part.

The body is first transfer decoded and then, if a charset is given, converted to UTF-8. Everything is done in memory.

@param transfer_encoding Value of `Content-Transfer-Encoding`, possibly empty.
@param charset           Charset of the decoded octets; empty to keep them as they are.
@param source            Raw body.
@param registry          Charset lookup.
@return                  Decoded content.
@error                   `errc::unsupported_charset` Charset unknown to the registry.
@error                   Any read error of the source, or conversion error of the charset decoder.
**/
[[nodiscard]] inline result<std::string> decode_section(std::string_view transfer_encoding, std::string_view charset,
    byte_source& source, const charset_registry& registry)
{
    result<std::string> octets;
    switch (detail::transfer_encoding_of(transfer_encoding))
    {
        case codec::transfer_encoding_t::BASE64:
            octets = detail::decode_base64_source(source);
            break;

        case codec::transfer_encoding_t::QUOTED_PRINTABLE:
        {
            auto raw = read_all(source);
            if (!raw)
                return detail::make_unexpected(std::move(raw.error()));
            quoted_printable qp;
            octets = qp.decode(*raw);
            break;
        }

        default:
            octets = read_all(source);
            break;
    }
    if (!octets)
        return detail::make_unexpected(std::move(octets.error()));

    charset = detail::trim_view(charset);
    if (charset.empty())
        return octets;

    auto decoder = registry.find(charset);
    if (!decoder)
    {
        detail::error_detail det;
        det.add("charset", charset);
        return fail<std::string>(errc::unsupported_charset, "Unsupported charset `" + std::string(charset) + "`.", det.str());
    }
    return decoder->to_utf8(*octets);
}


} // namespace mimetree
