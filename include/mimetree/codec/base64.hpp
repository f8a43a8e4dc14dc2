/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <mimetree/codec/codec.hpp>
#include <mimetree/detail/log.hpp>
#include <mimetree/detail/output_sink.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Streaming Base64 decoder.

Input is accepted in chunks of any size. Decoding stops at the first padding character, anything after it is ignored. Non alphabet
characters are an error in strict mode and skipped otherwise.
**/
class MIMETREE_EXPORT base64_stream_decoder
{
public:

    explicit base64_stream_decoder(bool strict = false) : strict_(strict)
    {
    }

    /**
    Decoding a chunk of Base64 text.

    @param chunk       Encoded text.
    @param sink        Receives the decoded octets.
    @return            Error in strict mode if a bad character is met.
    **/
    result_void update(std::string_view chunk, detail::output_sink& sink)
    {
        for (char ch : chunk)
        {
            if (padded_)
                break;
            if (ch == PAD_CHAR)
            {
                padded_ = true;
                break;
            }
            const int value = sextet(ch);
            if (value < 0)
            {
                if (strict_)
                    return fail_void(errc::codec_error, "Bad character `" + std::string(1, ch) + "`.");
                continue;
            }

            sextets_[pending_++] = static_cast<unsigned char>(value);
            if (pending_ == SEXTETS_NO)
            {
                emit(OCTETS_NO, sink);
                pending_ = 0;
            }
        }
        return ok();
    }

    /**
    Flushing the remaining quantum.

    Two or three pending sextets give one or two octets. A single pending sextet cannot carry a whole octet; it is dropped, or reported in
    strict mode.

    @param sink Receives the decoded octets.
    @return     Error in strict mode for a truncated quantum.
    **/
    result_void finalize(detail::output_sink& sink)
    {
        const std::size_t pending = pending_;
        pending_ = 0;
        if (pending == 0)
            return ok();
        if (pending == 1)
        {
            if (strict_)
                return fail_void(errc::codec_error, "Truncated Base64 quantum.");
            MIMETREE_DEBUG("Dropping a trailing Base64 sextet which carries no full octet.");
            return ok();
        }
        for (std::size_t i = pending; i < SEXTETS_NO; ++i)
            sextets_[i] = 0;
        emit(pending - 1, sink);
        return ok();
    }

    /**
    Checking if the given character is in the Base64 alphabet, padding included.
    **/
    static constexpr bool is_alphabet(char ch)
    {
        return sextet(ch) >= 0 || ch == PAD_CHAR;
    }

private:

    static constexpr int sextet(char ch)
    {
        if (ch >= 'A' && ch <= 'Z')
            return ch - 'A';
        if (ch >= 'a' && ch <= 'z')
            return ch - 'a' + 26;
        if (ch >= '0' && ch <= '9')
            return ch - '0' + 52;
        if (ch == codec::PLUS_CHAR)
            return 62;
        if (ch == codec::SLASH_CHAR)
            return 63;
        return -1;
    }

    void emit(std::size_t count, detail::output_sink& sink)
    {
        char octets[OCTETS_NO];
        octets[0] = static_cast<char>((sextets_[0] << 2) | ((sextets_[1] & 0x30) >> 4));
        octets[1] = static_cast<char>(((sextets_[1] & 0x0f) << 4) | ((sextets_[2] & 0x3c) >> 2));
        octets[2] = static_cast<char>(((sextets_[2] & 0x03) << 6) | sextets_[3]);
        sink.write(std::string_view(octets, count));
    }

    static constexpr char PAD_CHAR = codec::EQUAL_CHAR;

    /**
    Number of six bit chunks.
    **/
    static constexpr std::size_t SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr std::size_t OCTETS_NO = SEXTETS_NO - 1;

    std::array<unsigned char, SEXTETS_NO> sextets_{};
    std::size_t pending_{0};
    bool padded_{false};
    bool strict_;
};


/**
Base64 codec.
**/
class MIMETREE_EXPORT base64 : public codec
{
public:

    /**
    Base64 character set.
    **/
    inline static const std::string CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    base64() = default;

    base64(const base64&) = delete;

    base64(base64&&) = delete;

    /**
    Default destructor.
    **/
    ~base64() = default;

    void operator=(const base64&) = delete;

    void operator=(base64&&) = delete;

    /**
    Decoding a Base64 string to a string.

    Line breaks are skipped in both modes.

    @param text Base64 encoded string.
    @return     Decoded string.
    @error      `errc::codec_error` Bad character or truncated input, in strict mode only.
    **/
    result<std::string> decode(std::string_view text) const
    {
        std::string dec_text;
        dec_text.reserve(text.size() / 4 * 3 + 3);
        detail::string_sink sink(dec_text);
        base64_stream_decoder decoder(strict_mode_);

        std::size_t start = 0;
        while (start < text.size())
        {
            auto eol = text.find_first_of("\r\n", start);
            if (eol == std::string_view::npos)
                eol = text.size();
            auto updated = decoder.update(text.substr(start, eol - start), sink);
            if (!updated)
                return detail::make_unexpected(std::move(updated.error()));
            start = eol + 1;
        }

        auto finalized = decoder.finalize(sink);
        if (!finalized)
            return detail::make_unexpected(std::move(finalized.error()));
        return dec_text;
    }
};


} // namespace mimetree


#ifdef _MSC_VER
#pragma warning(pop)
#endif
