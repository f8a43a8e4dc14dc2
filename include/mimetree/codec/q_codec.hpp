/*

q_codec.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <boost/algorithm/string.hpp>
#include <mimetree/charset/charset_registry.hpp>
#include <mimetree/codec/base64.hpp>
#include <mimetree/codec/codec.hpp>
#include <mimetree/codec/quoted_printable.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Q codec, decoder of RFC 2047 encoded words such as `=?UTF-8?B?...?=`.

Decoded words are converted to UTF-8 through a charset registry.
**/
class MIMETREE_EXPORT q_codec : public codec
{
public:

    /**
    Encoding method of a word.
    **/
    enum class method_t {BASE64, QUOTED_PRINTABLE};

    explicit q_codec(const charset_registry& registry) : registry_(&registry)
    {
    }

    q_codec(const q_codec&) = delete;

    q_codec(q_codec&&) = delete;

    /**
    Default destructor.
    **/
    ~q_codec() = default;

    void operator=(const q_codec&) = delete;

    void operator=(q_codec&&) = delete;

    /**
    Decoding a single encoded word without its `=?` and `?=` delimiters.

    @param text Word content in the form `charset?method?text`.
    @return     Decoded octets, their charset and the method.
    @error      `errc::codec_error` Missing Q codec separator.
    @error      `errc::codec_error` Bad encoding method.
    @error      Any error of the Base64 or Quoted Printable decoders in strict mode.
    **/
    result<std::tuple<std::string, std::string, method_t>> decode(std::string_view text) const
    {
        const auto method_pos = text.find(QUESTION_MARK_CHAR);
        if (method_pos == std::string_view::npos)
            return fail<std::tuple<std::string, std::string, method_t>>(errc::codec_error, "Missing Q codec separator for codec type.");
        const std::string charset(text.substr(0, method_pos));
        if (charset.empty())
            return fail<std::tuple<std::string, std::string, method_t>>(errc::codec_error, "Missing Q codec charset.");
        const auto content_pos = text.find(QUESTION_MARK_CHAR, method_pos + 1);
        if (content_pos == std::string_view::npos)
            return fail<std::tuple<std::string, std::string, method_t>>(errc::codec_error, "Missing last Q codec separator.");
        const std::string_view method = text.substr(method_pos + 1, content_pos - method_pos - 1);
        const std::string_view text_c = text.substr(content_pos + 1);

        if (boost::iequals(method, BASE64_CODEC_STR))
        {
            base64 b64;
            b64.strict_mode(strict_mode_);
            auto dec = b64.decode(text_c);
            if (!dec)
                return detail::make_unexpected(std::move(dec.error()));
            return std::make_tuple(std::move(*dec), charset, method_t::BASE64);
        }
        if (boost::iequals(method, QP_CODEC_STR))
        {
            quoted_printable qp;
            qp.q_codec_mode(true);
            qp.strict_mode(strict_mode_);
            auto dec = qp.decode(text_c);
            if (!dec)
                return detail::make_unexpected(std::move(dec.error()));
            return std::make_tuple(std::move(*dec), charset, method_t::QUOTED_PRINTABLE);
        }
        return fail<std::tuple<std::string, std::string, method_t>>(errc::codec_error, "Bad encoding method.");
    }

    /**
    Decoding every encoded word of a header value to UTF-8.

    Whitespace between two adjacent encoded words is dropped. A malformed word, or a word in a charset unknown to the registry, is kept
    verbatim.

    @param text Header value, possibly containing encoded words.
    @return     Decoded value.
    **/
    std::string decode_words(std::string_view text) const
    {
        std::string dec_text;
        bool last_was_word = false;
        std::size_t pos = 0;

        while (pos < text.size())
        {
            const auto begin = text.find(WORD_BEGIN, pos);
            if (begin == std::string_view::npos)
            {
                dec_text.append(text.substr(pos));
                return dec_text;
            }

            std::string_view between = text.substr(pos, begin - pos);
            const auto end = find_word_end(text, begin);
            std::optional<std::string> word;
            if (end != std::string_view::npos)
                word = convert(text.substr(begin + WORD_BEGIN.size(), end - begin - WORD_BEGIN.size()));

            if (!word)
            {
                // Not a decodable word, copy its opening and carry on after it.
                dec_text.append(between);
                dec_text.append(WORD_BEGIN);
                pos = begin + WORD_BEGIN.size();
                last_was_word = false;
                continue;
            }

            const bool only_space = between.find_first_not_of(" \t\r\n") == std::string_view::npos;
            if (!(last_was_word && only_space))
                dec_text.append(between);
            dec_text += *word;
            last_was_word = true;
            pos = end + WORD_END.size();
        }

        return dec_text;
    }

private:

    /**
    Position of the `?=` closing the word opened at `begin`, skipping the charset and method separators.
    **/
    static std::string_view::size_type find_word_end(std::string_view text, std::string_view::size_type begin)
    {
        auto first = text.find(QUESTION_MARK_CHAR, begin + WORD_BEGIN.size());
        if (first == std::string_view::npos)
            return std::string_view::npos;
        auto second = text.find(QUESTION_MARK_CHAR, first + 1);
        if (second == std::string_view::npos)
            return std::string_view::npos;
        return text.find(WORD_END, second + 1);
    }

    std::optional<std::string> convert(std::string_view word) const
    {
        auto dec = decode(word);
        if (!dec)
            return std::nullopt;
        [[maybe_unused]] const auto& [octets, charset, method] = *dec;
        auto decoder = registry_->find(charset);
        if (!decoder)
            return std::nullopt;
        auto utf8 = decoder->to_utf8(octets);
        if (!utf8)
            return std::nullopt;
        return std::move(*utf8);
    }

    /**
    String representation of Base64 method.
    **/
    inline static const std::string BASE64_CODEC_STR{"B"};

    /**
    String representation of Quoted Printable method.
    **/
    inline static const std::string QP_CODEC_STR{"Q"};

    static constexpr std::string_view WORD_BEGIN{"=?"};

    static constexpr std::string_view WORD_END{"?="};

    const charset_registry* registry_;
};


} // namespace mimetree


#ifdef _MSC_VER
#pragma warning(pop)
#endif
