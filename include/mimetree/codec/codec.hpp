/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <mimetree/export.hpp>


namespace mimetree
{


/**
Base class for decoders, contains various constants and the strict mode switch.
**/
class MIMETREE_EXPORT codec
{
public:

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    /**
    Plus character.
    **/
    static constexpr char PLUS_CHAR = '+';

    /**
    Slash character.
    **/
    static constexpr char SLASH_CHAR = '/';

    /**
    Equal character.
    **/
    static constexpr char EQUAL_CHAR = '=';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Question mark character.
    **/
    static constexpr char QUESTION_MARK_CHAR = '?';

    /**
    Underscore character.
    **/
    static constexpr char UNDERSCORE_CHAR = '_';

    /**
    Content transfer encodings understood by the decoders.
    **/
    enum class transfer_encoding_t {IDENTITY, BASE64, QUOTED_PRINTABLE};

    codec() : strict_mode_(false)
    {
    }

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    /**
    Default destructor.
    **/
    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;

    /**
    Enabling/disabling the strict mode.

    In strict mode malformed input is reported as `errc::codec_error`, otherwise decoders recover and keep going.

    @param mode True to enable strict mode, false to disable.
    **/
    void strict_mode(bool mode)
    {
        strict_mode_ = mode;
    }

    /**
    Returning the strict mode status.

    @return True if strict mode enabled, false if disabled.
    **/
    bool strict_mode() const
    {
        return strict_mode_;
    }

protected:

    /**
    Strict mode for decoding.
    **/
    bool strict_mode_;
};


} // namespace mimetree


#ifdef _MSC_VER
#pragma warning(pop)
#endif
