/*

base64_cleaner.hpp
------------------

Filters a byte source down to the Base64 alphabet before it reaches the
decoder, so that bodies with stray characters still decode.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <span>

#include <mimetree/codec/base64.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/io/byte_source.hpp>

namespace mimetree
{

class base64_cleaner : public byte_source
{
public:
    explicit base64_cleaner(byte_source& source) : source_(&source) {}

    /**
    Filling the buffer with alphabet characters only.

    The wrapped source is read straight into the caller's buffer which is then compacted in place; nothing is kept between calls.
    Returns zero only at the end of the wrapped source.
    **/
    result<std::size_t> read(std::span<char> buffer) override
    {
        if (buffer.empty())
            return std::size_t{0};

        while (true)
        {
            auto n = source_->read(buffer);
            if (!n)
                return detail::make_unexpected(std::move(n.error()));
            if (*n == 0)
                return std::size_t{0};

            auto first = buffer.begin();
            auto kept = std::remove_if(first, first + static_cast<std::ptrdiff_t>(*n),
                [](char ch) { return !base64_stream_decoder::is_alphabet(ch); });
            const auto count = static_cast<std::size_t>(kept - first);
            if (count > 0)
                return count;
        }
    }

private:
    byte_source* source_;
};

} // namespace mimetree
