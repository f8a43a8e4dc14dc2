/*

test_base64_stream.cpp
----------------------

Validate streaming Base64 decoding, the alphabet cleaner in front of it, and the buffer decoder.

*/

#define BOOST_TEST_MODULE base64_stream_test

#include <boost/test/unit_test.hpp>
#include <mimetree/codec/base64.hpp>
#include <mimetree/codec/base64_cleaner.hpp>
#include <mimetree/detail/output_sink.hpp>
#include <mimetree/io/byte_source.hpp>
#include <vector>
#include <string>
#include <algorithm>
#include <string_view>

using namespace mimetree;

namespace
{
std::string decode_streaming(std::string_view input, bool strict = false)
{
    base64_stream_decoder dec(strict);
    std::string out;
    detail::string_sink sink(out);

    // Chunk the input to ensure incremental paths are covered
    std::vector<std::size_t> chunks{1, 2, 5, 7};
    std::size_t offset = 0;
    for (std::size_t chunk : chunks)
    {
        if (offset >= input.size())
            break;
        const std::size_t len = std::min(chunk, input.size() - offset);
        BOOST_REQUIRE(dec.update(input.substr(offset, len), sink).has_value());
        offset += len;
    }
    if (offset < input.size())
        BOOST_REQUIRE(dec.update(input.substr(offset), sink).has_value());

    BOOST_REQUIRE(dec.finalize(sink).has_value());
    return out;
}

/// Source handing out its data a few bytes at a time.
class trickle_source : public byte_source
{
public:
    trickle_source(std::string_view data, std::size_t step) : data_(data), step_(step) {}

    result<std::size_t> read(std::span<char> buffer) override
    {
        const std::size_t n = std::min({buffer.size(), step_, data_.size() - pos_});
        std::copy_n(data_.data() + pos_, n, buffer.data());
        pos_ += n;
        return n;
    }

private:
    std::string_view data_;
    std::size_t step_;
    std::size_t pos_{0};
};

std::string clean(byte_source& source, std::size_t buffer_size)
{
    base64_cleaner cleaner(source);
    std::string out;
    std::vector<char> buffer(buffer_size);
    while (true)
    {
        auto n = cleaner.read(buffer);
        BOOST_REQUIRE(n.has_value());
        if (*n == 0)
            break;
        out.append(buffer.data(), *n);
    }
    return out;
}
} // namespace

BOOST_AUTO_TEST_CASE(base64_stream_decodes_in_chunks)
{
    BOOST_TEST(decode_streaming("SGVsbG8sIFdvcmxkIQ==") == "Hello, World!");
    BOOST_TEST(decode_streaming("YWJj") == "abc");
    BOOST_TEST(decode_streaming("") == "");
}

BOOST_AUTO_TEST_CASE(base64_stream_handles_partial_quanta)
{
    BOOST_TEST(decode_streaming("YQ") == "a");
    BOOST_TEST(decode_streaming("YWI") == "ab");
    // A lone sextet carries no full octet.
    BOOST_TEST(decode_streaming("YWJjZ") == "abc");
}

BOOST_AUTO_TEST_CASE(base64_stream_stops_at_padding)
{
    BOOST_TEST(decode_streaming("YQ==YWJj") == "a");
}

BOOST_AUTO_TEST_CASE(base64_stream_strict_mode)
{
    base64_stream_decoder dec(true);
    std::string out;
    detail::string_sink sink(out);
    auto res = dec.update("YW!J", sink);
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(errc::codec_error));

    base64_stream_decoder trunc(true);
    BOOST_TEST_REQUIRE(trunc.update("YWJjZ", sink).has_value());
    auto fin = trunc.finalize(sink);
    BOOST_TEST_REQUIRE(!fin.has_value());
    BOOST_TEST(fin.error().is(errc::codec_error));
}

BOOST_AUTO_TEST_CASE(cleaner_keeps_only_alphabet)
{
    string_source source("SGVs\r\nbG8s!IFdv cmxk\tIQ==\r\n");
    BOOST_TEST(clean(source, 64) == "SGVsbG8sIFdvcmxkIQ==");
}

BOOST_AUTO_TEST_CASE(cleaner_skips_chunks_without_alphabet)
{
    // Whole reads made only of dropped bytes must not be reported as end of input.
    trickle_source source("YW\r\n\r\n!!\r\nJj", 2);
    BOOST_TEST(clean(source, 2) == "YWJj");

    string_source junk("\r\n!!\r\n");
    BOOST_TEST(clean(junk, 8) == "");
}

BOOST_AUTO_TEST_CASE(cleaned_stray_characters_decode_like_clean_payload)
{
    const std::string payload = "VGhlIHF1aWNrIGJyb3duIGZveA==";
    const std::string dirty = "VGhlIHF1\r\naWNrIGJy!b3duIGZv\r\neA==\r\n";

    string_source source(dirty);
    BOOST_TEST(decode_streaming(clean(source, 5)) == decode_streaming(payload));
    BOOST_TEST(decode_streaming(payload) == "The quick brown fox");
}

BOOST_AUTO_TEST_CASE(base64_codec_skips_line_breaks)
{
    base64 b64;
    auto dec = b64.decode("SGVsbG8s\r\nIFdvcmxk\r\nIQ==");
    BOOST_TEST_REQUIRE(dec.has_value());
    BOOST_TEST(*dec == "Hello, World!");

    b64.strict_mode(true);
    auto bad = b64.decode("SGVs*bG8=");
    BOOST_TEST_REQUIRE(!bad.has_value());
    BOOST_TEST(bad.error().is(errc::codec_error));
}
