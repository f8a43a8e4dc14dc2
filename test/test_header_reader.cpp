/*

test_header_reader.cpp
----------------------

RFC 822 header block reading and unfolding.

*/

#define BOOST_TEST_MODULE header_reader_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <mimetree/io/byte_source.hpp>
#include <mimetree/io/line_reader.hpp>
#include <mimetree/mime/header_reader.hpp>

using namespace mimetree;


BOOST_AUTO_TEST_CASE(reads_fields_until_blank_line)
{
    const std::string text =
        "Content-Type: text/plain\r\n"
        "Subject:  Hello \r\n"
        "\r\n"
        "body line\r\n";
    string_source source(text);
    line_reader reader(source);

    auto header = read_header(reader);
    BOOST_TEST_REQUIRE(header.has_value());
    BOOST_TEST(header->size() == 2U);
    BOOST_TEST(header->get("content-type") == "text/plain");
    BOOST_TEST(header->get("subject") == "Hello");

    std::string line;
    auto got = reader.read_line(line);
    BOOST_TEST_REQUIRE(got.has_value());
    BOOST_TEST(*got);
    BOOST_TEST(line == "body line\r\n");
}

BOOST_AUTO_TEST_CASE(unfolds_continuation_lines)
{
    const std::string text =
        "Content-Type: multipart/mixed;\r\n"
        "\tboundary=\"XYZ\"\r\n"
        "Subject: one\n"
        "  two\n"
        "\n";
    string_source source(text);
    line_reader reader(source);

    auto header = read_header(reader);
    BOOST_TEST_REQUIRE(header.has_value());
    BOOST_TEST(header->get("Content-Type") == "multipart/mixed; boundary=\"XYZ\"");
    BOOST_TEST(header->get("Subject") == "one two");
}

BOOST_AUTO_TEST_CASE(end_of_input_ends_block)
{
    string_source source("X-Only: value");
    line_reader reader(source);

    auto header = read_header(reader);
    BOOST_TEST_REQUIRE(header.has_value());
    BOOST_TEST(header->get("x-only") == "value");

    string_source empty("");
    line_reader empty_reader(empty);
    auto none = read_header(empty_reader);
    BOOST_TEST_REQUIRE(none.has_value());
    BOOST_TEST(none->empty());
}

BOOST_AUTO_TEST_CASE(malformed_lines_are_rejected)
{
    {
        string_source source(" leading continuation\r\n\r\n");
        line_reader reader(source);
        auto header = read_header(reader);
        BOOST_TEST_REQUIRE(!header.has_value());
        BOOST_TEST(header.error().is(errc::header_parse_error));
    }
    {
        string_source source("Subject: fine\r\nno colon here\r\n\r\n");
        line_reader reader(source);
        auto header = read_header(reader);
        BOOST_TEST_REQUIRE(!header.has_value());
        BOOST_TEST(header.error().is(errc::header_parse_error));
        BOOST_TEST(header.error().detail.find("line=2\n") != std::string::npos);
    }
    {
        string_source source("Bad Name: value\r\n\r\n");
        line_reader reader(source);
        auto header = read_header(reader);
        BOOST_TEST_REQUIRE(!header.has_value());
        BOOST_TEST(header.error().is(errc::header_parse_error));
    }
}
