/*

test_media_type.cpp
-------------------

Content-Type and Content-Disposition value parsing.

*/

#define BOOST_TEST_MODULE media_type_test

#include <boost/test/unit_test.hpp>

#include <mimetree/mime/media_type.hpp>

using namespace mimetree;


BOOST_AUTO_TEST_CASE(value_and_params_are_canonical)
{
    auto mt = parse_media_type("Text/HTML; Charset=\"UTF-8\"; format=flowed");
    BOOST_TEST_REQUIRE(mt.has_value());
    BOOST_TEST(mt->value == "text/html");
    BOOST_TEST(mt->param("charset") == "UTF-8");
    BOOST_TEST(mt->param("format") == "flowed");
    BOOST_TEST(mt->param("boundary").empty());
    BOOST_TEST(!mt->is_multipart());
}

BOOST_AUTO_TEST_CASE(multipart_boundary)
{
    auto mt = parse_media_type("multipart/mixed; boundary=\"----=_Part_0 1\"");
    BOOST_TEST_REQUIRE(mt.has_value());
    BOOST_TEST(mt->is_multipart());
    BOOST_TEST(mt->param(media_type_t::ATTR_BOUNDARY) == "----=_Part_0 1");
}

BOOST_AUTO_TEST_CASE(disposition_without_slash)
{
    auto mt = parse_media_type("attachment; filename=\"a \\\"b\\\".txt\"");
    BOOST_TEST_REQUIRE(mt.has_value());
    BOOST_TEST(mt->value == "attachment");
    BOOST_TEST(mt->param("filename") == "a \"b\".txt");
}

BOOST_AUTO_TEST_CASE(trailing_semicolon_is_tolerated)
{
    auto mt = parse_media_type("text/plain; charset=us-ascii;");
    BOOST_TEST_REQUIRE(mt.has_value());
    BOOST_TEST(mt->param("charset") == "us-ascii");
}

BOOST_AUTO_TEST_CASE(rfc2231_parameters)
{
    auto ext = parse_media_type("attachment; filename*=UTF-8''na%C3%AFve.txt");
    BOOST_TEST_REQUIRE(ext.has_value());
    BOOST_TEST(ext->param("filename") == "na\xC3\xAFve.txt");

    auto cont = parse_media_type("attachment; filename*0=\"long\"; filename*1=\"name.pdf\"");
    BOOST_TEST_REQUIRE(cont.has_value());
    BOOST_TEST(cont->param("filename") == "longname.pdf");

    auto mixed = parse_media_type("attachment; name*0*=utf-8''%41%42; name*1=C");
    BOOST_TEST_REQUIRE(mixed.has_value());
    BOOST_TEST(mixed->param("name") == "ABC");
}

BOOST_AUTO_TEST_CASE(malformed_values)
{
    for (const char* text : {"", "/plain", "text/", "text/plain extra", "text/plain; charset", "text/plain; a=1; A=2",
        "text/plain; name=\"unterminated"})
    {
        BOOST_TEST_INFO("value: " << text);
        auto mt = parse_media_type(text);
        BOOST_TEST_REQUIRE(!mt.has_value());
        BOOST_TEST(mt.error().is(errc::media_type_parse_error));
    }
}
