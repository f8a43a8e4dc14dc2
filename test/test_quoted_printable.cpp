/*

test_quoted_printable.cpp
-------------------------

Tolerant Quoted Printable decoding.

*/

#define BOOST_TEST_MODULE quoted_printable_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <mimetree/codec/quoted_printable.hpp>

using namespace mimetree;


BOOST_AUTO_TEST_CASE(decodes_escapes)
{
    quoted_printable qp;
    auto dec = qp.decode("Hello=20World=0A");
    BOOST_TEST_REQUIRE(dec.has_value());
    BOOST_TEST(*dec == "Hello World\n");

    auto lower = qp.decode("caf=c3=a9");
    BOOST_TEST_REQUIRE(lower.has_value());
    BOOST_TEST(*lower == "caf\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(soft_breaks_and_padding)
{
    quoted_printable qp;
    auto dec = qp.decode("first =\r\nsecond   \r\nthird=\nfourth\n");
    BOOST_TEST_REQUIRE(dec.has_value());
    BOOST_TEST(*dec == "first second\r\nthirdfourth\n");
}

BOOST_AUTO_TEST_CASE(eight_bit_and_malformed_escapes_pass_through)
{
    quoted_printable qp;
    auto dec = qp.decode("price =E2=82=AC 5 =G1 \xE9 100%=");
    BOOST_TEST_REQUIRE(dec.has_value());
    BOOST_TEST(*dec == "price \xE2\x82\xAC 5 =G1 \xE9 100%");

    auto tail = qp.decode("a=4");
    BOOST_TEST_REQUIRE(tail.has_value());
    BOOST_TEST(*tail == "a=4");
}

BOOST_AUTO_TEST_CASE(strict_mode_rejects_malformed_escapes)
{
    quoted_printable qp;
    qp.strict_mode(true);
    auto dec = qp.decode("bad =ZZ escape");
    BOOST_TEST_REQUIRE(!dec.has_value());
    BOOST_TEST(dec.error().is(errc::codec_error));
}

BOOST_AUTO_TEST_CASE(q_codec_mode_underscore_is_space)
{
    quoted_printable qp;
    qp.q_codec_mode(true);
    auto dec = qp.decode("Caf=C3=A9_au_lait");
    BOOST_TEST_REQUIRE(dec.has_value());
    BOOST_TEST(*dec == "Caf\xC3\xA9 au lait");
}
