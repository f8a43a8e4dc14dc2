/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <mimetree/detail/error_detail.hpp>
#include <mimetree/detail/result.hpp>
#include <mimetree/throwing.hpp>


BOOST_AUTO_TEST_CASE(error_detail_add_lines)
{
    mimetree::detail::error_detail detail;
    detail.add("boundary", "XYZ").add_int("depth", 33);
    BOOST_TEST(detail.str() == "boundary=XYZ\ndepth=33\n");
}

BOOST_AUTO_TEST_CASE(error_detail_add_nested)
{
    mimetree::detail::error_detail inner;
    inner.add("charset", "unknown-x");

    mimetree::detail::error_detail outer;
    outer.add("boundary", "B").add_nested("cause.", inner.str());
    BOOST_TEST(outer.str() == "boundary=B\ncause.charset=unknown-x\n");
}

BOOST_AUTO_TEST_CASE(error_info_formatting)
{
    auto res = mimetree::fail<int>(mimetree::errc::empty_header, "Empty header at boundary `B`.", "boundary=B\n");
    BOOST_TEST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().is(mimetree::errc::empty_header));
    BOOST_TEST(res.error().to_string() == "[203] Empty header: Empty header at boundary `B`. (boundary=B\n)");
    BOOST_TEST(std::string(res.error().where.file_name()).find("test_error_detail") != std::string::npos);

    auto unnamed = mimetree::make_error(mimetree::errc::io_error, "");
    BOOST_TEST(unnamed.message == "I/O error");
}

BOOST_AUTO_TEST_CASE(unwrap_throws_error_info)
{
    BOOST_TEST(mimetree::unwrap(mimetree::ok(7)) == 7);
    BOOST_CHECK_NO_THROW(mimetree::unwrap(mimetree::ok()));

    try
    {
        (void)mimetree::unwrap(mimetree::fail<int>(mimetree::errc::nesting_too_deep, "Too deep."));
        BOOST_FAIL("exception expected");
    }
    catch (const mimetree::exception& exc)
    {
        BOOST_TEST((exc.code() == mimetree::errc::nesting_too_deep));
        BOOST_TEST(std::string(exc.what()) == "Too deep.");
        BOOST_TEST(exc.info().message == "Too deep.");
    }
}
