/*

test_header.cpp
---------------

Ordered, case insensitive, multi valued header map.

*/

#define BOOST_TEST_MODULE header_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <mimetree/mime/header.hpp>

using mimetree::header_map;


BOOST_AUTO_TEST_CASE(lookup_ignores_case_and_keeps_spelling)
{
    header_map header;
    header.add("Content-Type", "text/plain");
    BOOST_TEST(header.get("content-type") == "text/plain");
    BOOST_TEST(header.get("CONTENT-TYPE") == "text/plain");
    BOOST_TEST(header.contains("Content-type"));
    BOOST_TEST(header[0].first == "Content-Type");
    BOOST_TEST(header.get("Subject").empty());
    BOOST_TEST(!header.contains("Subject"));
}

BOOST_AUTO_TEST_CASE(repeated_fields_keep_document_order)
{
    header_map header;
    header.add("Received", "first");
    header.add("Subject", "hello");
    header.add("received", "second");

    BOOST_TEST(header.size() == 3U);
    BOOST_TEST(header.get("Received") == "first");
    const std::vector<std::string> expected{"first", "second"};
    BOOST_TEST(header.get_all("RECEIVED") == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(set_replaces_all_occurrences_in_place)
{
    header_map header;
    header.add("X-A", "1");
    header.add("charset", "us-ascii");
    header.add("X-B", "2");
    header.add("Charset", "latin1");

    header.set("CHARSET", "utf-8");
    BOOST_TEST(header.size() == 3U);
    BOOST_TEST(header[1].first == "CHARSET");
    BOOST_TEST(header[1].second == "utf-8");
    BOOST_TEST(header[2].first == "X-B");
    BOOST_TEST(header.get_all("charset").size() == 1U);

    header.set("X-C", "3");
    BOOST_TEST(header.size() == 4U);
    BOOST_TEST(header[3].first == "X-C");
}

BOOST_AUTO_TEST_CASE(erase_rebuilds_index)
{
    header_map header;
    header.add("A", "1");
    header.add("B", "2");
    header.add("a", "3");
    header.add("C", "4");

    BOOST_TEST(header.erase("a") == 2U);
    BOOST_TEST(header.size() == 2U);
    BOOST_TEST(!header.contains("A"));
    BOOST_TEST(header.get("B") == "2");
    BOOST_TEST(header.get("c") == "4");
    BOOST_TEST(header.erase("missing") == 0U);
}
