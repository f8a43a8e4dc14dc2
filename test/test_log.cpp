/*

test_log.cpp
------------

Logger levels, callbacks and the messages the parser emits.

*/

#define BOOST_TEST_MODULE log_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <mimetree/detail/log.hpp>
#include <mimetree/mime/parser.hpp>

using namespace mimetree;

namespace
{
/// Routes log entries into a vector for the duration of a test.
struct capture_fixture
{
    capture_fixture()
    {
        auto& logger = log::logger::instance();
        logger.set_level(log::level::trace);
        logger.set_trace_enabled(true);
        logger.set_callback([this](const log::entry& e) { entries.push_back(e); });
    }

    ~capture_fixture()
    {
        auto& logger = log::logger::instance();
        logger.clear_callback();
        logger.set_trace_enabled(false);
        logger.set_level(log::level::info);
    }

    bool has(log::level lvl, const std::string& fragment) const
    {
        for (const auto& e : entries)
            if (e.lvl == lvl && e.message.find(fragment) != std::string::npos)
                return true;
        return false;
    }

    std::vector<log::entry> entries;
};
} // namespace


BOOST_FIXTURE_TEST_CASE(level_filters_entries, capture_fixture)
{
    log::logger::instance().set_level(log::level::warn);
    MIMETREE_DEBUG("hidden");
    MIMETREE_WARN("shown");
    BOOST_TEST_REQUIRE(entries.size() == 1U);
    BOOST_TEST(entries.front().message == "shown");
    BOOST_TEST(!log::logger::instance().is_enabled(log::level::info));
}

BOOST_FIXTURE_TEST_CASE(missing_closing_delimiter_is_warned, capture_fixture)
{
    auto tree = parse_mime(
        "Content-Type: multipart/mixed; boundary=B\r\n"
        "\r\n"
        "--B\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "x\r\n"
        "--B\r\n");
    BOOST_TEST_REQUIRE(tree.has_value());
    BOOST_TEST(has(log::level::warn, "Missing closing delimiter"));

    bool traced = false;
    for (const auto& e : entries)
        if (e.trace_info && e.trace_info->boundary == "B" && e.trace_info->content_type == "multipart/mixed")
            traced = true;
    BOOST_TEST(traced);
}

BOOST_FIXTURE_TEST_CASE(bad_disposition_is_logged_not_fatal, capture_fixture)
{
    auto tree = parse_mime(
        "Content-Type: text/plain\r\n"
        "Content-Disposition: ;;\r\n"
        "\r\n"
        "x");
    BOOST_TEST_REQUIRE(tree.has_value());
    BOOST_TEST(tree->root().disposition().empty());
    BOOST_TEST(tree->root().content() == "x");
    BOOST_TEST(has(log::level::debug, "Ignoring Content-Disposition"));
}

BOOST_FIXTURE_TEST_CASE(dropped_base64_sextet_is_logged, capture_fixture)
{
    auto tree = parse_mime(
        "Content-Type: application/octet-stream\r\n"
        "Content-Transfer-Encoding: base64\r\n"
        "\r\n"
        "QUJDZ\r\n");
    BOOST_TEST_REQUIRE(tree.has_value());
    BOOST_TEST(tree->root().content() == "ABC");
    BOOST_TEST(has(log::level::debug, "trailing Base64 sextet"));
}

BOOST_FIXTURE_TEST_CASE(aborted_parse_is_logged, capture_fixture)
{
    auto tree = parse_mime("Content-Type: text/plain; charset=unknown-x\r\n\r\nx");
    BOOST_TEST_REQUIRE(!tree.has_value());
    BOOST_TEST(has(log::level::debug, "Parse aborted"));
}
