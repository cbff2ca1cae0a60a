// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#define BOOST_TEST_MODULE content_path
#include <boost/test/unit_test.hpp>

#include "content_path.hpp"
#include "error.hpp"

#include <set>
#include <string>
#include <vector>

using namespace wikirev;

namespace {

bool is_invalid_slug(revision_error const& e)
{
    return e.kind() == error_kind::invalid_slug;
}

} // unnamed namespace

BOOST_AUTO_TEST_CASE(normalizes_text)
{
    BOOST_CHECK_EQUAL(normalize_slug("SCP-001"), "scp-001");
    BOOST_CHECK_EQUAL(normalize_slug("Component:Theme X"), "component:theme-x");
    BOOST_CHECK_EQUAL(normalize_slug("  Hello,  World!! "), "hello-world");
    BOOST_CHECK_EQUAL(normalize_slug("a::b"), "a:b");
    BOOST_CHECK_EQUAL(normalize_slug(":a:"), "a");
    BOOST_CHECK_EQUAL(normalize_slug("fragment - :page"), "fragment:page");
    BOOST_CHECK_EQUAL(normalize_slug("_Template"), "_template");
    BOOST_CHECK_EQUAL(normalize_slug("a_b"), "a-b");
    BOOST_CHECK_EQUAL(normalize_slug("page.ftml"), "page-ftml");
    BOOST_CHECK_EQUAL(normalize_slug("cost$"), "cost");
    BOOST_CHECK_EQUAL(normalize_slug("---"), "");
    BOOST_CHECK_EQUAL(normalize_slug(""), "");
}

BOOST_AUTO_TEST_CASE(normal_form)
{
    BOOST_CHECK(is_normalized("main"));
    BOOST_CHECK(is_normalized("scp-4004"));
    BOOST_CHECK(is_normalized("fragment:component:decommissioned:page"));
    BOOST_CHECK(is_normalized("_default:_template"));

    BOOST_CHECK(!is_normalized(""));
    BOOST_CHECK(!is_normalized("Main"));
    BOOST_CHECK(!is_normalized("a b"));
    BOOST_CHECK(!is_normalized("-a"));
    BOOST_CHECK(!is_normalized("a--b"));
    BOOST_CHECK(!is_normalized("a:"));
    BOOST_CHECK(!is_normalized("a$b"));
    BOOST_CHECK(!is_normalized("a.ftml"));
    BOOST_CHECK(!is_normalized("../etc/passwd"));
    BOOST_CHECK(!is_normalized("a/b"));
}

BOOST_AUTO_TEST_CASE(check_slug_throws)
{
    BOOST_CHECK_NO_THROW(check_slug("component:theme-x"));
    BOOST_CHECK_EXCEPTION(check_slug("Bad Slug"), revision_error, is_invalid_slug);
    BOOST_CHECK_EXCEPTION(check_slug(""), revision_error, is_invalid_slug);
    BOOST_CHECK_EXCEPTION(check_slug("../x"), revision_error, is_invalid_slug);
}

BOOST_AUTO_TEST_CASE(maps_slugs_to_paths)
{
    BOOST_CHECK_EQUAL(slug_to_path("main"), "main.ftml");
    BOOST_CHECK_EQUAL(slug_to_path("component:theme-x"), "component$theme-x.ftml");
    BOOST_CHECK_EQUAL(slug_to_path("a:b:c"), "a$b$c.ftml");
}

BOOST_AUTO_TEST_CASE(path_to_slug_inverts)
{
    BOOST_CHECK_EQUAL(*path_to_slug("component$theme-x.ftml"), "component:theme-x");
    BOOST_CHECK(!path_to_slug("main.txt"));
    BOOST_CHECK(!path_to_slug(".ftml"));
    BOOST_CHECK(!path_to_slug("Main.ftml"));
    BOOST_CHECK(!path_to_slug("a$$b.ftml"));
}

BOOST_AUTO_TEST_CASE(mapping_is_injective)
{
    std::vector<std::string> const slugs = {
        "main", "scp-001", "scp-001-ex", "component:aesthetic-theme",
        "component-aesthetic-theme", "component:aesthetic:theme",
        "fragment:component:decommissioned:page", "_default:page", "a", "a:b", "a-b", "ab"
    };

    std::set<std::string> paths;
    for (auto const& slug : slugs)
    {
        BOOST_REQUIRE(is_normalized(slug));
        std::string const path = slug_to_path(slug);
        BOOST_CHECK(path.find('/') == std::string::npos);
        BOOST_CHECK(paths.insert(path).second);
        BOOST_CHECK_EQUAL(*path_to_slug(path), slug);
    }
}
