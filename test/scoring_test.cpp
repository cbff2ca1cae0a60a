// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#define BOOST_TEST_MODULE scoring
#include <boost/test/unit_test.hpp>

#include "scoring.hpp"

#include <stdexcept>

using namespace wikirev;

namespace {

typedef votes::distribution_type distribution;

struct fixture
{
    fixture()
        : positive(distribution{{1, 20}}),
          positive_and_neutral(distribution{{1, 12}, {0, 8}}),
          negative(distribution{{-1, 5}}),
          neutral(distribution{{0, 8}}),
          mixed_1(distribution{{1, 46}, {0, 18}, {-1, 20}}),
          mixed_2(distribution{{1, 20}, {0, 36}, {-1, 15}})
    {}

    votes none;
    votes positive;
    votes positive_and_neutral;
    votes negative;
    votes neutral;
    votes mixed_1;
    votes mixed_2;
};

} // unnamed namespace

BOOST_FIXTURE_TEST_SUITE(scorers, fixture)

BOOST_AUTO_TEST_CASE(vote_counts)
{
    BOOST_CHECK_EQUAL(none.count(), 0u);
    BOOST_CHECK_EQUAL(mixed_1.count(), 84u);
    BOOST_CHECK_EQUAL(mixed_1.count_for(-1), 20u);
    BOOST_CHECK_EQUAL(positive.count_for(-1), 0u);
}

BOOST_AUTO_TEST_CASE(null_scoring)
{
    null_scorer s;
    BOOST_CHECK_EQUAL(s.score(none), 0.0);
    BOOST_CHECK_EQUAL(s.score(positive), 0.0);
    BOOST_CHECK_EQUAL(s.score(mixed_2), 0.0);
}

BOOST_AUTO_TEST_CASE(sum_scoring)
{
    sum_scorer s;
    BOOST_CHECK_EQUAL(s.score(none), 0.0);
    BOOST_CHECK_EQUAL(s.score(positive), 20.0);
    BOOST_CHECK_EQUAL(s.score(positive_and_neutral), 12.0);
    BOOST_CHECK_EQUAL(s.score(negative), -5.0);
    BOOST_CHECK_EQUAL(s.score(neutral), 0.0);
    BOOST_CHECK_EQUAL(s.score(mixed_1), 26.0);
    BOOST_CHECK_EQUAL(s.score(mixed_2), 5.0);
}

BOOST_AUTO_TEST_CASE(average_scoring)
{
    average_scorer s;
    BOOST_CHECK_EQUAL(s.score(none), 0.0);
    BOOST_CHECK_CLOSE(s.score(positive), 1.0, 1e-9);
    BOOST_CHECK_CLOSE(s.score(positive_and_neutral), 0.6, 1e-9);
    BOOST_CHECK_CLOSE(s.score(negative), -1.0, 1e-9);
    BOOST_CHECK_EQUAL(s.score(neutral), 0.0);
    BOOST_CHECK_CLOSE(s.score(mixed_1), 26.0 / 84.0, 1e-9);
    BOOST_CHECK_CLOSE(s.score(mixed_2), 5.0 / 71.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(percent_scoring)
{
    percent_scorer s;
    BOOST_CHECK_EQUAL(s.score(none), 0.0);
    BOOST_CHECK_CLOSE(s.score(positive), 100.0, 1e-9);
    BOOST_CHECK_CLOSE(s.score(positive_and_neutral), 80.0, 1e-9);
    BOOST_CHECK_EQUAL(s.score(negative), 0.0);
    BOOST_CHECK_CLOSE(s.score(neutral), 50.0, 1e-9);
    BOOST_CHECK_CLOSE(s.score(mixed_1), 65.476, 0.001);
    BOOST_CHECK_CLOSE(s.score(mixed_2), 53.521, 0.001);
}

BOOST_AUTO_TEST_CASE(wilson_scoring)
{
    wilson_scorer s;
    BOOST_CHECK_EQUAL(s.score(none), 0.0);
    BOOST_CHECK_EQUAL(s.score(neutral), 0.0);
    BOOST_CHECK_CLOSE(s.score(positive), 0.83887, 0.01);
    BOOST_CHECK_SMALL(s.score(negative), 1e-9);

    // Fewer votes of the same ratio rank lower
    votes const few(distribution{{1, 5}});
    BOOST_CHECK_CLOSE(s.score(few), 0.56552, 0.01);
    BOOST_CHECK_LT(s.score(few), s.score(positive));

    BOOST_CHECK_GT(s.score(mixed_1), 0.0);
    BOOST_CHECK_LT(s.score(mixed_1), 46.0 / 66.0);
}

BOOST_AUTO_TEST_CASE(scorer_by_name)
{
    BOOST_CHECK_EQUAL(make_scorer("sum")->score(mixed_1), 26.0);
    BOOST_CHECK_CLOSE(make_scorer("percent")->score(positive_and_neutral), 80.0, 1e-9);
    BOOST_CHECK_EQUAL(make_scorer("null")->score(positive), 0.0);
    BOOST_CHECK_CLOSE(make_scorer("average")->score(positive), 1.0, 1e-9);
    BOOST_CHECK_CLOSE(make_scorer("wilson")->score(positive), 0.83887, 0.01);
    BOOST_CHECK_THROW(make_scorer("wikidot"), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
