// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "scoring.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace wikirev {

votes::votes(distribution_type distribution)
    : distribution_(std::move(distribution)),
      count_(0)
{
    for (auto const& entry : distribution_)
        count_ += entry.second;
}

unsigned votes::count_for(int vote) const
{
    auto const found = distribution_.find(vote);
    return found == distribution_.end() ? 0 : found->second;
}

double null_scorer::score(votes const&) const
{
    return 0;
}

double sum_scorer::score(votes const& v) const
{
    double sum = 0;
    for (auto const& entry : v.distribution())
        sum += static_cast<double>(entry.first) * entry.second;
    return sum;
}

double average_scorer::score(votes const& v) const
{
    if (v.count() == 0)
        return 0;
    return sum_scorer().score(v) / v.count();
}

double percent_scorer::score(votes const& v) const
{
    if (v.count() == 0)
        return 0;

    double const positive = v.count_for(1);
    double const neutral = v.count_for(0) * 0.5;
    return (positive + neutral) / v.count() * 100.0;
}

double wilson_scorer::score(votes const& v) const
{
    // z for a two-sided 95% interval
    double const z = 1.96;

    double const positive = v.count_for(1);
    double const n = positive + v.count_for(-1);
    if (n == 0)
        return 0;

    double const p = positive / n;
    double const z2 = z * z;
    return (p + z2 / (2 * n) - z * std::sqrt((p * (1 - p) + z2 / (4 * n)) / n)) / (1 + z2 / n);
}

std::unique_ptr<scorer> make_scorer(std::string const& name)
{
    if (name == "null")
        return std::unique_ptr<scorer>(new null_scorer);
    if (name == "sum")
        return std::unique_ptr<scorer>(new sum_scorer);
    if (name == "average")
        return std::unique_ptr<scorer>(new average_scorer);
    if (name == "percent")
        return std::unique_ptr<scorer>(new percent_scorer);
    if (name == "wilson")
        return std::unique_ptr<scorer>(new wilson_scorer);
    throw std::runtime_error("unknown scoring strategy: " + name);
}

} // namespace wikirev
