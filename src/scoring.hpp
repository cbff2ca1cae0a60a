// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef SCORING_HPP
# define SCORING_HPP

# include <map>
# include <memory>
# include <string>

namespace wikirev {

// How many times each vote value was cast on a page, e.g. {+1: 2, -1: 3}
class votes
{
 public:
    typedef std::map<int, unsigned> distribution_type;

    votes() : count_(0) {}
    explicit votes(distribution_type distribution);

    distribution_type const& distribution() const { return distribution_; }

    // 0 for a value nobody voted
    unsigned count_for(int vote) const;

    // Votes of all values together
    unsigned count() const { return count_; }

 private:
    distribution_type distribution_;
    unsigned count_;
};

// Turns a vote distribution into a page rating.  Which one a wiki uses
// is up to its administrators.
class scorer
{
 public:
    virtual ~scorer() {}
    virtual double score(votes const& v) const = 0;
};

// Always 0
class null_scorer : public scorer
{
 public:
    double score(votes const& v) const;
};

// Sum of all votes, i.e. ups minus downs for +1/-1 voting
class sum_scorer : public scorer
{
 public:
    double score(votes const& v) const;
};

// Mean vote
class average_scorer : public scorer
{
 public:
    double score(votes const& v) const;
};

// Percentage of upvotes, a neutral vote counting as half of one
class percent_scorer : public scorer
{
 public:
    double score(votes const& v) const;
};

// Lower bound of the 95% Wilson score interval for the share of
// upvotes among +1 and -1 votes.  Ranks a page with few votes below one
// with many votes of the same ratio.
class wilson_scorer : public scorer
{
 public:
    double score(votes const& v) const;
};

// By name: "null", "sum", "average", "percent" or "wilson".  Throws
// std::runtime_error for anything else.
std::unique_ptr<scorer> make_scorer(std::string const& name);

} // namespace wikirev

#endif // SCORING_HPP
