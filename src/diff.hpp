// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef DIFF_HPP
# define DIFF_HPP

# include <boost/optional.hpp>
# include <cstddef>
# include <string>
# include <vector>

namespace wikirev {

// One line of a unified diff.
//
// origin is ' ' (context), '+' (added) or '-' (deleted).  The
// "\ No newline at end of file" marker gets '=', '>' or '<' when it
// follows a context, added or deleted line respectively, and has no
// line numbers.
struct diff_line
{
    diff_line()
        : origin(' '), line_count(1)
    {}

    char origin;
    boost::optional<unsigned> old_lineno;
    boost::optional<unsigned> new_lineno;
    unsigned line_count;

    // Without the origin character and the trailing newline
    std::string content;
};

struct diff_stat
{
    diff_stat() : insertions(0), deletions(0) {}

    std::size_t insertions;
    std::size_t deletions;
};

struct diff
{
    diff() : insertions(0), deletions(0), percent_changed(0) {}

    std::size_t insertions;
    std::size_t deletions;
    double percent_changed;

    // Absent when the page did not exist on that side
    boost::optional<std::string> old_name;
    boost::optional<std::string> new_name;

    std::vector<diff_line> lines;
};

// Sums the insertion and deletion columns of "git diff --numstat".
// Binary entries ("-") count as zero.
diff_stat parse_numstat(std::string const& numstat);

// Fills names and lines of `result` from "git diff --no-prefix" output
// for a single path.  Name fields hold repository paths.
void parse_unified_diff(std::string const& text, diff& result);

// 100 * (insertions + deletions) / (first_lines + second_lines), or 0
// when both versions are empty.
double percent_changed(diff_stat const& change, std::size_t first_lines, std::size_t second_lines);

} // namespace wikirev

#endif // DIFF_HPP
