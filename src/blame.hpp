// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BLAME_HPP
# define BLAME_HPP

# include "commit_hash.hpp"

# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <boost/optional.hpp>
# include <string>
# include <vector>

namespace wikirev {

struct blame_author
{
    std::string name;
    std::string email;

    // The instant, in UTC
    boost::posix_time::ptime time;

    // The zone the author was in, e.g. +02:00
    boost::posix_time::time_duration utc_offset;
};

struct blame_line
{
    blame_line(commit_hash const& commit, unsigned old_lineno, unsigned new_lineno, std::string line)
        : commit(commit), old_lineno(old_lineno), new_lineno(new_lineno), line(std::move(line))
    {}

    commit_hash commit;
    unsigned old_lineno;
    unsigned new_lineno;
    std::string line;
};

// A run of consecutive lines last touched by the same commit.
struct blame_group
{
    blame_author author;
    blame_author committer;
    std::string summary;
    boost::optional<commit_hash> previous;
    std::vector<blame_line> lines;
};

struct blame
{
    std::vector<blame_group> groups;
};

// Parses the output of "git blame --porcelain".  Throws
// revision_error(parse_error) on anything that does not fit the format.
blame parse_blame_porcelain(std::string const& porcelain);

} // namespace wikirev

#endif // BLAME_HPP
