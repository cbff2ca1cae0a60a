// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "commit_hash.hpp"
#include "error.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/regex.hpp>

namespace wikirev {

std::size_t const commit_hash::size;

static boost::regex const hash_regex("[0-9a-fA-F]{40}");

boost::optional<commit_hash> commit_hash::try_parse(std::string const& text)
{
    if (!boost::regex_match(text, hash_regex))
        return boost::none;

    return commit_hash(boost::algorithm::to_lower_copy(text));
}

commit_hash commit_hash::parse(std::string const& text)
{
    boost::optional<commit_hash> hash = try_parse(text);
    if (!hash)
        throw revision_error(error_kind::invalid_hash, "'" + text + "'");
    return *hash;
}

} // namespace wikirev
