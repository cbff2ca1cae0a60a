// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef CONTENT_PATH_HPP
# define CONTENT_PATH_HPP

# include <boost/optional.hpp>
# include <string>

// Mapping between page slugs ("component:theme-x") and the flat file
// names they are stored under in a wiki's repository
// ("component$theme-x.ftml").
//
// Only slugs in normal form are mapped.  Normal form has no '$' and no
// '.', so the mapping is injective and every file lives directly in the
// repository root.

namespace wikirev {

char const category_separator = ':';
char const filename_separator = '$';
extern char const* const page_extension;

// Brings arbitrary text into normal form: lowercase ASCII, every
// character outside [a-z0-9:_] replaced by '-', '_' kept only at the
// start of a category, '-' runs collapsed and trimmed around ':' and
// at the ends, empty categories dropped.  May return "".
std::string normalize_slug(std::string const& text);

bool is_normalized(std::string const& slug);

// Throws revision_error(invalid_slug) unless is_normalized(slug).
void check_slug(std::string const& slug);

// Relative to the repository root.  Precondition: is_normalized(slug).
std::string slug_to_path(std::string const& slug);

// Inverse of slug_to_path; none for names it cannot have produced.
boost::optional<std::string> path_to_slug(std::string const& path);

} // namespace wikirev

#endif // CONTENT_PATH_HPP
