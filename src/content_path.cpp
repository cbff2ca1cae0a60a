// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "content_path.hpp"
#include "error.hpp"
#include "log.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/range/algorithm/replace.hpp>
#include <cstring>
#include <vector>

namespace wikirev {

char const* const page_extension = ".ftml";

namespace {

bool is_slug_char(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

std::string normalize_category(std::string const& category)
{
    std::string body;
    bool const underscore = !category.empty() && category[0] == '_';

    for (std::size_t i = underscore ? 1 : 0; i < category.size(); ++i)
    {
        char c = category[i];
        if (c >= 'A' && c <= 'Z')
            c = c - 'A' + 'a';

        if (is_slug_char(c))
            body.push_back(c);
        else if (body.empty() || body.back() != '-')
            body.push_back('-');
    }

    boost::algorithm::trim_if(body, boost::algorithm::is_any_of("-"));
    if (body.empty())
        return body;
    return underscore ? "_" + body : body;
}

} // unnamed namespace

std::string normalize_slug(std::string const& text)
{
    std::vector<std::string> categories;
    boost::algorithm::split(categories, text, boost::algorithm::is_any_of(":"));

    std::vector<std::string> normal;
    for (auto const& category : categories)
    {
        std::string c = normalize_category(category);
        if (!c.empty())
            normal.push_back(c);
    }
    return boost::algorithm::join(normal, ":");
}

bool is_normalized(std::string const& slug)
{
    return !slug.empty() && normalize_slug(slug) == slug;
}

void check_slug(std::string const& slug)
{
    Log::trace() << "Checking slug for normal form: " << slug << std::endl;

    if (!is_normalized(slug))
        throw revision_error(error_kind::invalid_slug, "'" + slug + "'");
}

std::string slug_to_path(std::string const& slug)
{
    std::string path = slug;
    boost::replace(path, category_separator, filename_separator);
    path += page_extension;

    Log::trace() << "Converted slug '" << slug << "' to path " << path << std::endl;
    return path;
}

boost::optional<std::string> path_to_slug(std::string const& path)
{
    if (!boost::algorithm::ends_with(path, page_extension))
        return boost::none;

    std::string slug = path.substr(0, path.size() - std::strlen(page_extension));
    boost::replace(slug, filename_separator, category_separator);

    if (!is_normalized(slug))
        return boost::none;
    return slug;
}

} // namespace wikirev
