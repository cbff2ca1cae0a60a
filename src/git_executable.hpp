// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_EXECUTABLE_DWA2013614_HPP
# define GIT_EXECUTABLE_DWA2013614_HPP

# include "error.hpp"
# include <boost/process/search_path.hpp>
# include <string>

namespace wikirev {

// An explicit path is taken as is; a bare name (or nothing, meaning
// "git") is looked up on PATH.
inline std::string git_executable(std::string const& configured = std::string())
{
    if (configured.find('/') != std::string::npos)
        return configured;

    if (configured.empty() || configured == "git")
    {
        static std::string const git_exe
            = boost::process::search_path("git").string();
        if (git_exe.empty())
            throw revision_error(error_kind::io, "git executable not found on PATH");
        return git_exe;
    }

    std::string found = boost::process::search_path(configured).string();
    if (found.empty())
        throw revision_error(error_kind::io, configured + " not found on PATH");
    return found;
}

} // namespace wikirev

#endif // GIT_EXECUTABLE_DWA2013614_HPP
