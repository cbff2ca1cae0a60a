// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "error.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <sstream>
#include <utility>

namespace wikirev {

char const* describe(error_kind kind)
{
    switch (kind)
    {
    case error_kind::invalid_slug: return "slug not in normal form";
    case error_kind::page_exists: return "the given page already exists";
    case error_kind::page_not_found: return "the given page was not found";
    case error_kind::command_failed: return "command failed";
    case error_kind::command_timed_out: return "command timed out";
    case error_kind::io: return "I/O error";
    case error_kind::parse_error: return "unexpected or mismatched input in git output";
    case error_kind::internal: return "internal consistency error";
    case error_kind::invalid_hash: return "not a valid commit hash";
    case error_kind::wiki_not_found: return "the given wiki was not found";
    case error_kind::revision_not_found: return "the given revision was not found";
    case error_kind::revision_page_mismatch:
        return "the given revision does not correspond to the specified page";
    }
    return "unknown error";
}

revision_error::revision_error(error_kind kind, std::string const& detail)
    : std::runtime_error(std::string(describe(kind)) + ": " + detail),
      kind_(kind)
{
}

revision_error::revision_error(error_kind kind)
    : std::runtime_error(describe(kind)),
      kind_(kind)
{
}

command_failed::command_failed(
    std::vector<std::string> command,
    std::string stderr_text,
    boost::optional<int> exit_code,
    boost::optional<int> signal)
    : revision_error(
          error_kind::command_failed,
          format(command, stderr_text, exit_code, signal)),
      command_(std::move(command)),
      stderr_text_(std::move(stderr_text)),
      exit_code_(exit_code),
      signal_(signal)
{
}

std::string command_failed::format(
    std::vector<std::string> const& command,
    std::string const& stderr_text,
    boost::optional<int> exit_code,
    boost::optional<int> signal)
{
    std::ostringstream s;
    s << boost::algorithm::join(command, " ");
    std::string trimmed = boost::algorithm::trim_copy(stderr_text);
    if (!trimmed.empty())
        s << ": " << trimmed;
    if (exit_code)
        s << " (exit status " << *exit_code << ")";
    else if (signal)
        s << " (killed by signal " << *signal << ")";
    else
        s << " (unknown cause)";
    return s.str();
}

command_timed_out::command_timed_out(
    std::vector<std::string> command, std::chrono::milliseconds timeout)
    : revision_error(
          error_kind::command_timed_out,
          boost::algorithm::join(command, " ")
          + " (" + std::to_string(timeout.count()) + " ms)"),
      command_(std::move(command)),
      timeout_(timeout)
{
}

} // namespace wikirev
