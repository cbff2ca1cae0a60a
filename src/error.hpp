// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef ERROR_HPP
# define ERROR_HPP

# include <boost/optional.hpp>
# include <chrono>
# include <stdexcept>
# include <string>
# include <vector>

namespace wikirev {

enum class error_kind
{
    invalid_slug,
    page_exists,
    page_not_found,
    command_failed,
    command_timed_out,
    io,
    parse_error,
    internal,
    invalid_hash,
    wiki_not_found,
    revision_not_found,
    revision_page_mismatch
};

char const* describe(error_kind kind);

// Base of everything the revision store and page manager throw.
class revision_error : public std::runtime_error
{
 public:
    revision_error(error_kind kind, std::string const& detail);
    explicit revision_error(error_kind kind);

    error_kind kind() const { return kind_; }

 private:
    error_kind kind_;
};

// git (or whatever the runner was asked to start) exited non-zero or
// was killed by a signal.
class command_failed : public revision_error
{
 public:
    command_failed(
        std::vector<std::string> command,
        std::string stderr_text,
        boost::optional<int> exit_code,
        boost::optional<int> signal);

    // Leading arguments of the invocation, e.g. {"git", "revert"}
    std::vector<std::string> const& command() const { return command_; }
    std::string const& stderr_text() const { return stderr_text_; }
    boost::optional<int> exit_code() const { return exit_code_; }
    boost::optional<int> signal() const { return signal_; }

 private:
    static std::string format(
        std::vector<std::string> const& command,
        std::string const& stderr_text,
        boost::optional<int> exit_code,
        boost::optional<int> signal);

    std::vector<std::string> command_;
    std::string stderr_text_;
    boost::optional<int> exit_code_;
    boost::optional<int> signal_;
};

class command_timed_out : public revision_error
{
 public:
    command_timed_out(std::vector<std::string> command, std::chrono::milliseconds timeout);

    std::vector<std::string> const& command() const { return command_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

 private:
    std::vector<std::string> command_;
    std::chrono::milliseconds timeout_;
};

} // namespace wikirev

#endif // ERROR_HPP
