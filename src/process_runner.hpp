// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef PROCESS_RUNNER_HPP
# define PROCESS_RUNNER_HPP

# include <boost/filesystem/path.hpp>
# include <chrono>
# include <string>
# include <vector>

namespace wikirev {

struct process_limits
{
    process_limits()
        : timeout(1800),
          grace(500)
    {}

    process_limits(std::chrono::milliseconds timeout, std::chrono::milliseconds grace)
        : timeout(timeout),
          grace(grace)
    {}

    // How long the child may run before it is asked to terminate
    std::chrono::milliseconds timeout;

    // How long a terminated child gets to exit before it is killed
    std::chrono::milliseconds grace;
};

// Runs one external program to completion in a given directory.
//
// stdin reads from the null device; stdout and stderr are drained
// while the child runs, so output size never stalls it.  Failures are
// reported as command_failed, command_timed_out or (when the program
// cannot be started) revision_error(io).  Nothing is retried.
class process_runner
{
 public:
    process_runner(std::string executable, process_limits limits = process_limits());

    // Runs and discards stdout.
    void run(
        boost::filesystem::path const& directory,
        std::vector<std::string> const& args) const;

    // Runs and returns everything written to stdout.
    std::string run_capturing(
        boost::filesystem::path const& directory,
        std::vector<std::string> const& args) const;

    std::string const& executable() const { return executable_; }
    process_limits const& limits() const { return limits_; }

 private:
    std::string execute(
        boost::filesystem::path const& directory,
        std::vector<std::string> const& args) const;

    // The program name followed by at most the first argument, for
    // error reports.
    std::vector<std::string> leading_arguments(std::vector<std::string> const& args) const;

 private:
    std::string executable_;
    process_limits limits_;
};

} // namespace wikirev

#endif // PROCESS_RUNNER_HPP
