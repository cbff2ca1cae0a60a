// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "process_runner.hpp"
#include "error.hpp"
#include "log.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <future>
#include <thread>
#include <utility>

#if defined(BOOST_POSIX_API)
# include <cerrno>
# include <cstring>
# include <signal.h>
# include <sys/wait.h>
#endif

namespace wikirev {

namespace process = boost::process;
namespace fs = boost::filesystem;

namespace {

typedef std::chrono::steady_clock clock_type;

std::chrono::milliseconds const poll_interval(5);

// Pumps the pipe readers and polls the child until it has exited with
// both pipes at end-of-file.  Returns false if the deadline passes
// first.
bool await_completion(
    process::child& child, boost::asio::io_context& ios, clock_type::time_point deadline)
{
    for (;;)
    {
        if (!ios.stopped())
            ios.run_for(poll_interval);
        else
            std::this_thread::sleep_for(poll_interval);

        if (ios.stopped() && !child.running())
            return true;

        if (clock_type::now() >= deadline)
            return false;
    }
}

// Waits for exit only; the pipes no longer matter once we are tearing
// the child down.
bool await_exit(process::child& child, clock_type::time_point deadline)
{
    while (child.running())
    {
        if (clock_type::now() >= deadline)
            return false;
        std::this_thread::sleep_for(poll_interval);
    }
    return true;
}

std::string resolve(std::string const& executable)
{
    if (executable.find('/') != std::string::npos)
        return executable;

    std::string found = process::search_path(executable).string();
    if (found.empty())
        throw revision_error(error_kind::io, executable + " not found on PATH");
    return found;
}

} // unnamed namespace

process_runner::process_runner(std::string executable, process_limits limits)
    : executable_(resolve(executable)),
      limits_(limits)
{
}

void process_runner::run(
    fs::path const& directory, std::vector<std::string> const& args) const
{
    Log::debug() << "Running process: (in " << directory << ") " << executable_ << ' '
                 << boost::algorithm::join(args, " ") << " (no capture)" << std::endl;

    execute(directory, args);
}

std::string process_runner::run_capturing(
    fs::path const& directory, std::vector<std::string> const& args) const
{
    Log::debug() << "Running process: (in " << directory << ") " << executable_ << ' '
                 << boost::algorithm::join(args, " ") << " (capturing stdout)" << std::endl;

    std::string output = execute(directory, args);
    Log::trace() << "Gathered " << output.size() << " bytes of stdout" << std::endl;
    return output;
}

std::vector<std::string> process_runner::leading_arguments(
    std::vector<std::string> const& args) const
{
    std::vector<std::string> leading(1, fs::path(executable_).filename().string());

    // Skip global options such as "-c key=value" to reach the subcommand
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == "-c" || args[i] == "-C")
        {
            ++i;
            continue;
        }
        if (!args[i].empty() && args[i][0] == '-')
            continue;

        leading.push_back(args[i]);
        break;
    }
    return leading;
}

std::string process_runner::execute(
    fs::path const& directory, std::vector<std::string> const& args) const
{
    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;

    try
    {
        process::child child(
            process::exe = executable_,
            process::args = args,
            process::start_dir = directory,
            process::std_in < process::null,
            process::std_out > out,
            process::std_err > err,
            ios);

        Log::trace() << "Started pid " << child.id() << ", waiting "
                     << limits_.timeout.count() << " ms for completion" << std::endl;

        if (!await_completion(child, ios, clock_type::now() + limits_.timeout))
        {
            Log::warn() << "Process timed out after " << limits_.timeout.count()
                        << " ms, terminating" << std::endl;

            // Once reaped, the pid may already belong to another process.
            // The child can exit first when a descendant holds its pipes.
            if (child.running())
            {
#if defined(BOOST_POSIX_API)
                if (::kill(child.id(), SIGTERM) != 0)
                    Log::warn() << "Failed to terminate process: "
                                << std::strerror(errno) << std::endl;

                if (!await_exit(child, clock_type::now() + limits_.grace))
                {
                    Log::warn() << "Process did not exit after termination, killing" << std::endl;
                    child.terminate();
                }
#else
                child.terminate();
#endif
            }
            else
            {
                Log::warn() << "Process exited, but its output was still open" << std::endl;
            }
            throw command_timed_out(leading_arguments(args), limits_.timeout);
        }

        int const exit_code = child.exit_code();
        if (exit_code == 0
#if defined(BOOST_POSIX_API)
            && !WIFSIGNALED(child.native_exit_code())
#endif
            )
        {
            Log::trace() << "Command succeeded, gathering stdout" << std::endl;
            return out.get();
        }

        boost::optional<int> code;
        boost::optional<int> signal;
#if defined(BOOST_POSIX_API)
        int const status = child.native_exit_code();
        if (WIFSIGNALED(status))
        {
            signal = WTERMSIG(status);
            Log::warn() << "Process was killed by signal " << *signal << std::endl;
        }
        else
#endif
        {
            code = exit_code;
            Log::warn() << "Process exited with non-zero status code " << exit_code << std::endl;
        }

        throw command_failed(leading_arguments(args), err.get(), code, signal);
    }
    catch (process::process_error const& e)
    {
        Log::warn() << "Failed to run " << executable_ << ": " << e.what() << std::endl;
        throw revision_error(error_kind::io, e.what());
    }
}

} // namespace wikirev
