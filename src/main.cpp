/*
 *  Copyright (C) 2007  Thiago Macieira <thiago@kde.org>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/date_time/posix_time/posix_time_io.hpp>
#include <boost/program_options.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

#include "error.hpp"
#include "log.hpp"
#include "options.hpp"
#include "revision_store.hpp"

using wikirev::commit_hash;
using wikirev::commit_info;
using wikirev::revision_store;

static std::string read_content(std::string const& filename)
{
    std::ifstream file(filename.c_str(), std::ios::in | std::ios::binary);
    if (!file)
        throw std::runtime_error("cannot open " + filename);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

static void expect_arguments(
    std::string const& command, std::vector<std::string> const& args, std::size_t min, std::size_t max)
{
    if (args.size() < min || args.size() > max)
        throw std::runtime_error("wrong number of arguments for '" + command + "'");
}

static void print_diff(wikirev::diff const& d)
{
    std::cout << "--- " << (d.old_name ? *d.old_name : "(none)") << '\n'
              << "+++ " << (d.new_name ? *d.new_name : "(none)") << '\n'
              << d.insertions << " insertions(+), " << d.deletions << " deletions(-), "
              << d.percent_changed << "% changed\n";

    for (auto const& line : d.lines)
        std::cout << line.origin << line.content << '\n';
}

static void print_blame(wikirev::blame const& b)
{
    for (auto const& group : b.groups)
    {
        for (auto const& line : group.lines)
        {
            std::cout << line.commit.str().substr(0, 8) << " (" << group.author.name << ' '
                      << (group.author.time + group.author.utc_offset) << ' '
                      << line.new_lineno << ") " << line.line << '\n';
        }
    }
}

static int run_command(
    revision_store& store, std::string const& command, std::vector<std::string> const& args, bool deep)
{
    commit_info const info(options.user, options.message);

    if (command == "init")
    {
        expect_arguments(command, args, 0, 0);
        store.initial_commit();
        std::cout << "Initialized " << store.repository().string() << std::endl;
    }
    else if (command == "commit")
    {
        expect_arguments(command, args, 1, 2);
        boost::optional<std::string> content;
        if (args.size() == 2)
            content = read_content(args[1]);
        std::cout << store.commit(args[0], content, info) << std::endl;
    }
    else if (command == "show")
    {
        expect_arguments(command, args, 1, 2);
        boost::optional<std::string> content = args.size() == 2
            ? store.get_page_version(args[0], commit_hash::parse(args[1]))
            : store.get_page(args[0]);
        if (!content)
        {
            Log::error() << "No page '" << args[0] << "'" << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << *content;
    }
    else if (command == "rm")
    {
        expect_arguments(command, args, 1, 1);
        if (boost::optional<commit_hash> hash = store.remove(args[0], info))
            std::cout << *hash << std::endl;
        else
            Log::info() << "No page '" << args[0] << "', nothing removed" << std::endl;
    }
    else if (command == "mv")
    {
        expect_arguments(command, args, 2, 2);
        std::cout << store.rename(args[0], args[1], info) << std::endl;
    }
    else if (command == "restore")
    {
        expect_arguments(command, args, 3, 3);
        std::cout << store.restore(args[0], args[1], commit_hash::parse(args[2]), info) << std::endl;
    }
    else if (command == "undo")
    {
        expect_arguments(command, args, 1, 1);
        std::cout << store.undo(commit_hash::parse(args[0]), info) << std::endl;
    }
    else if (command == "diff")
    {
        expect_arguments(command, args, 3, 3);
        print_diff(store.get_diff(args[0], commit_hash::parse(args[1]), commit_hash::parse(args[2])));
    }
    else if (command == "blame")
    {
        expect_arguments(command, args, 1, 2);
        boost::optional<commit_hash> hash;
        if (args.size() == 2)
            hash = commit_hash::parse(args[1]);

        boost::optional<wikirev::blame> blame = store.get_blame(args[0], hash);
        if (!blame)
        {
            Log::error() << "No page '" << args[0] << "'" << std::endl;
            return EXIT_FAILURE;
        }
        print_blame(*blame);
    }
    else if (command == "vacuum")
    {
        expect_arguments(command, args, 0, 0);
        std::size_t const pruned = deep ? store.vacuum_deep() : store.vacuum();
        std::cout << pruned << " objects pruned" << std::endl;
    }
    else
    {
        throw std::runtime_error("unknown command '" + command + "'");
    }
    return Log::result();
}

int main(int argc, char **argv)
{
    std::string command;
    std::vector<std::string> args;
    try
    {
        namespace po = boost::program_options;
        po::options_description program_options("Allowed options");
        program_options.add_options()
            ("help,h", "produce help message")
            ("version,v", "print version string")
            ("quiet,q", "be quiet")
            ("verbose,V", "be verbose")
            ("extra-verbose,X", "be even more verbose")
            ("repo,r", po::value(&options.repository)->value_name("PATH")->required(), "path to the page repository")
            ("config", po::value<std::string>()->value_name("FILENAME"), "INI file with git, store and log settings")
            ("git", po::value<std::string>()->value_name("PATH"), "git executable to run")
            ("timeout", po::value<long>()->value_name("MS"), "milliseconds a git command may take")
            ("domain", po::value<std::string>()->value_name("DOMAIN"), "domain of the noreply author addresses")
            ("user,u", po::value(&options.user)->value_name("NAME"), "author of the commit")
            ("message,m", po::value(&options.message)->value_name("TEXT"), "commit message")
            ("deep", "with vacuum: also repack the repository")
            ;

        po::options_description hidden;
        hidden.add_options()
            ("command", po::value(&command))
            ("args", po::value(&args))
            ;

        po::options_description all;
        all.add(program_options).add(hidden);

        po::positional_options_description positional;
        positional.add("command", 1).add("args", -1);

        po::variables_map variables;
        store(po::command_line_parser(argc, argv)
              .options(all)
              .positional(positional)
              .run(), variables);
        if (variables.count("help"))
        {
            std::cout << "Usage: wikirev-admin [options] COMMAND [ARGS]\n\n"
                      << "Commands:\n"
                      << "  init\n"
                      << "  commit SLUG [FILE]\n"
                      << "  show SLUG [HASH]\n"
                      << "  rm SLUG\n"
                      << "  mv OLD NEW\n"
                      << "  restore SLUG OLD HASH\n"
                      << "  undo HASH\n"
                      << "  diff SLUG FIRST SECOND\n"
                      << "  blame SLUG [HASH]\n"
                      << "  vacuum [--deep]\n\n"
                      << program_options << std::endl;
            return 0;
        }
        if (variables.count("version"))
        {
            std::cout << "wikirev-admin 0.1" << std::endl;
            return 0;
        }
        notify(variables);

        if (variables.count("config"))
        {
            load_config_file(variables["config"].as<std::string>(), options);
            Log::set_level(Log::parse_level(options.log_level));
        }

        // The command line wins over the configuration file
        if (variables.count("quiet"))
        {
            Log::set_level(Log::Warning);
        }
        if (variables.count("verbose"))
        {
            Log::set_level(Log::Debug);
        }
        if (variables.count("extra-verbose"))
        {
            Log::set_level(Log::Trace);
        }
        if (variables.count("git"))
        {
            options.settings.git = variables["git"].as<std::string>();
        }
        if (variables.count("timeout"))
        {
            long const ms = variables["timeout"].as<long>();
            if (ms <= 0)
                throw std::runtime_error("--timeout must be positive");
            options.settings.limits.timeout = std::chrono::milliseconds(ms);
        }
        if (variables.count("domain"))
        {
            options.settings.domain = variables["domain"].as<std::string>();
        }

        if (command.empty())
            throw std::runtime_error("no command given, see --help");

        revision_store store(options.repository, options.settings);
        return run_command(store, command, args, variables.count("deep") > 0);
    }
    catch (std::exception const& error)
    {
        Log::error() << error.what() << "\n\n";
        return EXIT_FAILURE;
    }
}
