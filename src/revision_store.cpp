// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "revision_store.hpp"
#include "content_path.hpp"
#include "error.hpp"
#include "git_executable.hpp"
#include "log.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread/locks.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>

namespace wikirev {

namespace fs = boost::filesystem;

namespace {

// This is the SHA1 of an empty tree.  Diffing a version against it
// counts the version's lines.
std::string const empty_tree_sha("4b825dc642cb6eb9a060e54bf8d69288fbee4904");

// Identity of the commits the store makes on its own behalf
char const* const service_name = "wikirev";

std::size_t count_lines(std::string const& text)
{
    std::size_t lines = std::count(text.begin(), text.end(), '\n');
    if (!text.empty() && text.back() != '\n')
        ++lines;
    return lines;
}

bool file_exists(fs::path const& path)
{
    boost::system::error_code ec;
    bool const exists = fs::exists(path, ec);
    if (ec && ec != boost::system::errc::no_such_file_or_directory)
        throw revision_error(error_kind::io, path.string() + ": " + ec.message());
    return exists;
}

boost::optional<std::string> slug_of(boost::optional<std::string> const& path)
{
    if (!path)
        return boost::none;
    return path_to_slug(*path);
}

} // unnamed namespace

revision_store::revision_store(fs::path repository, store_settings const& settings)
    : repository_(std::move(repository)),
      git_(git_executable(settings.git), settings.limits),
      maintenance_git_(git_executable(settings.git), settings.maintenance),
      domain_(settings.domain)
{
    Log::info() << "Creating revision store for repository " << repository_
                << ", domain " << domain_ << std::endl;
}

// Helpers

fs::path revision_store::absolute(std::string const& path) const
{
    return repository_ / path;
}

boost::optional<std::string> revision_store::read_file(std::string const& path) const
{
    fs::path const file_path = absolute(path);
    Log::debug() << "Reading file from " << file_path << std::endl;

    if (!file_exists(file_path))
        return boost::none;

    std::ifstream file(file_path.string().c_str(), std::ios::in | std::ios::binary);
    if (!file)
        throw revision_error(error_kind::io, "cannot open " + file_path.string());

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
        throw revision_error(error_kind::io, "cannot read " + file_path.string());
    return content;
}

void revision_store::write_file(std::string const& path, std::string const& content) const
{
    fs::path const file_path = absolute(path);
    Log::debug() << "Writing " << content.size() << " bytes to " << file_path << std::endl;

    std::ofstream file(file_path.string().c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file)
        throw revision_error(error_kind::io, "cannot open " + file_path.string() + " for writing");

    file.write(content.data(), content.size());
    file.close();
    if (!file)
        throw revision_error(error_kind::io, "cannot write " + file_path.string());
}

bool revision_store::remove_file(std::string const& path) const
{
    fs::path const file_path = absolute(path);
    Log::debug() << "Removing file " << file_path << std::endl;

    boost::system::error_code ec;
    bool const removed = fs::remove(file_path, ec);
    if (ec)
        throw revision_error(error_kind::io, file_path.string() + ": " + ec.message());
    return removed;
}

std::vector<std::string> revision_store::git_arguments(std::vector<std::string> const& args) const
{
    std::vector<std::string> full = {
        "-c", "gc.auto=0",
        "-c", "commit.gpgsign=false",
        "-c", "core.autocrlf=false"
    };
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

std::vector<std::string> revision_store::commit_arguments(
    std::string const& username, std::string const& message, std::vector<std::string> const& args) const
{
    std::string const email = "noreply@" + domain();

    // The committer is the author; git would otherwise take it from
    // whatever configuration the service happens to run with.
    std::vector<std::string> full = {
        "-c", "user.name=" + username,
        "-c", "user.email=" + email,
        "commit",
        "--author=" + username + " <" + email + ">",
        "--message=" + message,
        "--allow-empty-message",
        "--quiet"
    };
    full.insert(full.end(), args.begin(), args.end());
    return git_arguments(full);
}

commit_hash revision_store::head() const
{
    Log::debug() << "Getting current HEAD commit" << std::endl;

    std::string const output = boost::algorithm::trim_copy(
        git_.run_capturing(repository_, git_arguments({"rev-parse", "--verify", "HEAD"})));
    boost::optional<commit_hash> hash = commit_hash::try_parse(output);
    if (!hash)
        throw revision_error(error_kind::internal, "unable to parse git hash from '" + output + "'");
    return *hash;
}

bool revision_store::exists_at(std::string const& revision, std::string const& path) const
{
    std::string const listing = git_.run_capturing(
        repository_, git_arguments({"ls-tree", "--name-only", revision, "--", path}));
    return !boost::algorithm::trim_copy(listing).empty();
}

std::string revision_store::blob_at(std::string const& revision, std::string const& path) const
{
    return git_.run_capturing(repository_, git_arguments({"cat-file", "blob", revision + ":" + path}));
}

std::size_t revision_store::line_count_at(commit_hash const& hash, std::string const& path) const
{
    std::string const numstat = git_.run_capturing(
        repository_, git_arguments({"diff", "--numstat", empty_tree_sha, hash.str(), "--", path}));
    return parse_numstat(numstat).insertions;
}

std::size_t revision_store::prune()
{
    std::string const pruned = maintenance_git_.run_capturing(repository_, git_arguments({"prune", "--verbose"}));
    std::size_t const objects = count_lines(pruned);
    Log::debug() << "Pruned " << objects << " unreachable objects" << std::endl;
    return objects;
}

void revision_store::check_clean() const
{
#ifndef NDEBUG
    std::string const status = git_.run_capturing(repository_, git_arguments({"status", "--porcelain"}));
    if (!status.empty())
        Log::error() << "Working tree of " << repository_ << " is dirty:\n" << status << std::endl;
    BOOST_ASSERT_MSG(status.empty(), "working tree not clean after commit");
#endif
}

// Mutations

void revision_store::initial_commit()
{
    Log::info() << "Initializing new git repository in " << repository_ << std::endl;

    boost::lock_guard<boost::mutex> guard(guard_);

    boost::system::error_code ec;
    fs::create_directories(repository_, ec);
    if (ec)
        throw revision_error(error_kind::io, repository_.string() + ": " + ec.message());

    git_.run(repository_, git_arguments({"init", "--quiet"}));
    git_.run(repository_, commit_arguments(service_name, "Initial commit", {"--allow-empty"}));
    check_clean();
}

commit_hash revision_store::commit(
    std::string const& slug, boost::optional<std::string> const& content, commit_info const& info)
{
    Log::info() << "Committing file changes for slug '" << slug << "' ("
                << (content ? boost::lexical_cast<std::string>(content->size()) + " bytes" : "no content")
                << ")" << std::endl;

    check_slug(slug);
    std::string const path = slug_to_path(slug);

    boost::lock_guard<boost::mutex> guard(guard_);

    if (content)
    {
        write_file(path, *content);
        git_.run(repository_, git_arguments({"add", "--", path}));
        git_.run(repository_, commit_arguments(info.username, info.message, {"--allow-empty", "--", path}));
    }
    else
    {
        git_.run(repository_, commit_arguments(info.username, info.message, {"--allow-empty"}));
    }

    check_clean();
    return head();
}

commit_hash revision_store::empty_commit(commit_info const& info)
{
    Log::info() << "Creating empty commit" << std::endl;

    boost::lock_guard<boost::mutex> guard(guard_);
    git_.run(repository_, commit_arguments(info.username, info.message, {"--allow-empty"}));

    check_clean();
    return head();
}

commit_hash revision_store::rename(
    std::string const& old_slug, std::string const& new_slug, commit_info const& info)
{
    Log::info() << "Renaming file for slug '" << old_slug << "' -> '" << new_slug << "'" << std::endl;

    check_slug(old_slug);
    check_slug(new_slug);
    std::string const old_path = slug_to_path(old_slug);
    std::string const new_path = slug_to_path(new_slug);

    boost::lock_guard<boost::mutex> guard(guard_);

    if (!file_exists(absolute(old_path)))
        throw revision_error(error_kind::page_not_found, "'" + old_slug + "'");
    if (file_exists(absolute(new_path)))
        throw revision_error(error_kind::page_exists, "'" + new_slug + "'");

    git_.run(repository_, git_arguments({"mv", "--", old_path, new_path}));

    // Both sides, or the deletion of old_path stays staged
    git_.run(repository_, commit_arguments(info.username, info.message, {"--", old_path, new_path}));

    check_clean();
    return head();
}

boost::optional<commit_hash> revision_store::remove(std::string const& slug, commit_info const& info)
{
    Log::info() << "Removing file for slug '" << slug << "'" << std::endl;

    check_slug(slug);
    std::string const path = slug_to_path(slug);

    boost::lock_guard<boost::mutex> guard(guard_);

    if (!remove_file(path))
    {
        Log::debug() << "No file for slug '" << slug << "', nothing to remove" << std::endl;
        return boost::none;
    }

    git_.run(repository_, commit_arguments(info.username, info.message, {"--", path}));

    check_clean();
    return head();
}

commit_hash revision_store::restore(
    std::string const& slug, std::string const& old_slug, commit_hash const& hash, commit_info const& info)
{
    Log::info() << "Restoring slug '" << slug << "' from '" << old_slug << "' at commit " << hash << std::endl;

    check_slug(slug);
    check_slug(old_slug);
    std::string const path = slug_to_path(slug);
    std::string const old_path = slug_to_path(old_slug);

    boost::lock_guard<boost::mutex> guard(guard_);

    if (!exists_at(hash.str(), old_path))
        throw revision_error(error_kind::page_not_found, "'" + old_slug + "' at " + hash.str());

    write_file(path, blob_at(hash.str(), old_path));
    git_.run(repository_, git_arguments({"add", "--", path}));
    git_.run(repository_, commit_arguments(info.username, info.message, {"--allow-empty", "--", path}));

    check_clean();
    return head();
}

commit_hash revision_store::undo(commit_hash const& hash, commit_info const& info)
{
    Log::info() << "Undoing commit " << hash << std::endl;

    boost::lock_guard<boost::mutex> guard(guard_);

    try
    {
        git_.run(repository_, git_arguments({"revert", "--no-commit", hash.str()}));
        git_.run(repository_, commit_arguments(info.username, info.message, {"--allow-empty"}));
    }
    catch (revision_error const&)
    {
        // The tree was clean before the revert; put it back that way.
        // A timed out revert may have staged its changes regardless.
        try
        {
            git_.run(repository_, git_arguments({"reset", "--hard", "--quiet", "HEAD"}));
        }
        catch (revision_error const& e)
        {
            Log::warn() << "Failed to clean up after a failed revert of " << hash
                        << ": " << e.what() << std::endl;
        }
        throw;
    }

    check_clean();
    return head();
}

// Reads

boost::optional<std::string> revision_store::get_page(std::string const& slug) const
{
    Log::info() << "Getting page content for slug '" << slug << "'" << std::endl;

    check_slug(slug);
    std::string const path = slug_to_path(slug);

    boost::lock_guard<boost::mutex> guard(guard_);
    return read_file(path);
}

boost::optional<std::string> revision_store::get_page_version(
    std::string const& slug, commit_hash const& hash) const
{
    Log::info() << "Getting page content for slug '" << slug << "' at commit " << hash << std::endl;

    check_slug(slug);
    std::string const path = slug_to_path(slug);

    boost::lock_guard<boost::mutex> guard(guard_);

    if (!exists_at(hash.str(), path))
        return boost::none;
    return blob_at(hash.str(), path);
}

diff revision_store::get_diff(
    std::string const& slug, commit_hash const& first, commit_hash const& second) const
{
    Log::info() << "Getting diff for slug '" << slug << "' between " << first << ".." << second << std::endl;

    check_slug(slug);
    std::string const path = slug_to_path(slug);

    boost::lock_guard<boost::mutex> guard(guard_);

    diff result;
    parse_unified_diff(
        git_.run_capturing(
            repository_,
            git_arguments({"diff", "--no-color", "--no-ext-diff", "--no-prefix", first.str(), second.str(), "--", path})),
        result);

    diff_stat const change = parse_numstat(
        git_.run_capturing(
            repository_, git_arguments({"diff", "--numstat", first.str(), second.str(), "--", path})));

    result.insertions = change.insertions;
    result.deletions = change.deletions;
    result.percent_changed = percent_changed(change, line_count_at(first, path), line_count_at(second, path));
    result.old_name = slug_of(result.old_name);
    result.new_name = slug_of(result.new_name);

    Log::debug() << "Diff has " << change.insertions << " insertions, " << change.deletions
                 << " deletions, " << result.percent_changed << "% changed" << std::endl;
    return result;
}

boost::optional<blame> revision_store::get_blame(
    std::string const& slug, boost::optional<commit_hash> const& hash) const
{
    Log::info() << "Getting blame for slug '" << slug << "' at "
                << (hash ? hash->str() : std::string("HEAD")) << std::endl;

    check_slug(slug);
    std::string const path = slug_to_path(slug);

    boost::lock_guard<boost::mutex> guard(guard_);

    if (!exists_at(hash ? hash->str() : "HEAD", path))
        return boost::none;

    std::vector<std::string> args = {"blame", "--porcelain"};
    if (hash)
        args.push_back(hash->str());
    args.push_back("--");
    args.push_back(path);

    return parse_blame_porcelain(git_.run_capturing(repository_, git_arguments(args)));
}

// Administration

void revision_store::set_domain(std::string const& domain)
{
    Log::info() << "Setting author domain of " << repository_ << " to " << domain << std::endl;

    boost::unique_lock<boost::shared_mutex> lock(domain_lock_);
    domain_ = domain;
}

std::string revision_store::domain() const
{
    boost::shared_lock<boost::shared_mutex> lock(domain_lock_);
    return domain_;
}

std::size_t revision_store::vacuum()
{
    Log::info() << "Vacuuming repository " << repository_ << std::endl;

    boost::lock_guard<boost::mutex> guard(guard_);
    return prune();
}

std::size_t revision_store::vacuum_deep()
{
    Log::info() << "Deep-vacuuming repository " << repository_ << std::endl;

    boost::lock_guard<boost::mutex> guard(guard_);

    std::size_t const objects = prune();
    maintenance_git_.run(
        repository_, git_arguments({"repack", "-a", "-d", "-q", "-f", "--window=250", "--depth=50"}));
    maintenance_git_.run(repository_, git_arguments({"prune-packed", "-q"}));
    return objects;
}

std::size_t revision_store::commit_count() const
{
    boost::lock_guard<boost::mutex> guard(guard_);

    std::string const output = boost::algorithm::trim_copy(
        git_.run_capturing(repository_, git_arguments({"rev-list", "--count", "HEAD"})));
    try
    {
        return boost::lexical_cast<std::size_t>(output);
    }
    catch (boost::bad_lexical_cast const&)
    {
        throw revision_error(error_kind::internal, "unable to parse commit count from '" + output + "'");
    }
}

} // namespace wikirev
