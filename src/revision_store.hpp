// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef REVISION_STORE_HPP
# define REVISION_STORE_HPP

# include "blame.hpp"
# include "commit_hash.hpp"
# include "diff.hpp"
# include "process_runner.hpp"

# include <boost/filesystem/path.hpp>
# include <boost/optional.hpp>
# include <boost/thread/mutex.hpp>
# include <boost/thread/shared_mutex.hpp>
# include <string>
# include <utility>
# include <vector>

namespace wikirev {

struct commit_info
{
    commit_info(std::string username, std::string message)
        : username(std::move(username)), message(std::move(message))
    {}

    std::string username;
    std::string message;
};

struct store_settings
{
    store_settings()
        : git("git"),
          domain("localhost"),
          maintenance(std::chrono::milliseconds(60000), std::chrono::milliseconds(500))
    {}

    // Name or path of the git executable
    std::string git;

    // Authors are recorded as "<username> <noreply@domain>"
    std::string domain;

    // For ordinary commands
    process_limits limits;

    // For prune and repack, which take much longer on large histories
    process_limits maintenance;
};

// The history of every page of one wiki, kept as commits in a git
// repository with one flat file per page.
//
// Every operation, reads included, holds one mutex for its whole
// duration: git is not safe to run concurrently against a shared
// working directory.  The author domain has its own reader/writer lock
// so that changing it never waits for a running git command.
//
// Slugs must be in normal form (see content_path.hpp); anything else is
// rejected with invalid_slug before the repository is touched.
class revision_store
{
 public:
    revision_store(boost::filesystem::path repository, store_settings const& settings = store_settings());

    revision_store(revision_store const&) = delete;
    void operator=(revision_store const&) = delete;

    // Creates the repository with an empty seed commit.  Call once.
    void initial_commit();

    // Writes content (if any) to the page's file and commits it.  The
    // commit is made even when nothing changed.
    commit_hash commit(
        std::string const& slug, boost::optional<std::string> const& content, commit_info const& info);

    commit_hash empty_commit(commit_info const& info);

    // Throws page_not_found if old_slug has no file and page_exists if
    // new_slug has one.
    commit_hash rename(std::string const& old_slug, std::string const& new_slug, commit_info const& info);

    // none, with no commit made, if the page had no file.
    boost::optional<commit_hash> remove(std::string const& slug, commit_info const& info);

    // Writes old_slug's content as of `hash` to slug, replacing whatever
    // slug holds now, and commits it.  Throws page_not_found if old_slug
    // did not exist at `hash`.
    commit_hash restore(
        std::string const& slug, std::string const& old_slug, commit_hash const& hash, commit_info const& info);

    // Commits the inverse of `hash`.  A failed revert is abandoned,
    // leaving the tree as it was, and its error is rethrown.
    commit_hash undo(commit_hash const& hash, commit_info const& info);

    boost::optional<std::string> get_page(std::string const& slug) const;
    boost::optional<std::string> get_page_version(std::string const& slug, commit_hash const& hash) const;

    diff get_diff(std::string const& slug, commit_hash const& first, commit_hash const& second) const;

    // At `hash`, or at HEAD if none.  none if the page does not exist
    // there.
    boost::optional<blame> get_blame(
        std::string const& slug, boost::optional<commit_hash> const& hash = boost::none) const;

    void set_domain(std::string const& domain);
    std::string domain() const;

    // Both return the number of unreachable objects pruned.
    std::size_t vacuum();
    std::size_t vacuum_deep();

    std::size_t commit_count() const;

    boost::filesystem::path const& repository() const { return repository_; }

 private:
    std::vector<std::string> git_arguments(std::vector<std::string> const& args) const;
    std::vector<std::string> commit_arguments(
        std::string const& username, std::string const& message, std::vector<std::string> const& args) const;

    commit_hash head() const;
    bool exists_at(std::string const& revision, std::string const& path) const;
    std::string blob_at(std::string const& revision, std::string const& path) const;
    std::size_t line_count_at(commit_hash const& hash, std::string const& path) const;
    std::size_t prune();
    void check_clean() const;

    boost::filesystem::path absolute(std::string const& path) const;
    boost::optional<std::string> read_file(std::string const& path) const;
    void write_file(std::string const& path, std::string const& content) const;
    bool remove_file(std::string const& path) const;

 private:
    boost::filesystem::path repository_;
    process_runner git_;
    process_runner maintenance_git_;

    mutable boost::mutex guard_;

    mutable boost::shared_mutex domain_lock_;
    std::string domain_;
};

} // namespace wikirev

#endif // REVISION_STORE_HPP
