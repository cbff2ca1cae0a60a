// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#define BOOST_TEST_MODULE revision_store
#include <boost/test/unit_test.hpp>

#include "error.hpp"
#include "git_executable.hpp"
#include "revision_store.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread/thread.hpp>
#include <atomic>
#include <fstream>

using namespace wikirev;
namespace fs = boost::filesystem;

namespace {

store_settings test_settings()
{
    store_settings settings;
    settings.domain = "example.org";
    settings.limits.timeout = std::chrono::milliseconds(10000);
    settings.maintenance.timeout = std::chrono::milliseconds(60000);
    return settings;
}

// A freshly initialized store in a directory of its own
struct store_fixture
{
    store_fixture()
        : directory(fs::temp_directory_path() / fs::unique_path("wikirev-test-%%%%-%%%%-%%%%")),
          store(directory, test_settings()),
          info("alice", "test edit")
    {
        store.initial_commit();
    }

    ~store_fixture()
    {
        boost::system::error_code ec;
        fs::remove_all(directory, ec);
        if (ec)
            BOOST_TEST_MESSAGE("Could not remove " << directory << ": " << ec.message());
    }

    std::string git_status() const
    {
        process_runner const git(git_executable());
        return git.run_capturing(directory, {"status", "--porcelain"});
    }

    // Stores a blob that no commit refers to
    void write_unreachable_object(std::string const& content) const
    {
        fs::path const scratch = fs::temp_directory_path() / fs::unique_path("wikirev-blob-%%%%-%%%%");
        {
            std::ofstream file(scratch.string().c_str(), std::ios::out | std::ios::binary);
            file << content;
        }
        process_runner const git(git_executable());
        git.run(directory, {"hash-object", "-w", scratch.string()});

        boost::system::error_code ec;
        fs::remove(scratch, ec);
    }

    fs::path directory;
    revision_store store;
    commit_info const info;
};

bool is_kind(revision_error const& e, error_kind kind)
{
    return e.kind() == kind;
}

bool is_invalid_slug(revision_error const& e) { return is_kind(e, error_kind::invalid_slug); }
bool is_page_exists(revision_error const& e) { return is_kind(e, error_kind::page_exists); }
bool is_page_not_found(revision_error const& e) { return is_kind(e, error_kind::page_not_found); }

} // unnamed namespace

BOOST_FIXTURE_TEST_SUITE(revisions, store_fixture)

BOOST_AUTO_TEST_CASE(initial_state)
{
    BOOST_CHECK_EQUAL(store.commit_count(), 1u);
    BOOST_CHECK(fs::is_directory(directory / ".git"));
    BOOST_CHECK(!store.get_page("main"));
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(commit_and_read_back)
{
    commit_hash const first = store.commit("main", std::string("hello\n"), info);
    BOOST_CHECK_EQUAL(*store.get_page("main"), "hello\n");
    BOOST_CHECK(fs::exists(directory / "main.ftml"));

    commit_hash const second = store.commit("main", std::string("goodbye\n"), info);
    BOOST_CHECK(first != second);
    BOOST_CHECK_EQUAL(*store.get_page("main"), "goodbye\n");
    BOOST_CHECK_EQUAL(*store.get_page_version("main", first), "hello\n");
    BOOST_CHECK_EQUAL(*store.get_page_version("main", second), "goodbye\n");

    BOOST_CHECK(!store.get_page_version("scp-001", second));
    BOOST_CHECK_EQUAL(store.commit_count(), 3u);
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(category_slugs)
{
    commit_hash const hash = store.commit("component:theme-x", std::string("theme"), info);
    BOOST_CHECK(fs::exists(directory / "component$theme-x.ftml"));
    BOOST_CHECK_EQUAL(*store.get_page_version("component:theme-x", hash), "theme");
}

BOOST_AUTO_TEST_CASE(unchanged_and_empty_commits)
{
    store.commit("main", std::string("same"), info);
    store.commit("main", std::string("same"), info);
    store.commit("main", boost::none, info);
    store.empty_commit(info);

    BOOST_CHECK_EQUAL(store.commit_count(), 5u);
    BOOST_CHECK_EQUAL(*store.get_page("main"), "same");
}

BOOST_AUTO_TEST_CASE(remove_pages)
{
    commit_hash const created = store.commit("scp-173", std::string("statue\n"), info);

    boost::optional<commit_hash> removed = store.remove("scp-173", info);
    BOOST_REQUIRE(removed);
    BOOST_CHECK(!store.get_page("scp-173"));
    BOOST_CHECK(!store.get_page_version("scp-173", *removed));
    BOOST_CHECK_EQUAL(*store.get_page_version("scp-173", created), "statue\n");

    std::size_t const count = store.commit_count();
    BOOST_CHECK(!store.remove("scp-173", info));
    BOOST_CHECK(!store.remove("never-existed", info));
    BOOST_CHECK_EQUAL(store.commit_count(), count);
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(rename_pages)
{
    store.commit("old-name", std::string("content\n"), info);
    store.rename("old-name", "new-name", info);

    BOOST_CHECK(!store.get_page("old-name"));
    BOOST_CHECK_EQUAL(*store.get_page("new-name"), "content\n");
    BOOST_CHECK_EQUAL(git_status(), "");

    BOOST_CHECK_EXCEPTION(store.rename("old-name", "other", info), revision_error, is_page_not_found);
}

BOOST_AUTO_TEST_CASE(rename_onto_existing_page)
{
    store.commit("first", std::string("one"), info);
    store.commit("second", std::string("two"), info);
    std::size_t const count = store.commit_count();

    BOOST_CHECK_EXCEPTION(store.rename("first", "second", info), revision_error, is_page_exists);

    BOOST_CHECK_EQUAL(*store.get_page("first"), "one");
    BOOST_CHECK_EQUAL(*store.get_page("second"), "two");
    BOOST_CHECK_EQUAL(store.commit_count(), count);
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(restore_pages)
{
    commit_hash const created = store.commit("scp-682", std::string("hard to destroy\n"), info);
    BOOST_REQUIRE(store.remove("scp-682", info));

    store.restore("scp-682", "scp-682", created, info);
    BOOST_CHECK_EQUAL(*store.get_page("scp-682"), "hard to destroy\n");

    // Over the page's current content
    store.commit("scp-682", std::string("destroyed at last\n"), info);
    store.restore("scp-682", "scp-682", created, info);
    BOOST_CHECK_EQUAL(*store.get_page("scp-682"), "hard to destroy\n");

    // Over identical content
    std::size_t const count = store.commit_count();
    store.restore("scp-682", "scp-682", created, info);
    BOOST_CHECK_EQUAL(store.commit_count(), count + 1);

    // Under another name
    store.restore("scp-682-copy", "scp-682", created, info);
    BOOST_CHECK_EQUAL(*store.get_page("scp-682-copy"), "hard to destroy\n");

    BOOST_CHECK_EXCEPTION(store.restore("missing", "missing", created, info), revision_error, is_page_not_found);
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(undo_twice)
{
    store.commit("main", std::string("one\n"), info);
    commit_hash const second = store.commit("main", std::string("two\n"), info);

    commit_hash const undone = store.undo(second, info);
    BOOST_CHECK_EQUAL(*store.get_page("main"), "one\n");

    store.undo(undone, info);
    BOOST_CHECK_EQUAL(*store.get_page("main"), "two\n");
    BOOST_CHECK_EQUAL(store.commit_count(), 5u);
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(undo_removal)
{
    store.commit("main", std::string("keep me\n"), info);
    boost::optional<commit_hash> removed = store.remove("main", info);
    BOOST_REQUIRE(removed);

    store.undo(*removed, info);
    BOOST_CHECK_EQUAL(*store.get_page("main"), "keep me\n");
}

BOOST_AUTO_TEST_CASE(conflicting_undo_leaves_tree_clean)
{
    store.commit("main", std::string("a\n"), info);
    commit_hash const second = store.commit("main", std::string("b\n"), info);
    store.commit("main", std::string("c\n"), info);
    std::size_t const count = store.commit_count();

    BOOST_CHECK_THROW(store.undo(second, info), command_failed);

    BOOST_CHECK_EQUAL(*store.get_page("main"), "c\n");
    BOOST_CHECK_EQUAL(store.commit_count(), count);
    BOOST_CHECK_EQUAL(git_status(), "");

    // The store is still usable
    store.commit("main", std::string("d\n"), info);
    BOOST_CHECK_EQUAL(*store.get_page("main"), "d\n");
}

BOOST_AUTO_TEST_CASE(timed_out_undo_leaves_tree_clean)
{
    store.commit("main", std::string("one\n"), info);
    commit_hash const second = store.commit("main", std::string("two\n"), info);
    std::size_t const count = store.commit_count();

    // git that finishes a revert, then stalls past the deadline
    fs::path const slow_git = fs::temp_directory_path() / fs::unique_path("wikirev-slow-git-%%%%-%%%%");
    {
        std::ofstream script(slow_git.string().c_str());
        script << "#!/bin/sh\n"
               << "\"" << git_executable() << "\" \"$@\"\n"
               << "status=$?\n"
               << "case \" $* \" in *\" revert \"*) exec sleep 3 ;; esac\n"
               << "exit $status\n";
    }
    fs::permissions(slow_git, fs::owner_all);

    store_settings settings = test_settings();
    settings.git = slow_git.string();
    settings.limits = process_limits(std::chrono::milliseconds(1000), std::chrono::milliseconds(500));
    revision_store slow(directory, settings);

    BOOST_CHECK_THROW(slow.undo(second, info), command_timed_out);

    BOOST_CHECK_EQUAL(git_status(), "");
    BOOST_CHECK_EQUAL(*store.get_page("main"), "two\n");
    BOOST_CHECK_EQUAL(store.commit_count(), count);

    // Nothing left staged for the next commit to pick up
    store.empty_commit(info);
    BOOST_CHECK_EQUAL(*store.get_page_version("main", store.commit("main", boost::none, info)), "two\n");

    boost::system::error_code ec;
    fs::remove(slow_git, ec);
}

BOOST_AUTO_TEST_CASE(rejects_invalid_slugs)
{
    std::size_t const count = store.commit_count();

    BOOST_CHECK_EXCEPTION(store.commit("Bad Slug", std::string("x"), info), revision_error, is_invalid_slug);
    BOOST_CHECK_EXCEPTION(store.commit("../escape", std::string("x"), info), revision_error, is_invalid_slug);
    BOOST_CHECK_EXCEPTION(store.get_page("a$b"), revision_error, is_invalid_slug);
    BOOST_CHECK_EXCEPTION(store.remove("", info), revision_error, is_invalid_slug);
    BOOST_CHECK_EXCEPTION(store.rename("main", "Main", info), revision_error, is_invalid_slug);

    BOOST_CHECK_EQUAL(store.commit_count(), count);
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(diff_between_versions)
{
    commit_hash const before = store.empty_commit(info);
    commit_hash const first = store.commit("main", std::string("a\nb\nc\nd\n"), info);
    commit_hash const spaced = store.commit("main", std::string("a \nb\nc\nd\n"), info);
    commit_hash const rewritten = store.commit("main", std::string("w\nx\ny\nz\n"), info);

    diff const created = store.get_diff("main", before, first);
    BOOST_CHECK(!created.old_name);
    BOOST_REQUIRE(created.new_name);
    BOOST_CHECK_EQUAL(*created.new_name, "main");
    BOOST_CHECK_EQUAL(created.insertions, 4u);
    BOOST_CHECK_EQUAL(created.deletions, 0u);
    BOOST_CHECK_CLOSE(created.percent_changed, 100.0, 1e-9);

    diff const whitespace = store.get_diff("main", first, spaced);
    BOOST_CHECK_EQUAL(whitespace.insertions, 1u);
    BOOST_CHECK_EQUAL(whitespace.deletions, 1u);
    BOOST_CHECK_CLOSE(whitespace.percent_changed, 25.0, 1e-9);
    BOOST_REQUIRE(whitespace.old_name);
    BOOST_CHECK_EQUAL(*whitespace.old_name, "main");

    diff const rewrite = store.get_diff("main", spaced, rewritten);
    BOOST_CHECK_CLOSE(rewrite.percent_changed, 100.0, 1e-9);
    BOOST_CHECK_LT(whitespace.percent_changed, rewrite.percent_changed);

    diff const same = store.get_diff("main", first, first);
    BOOST_CHECK(same.lines.empty());
    BOOST_CHECK_EQUAL(same.percent_changed, 0.0);
}

BOOST_AUTO_TEST_CASE(blame_pages)
{
    BOOST_CHECK(!store.get_blame("missing"));

    commit_hash const first = store.commit("main", std::string("one\ntwo\nthree\n"), commit_info("alice", "create"));
    commit_hash const second = store.commit("main", std::string("one\nTWO\nthree\n"), commit_info("bob", "shout"));

    boost::optional<blame> const b = store.get_blame("main");
    BOOST_REQUIRE(b);
    BOOST_REQUIRE_EQUAL(b->groups.size(), 3u);

    BOOST_CHECK_EQUAL(b->groups[0].author.name, "alice");
    BOOST_CHECK_EQUAL(b->groups[0].author.email, "noreply@example.org");
    BOOST_CHECK_EQUAL(b->groups[0].lines[0].commit, first);
    BOOST_CHECK_EQUAL(b->groups[0].lines[0].line, "one");

    BOOST_CHECK_EQUAL(b->groups[1].author.name, "bob");
    BOOST_CHECK_EQUAL(b->groups[1].summary, "shout");
    BOOST_REQUIRE(b->groups[1].previous);
    BOOST_CHECK_EQUAL(*b->groups[1].previous, first);
    BOOST_CHECK_EQUAL(b->groups[1].lines[0].commit, second);
    BOOST_CHECK_EQUAL(b->groups[1].lines[0].line, "TWO");
    BOOST_CHECK_EQUAL(b->groups[1].lines[0].new_lineno, 2u);

    BOOST_CHECK_EQUAL(b->groups[2].author.name, "alice");
    BOOST_CHECK_EQUAL(b->groups[2].lines[0].line, "three");

    boost::optional<blame> const old = store.get_blame("main", first);
    BOOST_REQUIRE(old);
    BOOST_REQUIRE_EQUAL(old->groups.size(), 1u);
    BOOST_CHECK_EQUAL(old->groups[0].lines.size(), 3u);

    BOOST_REQUIRE(store.remove("main", info));
    BOOST_CHECK(!store.get_blame("main"));
}

BOOST_AUTO_TEST_CASE(author_domain)
{
    BOOST_CHECK_EQUAL(store.domain(), "example.org");
    store.set_domain("wiki.example.com");
    BOOST_CHECK_EQUAL(store.domain(), "wiki.example.com");

    store.commit("main", std::string("line\n"), info);
    boost::optional<blame> const b = store.get_blame("main");
    BOOST_REQUIRE(b);
    BOOST_REQUIRE(!b->groups.empty());
    BOOST_CHECK_EQUAL(b->groups[0].author.email, "noreply@wiki.example.com");
    BOOST_CHECK_EQUAL(b->groups[0].committer.email, "noreply@wiki.example.com");
    BOOST_CHECK_EQUAL(b->groups[0].committer.name, "alice");
}

BOOST_AUTO_TEST_CASE(concurrent_commits)
{
    std::size_t const threads = 8;
    std::size_t const count = store.commit_count();
    std::atomic<int> failures(0);

    boost::thread_group group;
    for (std::size_t i = 0; i < threads; ++i)
    {
        group.create_thread(
            [this, i, &failures]
            {
                std::string const n = boost::lexical_cast<std::string>(i);
                try
                {
                    store.commit("test-" + n, "content " + n + "\n", commit_info("user-" + n, "thread " + n));
                }
                catch (revision_error const&)
                {
                    ++failures;
                }
            });
    }
    group.join_all();

    BOOST_CHECK_EQUAL(failures.load(), 0);
    BOOST_CHECK_EQUAL(store.commit_count(), count + threads);
    for (std::size_t i = 0; i < threads; ++i)
    {
        std::string const n = boost::lexical_cast<std::string>(i);
        BOOST_CHECK_EQUAL(*store.get_page("test-" + n), "content " + n + "\n");
    }
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(two_pages_then_vacuum)
{
    store.commit("test-1", std::string("abc"), info);
    store.commit("test-2", std::string("def"), info);

    BOOST_CHECK_EQUAL(*store.get_page("test-1"), "abc");
    BOOST_CHECK_EQUAL(*store.get_page("test-2"), "def");
    BOOST_CHECK_EQUAL(store.vacuum(), 0u);
}

BOOST_AUTO_TEST_CASE(vacuum_counts_unreachable_objects)
{
    store.commit("main", std::string("kept\n"), info);

    write_unreachable_object("dangling one\n");
    write_unreachable_object("dangling two\n");
    BOOST_CHECK_EQUAL(store.vacuum(), 2u);
    BOOST_CHECK_EQUAL(store.vacuum(), 0u);

    write_unreachable_object("dangling three\n");
    BOOST_CHECK_EQUAL(store.vacuum_deep(), 1u);

    BOOST_CHECK_EQUAL(*store.get_page("main"), "kept\n");
    BOOST_CHECK_EQUAL(git_status(), "");
}

BOOST_AUTO_TEST_CASE(vacuum_after_concurrent_commits)
{
    store.commit("test-0", std::string("000"), info);

    std::atomic<int> failures(0);
    boost::thread_group group;
    char const* const contents[] = { "abc", "def", "ghi" };
    for (int i = 1; i <= 3; ++i)
    {
        group.create_thread(
            [this, i, &contents, &failures]
            {
                try
                {
                    store.commit(
                        "test-" + boost::lexical_cast<std::string>(i), std::string(contents[i - 1]), info);
                }
                catch (revision_error const&)
                {
                    ++failures;
                }
            });
    }
    group.join_all();
    BOOST_REQUIRE_EQUAL(failures.load(), 0);

    store.vacuum_deep();
    BOOST_CHECK_EQUAL(store.vacuum(), 0u);
    BOOST_CHECK_EQUAL(store.commit_count(), 5u);
}

BOOST_AUTO_TEST_SUITE_END()
