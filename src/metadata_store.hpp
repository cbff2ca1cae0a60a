// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef METADATA_STORE_HPP
# define METADATA_STORE_HPP

# include "commit_hash.hpp"

# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <boost/optional.hpp>
# include <cstdint>
# include <memory>
# include <ostream>
# include <string>
# include <utility>
# include <vector>

// The relational side of the wiki: pages, revisions and tag history.
// The page manager only sees it through the abstract classes below.

namespace wikirev {

typedef std::int64_t wiki_id;
typedef std::int64_t page_id;
typedef std::int64_t user_id;
typedef std::int64_t revision_id;

enum class change_type
{
    create,
    modify,
    rename,
    remove,
    restore,
    undo,
    tags
};

// As stored in the revisions table, e.g. "create"
char const* to_string(change_type change);

// As used in synthesized commit messages, e.g. "created"
char const* verb(change_type change);

std::ostream& operator<<(std::ostream& os, change_type change);

struct wiki
{
    wiki_id id;
    std::string slug;
    std::string domain;
};

struct user
{
    user_id id;
    std::string name;
};

struct page_record
{
    page_record() : id(0), wiki(0) {}

    page_id id;
    wiki_id wiki;
    std::string slug;
    std::string title;
    boost::optional<std::string> alt_title;

    // Sorted
    std::vector<std::string> tags;

    boost::posix_time::ptime created_at;
    boost::optional<boost::posix_time::ptime> deleted_at;
};

struct revision_record
{
    revision_record(page_id page, user_id user, std::string message, commit_hash commit, change_type change)
        : id(0), page(page), user(user), message(std::move(message)), commit(std::move(commit)), change(change)
    {}

    // Assigned on insertion
    revision_id id;

    page_id page;
    user_id user;
    std::string message;
    commit_hash commit;
    change_type change;
};

struct tag_change_record
{
    revision_id revision;
    std::vector<std::string> added;
    std::vector<std::string> removed;
};

// Fields left empty are not changed.  alt_title may be set to none.
struct page_update
{
    bool empty() const { return !slug && !title && !alt_title; }

    boost::optional<std::string> slug;
    boost::optional<std::string> title;
    boost::optional<boost::optional<std::string> > alt_title;
};

// One unit of work.  Everything it did is rolled back on destruction
// unless commit() was called first.
class metadata_transaction
{
 public:
    virtual ~metadata_transaction() {}

    // Pages

    // Including deleted pages
    virtual boost::optional<page_id> find_page(wiki_id wiki, std::string const& slug) = 0;

    virtual boost::optional<page_id> find_live_page(wiki_id wiki, std::string const& slug) = 0;

    // Most recently created of the deleted pages with that slug
    virtual boost::optional<page_id> find_deleted_page(wiki_id wiki, std::string const& slug) = 0;

    virtual boost::optional<page_record> get_page(page_id page) = 0;

    // Live pages carrying all of the given tags
    virtual std::vector<page_record> pages_with_tags(wiki_id wiki, std::vector<std::string> const& tags) = 0;

    virtual page_id insert_page(
        wiki_id wiki, std::string const& slug, std::string const& title,
        boost::optional<std::string> const& alt_title) = 0;

    virtual void update_page(page_id page, page_update const& update) = 0;
    virtual void set_deleted(page_id page, bool deleted) = 0;
    virtual void set_tags(page_id page, std::vector<std::string> const& tags) = 0;

    // Revisions

    virtual revision_id insert_revision(revision_record const& revision) = 0;
    virtual boost::optional<revision_record> get_revision(revision_id revision) = 0;
    virtual boost::optional<revision_record> find_revision(commit_hash const& commit) = 0;

    // The newest revision of a page, optionally skipping removals
    virtual boost::optional<revision_record> last_revision(page_id page, bool skip_removals) = 0;

    // Returns false if there is no such revision
    virtual bool set_revision_message(revision_id revision, std::string const& message) = 0;

    virtual void insert_tag_change(tag_change_record const& change) = 0;

    virtual void commit() = 0;
};

class metadata_store
{
 public:
    virtual ~metadata_store() {}

    virtual std::unique_ptr<metadata_transaction> begin() = 0;
};

} // namespace wikirev

#endif // METADATA_STORE_HPP
