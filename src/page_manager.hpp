// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef PAGE_MANAGER_HPP
# define PAGE_MANAGER_HPP

# include "metadata_store.hpp"
# include "revision_store.hpp"

# include <boost/filesystem/path.hpp>
# include <boost/thread/locks.hpp>
# include <boost/thread/shared_mutex.hpp>
# include <boost/variant.hpp>
# include <map>
# include <memory>
# include <string>
# include <utility>
# include <vector>

namespace wikirev {

// A revision named either by its row or by its commit
typedef boost::variant<revision_id, commit_hash> revision_ref;

struct page_commit
{
    wiki_id wiki;
    std::string slug;

    // Stored in the revision row; git gets a synthesized message
    std::string message;

    user author;
};

// Ties the revision rows in the metadata store to commits in the
// wikis' revision stores.
//
// Each mutating operation runs in one metadata transaction around the
// git commit.  If the transaction fails after the commit was made, the
// commit stays: the repository is then one commit ahead of the
// revisions table.
class page_manager
{
 public:
    page_manager(
        metadata_store& metadata,
        boost::filesystem::path directory,
        store_settings const& settings = store_settings());

    page_manager(page_manager const&) = delete;
    void operator=(page_manager const&) = delete;

    // Creates and initializes <directory>/<wiki slug> and registers it.
    void add_store(wiki const& w);

    bool has_store(wiki_id wiki) const;

    std::pair<page_id, revision_id> create(
        page_commit const& commit,
        std::string const& content,
        std::string const& title,
        boost::optional<std::string> const& alt_title);

    revision_id commit(
        page_commit const& commit,
        page_id page,
        boost::optional<std::string> const& content,
        boost::optional<std::string> const& title,
        boost::optional<boost::optional<std::string> > const& alt_title);

    revision_id rename(
        wiki_id wiki,
        std::string const& old_slug,
        std::string const& new_slug,
        page_id page,
        std::string const& message,
        user const& author);

    revision_id remove(page_commit const& commit, page_id page);

    // Without a page id, restores the most recently deleted page that
    // had commit.slug.
    revision_id restore(page_commit const& commit, boost::optional<page_id> const& page);

    revision_id undo(page_commit const& commit, revision_ref const& revision);

    // none if the tag set did not change
    boost::optional<revision_id> set_tags(
        page_commit const& commit, page_id page, std::vector<std::string> tags);

    // Reads

    bool check_page(wiki_id wiki, std::string const& slug);
    boost::optional<page_record> get_page(wiki_id wiki, std::string const& slug);
    boost::optional<page_record> get_page_by_id(page_id page);
    std::vector<page_record> get_pages_with_tags(wiki_id wiki, std::vector<std::string> const& tags);

    boost::optional<std::string> get_page_contents(wiki_id wiki, std::string const& slug);
    boost::optional<std::string> get_page_contents_by_id(page_id page);
    boost::optional<std::string> get_page_version(
        wiki_id wiki, std::string const& slug, revision_ref const& revision);

    diff get_diff(
        wiki_id wiki, std::string const& slug, revision_ref const& first, revision_ref const& second);

    boost::optional<blame> get_blame(wiki_id wiki, std::string const& slug);
    boost::optional<blame> get_blame_by_id(page_id page);

    void edit_revision(revision_id revision, std::string const& message);

    // Administration

    void set_domain(wiki_id wiki, std::string const& domain);
    std::size_t vacuum(wiki_id wiki);

 private:
    // A store, with the registry held for reading while it is in use
    struct store_handle
    {
        boost::shared_lock<boost::shared_mutex> lock;
        revision_store* store;

        revision_store* operator->() const { return store; }
    };

    store_handle store(wiki_id wiki) const;

    commit_hash resolve(metadata_transaction& transaction, revision_ref const& revision) const;

    // The page's slug and its newest commit
    boost::optional<std::pair<page_record, commit_hash> > last_commit(
        metadata_transaction& transaction, page_id page) const;

    commit_info commit_data(wiki_id wiki, page_id page, user const& author, change_type change) const;

 private:
    metadata_store& metadata_;
    boost::filesystem::path directory_;
    store_settings settings_;

    mutable boost::shared_mutex stores_lock_;
    std::map<wiki_id, std::unique_ptr<revision_store> > stores_;
};

} // namespace wikirev

#endif // PAGE_MANAGER_HPP
