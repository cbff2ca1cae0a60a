// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "page_manager.hpp"
#include "content_path.hpp"
#include "error.hpp"
#include "log.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/range/algorithm/set_algorithm.hpp>
#include <boost/range/algorithm/sort.hpp>
#include <boost/range/algorithm/unique.hpp>
#include <boost/range/algorithm_ext/erase.hpp>
#include <iterator>
#include <sstream>

namespace wikirev {

namespace fs = boost::filesystem;

page_manager::page_manager(metadata_store& metadata, fs::path directory, store_settings const& settings)
    : metadata_(metadata),
      directory_(std::move(directory)),
      settings_(settings)
{
    Log::debug() << "Creating page manager for " << directory_ << std::endl;
}

// Helpers

page_manager::store_handle page_manager::store(wiki_id wiki) const
{
    Log::trace() << "Getting revision store for wiki ID " << wiki << std::endl;

    boost::shared_lock<boost::shared_mutex> lock(stores_lock_);
    auto const found = stores_.find(wiki);
    if (found == stores_.end())
    {
        Log::warn() << "No revision store found for wiki ID " << wiki << std::endl;
        throw revision_error(error_kind::wiki_not_found, "wiki ID " + boost::lexical_cast<std::string>(wiki));
    }

    store_handle handle = { std::move(lock), found->second.get() };
    return handle;
}

commit_hash page_manager::resolve(metadata_transaction& transaction, revision_ref const& revision) const
{
    if (commit_hash const* hash = boost::get<commit_hash>(&revision))
        return *hash;

    revision_id const id = boost::get<revision_id>(revision);
    Log::debug() << "Getting commit hash for revision ID " << id << std::endl;

    boost::optional<revision_record> record = transaction.get_revision(id);
    if (!record)
        throw revision_error(error_kind::revision_not_found, "revision ID " + boost::lexical_cast<std::string>(id));
    return record->commit;
}

boost::optional<std::pair<page_record, commit_hash> > page_manager::last_commit(
    metadata_transaction& transaction, page_id page) const
{
    Log::debug() << "Getting last commit for page ID " << page << std::endl;

    boost::optional<page_record> record = transaction.get_page(page);
    if (!record)
        return boost::none;

    boost::optional<revision_record> last = transaction.last_revision(page, false);
    if (!last)
        return boost::none;

    return std::make_pair(*record, last->commit);
}

commit_info page_manager::commit_data(wiki_id wiki, page_id page, user const& author, change_type change) const
{
    std::ostringstream message;
    message << "User ID " << author.id << ' ' << verb(change) << " page ID " << page << " on wiki ID " << wiki;
    return commit_info(author.name, message.str());
}

// Stores

void page_manager::add_store(wiki const& w)
{
    Log::info() << "Adding revision store for wiki ID " << w.id << " ('" << w.slug << "')" << std::endl;

    check_slug(w.slug);
    fs::path const repository = directory_ / w.slug;

    boost::system::error_code ec;
    if (!fs::create_directories(repository, ec))
    {
        throw revision_error(
            error_kind::io, repository.string() + ": " + (ec ? ec.message() : std::string("already exists")));
    }

    store_settings settings = settings_;
    settings.domain = w.domain;

    std::unique_ptr<revision_store> store(new revision_store(repository, settings));
    store->initial_commit();

    boost::unique_lock<boost::shared_mutex> lock(stores_lock_);
    if (!stores_.insert(std::make_pair(w.id, std::move(store))).second)
        throw revision_error(error_kind::internal, "wiki ID " + boost::lexical_cast<std::string>(w.id) + " registered twice");
}

bool page_manager::has_store(wiki_id wiki) const
{
    boost::shared_lock<boost::shared_mutex> lock(stores_lock_);
    return stores_.find(wiki) != stores_.end();
}

// Mutations

std::pair<page_id, revision_id> page_manager::create(
    page_commit const& commit,
    std::string const& content,
    std::string const& title,
    boost::optional<std::string> const& alt_title)
{
    Log::info() << "Creating page '" << commit.slug << "' in wiki ID " << commit.wiki
                << " with title '" << title << "'" << std::endl;

    store_handle store = this->store(commit.wiki);
    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();

    Log::trace() << "Checking for existing page" << std::endl;
    if (transaction->find_live_page(commit.wiki, commit.slug))
        throw revision_error(error_kind::page_exists, "'" + commit.slug + "'");

    page_id const page = transaction->insert_page(commit.wiki, commit.slug, title, alt_title);

    change_type const change = change_type::create;
    commit_hash const hash = store->commit(
        commit.slug, content, commit_data(commit.wiki, page, commit.author, change));

    revision_id const revision = transaction->insert_revision(
        revision_record(page, commit.author.id, commit.message, hash, change));

    transaction->commit();
    return std::make_pair(page, revision);
}

revision_id page_manager::commit(
    page_commit const& commit,
    page_id page,
    boost::optional<std::string> const& content,
    boost::optional<std::string> const& title,
    boost::optional<boost::optional<std::string> > const& alt_title)
{
    Log::info() << "Committing change to page ID " << page << " ('" << commit.slug << "')" << std::endl;

    store_handle store = this->store(commit.wiki);
    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();

    page_update update;
    update.title = title;
    update.alt_title = alt_title;
    if (!update.empty())
    {
        Log::trace() << "Updating page ID " << page << " in pages table" << std::endl;
        transaction->update_page(page, update);
    }

    change_type const change = change_type::modify;
    commit_hash const hash = store->commit(
        commit.slug, content, commit_data(commit.wiki, page, commit.author, change));

    revision_id const revision = transaction->insert_revision(
        revision_record(page, commit.author.id, commit.message, hash, change));

    transaction->commit();
    return revision;
}

revision_id page_manager::rename(
    wiki_id wiki,
    std::string const& old_slug,
    std::string const& new_slug,
    page_id page,
    std::string const& message,
    user const& author)
{
    Log::info() << "Renaming page '" << old_slug << "' -> '" << new_slug << "' in wiki ID " << wiki << std::endl;

    store_handle store = this->store(wiki);
    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();

    page_update update;
    update.slug = new_slug;
    transaction->update_page(page, update);

    change_type const change = change_type::rename;
    commit_hash const hash = store->rename(old_slug, new_slug, commit_data(wiki, page, author, change));

    revision_id const revision = transaction->insert_revision(
        revision_record(page, author.id, message, hash, change));

    transaction->commit();
    return revision;
}

revision_id page_manager::remove(page_commit const& commit, page_id page)
{
    Log::info() << "Removing page ID " << page << " ('" << commit.slug << "')" << std::endl;

    store_handle store = this->store(commit.wiki);
    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();

    Log::trace() << "Marking page as deleted in table" << std::endl;
    transaction->set_deleted(page, true);

    change_type const change = change_type::remove;
    boost::optional<commit_hash> const hash = store->remove(
        commit.slug, commit_data(commit.wiki, page, commit.author, change));
    if (!hash)
        throw revision_error(error_kind::page_not_found, "'" + commit.slug + "'");

    revision_id const revision = transaction->insert_revision(
        revision_record(page, commit.author.id, commit.message, *hash, change));

    transaction->commit();
    return revision;
}

revision_id page_manager::restore(page_commit const& commit, boost::optional<page_id> const& page)
{
    Log::info() << "Restoring page '" << commit.slug << "' in wiki ID " << commit.wiki << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();

    if (transaction->find_live_page(commit.wiki, commit.slug))
        throw revision_error(error_kind::page_exists, "'" + commit.slug + "'");

    boost::optional<page_id> id = page;
    if (!id)
    {
        Log::trace() << "Finding last deleted page ID for slug" << std::endl;
        id = transaction->find_deleted_page(commit.wiki, commit.slug);
        if (!id)
            throw revision_error(error_kind::page_not_found, "no deleted page '" + commit.slug + "'");
    }

    boost::optional<page_record> record = transaction->get_page(*id);
    if (!record)
        throw revision_error(error_kind::page_not_found, "page ID " + boost::lexical_cast<std::string>(*id));

    Log::trace() << "Finding last extant commit for page" << std::endl;
    boost::optional<revision_record> last = transaction->last_revision(*id, true);
    if (!last)
    {
        Log::warn() << "Page ID " << *id << " found with no last revision" << std::endl;
        throw revision_error(error_kind::page_not_found, "page ID " + boost::lexical_cast<std::string>(*id));
    }

    change_type const change = change_type::restore;
    commit_hash const hash = store(record->wiki)->restore(
        commit.slug, record->slug, last->commit, commit_data(record->wiki, *id, commit.author, change));

    revision_id const revision = transaction->insert_revision(
        revision_record(*id, commit.author.id, commit.message, hash, change));

    Log::trace() << "Removing deletion marker from pages table" << std::endl;
    transaction->set_deleted(*id, false);
    if (record->slug != commit.slug)
    {
        page_update update;
        update.slug = commit.slug;
        transaction->update_page(*id, update);
    }

    transaction->commit();
    return revision;
}

revision_id page_manager::undo(page_commit const& commit, revision_ref const& revision)
{
    Log::info() << "Undoing revision " << revision << " of page '" << commit.slug << "'" << std::endl;

    store_handle store = this->store(commit.wiki);
    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();

    boost::optional<page_id> const page = transaction->find_page(commit.wiki, commit.slug);
    if (!page)
        throw revision_error(error_kind::page_not_found, "'" + commit.slug + "'");

    commit_hash const target = resolve(*transaction, revision);

    // The revision must belong to this page
    boost::optional<revision_record> const record = transaction->find_revision(target);
    if (!record)
        throw revision_error(error_kind::revision_not_found, "no revision for commit " + target.str());
    if (record->page != *page)
        throw revision_error(error_kind::revision_page_mismatch, target.str() + " is not a revision of '" + commit.slug + "'");

    change_type const change = change_type::undo;
    commit_hash const hash = store->undo(target, commit_data(commit.wiki, *page, commit.author, change));

    revision_id const id = transaction->insert_revision(
        revision_record(*page, commit.author.id, commit.message, hash, change));

    transaction->commit();
    return id;
}

boost::optional<revision_id> page_manager::set_tags(
    page_commit const& commit, page_id page, std::vector<std::string> tags)
{
    Log::info() << "Modifying tags for page ID " << page << " ('" << commit.slug << "')" << std::endl;

    store_handle store = this->store(commit.wiki);
    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();

    boost::optional<page_record> const record = transaction->get_page(page);
    if (!record)
        throw revision_error(error_kind::page_not_found, "page ID " + boost::lexical_cast<std::string>(page));

    Log::trace() << "Getting tag difference" << std::endl;
    boost::erase(tags, boost::unique<boost::return_found_end>(boost::sort(tags)));

    std::vector<std::string> current = record->tags;
    boost::sort(current);

    tag_change_record tag_change;
    boost::set_difference(tags, current, std::back_inserter(tag_change.added));
    boost::set_difference(current, tags, std::back_inserter(tag_change.removed));

    if (tag_change.added.empty() && tag_change.removed.empty())
    {
        Log::debug() << "Tags unchanged, nothing to commit" << std::endl;
        return boost::none;
    }

    change_type const change = change_type::tags;
    commit_hash const hash = store->empty_commit(commit_data(commit.wiki, page, commit.author, change));

    revision_id const revision = transaction->insert_revision(
        revision_record(page, commit.author.id, commit.message, hash, change));

    tag_change.revision = revision;
    transaction->insert_tag_change(tag_change);
    transaction->set_tags(page, tags);

    transaction->commit();
    return revision;
}

// Reads

bool page_manager::check_page(wiki_id wiki, std::string const& slug)
{
    Log::info() << "Checking if page '" << slug << "' exists in wiki ID " << wiki << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    return transaction->find_live_page(wiki, slug).is_initialized();
}

boost::optional<page_record> page_manager::get_page(wiki_id wiki, std::string const& slug)
{
    Log::info() << "Getting page '" << slug << "' in wiki ID " << wiki << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    boost::optional<page_id> const page = transaction->find_live_page(wiki, slug);
    if (!page)
        return boost::none;
    return transaction->get_page(*page);
}

boost::optional<page_record> page_manager::get_page_by_id(page_id page)
{
    Log::info() << "Getting page ID " << page << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    return transaction->get_page(page);
}

std::vector<page_record> page_manager::get_pages_with_tags(wiki_id wiki, std::vector<std::string> const& tags)
{
    Log::info() << "Getting pages with " << tags.size() << " tags in wiki ID " << wiki << std::endl;

    if (tags.empty())
    {
        Log::warn() << "Tag list was empty, returning nothing" << std::endl;
        return std::vector<page_record>();
    }

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    return transaction->pages_with_tags(wiki, tags);
}

boost::optional<std::string> page_manager::get_page_contents(wiki_id wiki, std::string const& slug)
{
    Log::info() << "Getting contents of page '" << slug << "' in wiki ID " << wiki << std::endl;

    return store(wiki)->get_page(slug);
}

boost::optional<std::string> page_manager::get_page_contents_by_id(page_id page)
{
    Log::info() << "Getting contents of page ID " << page << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    auto const last = last_commit(*transaction, page);
    if (!last)
        return boost::none;

    return store(last->first.wiki)->get_page_version(last->first.slug, last->second);
}

boost::optional<std::string> page_manager::get_page_version(
    wiki_id wiki, std::string const& slug, revision_ref const& revision)
{
    Log::info() << "Getting version " << revision << " of page '" << slug << "' in wiki ID " << wiki << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    commit_hash const hash = resolve(*transaction, revision);
    return store(wiki)->get_page_version(slug, hash);
}

diff page_manager::get_diff(
    wiki_id wiki, std::string const& slug, revision_ref const& first, revision_ref const& second)
{
    Log::info() << "Getting diff of page '" << slug << "' in wiki ID " << wiki << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    commit_hash const first_hash = resolve(*transaction, first);
    commit_hash const second_hash = resolve(*transaction, second);
    return store(wiki)->get_diff(slug, first_hash, second_hash);
}

boost::optional<blame> page_manager::get_blame(wiki_id wiki, std::string const& slug)
{
    Log::info() << "Getting blame of page '" << slug << "' in wiki ID " << wiki << std::endl;

    return store(wiki)->get_blame(slug);
}

boost::optional<blame> page_manager::get_blame_by_id(page_id page)
{
    Log::info() << "Getting blame of page ID " << page << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    auto const last = last_commit(*transaction, page);
    if (!last)
        return boost::none;

    return store(last->first.wiki)->get_blame(last->first.slug, last->second);
}

void page_manager::edit_revision(revision_id revision, std::string const& message)
{
    Log::info() << "Editing message of revision ID " << revision << std::endl;

    std::unique_ptr<metadata_transaction> transaction = metadata_.begin();
    if (!transaction->set_revision_message(revision, message))
        throw revision_error(error_kind::revision_not_found, "revision ID " + boost::lexical_cast<std::string>(revision));
    transaction->commit();
}

// Administration

void page_manager::set_domain(wiki_id wiki, std::string const& domain)
{
    store(wiki)->set_domain(domain);
}

std::size_t page_manager::vacuum(wiki_id wiki)
{
    return store(wiki)->vacuum();
}

} // namespace wikirev
