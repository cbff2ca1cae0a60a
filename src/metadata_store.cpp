// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "metadata_store.hpp"

namespace wikirev {

char const* to_string(change_type change)
{
    switch (change)
    {
    case change_type::create: return "create";
    case change_type::modify: return "modify";
    case change_type::rename: return "rename";
    case change_type::remove: return "delete";
    case change_type::restore: return "restore";
    case change_type::undo: return "undo";
    case change_type::tags: return "tags";
    }
    return "unknown";
}

char const* verb(change_type change)
{
    switch (change)
    {
    case change_type::create: return "created";
    case change_type::modify: return "modified";
    case change_type::rename: return "renamed";
    case change_type::remove: return "deleted";
    case change_type::restore: return "restored";
    case change_type::undo: return "reverted";
    case change_type::tags: return "retagged";
    }
    return "changed";
}

std::ostream& operator<<(std::ostream& os, change_type change)
{
    return os << to_string(change);
}

} // namespace wikirev
