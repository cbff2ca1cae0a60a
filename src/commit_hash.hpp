// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef COMMIT_HASH_HPP
# define COMMIT_HASH_HPP

# include <boost/operators.hpp>
# include <boost/optional.hpp>
# include <ostream>
# include <string>
# include <utility>

namespace wikirev {

// A validated full SHA-1 commit name: exactly 40 lowercase hex digits.
//
// Only parse() makes one, so anything of this type is safe to hand to
// git as an argument.
struct commit_hash : boost::totally_ordered<commit_hash>
{
    static std::size_t const size = 40;

    // Upper case is accepted; throws revision_error(invalid_hash) for
    // anything but 40 hex digits, surrounding whitespace included.
    static commit_hash parse(std::string const& text);
    static boost::optional<commit_hash> try_parse(std::string const& text);

    std::string const& str() const { return text; }

    friend bool operator==(commit_hash const& h0, commit_hash const& h1)
    {
        return h0.text == h1.text;
    }

    friend bool operator<(commit_hash const& h0, commit_hash const& h1)
    {
        return h0.text < h1.text;
    }

    friend std::ostream& operator<<(std::ostream& os, commit_hash const& h)
    {
        return os << h.text;
    }

 private:
    explicit commit_hash(std::string text) : text(std::move(text)) {}

 private:
    std::string text;
};

} // namespace wikirev

#endif // COMMIT_HASH_HPP
