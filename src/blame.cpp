// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "blame.hpp"
#include "error.hpp"
#include "log.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/date_time/posix_time/conversion.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>
#include <cstdint>
#include <ctime>
#include <map>
#include <utility>

namespace wikirev {

namespace {

// "<hash> <orig-lineno> <final-lineno>" continues a group; a fourth
// field, the number of lines in the group, starts a new one.
boost::regex const header_regex("([0-9a-f]{40}) ([0-9]+) ([0-9]+)(?: ([0-9]+))?");
boost::regex const metadata_regex("([a-z-]+)(?: (.*))?");
boost::regex const timezone_regex("([+-])([0-9]{2})([0-9]{2})");

enum field
{
    author_name = 1 << 0,
    author_mail = 1 << 1,
    author_time = 1 << 2,
    author_tz = 1 << 3,
    committer_name = 1 << 4,
    committer_mail = 1 << 5,
    committer_time = 1 << 6,
    committer_tz = 1 << 7,
    summary_line = 1 << 8,
    all_fields = (1 << 9) - 1
};

// Porcelain prints a commit's metadata only the first time the commit
// appears, so it is remembered across groups.
struct commit_metadata
{
    commit_metadata() : fields(0) {}

    blame_author author;
    blame_author committer;
    std::string summary;
    boost::optional<commit_hash> previous;
    unsigned fields;
};

[[noreturn]] void malformed(std::size_t line_number, std::string const& why)
{
    throw revision_error(
        error_kind::parse_error,
        "git blame porcelain line " + boost::lexical_cast<std::string>(line_number) + ": " + why);
}

class porcelain_parser
{
 public:
    porcelain_parser() : state(expect_commit_header), line_number(0) {}

    void feed(std::string const& line);
    blame finish();

 private:
    void commit_header(std::string const& line);
    void metadata_line(std::string const& line);
    void content_line(std::string const& line);

    void set_field(std::string const& key, std::string const& value);
    void complete_metadata();

    std::string const& require_value(std::string const& key, std::string const& value) const;
    boost::posix_time::ptime parse_time(std::string const& value) const;
    boost::posix_time::time_duration parse_offset(std::string const& value) const;
    std::string strip_mail(std::string const& value) const;

 private:
    enum
    {
        expect_commit_header,
        expect_metadata_line,
        expect_content_line
    } state;

    std::size_t line_number;
    blame result;
    std::map<commit_hash, commit_metadata> seen;

    // The commit named by the last header, its metadata as gathered so
    // far, and the line numbers the next content line gets.
    boost::optional<commit_hash> current;
    commit_metadata metadata;
    unsigned old_lineno;
    unsigned new_lineno;
};

void porcelain_parser::feed(std::string const& line)
{
    ++line_number;
    switch (state)
    {
    case expect_commit_header:
        commit_header(line);
        break;
    case expect_metadata_line:
        metadata_line(line);
        break;
    case expect_content_line:
        content_line(line);
        break;
    }
}

blame porcelain_parser::finish()
{
    if (state != expect_commit_header)
        malformed(line_number, "output ends in the middle of an entry");
    return std::move(result);
}

void porcelain_parser::commit_header(std::string const& line)
{
    boost::smatch match;
    if (!boost::regex_match(line, match, header_regex))
        malformed(line_number, "expected a commit header, got '" + line + "'");

    commit_hash const commit = commit_hash::parse(match.str(1));
    try
    {
        old_lineno = boost::lexical_cast<unsigned>(match.str(2));
        new_lineno = boost::lexical_cast<unsigned>(match.str(3));
    }
    catch (boost::bad_lexical_cast const&)
    {
        malformed(line_number, "line number out of range in '" + line + "'");
    }

    if (match[4].matched)
    {
        result.groups.push_back(blame_group());
        current = commit;

        auto const known = seen.find(commit);
        metadata = known == seen.end() ? commit_metadata() : known->second;
        state = expect_metadata_line;
    }
    else
    {
        if (!current)
            malformed(line_number, "continuation header before any group");
        if (*current != commit)
            malformed(line_number, "commit " + commit.str() + " continues a group of " + current->str());
        state = expect_content_line;
    }
}

void porcelain_parser::metadata_line(std::string const& line)
{
    if (boost::algorithm::starts_with(line, "\t"))
    {
        // Only a commit printed before may go straight to its content.
        if (seen.find(*current) == seen.end())
            malformed(line_number, "content for commit " + current->str() + " without its metadata");
        complete_metadata();
        content_line(line);
        return;
    }

    boost::smatch match;
    if (!boost::regex_match(line, match, metadata_regex))
        malformed(line_number, "expected a metadata line, got '" + line + "'");

    std::string const key = match.str(1);
    set_field(key, match.str(2));

    if (key == "filename")
    {
        complete_metadata();
        state = expect_content_line;
    }
}

void porcelain_parser::content_line(std::string const& line)
{
    if (!boost::algorithm::starts_with(line, "\t"))
        malformed(line_number, "expected a content line, got '" + line + "'");

    result.groups.back().lines.push_back(blame_line(*current, old_lineno, new_lineno, line.substr(1)));
    state = expect_commit_header;
}

void porcelain_parser::set_field(std::string const& key, std::string const& value)
{
    if (key == "author")
    {
        metadata.author.name = value;
        metadata.fields |= author_name;
    }
    else if (key == "author-mail")
    {
        metadata.author.email = strip_mail(require_value(key, value));
        metadata.fields |= author_mail;
    }
    else if (key == "author-time")
    {
        metadata.author.time = parse_time(require_value(key, value));
        metadata.fields |= author_time;
    }
    else if (key == "author-tz")
    {
        metadata.author.utc_offset = parse_offset(require_value(key, value));
        metadata.fields |= author_tz;
    }
    else if (key == "committer")
    {
        metadata.committer.name = value;
        metadata.fields |= committer_name;
    }
    else if (key == "committer-mail")
    {
        metadata.committer.email = strip_mail(require_value(key, value));
        metadata.fields |= committer_mail;
    }
    else if (key == "committer-time")
    {
        metadata.committer.time = parse_time(require_value(key, value));
        metadata.fields |= committer_time;
    }
    else if (key == "committer-tz")
    {
        metadata.committer.utc_offset = parse_offset(require_value(key, value));
        metadata.fields |= committer_tz;
    }
    else if (key == "summary")
    {
        metadata.summary = value;
        metadata.fields |= summary_line;
    }
    else if (key == "previous")
    {
        // "<hash> <filename>"
        std::string const& v = require_value(key, value);
        boost::optional<commit_hash> previous = commit_hash::try_parse(v.substr(0, v.find(' ')));
        if (!previous)
            malformed(line_number, "bad previous commit '" + v + "'");
        metadata.previous = previous;
    }
    else if (key == "boundary" || key == "filename")
    {
    }
    else
    {
        Log::trace() << "Ignoring unknown git blame key '" << key << "'" << std::endl;
    }
}

void porcelain_parser::complete_metadata()
{
    if (metadata.fields != all_fields)
        malformed(line_number, "incomplete metadata for commit " + current->str());

    seen[*current] = metadata;

    blame_group& group = result.groups.back();
    group.author = metadata.author;
    group.committer = metadata.committer;
    group.summary = metadata.summary;
    group.previous = metadata.previous;
}

std::string const& porcelain_parser::require_value(std::string const& key, std::string const& value) const
{
    if (value.empty())
        malformed(line_number, "missing value for '" + key + "'");
    return value;
}

boost::posix_time::ptime porcelain_parser::parse_time(std::string const& value) const
{
    std::int64_t seconds;
    try
    {
        seconds = boost::lexical_cast<std::int64_t>(value);
    }
    catch (boost::bad_lexical_cast const&)
    {
        malformed(line_number, "bad timestamp '" + value + "'");
    }
    return boost::posix_time::from_time_t(static_cast<std::time_t>(seconds));
}

boost::posix_time::time_duration porcelain_parser::parse_offset(std::string const& value) const
{
    boost::smatch match;
    if (!boost::regex_match(value, match, timezone_regex))
        malformed(line_number, "bad timezone '" + value + "'");

    boost::posix_time::time_duration offset(
        boost::lexical_cast<int>(match.str(2)), boost::lexical_cast<int>(match.str(3)), 0);
    return match.str(1) == "-" ? offset.invert_sign() : offset;
}

std::string porcelain_parser::strip_mail(std::string const& value) const
{
    if (value.size() >= 2 && value.front() == '<' && value.back() == '>')
        return value.substr(1, value.size() - 2);
    return value;
}

} // unnamed namespace

blame parse_blame_porcelain(std::string const& porcelain)
{
    std::vector<std::string> lines;
    boost::algorithm::split(lines, porcelain, boost::algorithm::is_any_of("\n"));

    // The final newline leaves one empty element behind
    if (!lines.empty() && lines.back().empty())
        lines.pop_back();

    porcelain_parser parser;
    for (auto const& line : lines)
        parser.feed(line);

    blame result = parser.finish();
    Log::trace() << "Parsed " << result.groups.size() << " blame groups" << std::endl;
    return result;
}

} // namespace wikirev
