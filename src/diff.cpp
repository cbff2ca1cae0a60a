// Copyright the wikirev contributors 2026. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "diff.hpp"
#include "error.hpp"
#include "log.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

namespace wikirev {

namespace {

boost::regex const numstat_regex("(-|[0-9]+)\t(-|[0-9]+)\t.+");
boost::regex const hunk_regex("@@ -([0-9]+)(?:,([0-9]+))? \\+([0-9]+)(?:,([0-9]+))? @@.*");

char const* const dev_null = "/dev/null";

std::vector<std::string> split_lines(std::string const& text)
{
    std::vector<std::string> lines;
    boost::algorithm::split(lines, text, boost::algorithm::is_any_of("\n"));
    if (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}

[[noreturn]] void malformed(char const* what, std::string const& line)
{
    throw revision_error(error_kind::parse_error, std::string(what) + ": '" + line + "'");
}

std::size_t count(std::string const& column)
{
    return column == "-" ? 0 : boost::lexical_cast<std::size_t>(column);
}

// Extended header lines git may print between "diff --git" and the
// first hunk.
bool is_extended_header(std::string const& line)
{
    static char const* const prefixes[] = {
        "diff --git ", "index ", "old mode ", "new mode ", "new file mode ",
        "deleted file mode ", "similarity index ", "dissimilarity index ",
        "rename from ", "rename to ", "copy from ", "copy to ", "Binary files "
    };
    for (char const* prefix : prefixes)
    {
        if (boost::algorithm::starts_with(line, prefix))
            return true;
    }
    return false;
}

boost::optional<std::string> file_name(std::string const& field)
{
    // git appends a tab to names containing spaces
    std::string name = field.substr(0, field.find('\t'));
    if (name == dev_null)
        return boost::none;
    return name;
}

char no_newline_origin(char previous)
{
    switch (previous)
    {
    case ' ': return '=';
    case '+': return '>';
    case '-': return '<';
    }
    return 0;
}

} // unnamed namespace

diff_stat parse_numstat(std::string const& numstat)
{
    diff_stat stat;
    for (auto const& line : split_lines(numstat))
    {
        boost::smatch match;
        if (!boost::regex_match(line, match, numstat_regex))
            malformed("unexpected git numstat line", line);

        try
        {
            stat.insertions += count(match.str(1));
            stat.deletions += count(match.str(2));
        }
        catch (boost::bad_lexical_cast const&)
        {
            malformed("count out of range in git numstat line", line);
        }
    }
    return stat;
}

void parse_unified_diff(std::string const& text, diff& result)
{
    bool in_hunk = false;
    unsigned old_lineno = 0;
    unsigned new_lineno = 0;

    for (auto const& line : split_lines(text))
    {
        if (boost::algorithm::starts_with(line, "diff --git "))
        {
            in_hunk = false;
            continue;
        }

        if (boost::algorithm::starts_with(line, "@@"))
        {
            boost::smatch match;
            if (!boost::regex_match(line, match, hunk_regex))
                malformed("bad hunk header", line);

            try
            {
                old_lineno = boost::lexical_cast<unsigned>(match.str(1));
                new_lineno = boost::lexical_cast<unsigned>(match.str(3));
            }
            catch (boost::bad_lexical_cast const&)
            {
                malformed("line number out of range in hunk header", line);
            }
            in_hunk = true;
            continue;
        }

        if (!in_hunk)
        {
            if (boost::algorithm::starts_with(line, "--- "))
                result.old_name = file_name(line.substr(4));
            else if (boost::algorithm::starts_with(line, "+++ "))
                result.new_name = file_name(line.substr(4));
            else if (!is_extended_header(line))
                malformed("unexpected line in git diff header", line);
            continue;
        }

        diff_line record;
        if (line.empty())
        {
            // Blank context line, as printed with diff.suppressBlankEmpty
            record.origin = ' ';
        }
        else if (line[0] == '\\')
        {
            if (result.lines.empty())
                malformed("no-newline marker before any line", line);

            record.origin = no_newline_origin(result.lines.back().origin);
            if (!record.origin)
                malformed("repeated no-newline marker", line);
            std::string::size_type const text = line.find_first_not_of("\\ ");
            if (text != std::string::npos)
                record.content = line.substr(text);
            result.lines.push_back(record);
            continue;
        }
        else if (line[0] == ' ' || line[0] == '+' || line[0] == '-')
        {
            record.origin = line[0];
            record.content = line.substr(1);
        }
        else
        {
            malformed("unexpected line in git diff hunk", line);
        }

        if (record.origin != '+')
            record.old_lineno = old_lineno++;
        if (record.origin != '-')
            record.new_lineno = new_lineno++;
        result.lines.push_back(record);
    }

    Log::trace() << "Parsed " << result.lines.size() << " diff lines" << std::endl;
}

double percent_changed(diff_stat const& change, std::size_t first_lines, std::size_t second_lines)
{
    std::size_t const total = first_lines + second_lines;
    if (total == 0)
        return 0;
    return 100.0 * static_cast<double>(change.insertions + change.deletions) / static_cast<double>(total);
}

} // namespace wikirev
