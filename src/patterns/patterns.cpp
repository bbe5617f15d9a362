#include "patterns.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace patterns
{
    namespace
    {
        const std::string kNotSep = "[^/]";
        const std::string kAnyChar = "[\\s\\S]";

        std::string join(const std::set<std::string> &items)
        {
            std::string out;
            for (const auto &item : items)
            {
                if (!out.empty())
                    out += ", ";
                out += "`" + item + "`";
            }
            return out;
        }

        std::string to_lower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::vector<std::string> split(const std::string &text, char sep)
        {
            std::vector<std::string> parts;
            std::string current;
            for (char c : text)
            {
                if (c == sep)
                {
                    parts.push_back(current);
                    current.clear();
                }
                else
                {
                    current.push_back(c);
                }
            }
            parts.push_back(current);
            return parts;
        }

        std::string escape_char(char c)
        {
            static const std::string special = "\\^$.|?*+()[]{}";
            if (special.find(c) != std::string::npos)
                return std::string("\\") + c;
            return std::string(1, c);
        }

        // Translate one path segment: '*', '?' and '[...]' never cross a separator.
        std::string translate_segment(const std::string &part)
        {
            std::string out;
            size_t i = 0;
            const size_t n = part.size();
            while (i < n)
            {
                char c = part[i++];
                if (c == '*')
                {
                    // Collapse runs of '*'
                    while (i < n && part[i] == '*')
                        ++i;
                    out += kNotSep + "*";
                }
                else if (c == '?')
                {
                    out += kNotSep;
                }
                else if (c == '[')
                {
                    size_t j = i;
                    if (j < n && part[j] == '!')
                        ++j;
                    if (j < n && part[j] == ']')
                        ++j;
                    while (j < n && part[j] != ']')
                        ++j;
                    if (j >= n)
                    {
                        out += "\\[";
                        continue;
                    }
                    std::string body = part.substr(i, j - i);
                    i = j + 1;
                    std::string cls = "[";
                    size_t k = 0;
                    if (!body.empty() && body[0] == '!')
                    {
                        cls += "^";
                        k = 1;
                    }
                    else if (!body.empty() && body[0] == '^')
                    {
                        cls += "\\^";
                        k = 1;
                    }
                    for (; k < body.size(); ++k)
                    {
                        if (body[k] == '\\' || body[k] == ']' || body[k] == '[')
                            cls += '\\';
                        cls += body[k];
                    }
                    cls += "]";
                    out += cls;
                }
                else
                {
                    out += escape_char(c);
                }
            }
            return out;
        }
    }

    ConflictingPatternsError::ConflictingPatternsError(const std::set<std::string> &conflicts)
        : std::invalid_argument("conflicting patterns " + join(conflicts) + " included and excluded"),
          conflicts_(conflicts)
    {
    }

    PatternFilter::PatternFilter()
        : PatternFilter({"**"}, {}, true)
    {
    }

    PatternFilter::PatternFilter(const std::vector<std::string> &included_patterns,
                                 const std::vector<std::string> &excluded_patterns,
                                 bool case_sensitive)
        : case_sensitive_(case_sensitive)
    {
        for (const auto &pattern : included_patterns)
            included_.insert(normalize(pattern));
        for (const auto &pattern : excluded_patterns)
            excluded_.insert(normalize(pattern));

        std::set<std::string> common;
        std::set_intersection(included_.begin(), included_.end(),
                              excluded_.begin(), excluded_.end(),
                              std::inserter(common, common.begin()));
        if (!common.empty())
            throw ConflictingPatternsError(common);

        for (const auto &pattern : included_)
            included_regex_.push_back(compile(pattern));
        for (const auto &pattern : excluded_)
            excluded_regex_.push_back(compile(pattern));
    }

    bool PatternFilter::matches(const std::string &path) const
    {
        std::string subject = path;
        if (!case_sensitive_)
            std::replace(subject.begin(), subject.end(), '\\', '/');

        auto full_match = [&subject](const std::regex &re)
        { return std::regex_match(subject, re); };

        return std::any_of(included_regex_.begin(), included_regex_.end(), full_match) &&
               std::none_of(excluded_regex_.begin(), excluded_regex_.end(), full_match);
    }

    std::string PatternFilter::glob_to_regex(const std::string &pattern)
    {
        const std::string one_last_segment = kNotSep + "+";
        const std::string one_segment = one_last_segment + "/";
        const std::string any_segments = "(?:" + kAnyChar + "+/)?";
        const std::string any_last_segments = kAnyChar + "*";

        std::vector<std::string> parts = split(pattern, '/');
        const size_t last = parts.size() - 1;
        std::string out;
        for (size_t idx = 0; idx < parts.size(); ++idx)
        {
            const std::string &part = parts[idx];
            if (part == "*")
            {
                out += (idx < last) ? one_segment : one_last_segment;
            }
            else if (part == "**")
            {
                if (idx < last)
                {
                    if (parts[idx + 1] != "**")
                        out += any_segments;
                }
                else
                {
                    out += any_last_segments;
                }
            }
            else
            {
                out += translate_segment(part);
                if (idx < last)
                    out += "/";
            }
        }
        return out;
    }

    std::regex PatternFilter::compile(const std::string &pattern) const
    {
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (!case_sensitive_)
            flags |= std::regex::icase;
        return std::regex(glob_to_regex(pattern), flags);
    }

    std::string PatternFilter::normalize(const std::string &text) const
    {
        if (case_sensitive_)
            return text;
        std::string out = to_lower(text);
        std::replace(out.begin(), out.end(), '\\', '/');
        return out;
    }

    std::vector<std::string> filter_paths(const std::vector<std::string> &paths,
                                          const std::vector<std::string> &included_patterns,
                                          const std::vector<std::string> &excluded_patterns,
                                          bool case_sensitive)
    {
        PatternFilter filter(included_patterns, excluded_patterns, case_sensitive);
        std::vector<std::string> result;
        std::copy_if(paths.begin(), paths.end(), std::back_inserter(result),
                     [&filter](const std::string &path)
                     { return filter.matches(path); });
        return result;
    }

    bool match_any_paths(const std::vector<std::string> &paths,
                         const std::vector<std::string> &included_patterns,
                         const std::vector<std::string> &excluded_patterns,
                         bool case_sensitive)
    {
        PatternFilter filter(included_patterns, excluded_patterns, case_sensitive);
        return std::any_of(paths.begin(), paths.end(),
                           [&filter](const std::string &path)
                           { return filter.matches(path); });
    }

} // namespace patterns
