#ifndef PATTERNS_HPP
#define PATTERNS_HPP

#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace patterns
{

    // Raised when the same pattern is both included and excluded.
    class ConflictingPatternsError : public std::invalid_argument
    {
    public:
        explicit ConflictingPatternsError(const std::set<std::string> &conflicts);

        const std::set<std::string> &conflicts() const { return conflicts_; }

    private:
        std::set<std::string> conflicts_;
    };

    // Full-path glob predicate built from inclusion and exclusion lists.
    //
    // "**" as a whole segment matches any number of segments, "*" and "?" stay
    // within one segment and "[...]" is a character class. In case-insensitive
    // mode both '/' and '\' separate segments.
    class PatternFilter
    {
    public:
        PatternFilter();
        PatternFilter(const std::vector<std::string> &included_patterns,
                      const std::vector<std::string> &excluded_patterns,
                      bool case_sensitive = true);

        bool matches(const std::string &path) const;

        bool case_sensitive() const { return case_sensitive_; }
        const std::set<std::string> &included_patterns() const { return included_; }
        const std::set<std::string> &excluded_patterns() const { return excluded_; }

        static std::string glob_to_regex(const std::string &pattern);

    private:
        std::regex compile(const std::string &pattern) const;
        std::string normalize(const std::string &text) const;

        bool case_sensitive_;
        std::set<std::string> included_;
        std::set<std::string> excluded_;
        std::vector<std::regex> included_regex_;
        std::vector<std::regex> excluded_regex_;
    };

    // Paths that pass the patterns, in input order.
    std::vector<std::string> filter_paths(const std::vector<std::string> &paths,
                                          const std::vector<std::string> &included_patterns = {"**"},
                                          const std::vector<std::string> &excluded_patterns = {},
                                          bool case_sensitive = true);

    bool match_any_paths(const std::vector<std::string> &paths,
                         const std::vector<std::string> &included_patterns = {"**"},
                         const std::vector<std::string> &excluded_patterns = {},
                         bool case_sensitive = true);

} // namespace patterns

#endif // PATTERNS_HPP
