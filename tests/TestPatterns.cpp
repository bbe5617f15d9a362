#include "patterns/patterns.hpp"

#include <gtest/gtest.h>

using namespace patterns;

TEST(PatternFilterTest, DefaultMatchesEverything) {
  PatternFilter filter;
  EXPECT_TRUE(filter.matches("/tmp/a.txt"));
  EXPECT_TRUE(filter.matches("relative/deeper/b"));
  EXPECT_TRUE(filter.matches(""));
}

TEST(PatternFilterTest, StarStaysInSegment) {
  PatternFilter filter({"*.py"}, {});
  EXPECT_TRUE(filter.matches("setup.py"));
  EXPECT_FALSE(filter.matches("pkg/setup.py"));
  EXPECT_FALSE(filter.matches("setup.pyc"));
}

TEST(PatternFilterTest, DoubleStarCrossesSegments) {
  PatternFilter filter({"**/*.py"}, {});
  EXPECT_TRUE(filter.matches("setup.py"));
  EXPECT_TRUE(filter.matches("pkg/setup.py"));
  EXPECT_TRUE(filter.matches("/abs/pkg/mod/setup.py"));
  EXPECT_FALSE(filter.matches("/abs/pkg/setup.txt"));
}

TEST(PatternFilterTest, QuestionMarkAndClasses) {
  PatternFilter filter({"file?.[ch]", "log[!0-9].txt"}, {});
  EXPECT_TRUE(filter.matches("file1.c"));
  EXPECT_TRUE(filter.matches("fileX.h"));
  EXPECT_FALSE(filter.matches("file12.c"));
  EXPECT_FALSE(filter.matches("file/.c"));
  EXPECT_TRUE(filter.matches("logA.txt"));
  EXPECT_FALSE(filter.matches("log1.txt"));
}

TEST(PatternFilterTest, RegexCharactersAreLiteral) {
  PatternFilter filter({"a+b(1).txt"}, {});
  EXPECT_TRUE(filter.matches("a+b(1).txt"));
  EXPECT_FALSE(filter.matches("aab1.txt"));
}

TEST(PatternFilterTest, ExclusionWins) {
  PatternFilter filter({"**"}, {"**/*.swp"});
  EXPECT_TRUE(filter.matches("/srv/data/report.txt"));
  EXPECT_FALSE(filter.matches("/srv/data/.report.txt.swp"));
}

TEST(PatternFilterTest, CaseSensitiveByDefault) {
  PatternFilter filter({"*.txt"}, {});
  EXPECT_TRUE(filter.matches("a.txt"));
  EXPECT_FALSE(filter.matches("a.TXT"));
}

TEST(PatternFilterTest, CaseInsensitive) {
  PatternFilter filter({"**/*.TXT"}, {"**/SECRET*"}, false);
  EXPECT_TRUE(filter.matches("dir/a.txt"));
  EXPECT_TRUE(filter.matches("DIR\\A.Txt"));
  EXPECT_FALSE(filter.matches("dir/secret.txt"));
  EXPECT_TRUE(filter.included_patterns().count("**/*.txt"));
}

TEST(PatternFilterTest, ConflictingPatternsThrow) {
  EXPECT_THROW(PatternFilter({"*.txt", "*.md"}, {"*.md"}), ConflictingPatternsError);

  try {
    PatternFilter({"*.txt", "*.md"}, {"*.md", "*.txt", "*.c"});
    FAIL() << "expected ConflictingPatternsError";
  } catch (const ConflictingPatternsError &e) {
    EXPECT_EQ(e.conflicts(), (std::set<std::string>{"*.md", "*.txt"}));
    EXPECT_NE(std::string(e.what()).find("`*.md`"), std::string::npos);
  }
}

TEST(PatternFilterTest, ConflictDetectionFoldsCase) {
  EXPECT_NO_THROW(PatternFilter({"*.TXT"}, {"*.txt"}, true));
  EXPECT_THROW(PatternFilter({"*.TXT"}, {"*.txt"}, false), ConflictingPatternsError);
}

TEST(PatternFilterTest, GlobToRegex) {
  EXPECT_EQ(PatternFilter::glob_to_regex("**"), "[\\s\\S]*");
  EXPECT_EQ(PatternFilter::glob_to_regex("*"), "[^/]+");
  EXPECT_EQ(PatternFilter::glob_to_regex("a/*/b"), "a/[^/]+/b");
  EXPECT_EQ(PatternFilter::glob_to_regex("**/x.c"), "(?:[\\s\\S]+/)?x\\.c");
}

TEST(FilterPathsTest, KeepsInputOrder) {
  std::vector<std::string> paths{"b.py", "a.txt", "c.py", "d/e.py"};
  EXPECT_EQ(filter_paths(paths, {"*.py"}), (std::vector<std::string>{"b.py", "c.py"}));
  EXPECT_EQ(filter_paths(paths), paths);
  EXPECT_EQ(filter_paths(paths, {"**"}, {"**/*.py"}), (std::vector<std::string>{"a.txt"}));
}

TEST(FilterPathsTest, MatchAny) {
  std::vector<std::string> paths{"a.txt", "b.md"};
  EXPECT_TRUE(match_any_paths(paths, {"*.md"}));
  EXPECT_FALSE(match_any_paths(paths, {"*.c"}));
  EXPECT_FALSE(match_any_paths({}, {"**"}));
  EXPECT_THROW(match_any_paths(paths, {"*.md"}, {"*.md"}), ConflictingPatternsError);
}
