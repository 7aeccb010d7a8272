/**
 * @file test_contest_parser.cpp
 * @brief Problem link extraction tests
 */

#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "html_parser/contest_parser.hpp"
#include "html_parser/html_parser.hpp"

using Problems = std::vector<std::string>;

TEST(ContestParserTest, CollectsDistinctSortedIdentifiers) {
  const std::string html = R"(
    <table class="problems">
      <tr><td><a href="/contest/1234/problem/B">B</a></td></tr>
      <tr><td><a href="/contest/1234/problem/A">A</a></td></tr>
      <tr><td><a href="http://codeforces.com/contest/1234/problem/B">Again B</a></td></tr>
      <tr><td><a href="/contest/1234/problem/C1">C1</a></td></tr>
      <tr><td><a href="/contest/1234/problem/A"><img src="a.png"/></a></td></tr>
    </table>)";

  EXPECT_EQ(HtmlParser::extractProblems(html), (Problems{"A", "B", "C1"}));
}

TEST(ContestParserTest, MatchesAnywhereInsideHref) {
  ContestParser parser;
  parser.feed(R"(<A HREF="https://codeforces.com/gym/contest/99/problem/X_2?locale=en">x</A>)");
  EXPECT_EQ(parser.getProblems(), (Problems{"X_2"}));
}

TEST(ContestParserTest, IgnoresOtherTagsAndMissingHrefs) {
  ContestParser parser;
  parser.feed(R"(
    <link href="/contest/1/problem/Z">
    <div href="/contest/1/problem/Y"></div>
    <a name="top"></a>
    <a href="">empty</a>
    <a href="/problemset/problem/1/A">archive</a>
    <a href="/contest/x/problem/W">not numeric</a>)");
  EXPECT_TRUE(parser.getProblems().empty());
}

TEST(ContestParserTest, AcceptsTokensOneByOne) {
  ContestParser parser;
  parser.handleToken(StartTag{"a", {{"href", "/contest/5/problem/D"}}, false});
  parser.handleToken(Text{"/contest/5/problem/E"});
  parser.handleToken(StartTag{"a", {{"href", "/contest/5/problem/D"}}, false});
  EXPECT_EQ(parser.getProblems(), (Problems{"D"}));
}

TEST(ContestParserTest, UnknownEntityFailsTheContestPage) {
  EXPECT_THROW(HtmlParser::extractProblems("<a href=\"/contest/1/problem/A\">&madeup;</a>"), ParseError);
}
