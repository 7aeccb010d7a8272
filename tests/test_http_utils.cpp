/**
 * @file test_http_utils.cpp
 * @brief URL handling tests; nothing here opens a connection
 */

#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "spider/contest.hpp"
#include "spider/http_utils.hpp"

TEST(ParseUrlTest, SplitsHttpsUrl) {
  auto url = parse_url("https://codeforces.com/contest/1/problem/A");
  EXPECT_EQ(url.scheme, "https");
  EXPECT_EQ(url.host, "codeforces.com");
  EXPECT_EQ(url.port, "443");
  EXPECT_EQ(url.path, "/contest/1/problem/A");
}

TEST(ParseUrlTest, KeepsExplicitPortAndDefaultsPath) {
  auto url = parse_url("http://localhost:8080");
  EXPECT_EQ(url.scheme, "http");
  EXPECT_EQ(url.host, "localhost");
  EXPECT_EQ(url.port, "8080");
  EXPECT_EQ(url.path, "/");
}

TEST(ParseUrlTest, NormalizesSchemeAndQuery) {
  auto url = parse_url("HTTP://Example.com?locale=en");
  EXPECT_EQ(url.scheme, "http");
  EXPECT_EQ(url.port, "80");
  EXPECT_EQ(url.path, "/?locale=en");
}

TEST(ParseUrlTest, RejectsGarbage) {
  EXPECT_EQ(parse_url("not a url").scheme, "unsupported");
}

TEST(ResolveUrlTest, HandlesLocationForms) {
  EXPECT_EQ(resolve_url("http://a.com/b/c", "https://x.org/y"), "https://x.org/y");
  EXPECT_EQ(resolve_url("https://a.com/b/c", "//cdn.com/z"), "https://cdn.com/z");
  EXPECT_EQ(resolve_url("https://a.com:8443/x", "/y"), "https://a.com:8443/y");
  EXPECT_EQ(resolve_url("http://a.com/b/c?q=1/2", "d"), "http://a.com/b/d");
  EXPECT_EQ(resolve_url("http://a.com", "d"), "http://a.com/d");
}

TEST(ResolveUrlTest, QueryOnlyLocationKeepsBasePath) {
  EXPECT_EQ(resolve_url("http://a.com/a/b", "?x=1"), "http://a.com/a/b?x=1");
  EXPECT_EQ(resolve_url("http://a.com/a/b?old=2", "?x=1"), "http://a.com/a/b?x=1");
  EXPECT_EQ(resolve_url("http://a.com", "?x=1"), "http://a.com/?x=1");
}

TEST(ResolveUrlTest, FragmentOnlyLocationKeepsQuery) {
  EXPECT_EQ(resolve_url("http://a.com/a/b?q=1#top", "#end"), "http://a.com/a/b?q=1#end");
}

TEST(DownloadTest, UnsupportedSchemeIsFetchError) {
  EXPECT_THROW(download("ftp://example.com/file"), FetchError);
  EXPECT_THROW(download("contest 1234"), FetchError);
}

TEST(ContestUriTest, NumericIdUsesBaseUrl) {
  EXPECT_EQ(resolve_contest_uri("1234", "http://codeforces.com"), "http://codeforces.com/contest/1234");
  EXPECT_EQ(resolve_contest_uri(" 0042 ", "http://codeforces.com"), "http://codeforces.com/contest/42");
}

TEST(ContestUriTest, AnythingElseIsUsedLiterally) {
  EXPECT_EQ(resolve_contest_uri("https://codeforces.com/gym/100001/", "http://codeforces.com"),
            "https://codeforces.com/gym/100001");
  EXPECT_EQ(resolve_contest_uri("0", "http://codeforces.com"), "0");
  EXPECT_EQ(resolve_contest_uri("-5", "http://codeforces.com"), "-5");
}

TEST(ContestUriTest, BuildsProblemUri) {
  EXPECT_EQ(problem_uri("http://codeforces.com/contest/1", "B1"), "http://codeforces.com/contest/1/problem/B1");
}
