/**
 * @file test_problem_parser.cpp
 * @brief Sample block extraction tests
 *
 * Covered:
 *   - input/output pairing in document order
 *   - <br> handling, references inside <pre>
 *   - loud failures for several sample blocks and odd <pre> counts
 *   - pages without samples, markup patches, repeatability
 */

#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "html_parser/html_parser.hpp"
#include "html_parser/problem_parser.hpp"

using Examples = std::vector<Example>;

class ProblemParserTest : public ::testing::Test {
protected:
  ProblemParser parser_;
};

TEST_F(ProblemParserTest, ExtractsSinglePair) {
  parser_.feed("<div class=\"sample-tests\"><div class=\"sample-test\"><pre>3\n1 2 3</pre><pre>6</pre></div></div>");

  EXPECT_EQ(parser_.rootCount(), 1u);
  EXPECT_EQ(parser_.getExamples(), (Examples{{"3\n1 2 3", "6"}}));
}

TEST_F(ProblemParserTest, ExtractsCodeforcesLayout) {
  const std::string html = R"(<html><head><script>var s = "<div class='sample'>";</script></head>
<body><div class="problem-statement"><div class="header"><div class="title">A. Sum</div></div>
<p>Print the sum &mdash; nothing else.</p>
<div class="sample-tests"><div class="section-title">Examples</div><div class="sample-test">
<div class="input"><div class="title">Input</div><pre>3
1 2 3
</pre></div><div class="output"><div class="title">Output</div><pre>6
</pre></div>
<div class="input"><div class="title">Input</div><pre>1<br />5<br /></pre></div>
<div class="output"><div class="title">Output</div><pre>5<br /></pre></div>
</div></div><div class="note"><div class="section-title">Note</div><pre>not a sample</pre></div>
</div></body></html>)";

  parser_.feed(html);

  EXPECT_EQ(parser_.rootCount(), 1u);
  EXPECT_EQ(parser_.getExamples(), (Examples{{"3\n1 2 3\n", "6\n"}, {"1\n5\n", "5\n"}}));
  EXPECT_EQ(parser_.mismatchedEndTags(), 0u);
}

TEST_F(ProblemParserTest, ResolvesReferencesInsidePre) {
  parser_.feed("<div class=\"sample\"><pre>1 &lt; 2 &amp;&#33;</pre><pre>&#x59;ES</pre></div>");
  EXPECT_EQ(parser_.getExamples(), (Examples{{"1 < 2 &!", "YES"}}));
}

TEST_F(ProblemParserTest, LineBreakAppendsNewlineWithoutChild) {
  parser_.feed("<div class=\"sample\"><pre>1<br>2<br></pre><pre>3</pre></div>");
  EXPECT_EQ(parser_.getExamples(), (Examples{{"1\n2\n", "3"}}));
  EXPECT_EQ(parser_.mismatchedEndTags(), 0u) << "</pre> must close the <pre>, not a <br> node";
}

TEST_F(ProblemParserTest, LineBreakBetweenBlocksKeepsNesting) {
  parser_.feed("<div class=\"sample\"><pre>a</pre><br><pre>b</pre></div><p>after</p>");
  EXPECT_EQ(parser_.rootCount(), 1u);
  EXPECT_EQ(parser_.getExamples(), (Examples{{"a", "b"}}));
}

TEST_F(ProblemParserTest, OddPreCountIsStructuralError) {
  parser_.feed("<div class=\"sample-tests\"><pre>1</pre><pre>2</pre><pre>3</pre></div>");
  EXPECT_THROW(parser_.getExamples(), StructuralAssertionError);
}

TEST_F(ProblemParserTest, SeveralSampleRootsAreStructuralError) {
  parser_.feed("<div class=\"sample-tests\"><pre>1</pre><pre>2</pre></div>"
               "<p>between</p>"
               "<div class=\"sample-tests\"><pre>3</pre><pre>4</pre></div>");
  EXPECT_EQ(parser_.rootCount(), 2u);
  EXPECT_THROW(parser_.getExamples(), StructuralAssertionError);
}

TEST_F(ProblemParserTest, PageWithoutSamplesYieldsNothing) {
  parser_.feed("<div class=\"problem-statement\"><pre>code</pre><span class=\"sample\">x</span></div>");
  EXPECT_EQ(parser_.rootCount(), 0u);
  EXPECT_TRUE(parser_.getExamples().empty());
}

TEST_F(ProblemParserTest, EndTagsPopWhateverTheirName) {
  parser_.feed("<div class=\"sample\"><pre>in</b><pre>out</i></div>");
  EXPECT_EQ(parser_.getExamples(), (Examples{{"in", "out"}}));
  EXPECT_EQ(parser_.mismatchedEndTags(), 2u);
}

TEST_F(ProblemParserTest, NestedPreIsNotDescended) {
  parser_.feed("<div class=\"sample\"><pre>outer<pre>inner</pre></pre><pre>x</pre></div>");
  EXPECT_EQ(parser_.getExamples(), (Examples{{"outer", "x"}}));
}

TEST_F(ProblemParserTest, SelfClosingSampleContainerIsEmptyRoot) {
  parser_.feed("<div class=\"sample\"/><pre>1</pre>");
  EXPECT_EQ(parser_.rootCount(), 1u);
  EXPECT_TRUE(parser_.getExamples().empty());
}

TEST_F(ProblemParserTest, HarvestingIsRepeatable) {
  parser_.feed("<div class=\"sample\"><pre>1</pre><pre>2</pre><pre>3</pre><pre>4</pre></div>");
  auto first  = parser_.getExamples();
  auto second = parser_.getExamples();
  EXPECT_EQ(first, second);
  EXPECT_EQ(first, (Examples{{"1", "2"}, {"3", "4"}}));
}

TEST_F(ProblemParserTest, SurvivesDeepUnclosedNesting) {
  std::string html = "<div class=\"sample\">";
  for (int i = 0; i < 100000; ++i) {
    html += "<img>";
  }
  html += "</div>";

  parser_.feed(html);
  EXPECT_EQ(parser_.rootCount(), 0u) << "</div> only closes the innermost <img>";
  EXPECT_TRUE(parser_.getExamples().empty());
}

TEST_F(ProblemParserTest, WalksDeeplyNestedRoot) {
  const int   depth = 100000;
  std::string html  = "<div class=\"sample\">";
  for (int i = 0; i < depth; ++i) {
    html += "<img>";
  }
  html += "<pre>1</pre><pre>2</pre>";
  for (int i = 0; i < depth; ++i) {
    html += "</img>";
  }
  html += "</div>";

  parser_.feed(html);
  EXPECT_EQ(parser_.rootCount(), 1u);
  EXPECT_EQ(parser_.getExamples(), (Examples{{"1", "2"}}));
  EXPECT_EQ(parser_.mismatchedEndTags(), 0u);
}

TEST(HtmlParserTest, DeeplyNestedPageReturnsNormally) {
  std::string html = "<div class=\"sample\">";
  for (int i = 0; i < 100000; ++i) {
    html += "<input type=\"text\">";
  }
  html += "</div>";
  EXPECT_TRUE(HtmlParser::extractExamples(html).empty());
}

// ============================================================
// HtmlParser facade
// ============================================================

TEST(HtmlParserTest, PatchesKnownMarkupErrors) {
  EXPECT_EQ(HtmlParser::patchProblemHtml("<p</p><ul</ul><div class=\"sample-test\"<pre>"),
            "<p></p><ul></ul><div class=\"sample-test\"><pre>");
}

TEST(HtmlParserTest, ExtractsAfterPatching) {
  const std::string html = "<div class=\"sample-test\"<pre>1</pre><pre>2</pre></div>";
  EXPECT_EQ(HtmlParser::extractExamples(html), (Examples{{"1", "2"}}));
}

TEST(HtmlParserTest, SameMarkupGivesSameExamples) {
  const std::string html = "<div class=\"sample-tests\"><pre>a\nb</pre><pre>c</pre></div>";
  EXPECT_EQ(HtmlParser::extractExamples(html), HtmlParser::extractExamples(html));
}

TEST(HtmlParserTest, UnknownEntityInsideSampleIsParseError) {
  EXPECT_THROW(HtmlParser::extractExamples("<div class=\"sample\"><pre>&nope;</pre><pre>1</pre></div>"), ParseError);
}
