#include "html_parser.hpp"
#include "contest_parser.hpp"
#include <boost/algorithm/string/replace.hpp>

std::string HtmlParser::patchProblemHtml(const std::string &html) {
  std::string patched = html;
  boost::replace_all(patched, "<p</p>", "<p></p>");
  boost::replace_all(patched, "<ul</ul>", "<ul></ul>");
  boost::replace_all(patched, "<div class=\"sample-test\"<", "<div class=\"sample-test\"><");
  return patched;
}

std::vector<std::string> HtmlParser::extractProblems(const std::string &html) {
  ContestParser parser;
  parser.feed(html);
  return parser.getProblems();
}

std::vector<Example> HtmlParser::extractExamples(const std::string &html) {
  ProblemParser parser;
  parser.feed(patchProblemHtml(html));
  return parser.getExamples();
}
