#include "contest_parser.hpp"
#include <boost/regex.hpp>

void ContestParser::feed(std::string_view html) {
  Tokenizer tokenizer(html);
  while (auto token = tokenizer.next()) {
    handleToken(*token);
  }
}

void ContestParser::handleToken(const Token &token) {
  const auto *tag = std::get_if<StartTag>(&token);
  if (!tag || tag->name != "a") {
    return;
  }

  auto href = tag->attributes.find("href");
  if (href == tag->attributes.end() || href->second.empty()) {
    return;
  }

  static const boost::regex problem_re(R"(contest/\d+/problem/(\w+))");
  boost::smatch             match;
  if (boost::regex_search(href->second, match, problem_re)) {
    problems.insert(match[1].str());
  }
}

std::vector<std::string> ContestParser::getProblems() const {
  return std::vector<std::string>(problems.begin(), problems.end());
}
