#pragma once
#include "problem_parser.hpp"
#include <string>
#include <vector>

class HtmlParser {
public:
  // Fixes markup errors known to appear on problem pages
  static std::string              patchProblemHtml(const std::string &html);
  static std::vector<std::string> extractProblems(const std::string &html);
  static std::vector<Example>     extractExamples(const std::string &html);
};
