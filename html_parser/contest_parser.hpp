#pragma once
#include "tokenizer.hpp"
#include <set>
#include <string>
#include <string_view>
#include <vector>

// Collects problem identifiers from links of the form contest/<n>/problem/<id>
class ContestParser {
public:
  void feed(std::string_view html);
  void handleToken(const Token &token);

  // Distinct identifiers in ascending order
  std::vector<std::string> getProblems() const;

private:
  std::set<std::string> problems;
};
