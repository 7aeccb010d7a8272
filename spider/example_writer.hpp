#pragma once
#include "../html_parser/problem_parser.hpp"
#include <filesystem>
#include <string>
#include <vector>

// Lays out <root>/<id>/<id>.in.<n> and <id>.out.<n>, id lower-cased
class ExampleWriter {
public:
  explicit ExampleWriter(std::filesystem::path root);

  std::filesystem::path problemDir(const std::string &problem) const;
  void                  write(const std::string &problem, const std::vector<Example> &examples) const;

private:
  std::filesystem::path root;

  static void writeFile(const std::filesystem::path &path, const std::string &content);
};
