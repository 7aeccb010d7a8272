#include "example_writer.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

ExampleWriter::ExampleWriter(std::filesystem::path root)
    : root(std::move(root)) {
}

std::filesystem::path ExampleWriter::problemDir(const std::string &problem) const {
  return root / boost::algorithm::to_lower_copy(problem);
}

void ExampleWriter::write(const std::string &problem, const std::vector<Example> &examples) const {
  const std::string           name = boost::algorithm::to_lower_copy(problem);
  const std::filesystem::path dir  = problemDir(problem);

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec || !std::filesystem::is_directory(dir)) {
    throw std::runtime_error("Failed to create directory " + dir.string() + (ec ? ": " + ec.message() : ""));
  }

  for (size_t i = 0; i < examples.size(); ++i) {
    const std::string index = std::to_string(i + 1);
    writeFile(dir / (name + ".in." + index), examples[i].input);
    writeFile(dir / (name + ".out." + index), examples[i].output);
  }
}

void ExampleWriter::writeFile(const std::filesystem::path &path, const std::string &content) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open " + path.string() + " for writing");
  }
  file << content;
  file.close();
  if (!file) {
    throw std::runtime_error("Failed to write " + path.string());
  }
}
