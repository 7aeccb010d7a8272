#pragma once
#include <sstream>
#include <string>

// Whole-line console output shared by worker threads
namespace console {

void info(const std::string &line);
void warn(const std::string &line);
void error(const std::string &line);
void dump(const std::string &text);

template <typename... Args>
std::string format(const Args &...args) {
  std::ostringstream out;
  (out << ... << args);
  return out.str();
}

} // namespace console
