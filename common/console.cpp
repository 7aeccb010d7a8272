#include "console.hpp"
#include <iostream>
#include <mutex>

namespace console {

static std::mutex console_mutex;

void info(const std::string &line) {
  std::lock_guard<std::mutex> lock(console_mutex);
  std::cout << line << std::endl;
}

void warn(const std::string &line) {
  std::lock_guard<std::mutex> lock(console_mutex);
  std::cerr << "Warning: " << line << std::endl;
}

void error(const std::string &line) {
  std::lock_guard<std::mutex> lock(console_mutex);
  std::cerr << "Error: " << line << std::endl;
}

// Raw page text for diagnosing parse failures
void dump(const std::string &text) {
  std::lock_guard<std::mutex> lock(console_mutex);
  std::cerr << text << std::endl;
}

} // namespace console
