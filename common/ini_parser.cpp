#include "ini_parser.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

IniParser::IniParser(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file: " + filename);
  }
  parse(file);
}

IniParser IniParser::fromString(const std::string &text) {
  IniParser          config;
  std::istringstream in(text);
  config.parse(in);
  return config;
}

void IniParser::parse(std::istream &in) {
  std::string line;
  std::string currentSection;

  while (std::getline(in, line)) {
    trim(line);

    if (line.empty() || line[0] == ';' || line[0] == '#') {
      continue;
    }

    if (line[0] == '[' && line.back() == ']') {
      currentSection = line.substr(1, line.size() - 2);
      trim(currentSection);
      continue;
    }

    size_t pos = line.find('=');
    if (pos != std::string::npos) {
      std::string key   = line.substr(0, pos);
      std::string value = line.substr(pos + 1);

      trim(key);
      trim(value);

      sections[currentSection][key] = value;
    }
  }
}

void IniParser::trim(std::string &str) const {

  str.erase(0, str.find_first_not_of(" \t\r\n"));

  str.erase(str.find_last_not_of(" \t\r\n") + 1);
}

bool IniParser::has(const std::string &section, const std::string &key) const {
  auto it = sections.find(section);
  return it != sections.end() && it->second.count(key) != 0;
}

std::string IniParser::get(const std::string &section, const std::string &key, const std::string &fallback) const {
  if (!has(section, key)) {
    return fallback;
  }
  return sections.at(section).at(key);
}

int IniParser::getInt(const std::string &section, const std::string &key, int fallback, int min_value) const {
  if (!has(section, key)) {
    return fallback;
  }

  const std::string &raw = sections.at(section).at(key);
  int                value;
  size_t             used = 0;
  try {
    value = std::stoi(raw, &used);
  } catch (const std::exception &) {
    throw std::invalid_argument("Invalid integer for " + section + "." + key + ": " + raw);
  }
  if (used != raw.size() || value < min_value) {
    throw std::invalid_argument("Invalid value for " + section + "." + key + ": " + raw);
  }
  return value;
}

std::string IniParser::getBaseUrl() const {
  std::string url = get("scraper", "base_url", "http://codeforces.com");
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

int IniParser::getNumThreads() const {
  return getInt("scraper", "num_threads", 5, 1);
}

std::string IniParser::getOutputDir() const {
  return get("scraper", "output_dir", ".");
}

bool IniParser::getBool(const std::string &section, const std::string &key, bool fallback) const {
  if (!has(section, key)) {
    return fallback;
  }

  std::string value = boost::algorithm::to_lower_copy(sections.at(section).at(key));
  if (value == "true" || value == "yes" || value == "on" || value == "1") {
    return true;
  }
  if (value == "false" || value == "no" || value == "off" || value == "0") {
    return false;
  }
  throw std::invalid_argument("Invalid boolean for " + section + "." + key + ": " + value);
}

bool IniParser::getDumpMarkupOnError() const {
  return getBool("scraper", "dump_markup_on_error", true);
}

std::string IniParser::getUserAgent() const {
  return get("http", "user_agent", "Mozilla/5.0 (compatible; cf_scraper/1.0)");
}

int IniParser::getConnectTimeout() const {
  return getInt("http", "connect_timeout", 10, 1);
}

int IniParser::getOperationTimeout() const {
  return getInt("http", "operation_timeout", 30, 1);
}

int IniParser::getMaxRedirects() const {
  return getInt("http", "max_redirects", 5, 0);
}

bool IniParser::getVerifyCertificates() const {
  return getBool("http", "verify_certificates", true);
}
