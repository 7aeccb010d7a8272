#pragma once
#include <map>
#include <string>

class IniParser {
public:
  // Built-in defaults only
  IniParser() = default;
  IniParser(const std::string &filename);

  static IniParser fromString(const std::string &text);

  std::string get(const std::string &section, const std::string &key, const std::string &fallback) const;
  bool        has(const std::string &section, const std::string &key) const;

  std::string getBaseUrl() const;
  int         getNumThreads() const;
  std::string getOutputDir() const;
  bool        getDumpMarkupOnError() const;

  std::string getUserAgent() const;
  int         getConnectTimeout() const;
  int         getOperationTimeout() const;
  int         getMaxRedirects() const;
  bool        getVerifyCertificates() const;

private:
  std::map<std::string, std::map<std::string, std::string>> sections;

  void parse(std::istream &in);
  bool getBool(const std::string &section, const std::string &key, bool fallback) const;
  int  getInt(const std::string &section, const std::string &key, int fallback, int min_value) const;
  void trim(std::string &str) const;
};
