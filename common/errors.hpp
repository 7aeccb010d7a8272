#pragma once
#include <stdexcept>
#include <string>

// Transport failure or unusable response while retrieving a page
class FetchError : public std::runtime_error {
public:
  FetchError(const std::string &url, const std::string &what)
      : std::runtime_error(what + " for " + url)
      , url_(url) {
  }

  const std::string &url() const {
    return url_;
  }

private:
  std::string url_;
};

// Markup that the tokenizer refuses to interpret
class ParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Page shape does not match what the sample extractor assumes
class StructuralAssertionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
