#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using Attributes = std::map<std::string, std::string>;

struct StartTag {
  std::string name;
  Attributes  attributes;
  bool        self_closing = false;
};

struct EndTag {
  std::string name;
};

struct Text {
  std::string data;
};

struct EntityRef {
  std::string   name;
  std::uint32_t codepoint;

  std::string text() const;
};

struct CharRef {
  std::uint32_t codepoint;
  bool          hex = false;

  std::string text() const;
};

using Token = std::variant<StartTag, EndTag, Text, EntityRef, CharRef>;

/**
 * Lazy event stream over a markup buffer. The buffer must outlive the
 * tokenizer. Tags are reported one by one without any balancing; tag and
 * attribute names are lower-cased. Comments, declarations and processing
 * instructions produce no tokens, and script/style bodies come out as a
 * single Text token.
 *
 * Throws ParseError on an unknown named entity or a malformed numeric
 * character reference in text content.
 */
class Tokenizer {
public:
  explicit Tokenizer(std::string_view markup);

  std::optional<Token> next();

  static std::vector<Token> tokenize(std::string_view markup);

private:
  std::string_view markup;
  size_t           pos = 0;
  std::string      raw_text_tag;

  std::optional<Token> readMarkup();
  Token                readStartTag();
  Token                readReference();
  Token                readText();
  size_t               findRawTextEnd() const;
  Token                takeRest();
};

// Decodes references inside an attribute value; unknown ones stay literal
std::string decode_attribute_value(std::string_view value);
