#include "tokenizer.hpp"
#include "../common/errors.hpp"
#include "entities.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <cctype>

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_alpha(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_alnum(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Stops a tag or attribute name
bool is_name_end(char c) {
  return is_space(c) || c == '/' || c == '>';
}

std::optional<std::uint32_t> parse_codepoint(std::string_view digits, bool hex) {
  if (digits.empty()) {
    return std::nullopt;
  }

  std::uint32_t value = 0;
  for (char c : digits) {
    unsigned digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (hex && c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (hex && c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      return std::nullopt;
    }
    value = value * (hex ? 16 : 10) + digit;
    if (value > 0x10FFFF) {
      return std::nullopt;
    }
  }

  if (!is_valid_codepoint(value)) {
    return std::nullopt;
  }
  return value;
}

size_t alnum_run_end(std::string_view text, size_t from) {
  while (from < text.size() && is_alnum(text[from])) {
    ++from;
  }
  return from;
}

} // namespace

std::string EntityRef::text() const {
  std::string out;
  append_utf8(out, codepoint);
  return out;
}

std::string CharRef::text() const {
  std::string out;
  append_utf8(out, codepoint);
  return out;
}

Tokenizer::Tokenizer(std::string_view markup)
    : markup(markup) {
}

std::vector<Token> Tokenizer::tokenize(std::string_view markup) {
  std::vector<Token> tokens;
  Tokenizer          tokenizer(markup);
  while (auto token = tokenizer.next()) {
    tokens.push_back(std::move(*token));
  }
  return tokens;
}

std::optional<Token> Tokenizer::next() {
  while (pos < markup.size()) {
    if (!raw_text_tag.empty()) {
      size_t end = findRawTextEnd();
      raw_text_tag.clear();
      if (end > pos) {
        Text text{std::string(markup.substr(pos, end - pos))};
        pos = end;
        return Token(std::move(text));
      }
      continue;
    }

    char c = markup[pos];
    if (c == '<') {
      if (auto token = readMarkup()) {
        return token;
      }
      continue;
    }
    if (c == '&') {
      return readReference();
    }
    return readText();
  }
  return std::nullopt;
}

Token Tokenizer::takeRest() {
  Text text{std::string(markup.substr(pos))};
  pos = markup.size();
  return text;
}

std::optional<Token> Tokenizer::readMarkup() {
  std::string_view rest = markup.substr(pos);

  if (rest.substr(0, 4) == "<!--") {
    size_t end = markup.find("-->", pos + 4);
    pos        = end == std::string_view::npos ? markup.size() : end + 3;
    return std::nullopt;
  }

  if (rest.substr(0, 2) == "<!" || rest.substr(0, 2) == "<?") {
    size_t end = markup.find('>', pos + 2);
    if (end == std::string_view::npos) {
      return takeRest();
    }
    pos = end + 1;
    return std::nullopt;
  }

  if (rest.substr(0, 2) == "</") {
    size_t start = pos + 2;
    if (start < markup.size() && is_alpha(markup[start])) {
      size_t end = start;
      while (end < markup.size() && !is_name_end(markup[end])) {
        ++end;
      }
      size_t close = markup.find('>', end);
      if (close == std::string_view::npos) {
        return takeRest();
      }
      EndTag tag{boost::algorithm::to_lower_copy(std::string(markup.substr(start, end - start)))};
      pos = close + 1;
      return Token(std::move(tag));
    }

    // "</>" and "</ ..." carry no end tag
    size_t close = markup.find('>', start);
    if (close == std::string_view::npos) {
      return takeRest();
    }
    pos = close + 1;
    return std::nullopt;
  }

  if (pos + 1 < markup.size() && is_alpha(markup[pos + 1])) {
    return readStartTag();
  }

  ++pos;
  return Token(Text{"<"});
}

Token Tokenizer::readStartTag() {
  size_t i = pos + 1;
  while (i < markup.size() && !is_name_end(markup[i])) {
    ++i;
  }

  StartTag tag;
  tag.name = boost::algorithm::to_lower_copy(std::string(markup.substr(pos + 1, i - pos - 1)));

  for (;;) {
    while (i < markup.size() && is_space(markup[i])) {
      ++i;
    }
    if (i >= markup.size()) {
      return takeRest();
    }
    if (markup[i] == '>') {
      ++i;
      break;
    }
    if (markup[i] == '/') {
      if (i + 1 < markup.size() && markup[i + 1] == '>') {
        tag.self_closing = true;
        i += 2;
        break;
      }
      ++i;
      continue;
    }

    size_t name_start = i++;
    while (i < markup.size() && !is_name_end(markup[i]) && markup[i] != '=') {
      ++i;
    }
    std::string name = boost::algorithm::to_lower_copy(std::string(markup.substr(name_start, i - name_start)));

    while (i < markup.size() && is_space(markup[i])) {
      ++i;
    }

    std::string value;
    if (i < markup.size() && markup[i] == '=') {
      ++i;
      while (i < markup.size() && is_space(markup[i])) {
        ++i;
      }
      if (i >= markup.size()) {
        return takeRest();
      }
      if (markup[i] == '"' || markup[i] == '\'') {
        size_t close = markup.find(markup[i], i + 1);
        if (close == std::string_view::npos) {
          return takeRest();
        }
        value = decode_attribute_value(markup.substr(i + 1, close - i - 1));
        i     = close + 1;
      } else {
        size_t value_start = i;
        while (i < markup.size() && !is_space(markup[i]) && markup[i] != '>') {
          ++i;
        }
        value = decode_attribute_value(markup.substr(value_start, i - value_start));
      }
    }

    tag.attributes[name] = std::move(value);
  }

  pos = i;
  if (!tag.self_closing && (tag.name == "script" || tag.name == "style")) {
    raw_text_tag = tag.name;
  }
  return tag;
}

size_t Tokenizer::findRawTextEnd() const {
  size_t from = pos;
  for (;;) {
    size_t candidate = markup.find("</", from);
    if (candidate == std::string_view::npos) {
      return markup.size();
    }

    size_t name_end = candidate + 2 + raw_text_tag.size();
    if (name_end <= markup.size() &&
        boost::algorithm::iequals(std::string(markup.substr(candidate + 2, raw_text_tag.size())), raw_text_tag) &&
        (name_end == markup.size() || is_name_end(markup[name_end]))) {
      return candidate;
    }
    from = candidate + 2;
  }
}

Token Tokenizer::readReference() {
  if (pos + 1 < markup.size() && markup[pos + 1] == '#') {
    size_t start = pos + 2;
    bool   hex   = start < markup.size() && (markup[start] == 'x' || markup[start] == 'X');
    if (hex) {
      ++start;
    }

    size_t           end    = alnum_run_end(markup, start);
    std::string_view digits = markup.substr(start, end - start);
    auto             value  = parse_codepoint(digits, hex);
    if (!value) {
      throw ParseError("Malformed character reference &#" + std::string(hex ? "x" : "") + std::string(digits) + ";");
    }

    pos = end;
    if (pos < markup.size() && markup[pos] == ';') {
      ++pos;
    }
    return CharRef{*value, hex};
  }

  if (pos + 1 < markup.size() && is_alpha(markup[pos + 1])) {
    size_t end = alnum_run_end(markup, pos + 1);
    if (end < markup.size() && markup[end] == ';') {
      std::string name(markup.substr(pos + 1, end - pos - 1));
      auto        codepoint = lookup_entity(name);
      if (!codepoint) {
        throw ParseError("Unrecognized HTML entity &" + name + ";");
      }
      pos = end + 1;
      return EntityRef{name, *codepoint};
    }
  }

  // A bare ampersand is ordinary text
  ++pos;
  return Text{"&"};
}

Token Tokenizer::readText() {
  size_t end = markup.find_first_of("<&", pos);
  if (end == std::string_view::npos) {
    end = markup.size();
  }
  Text text{std::string(markup.substr(pos, end - pos))};
  pos = end;
  return text;
}

std::string decode_attribute_value(std::string_view value) {
  std::string out;
  out.reserve(value.size());

  size_t i = 0;
  while (i < value.size()) {
    if (value[i] != '&') {
      out += value[i++];
      continue;
    }

    if (i + 1 < value.size() && value[i + 1] == '#') {
      size_t start = i + 2;
      bool   hex   = start < value.size() && (value[start] == 'x' || value[start] == 'X');
      if (hex) {
        ++start;
      }
      size_t end = alnum_run_end(value, start);
      if (auto codepoint = parse_codepoint(value.substr(start, end - start), hex)) {
        append_utf8(out, *codepoint);
        i = end < value.size() && value[end] == ';' ? end + 1 : end;
        continue;
      }
    } else if (i + 1 < value.size() && is_alpha(value[i + 1])) {
      size_t end = alnum_run_end(value, i + 1);
      if (end < value.size() && value[end] == ';') {
        if (auto codepoint = lookup_entity(std::string(value.substr(i + 1, end - i - 1)))) {
          append_utf8(out, *codepoint);
          i = end + 1;
          continue;
        }
      }
    }

    out += value[i++];
  }
  return out;
}
