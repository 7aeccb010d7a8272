#pragma once
#include "tokenizer.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Sample input and the expected output that goes with it
struct Example {
  std::string input;
  std::string output;

  bool operator==(const Example &other) const {
    return input == other.input && output == other.output;
  }
};

struct SampleNode {
  SampleNode(std::string tag, Attributes attrs)
      : tag(std::move(tag))
      , attrs(std::move(attrs)) {
  }
  // Frees the subtree without recursion; unclosed tags can nest arbitrarily deep
  ~SampleNode();

  std::string                              tag;
  Attributes                               attrs;
  std::vector<std::unique_ptr<SampleNode>> children;
  std::string                              data;
};

/**
 * Streaming builder for the sample tests block of a problem page.
 *
 * Only the subtree under a <div> whose class contains "sample" is kept.
 * Recording starts at that div and stops when the end tag that empties the
 * stack arrives; end tags pop the top node whatever their name is.
 */
class ProblemParser {
public:
  void feed(std::string_view html);
  void handleToken(const Token &token);

  // Throws StructuralAssertionError if the page has several sample blocks
  // or an odd number of <pre> blocks
  std::vector<Example> getExamples() const;

  size_t rootCount() const {
    return roots.size();
  }

  // End tags whose name differed from the node they closed
  size_t mismatchedEndTags() const {
    return mismatched_end_tags;
  }

private:
  bool                                     recording = false;
  std::vector<SampleNode *>                stack;
  std::unique_ptr<SampleNode>              open_root;
  std::vector<std::unique_ptr<SampleNode>> roots;
  size_t                                   mismatched_end_tags = 0;

  void handleStartTag(const StartTag &tag);
  void handleEndTag(const std::string &name);
  void handleData(const std::string &data);
};
