#include "problem_parser.hpp"
#include "../common/errors.hpp"
#include <stdexcept>
#include <type_traits>

namespace {

bool is_sample_container(const StartTag &tag) {
  if (tag.name != "div") {
    return false;
  }
  auto cls = tag.attributes.find("class");
  return cls != tag.attributes.end() && cls->second.find("sample") != std::string::npos;
}

// Pre-order over the subtree, not descending into <pre>
void collect_pre_blocks(const SampleNode &root, std::vector<std::string> &out) {
  std::vector<const SampleNode *> pending{&root};
  while (!pending.empty()) {
    const SampleNode *node = pending.back();
    pending.pop_back();

    if (node->tag == "pre") {
      out.push_back(node->data);
      continue;
    }
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
      pending.push_back(it->get());
    }
  }
}

} // namespace

SampleNode::~SampleNode() {
  std::vector<std::unique_ptr<SampleNode>> pending = std::move(children);
  while (!pending.empty()) {
    std::unique_ptr<SampleNode> node = std::move(pending.back());
    pending.pop_back();
    for (auto &child : node->children) {
      pending.push_back(std::move(child));
    }
    node->children.clear();
  }
}

void ProblemParser::feed(std::string_view html) {
  Tokenizer tokenizer(html);
  while (auto token = tokenizer.next()) {
    handleToken(*token);
  }
}

void ProblemParser::handleToken(const Token &token) {
  std::visit(
      [this](const auto &event) {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, StartTag>) {
          handleStartTag(event);
        } else if constexpr (std::is_same_v<T, EndTag>) {
          handleEndTag(event.name);
        } else if constexpr (std::is_same_v<T, Text>) {
          handleData(event.data);
        } else {
          handleData(event.text());
        }
      },
      token);
}

void ProblemParser::handleStartTag(const StartTag &tag) {
  if (!recording && !is_sample_container(tag)) {
    return;
  }
  recording = true;

  if (!stack.empty() && tag.name == "br") {
    stack.back()->data += '\n';
    return;
  }

  auto        node = std::make_unique<SampleNode>(tag.name, tag.attributes);
  SampleNode *raw  = node.get();
  if (stack.empty()) {
    open_root = std::move(node);
  } else {
    stack.back()->children.push_back(std::move(node));
  }
  stack.push_back(raw);

  // <tag/> closes itself
  if (tag.self_closing) {
    handleEndTag(tag.name);
  }
}

void ProblemParser::handleEndTag(const std::string &name) {
  if (!recording) {
    return;
  }
  if (stack.empty()) {
    throw std::logic_error("Sample stack is empty while recording");
  }

  if (stack.back()->tag != name) {
    ++mismatched_end_tags;
  }
  stack.pop_back();

  if (stack.empty()) {
    roots.push_back(std::move(open_root));
    recording = false;
  }
}

void ProblemParser::handleData(const std::string &data) {
  if (!recording) {
    return;
  }
  if (stack.empty()) {
    throw std::logic_error("Sample stack is empty while recording");
  }
  stack.back()->data += data;
}

std::vector<Example> ProblemParser::getExamples() const {
  if (roots.empty()) {
    return {};
  }

  if (roots.size() != 1) {
    throw StructuralAssertionError("Multiple sample roots found (" + std::to_string(roots.size()) + ")");
  }

  std::vector<std::string> pre_blocks;
  collect_pre_blocks(*roots.front(), pre_blocks);

  if (pre_blocks.size() % 2 != 0) {
    throw StructuralAssertionError("Odd number of preformatted blocks (" + std::to_string(pre_blocks.size()) + ")");
  }

  std::vector<Example> examples;
  for (size_t i = 0; i < pre_blocks.size(); i += 2) {
    examples.push_back({pre_blocks[i], pre_blocks[i + 1]});
  }
  return examples;
}
