#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Named character reference lookup; the table is built once and never modified
std::optional<std::uint32_t> lookup_entity(const std::string &name);

// Appends the UTF-8 encoding of a Unicode scalar value
void append_utf8(std::string &out, std::uint32_t codepoint);

bool is_valid_codepoint(std::uint32_t codepoint);
