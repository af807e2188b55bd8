#pragma once

#include <string>

namespace ViewPane::Terminal {

// UTF-8 helpers for text spans. Width is measured in codepoints.
namespace Utf8 {

// Decode UTF-8 into codepoints. Malformed bytes decode to U+FFFD.
std::u32string Decode(const std::string& text);

// Encode codepoints as UTF-8.
std::string Encode(const std::u32string& text);
void AppendCodepoint(std::string& out, char32_t codepoint);

// Number of codepoints in a UTF-8 string
size_t Length(const std::string& text);

} // namespace Utf8

} // namespace ViewPane::Terminal
