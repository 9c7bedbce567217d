#pragma once

#include <string>
#include <vector>

namespace typokit
{

// Collapses every run of whitespace, fixed spaces included, to one ordinary
// space without trimming
[[nodiscard]] std::string normalize_whitespace(const std::string& text);
[[nodiscard]] std::u32string normalize_whitespace(const std::u32string& text);

// Converts \r\n and \r to \n
[[nodiscard]] std::string normalize_line_endings(const std::string& text);

// Splits on blank lines; empty paragraphs are dropped
[[nodiscard]] std::vector<std::string> split_paragraphs(const std::string& text);

namespace detail
{

// Like normalize_whitespace, except that a run holding a no-break or
// fixed-width space keeps the first such space. Used by the French formatter
// so that spacing already present in the input survives.
[[nodiscard]] std::u32string collapse_whitespace_keeping_fixed(const std::u32string& text);

} // namespace detail

} // namespace typokit
