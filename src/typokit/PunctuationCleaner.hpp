#pragma once

#include "TypographyConfig.hpp"

#include <string>

namespace typokit
{

// "..." (or any longer run of periods) -> U+2026; ". . ." -> dots joined by
// no-break spaces.
[[nodiscard]] std::u32string clean_ellipsis(const std::u32string& text);
[[nodiscard]] std::string clean_ellipsis(const std::string& text);

// Runs of '-' are consumed three at a time as an em dash; a remaining pair
// becomes an en dash and a remaining single hyphen is kept ("----" -> em
// dash + hyphen). A lone '-' is never touched.
[[nodiscard]] std::u32string clean_dashes(const std::u32string& text);
[[nodiscard]] std::string clean_dashes(const std::string& text);

// "<<" -> U+00AB, ">>" -> U+00BB
[[nodiscard]] std::u32string clean_guillemets(const std::u32string& text);
[[nodiscard]] std::string clean_guillemets(const std::string& text);

// Applies the rules enabled in config (dashes, guillemets, ellipsis).
// Disabled rules are pass-through.
[[nodiscard]] std::u32string clean_punctuation(const std::u32string& text, const TypographyConfig& config);
[[nodiscard]] std::string clean_punctuation(const std::string& text, const TypographyConfig& config);

} // namespace typokit
