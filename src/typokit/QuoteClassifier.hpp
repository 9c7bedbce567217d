#pragma once

#include "TypographyConfig.hpp"

#include <string>

namespace typokit
{

/**
 * @brief Replaces straight quotes (`"` and `'`) with directional quotation marks.
 *
 * Single left-to-right pass. Each quote is classified from its neighbours:
 * - opening position (space or opening punctuation before, word after) opens;
 * - closing position (word or closing punctuation before, space or
 *   punctuation after) closes;
 * - a `'` inside a word is an apostrophe (U+2019);
 * - a quote right after a digit with no quote of its kind open is a unit
 *   mark (`12" pizza`, `6'2"`) and stays straight;
 * - otherwise the quote is ambiguous and is paired with an open quote at
 *   most `config.threshold_quote` code points behind, or with the nearest
 *   free quote at most that far ahead. Failing that it stays straight:
 *   a straight quote is preferred over a wrong direction.
 *
 * Double and single quotes are tracked independently. Only
 * `config.threshold_quote` is read; `config.quotes` is the caller's switch.
 */
[[nodiscard]] std::u32string classify_quotes(const std::u32string& text, const TypographyConfig& config);
[[nodiscard]] std::string classify_quotes(const std::string& text, const TypographyConfig& config);

} // namespace typokit
