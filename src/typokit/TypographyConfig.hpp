#pragma once

#include <cstddef>

namespace typokit
{

// Options shared by every typography stage. Built once by the caller and
// passed by const reference into each call; stages never modify it.
struct TypographyConfig
{
    static constexpr std::size_t kDefaultThresholdQuote = 20;
    static constexpr std::size_t kDefaultThresholdCurrency = 3;
    static constexpr std::size_t kDefaultThresholdUnit = 2;
    static constexpr std::size_t kDefaultThresholdRealWord = 3;

    bool quotes = true;      // straight quotes -> directional quotes
    bool ellipsis = true;    // "..." -> U+2026
    bool guillemets = false; // "<<" / ">>" -> guillemets
    bool dashes = false;     // "--" / "---" -> en / em dash

    // Maximum distance, in code points, the quote classifier looks behind or
    // ahead for a partner of an ambiguous quote. 0 disables pairing.
    std::size_t threshold_quote = kDefaultThresholdQuote;

    // French number spacing: longest all-caps word taken as a currency code
    std::size_t threshold_currency = kDefaultThresholdCurrency;
    // French number spacing: longest lowercase word taken as a unit
    std::size_t threshold_unit = kDefaultThresholdUnit;
    // French incise dashes: longest capitalised word taken as an abbreviation
    std::size_t threshold_real_word = kDefaultThresholdRealWord;

    // French: full no-break space before ':' instead of a narrow one
    bool colon_full_space = false;

    bool operator==(const TypographyConfig&) const = default;
};

} // namespace typokit
