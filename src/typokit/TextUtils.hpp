#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace typokit
{

/// Thrown when a UTF-8 input cannot be decoded. The whole call fails; no
/// partial output is ever produced.
class InvalidUtf8Error : public std::runtime_error
{
public:
    explicit InvalidUtf8Error(std::size_t byte_offset);

    [[nodiscard]] std::size_t byteOffset() const noexcept { return byte_offset_; }

private:
    std::size_t byte_offset_;
};

/// UTF-8 to UTF-32 conversion. Throws InvalidUtf8Error on malformed input.
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Appends the UTF-8 encoding of a single code point
void appendUtf8(std::string& out, char32_t cp);

// Typographic code points produced by the engine
constexpr char32_t kNoBreakSpace = U'\u00A0';
constexpr char32_t kNarrowNoBreakSpace = U'\u202F';
constexpr char32_t kEnSpace = U'\u2002';
constexpr char32_t kEllipsis = U'\u2026';
constexpr char32_t kEnDash = U'\u2013';
constexpr char32_t kEmDash = U'\u2014';
constexpr char32_t kLeftGuillemet = U'\u00AB';
constexpr char32_t kRightGuillemet = U'\u00BB';
constexpr char32_t kLeftDoubleQuote = U'\u201C';
constexpr char32_t kRightDoubleQuote = U'\u201D';
constexpr char32_t kLeftSingleQuote = U'\u2018';
constexpr char32_t kRightSingleQuote = U'\u2019';
constexpr char32_t kApostrophe = kRightSingleQuote;

/// Space, tab, line breaks and the other spaces that allow a line break.
bool isBreakingWhitespace(char32_t cp);

/// No-break and fixed-width spaces whose presence is a typographic decision
/// (U+00A0, U+2002-U+200A, U+202F).
bool isFixedSpace(char32_t cp);

/// Either of the above.
bool isWhitespace(char32_t cp);

/// Letters, combining marks and numbers.
bool isWordChar(char32_t cp);

bool isLetter(char32_t cp);
bool isDigit(char32_t cp);
bool isUppercase(char32_t cp);
bool isLowercase(char32_t cp);
char32_t toLowercase(char32_t cp);

/// Ps, Pi and Pd categories: brackets, opening quotes, dashes.
bool isOpeningPunct(char32_t cp);

/// Pe and Pf categories: closing brackets and quotes.
bool isClosingPunct(char32_t cp);

} // namespace typokit
