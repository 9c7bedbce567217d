#include "TextUtils.hpp"
#include <utf8proc.h>

namespace typokit
{

InvalidUtf8Error::InvalidUtf8Error(std::size_t byte_offset)
    : std::runtime_error("invalid UTF-8 sequence at byte " + std::to_string(byte_offset))
    , byte_offset_(byte_offset)
{
}

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0 || codepoint < 0)
            throw InvalidUtf8Error(static_cast<std::size_t>(pos));
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

void appendUtf8(std::string& out, char32_t cp)
{
    utf8proc_uint8_t buffer[4];
    utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
    if (bytes > 0)
    {
        out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
    }
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        appendUtf8(result, cp);
    }
    return result;
}

namespace
{

utf8proc_category_t category(char32_t cp)
{
    return utf8proc_category(static_cast<utf8proc_int32_t>(cp));
}

} // anonymous namespace

bool isBreakingWhitespace(char32_t cp)
{
    switch (cp)
    {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case U'\x85':
    case U'\u1680':
    case U'\u2000':
    case U'\u2001':
    case U'\u2028':
    case U'\u2029':
    case U'\u205F':
    case U'\u3000':
        return true;
    default:
        return false;
    }
}

bool isFixedSpace(char32_t cp)
{
    return cp == kNoBreakSpace || cp == kNarrowNoBreakSpace || (cp >= U'\u2002' && cp <= U'\u200A');
}

bool isWhitespace(char32_t cp)
{
    return isBreakingWhitespace(cp) || isFixedSpace(cp);
}

bool isLetter(char32_t cp)
{
    switch (category(cp))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
        return true;
    default:
        return false;
    }
}

bool isDigit(char32_t cp)
{
    return category(cp) == UTF8PROC_CATEGORY_ND;
}

bool isWordChar(char32_t cp)
{
    switch (category(cp))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_MN:
    case UTF8PROC_CATEGORY_MC:
    case UTF8PROC_CATEGORY_ME:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

bool isUppercase(char32_t cp)
{
    return category(cp) == UTF8PROC_CATEGORY_LU;
}

bool isLowercase(char32_t cp)
{
    return category(cp) == UTF8PROC_CATEGORY_LL;
}

char32_t toLowercase(char32_t cp)
{
    return static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
}

bool isOpeningPunct(char32_t cp)
{
    switch (category(cp))
    {
    case UTF8PROC_CATEGORY_PS:
    case UTF8PROC_CATEGORY_PI:
    case UTF8PROC_CATEGORY_PD:
        return true;
    default:
        return false;
    }
}

bool isClosingPunct(char32_t cp)
{
    switch (category(cp))
    {
    case UTF8PROC_CATEGORY_PE:
    case UTF8PROC_CATEGORY_PF:
        return true;
    default:
        return false;
    }
}

} // namespace typokit
