#include "PunctuationCleaner.hpp"
#include "TextUtils.hpp"

namespace typokit
{

namespace
{

size_t run_length(const std::u32string& text, size_t pos, char32_t c)
{
    size_t end = pos;
    while (end < text.size() && text[end] == c)
        ++end;
    return end - pos;
}

// Number of dots in a ". . ." sequence starting at pos: single periods
// separated by exactly one ordinary space.
size_t spaced_dots(const std::u32string& text, size_t pos)
{
    size_t count = 0;
    size_t i = pos;
    while (i < text.size() && text[i] == U'.' && run_length(text, i, U'.') == 1)
    {
        ++count;
        if (i + 2 < text.size() && text[i + 1] == U' ' && text[i + 2] == U'.')
            i += 2;
        else
            break;
    }
    return count;
}

} // anonymous namespace

std::u32string clean_ellipsis(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != U'.')
        {
            out.push_back(text[i++]);
            continue;
        }

        size_t run = run_length(text, i, U'.');
        if (run >= 3)
        {
            out.push_back(kEllipsis);
            i += run;
            continue;
        }

        bool continues_sequence = i >= 2 && text[i - 1] == U' ' && text[i - 2] == U'.';
        // only the first three dots of a longer spaced sequence are bound
        if (run == 1 && !continues_sequence && spaced_dots(text, i) >= 3)
        {
            out.push_back(U'.');
            out.push_back(kNoBreakSpace);
            out.push_back(U'.');
            out.push_back(kNoBreakSpace);
            out.push_back(U'.');
            i += 5;
            continue;
        }

        out.append(text, i, run);
        i += run;
    }

    return out;
}

std::u32string clean_dashes(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != U'-')
        {
            out.push_back(text[i++]);
            continue;
        }

        size_t run = run_length(text, i, U'-');
        i += run;
        if (run == 1)
        {
            out.push_back(U'-');
            continue;
        }

        out.append(run / 3, kEmDash);
        switch (run % 3)
        {
        case 2:
            out.push_back(kEnDash);
            break;
        case 1:
            out.push_back(U'-');
            break;
        default:
            break;
        }
    }

    return out;
}

std::u32string clean_guillemets(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        char32_t c = text[i];
        if ((c == U'<' || c == U'>') && i + 1 < text.size() && text[i + 1] == c)
        {
            out.push_back(c == U'<' ? kLeftGuillemet : kRightGuillemet);
            i += 2;
        }
        else
        {
            out.push_back(c);
            ++i;
        }
    }

    return out;
}

std::u32string clean_punctuation(const std::u32string& text, const TypographyConfig& config)
{
    std::u32string out = text;
    if (config.dashes)
        out = clean_dashes(out);
    if (config.guillemets)
        out = clean_guillemets(out);
    if (config.ellipsis)
        out = clean_ellipsis(out);
    return out;
}

std::string clean_ellipsis(const std::string& text)
{
    return utf32ToUtf8(clean_ellipsis(utf8ToUtf32(text)));
}

std::string clean_dashes(const std::string& text)
{
    return utf32ToUtf8(clean_dashes(utf8ToUtf32(text)));
}

std::string clean_guillemets(const std::string& text)
{
    return utf32ToUtf8(clean_guillemets(utf8ToUtf32(text)));
}

std::string clean_punctuation(const std::string& text, const TypographyConfig& config)
{
    return utf32ToUtf8(clean_punctuation(utf8ToUtf32(text), config));
}

} // namespace typokit
