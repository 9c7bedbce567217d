#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <string>

namespace typokit
{

namespace
{

std::u32string collapse_runs(const std::u32string& text, bool keep_fixed)
{
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        if (!isWhitespace(text[i]))
        {
            out.push_back(text[i++]);
            continue;
        }

        char32_t replacement = U' ';
        for (; i < text.size() && isWhitespace(text[i]); ++i)
        {
            if (keep_fixed && replacement == U' ' && isFixedSpace(text[i]))
                replacement = text[i];
        }
        out.push_back(replacement);
    }

    return out;
}

} // anonymous namespace

std::u32string normalize_whitespace(const std::u32string& text)
{
    return collapse_runs(text, false);
}

namespace detail
{

std::u32string collapse_whitespace_keeping_fixed(const std::u32string& text)
{
    return collapse_runs(text, true);
}

} // namespace detail

std::string normalize_whitespace(const std::string& text)
{
    if (text.empty())
        return text;
    return utf32ToUtf8(normalize_whitespace(utf8ToUtf32(text)));
}

std::string normalize_line_endings(const std::string& text)
{
    if (text.empty())
        return text;
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            if (i + 1 < text.size() && text[i + 1] == '\n')
            {
                // skip the '\r', '\n' pair and emit single '\n'
                out.push_back('\n');
                ++i;
            }
            else
            {
                out.push_back('\n');
            }
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::vector<std::string> split_paragraphs(const std::string& text)
{
    std::vector<std::string> paragraphs;
    std::string normalized = normalize_line_endings(text);

    std::string current;
    int consecutive_newlines = 0;
    auto flush = [&]()
    {
        while (!current.empty() && current.back() == '\n')
            current.pop_back();
        if (!current.empty())
            paragraphs.push_back(std::move(current));
        current.clear();
    };

    for (char c : normalized)
    {
        if (c == '\n')
        {
            consecutive_newlines++;
            if (consecutive_newlines == 2)
                flush();
            else if (consecutive_newlines < 2 && !current.empty())
                current += c;
        }
        else
        {
            consecutive_newlines = 0;
            current += c;
        }
    }
    flush();

    return paragraphs;
}

} // namespace typokit
