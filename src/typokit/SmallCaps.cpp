#include "SmallCaps.hpp"
#include "TextUtils.hpp"

namespace typokit
{

namespace
{

bool isIdentChar(char32_t c)
{
    return isWordChar(c) || c == U'_';
}

// End of a dotted acronym starting at i (A.W.D), or i when there is none.
size_t dottedAcronymEnd(const std::u32string& buf, size_t i)
{
    size_t last = i;
    size_t links = 0;
    while (last + 2 < buf.size() && buf[last + 1] == U'.' && isUppercase(buf[last + 2]))
    {
        last += 2;
        ++links;
    }
    if (links == 0)
        return i;

    size_t end = last + 1;
    if (end < buf.size() && isIdentChar(buf[end]))
    {
        // "A.Bc": fall back to the acronym ending at the previous letter
        if (links == 1)
            return i;
        end -= 2;
    }
    return end;
}

void appendSmallCaps(std::string& out, const std::u32string& buf, size_t begin, size_t end)
{
    out += "\\textsc{";
    for (size_t k = begin; k < end; ++k)
        appendUtf8(out, toLowercase(buf[k]));
    out += "}";
}

} // anonymous namespace

std::string caps_latex(const std::string& text)
{
    std::u32string buf = utf8ToUtf32(text);
    std::string out;
    out.reserve(text.size() + text.size() / 4);

    size_t i = 0;
    while (i < buf.size())
    {
        const bool at_boundary = i == 0 || !isIdentChar(buf[i - 1]);
        if (!at_boundary || !isUppercase(buf[i]))
        {
            appendUtf8(out, buf[i++]);
            continue;
        }

        size_t word_end = i;
        bool all_upper = true;
        for (; word_end < buf.size() && isIdentChar(buf[word_end]); ++word_end)
            all_upper = all_upper && isUppercase(buf[word_end]);

        if (all_upper && word_end - i >= 2)
        {
            appendSmallCaps(out, buf, i, word_end);
            i = word_end;
            continue;
        }

        if (word_end - i == 1)
        {
            size_t acronym_end = dottedAcronymEnd(buf, i);
            if (acronym_end != i)
            {
                appendSmallCaps(out, buf, i, acronym_end);
                i = acronym_end;
                continue;
            }
        }

        appendUtf8(out, buf[i++]);
    }
    return out;
}

} // namespace typokit
