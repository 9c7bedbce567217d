#include "FormatEscaper.hpp"
#include "TextUtils.hpp"

namespace typokit
{

namespace
{

std::string texSpace(SpaceKind kind)
{
    switch (kind)
    {
    case SpaceKind::NarrowNoBreak:
        return "\\,";
    case SpaceKind::NoBreak:
        return "~";
    case SpaceKind::Dialog:
        return "\\enspace ";
    }
    return "~";
}

std::string htmlSpace(SpaceKind kind)
{
    switch (kind)
    {
    case SpaceKind::NarrowNoBreak:
        return "&#8239;";
    case SpaceKind::NoBreak:
        return "&#160;";
    case SpaceKind::Dialog:
        return "&#8194;";
    }
    return "&#160;";
}

} // anonymous namespace

// The reserved characters are ASCII, so a byte scan never touches the inside
// of a multi-byte sequence.
std::string escape_html(const std::string& text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 2);
    for (char c : text)
    {
        switch (c)
        {
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '&':
            out += "&amp;";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

std::string escape_tex(const std::string& text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 2);
    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        switch (c)
        {
        case '-':
            out += (i + 1 < text.size() && text[i + 1] == '-') ? "-{}" : "-";
            break;
        case '&':
            out += "\\&";
            break;
        case '%':
            out += "\\%";
            break;
        case '$':
            out += "\\$";
            break;
        case '#':
            out += "\\#";
            break;
        case '_':
            out += "\\_";
            break;
        case '{':
            out += "\\{";
            break;
        case '}':
            out += "\\}";
            break;
        case '[':
            out += "{[}";
            break;
        case ']':
            out += "{]}";
            break;
        case '~':
            out += "\\textasciitilde{}";
            break;
        case '^':
            out += "\\textasciicircum{}";
            break;
        case '<':
            out += "\\textless{}";
            break;
        case '>':
            out += "\\textgreater{}";
            break;
        case '!':
            out += "!{}";
            break;
        case '\\':
            out += "\\textbackslash{}";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

std::string escape_quotes(const std::string& text)
{
    std::string out = text;
    for (char& c : out)
    {
        if (c == '"')
            c = '\'';
    }
    return out;
}

std::string escape_nb_spaces_tex(const std::string& text)
{
    std::u32string buf = utf8ToUtf32(text);
    std::string out;
    out.reserve(text.size());
    for (char32_t c : buf)
    {
        if (c == kNarrowNoBreakSpace)
            out += texSpace(SpaceKind::NarrowNoBreak);
        else if (c == kNoBreakSpace)
            out += texSpace(SpaceKind::NoBreak);
        else if (c == kEnSpace)
            out += texSpace(SpaceKind::Dialog);
        else
            appendUtf8(out, c);
    }
    return out;
}

std::string escape_nb_spaces_html(const std::string& text)
{
    std::u32string buf = utf8ToUtf32(text);
    std::string out;
    out.reserve(text.size());

    auto in_token = [](char32_t c) { return c == kNarrowNoBreakSpace || !isWhitespace(c); };

    size_t i = 0;
    while (i < buf.size())
    {
        if (!in_token(buf[i]))
        {
            appendUtf8(out, buf[i++]);
            continue;
        }

        size_t end = i;
        bool has_narrow = false;
        for (; end < buf.size() && in_token(buf[end]); ++end)
            has_narrow = has_narrow || buf[end] == kNarrowNoBreakSpace;

        if (has_narrow)
            out += "<span class = \"nnbsp\">";
        for (size_t k = i; k < end; ++k)
        {
            if (buf[k] == kNarrowNoBreakSpace)
                out += "&#160;";
            else
                appendUtf8(out, buf[k]);
        }
        if (has_narrow)
            out += "</span>";
        i = end;
    }
    return out;
}

SpaceEscaper tex_space_escaper()
{
    return texSpace;
}

SpaceEscaper html_space_escaper()
{
    return htmlSpace;
}

std::string HtmlEscaper::escape(const std::string& text) const
{
    return escape_html(text);
}

std::string HtmlEscaper::escapeSpace(SpaceKind kind) const
{
    return htmlSpace(kind);
}

std::string HtmlEscaper::escapeNbSpaces(const std::string& text) const
{
    return escape_nb_spaces_html(text);
}

std::string TexEscaper::escape(const std::string& text) const
{
    return escape_tex(text);
}

std::string TexEscaper::escapeSpace(SpaceKind kind) const
{
    return texSpace(kind);
}

std::string TexEscaper::escapeNbSpaces(const std::string& text) const
{
    return escape_nb_spaces_tex(text);
}

std::unique_ptr<IFormatEscaper> make_format_escaper(std::string_view name)
{
    if (name == "html")
        return std::make_unique<HtmlEscaper>();
    if (name == "tex" || name == "latex")
        return std::make_unique<TexEscaper>();
    return nullptr;
}

} // namespace typokit
