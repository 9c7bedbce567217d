#pragma once

#include "FrenchFormatter.hpp"
#include "IFormatEscaper.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace typokit
{

// < > & -> &lt; &gt; &amp;
[[nodiscard]] std::string escape_html(const std::string& text);

// LaTeX special characters. A '-' followed by another '-' becomes "-{}" so
// that TeX does not build dash ligatures.
[[nodiscard]] std::string escape_tex(const std::string& text);

// '"' -> '\'', for attribute values
[[nodiscard]] std::string escape_quotes(const std::string& text);

// U+202F -> "\,", U+00A0 -> "~", U+2002 -> "\enspace ". Run after escape_tex,
// which would otherwise escape the '~'.
[[nodiscard]] std::string escape_nb_spaces_tex(const std::string& text);

// Wraps each token containing U+202F in <span class = "nnbsp">, the narrow
// space itself becoming &#160;, for browsers lacking the glyph.
[[nodiscard]] std::string escape_nb_spaces_html(const std::string& text);

/// Space escaper for format_french_markup producing LaTeX.
[[nodiscard]] SpaceEscaper tex_space_escaper();

/// Space escaper for format_french_markup producing HTML entities.
[[nodiscard]] SpaceEscaper html_space_escaper();

class HtmlEscaper : public IFormatEscaper
{
public:
    [[nodiscard]] std::string escape(const std::string& text) const override;
    [[nodiscard]] std::string escapeSpace(SpaceKind kind) const override;
    [[nodiscard]] std::string escapeNbSpaces(const std::string& text) const override;
    [[nodiscard]] std::string_view name() const override { return "html"; }
};

class TexEscaper : public IFormatEscaper
{
public:
    [[nodiscard]] std::string escape(const std::string& text) const override;
    [[nodiscard]] std::string escapeSpace(SpaceKind kind) const override;
    [[nodiscard]] std::string escapeNbSpaces(const std::string& text) const override;
    [[nodiscard]] std::string_view name() const override { return "tex"; }
};

/// "html", "tex" or "latex"; nullptr for anything else.
std::unique_ptr<IFormatEscaper> make_format_escaper(std::string_view name);

} // namespace typokit
