#pragma once

#include "TypographyConfig.hpp"

#include <functional>
#include <string>

namespace typokit
{

/// Space classes introduced by the French rules.
enum class SpaceKind
{
    NarrowNoBreak, // U+202F, before ? ! ; : and inside numbers
    NoBreak,       // U+00A0, inside guillemets and incises
    Dialog         // U+2002, after a dialog dash at paragraph start
};

/// Maps a space class to its representation in a target format ("~", "&#160;").
using SpaceEscaper = std::function<std::string(SpaceKind)>;

/// The code point a space class stands for in display output.
[[nodiscard]] char32_t space_glyph(SpaceKind kind) noexcept;

/**
 * @brief French typographic spacing.
 *
 * The input is treated as one paragraph: index 0 is assumed to be the start
 * of a line (dialog dashes). Before spacing, the text is whitespace-normalized
 * and the punctuation cleaners and the quote classifier run according to the
 * configuration.
 *
 * Spaces the author already typed as no-break or fixed-width are kept, which
 * makes format() idempotent.
 */
class FrenchFormatter
{
public:
    explicit FrenchFormatter(TypographyConfig config = {});

    /// Display variant: inserts the space code points themselves.
    [[nodiscard]] std::string format(const std::string& text) const;

    /// Markup variant: every space the formatter introduces or replaces is
    /// rendered through @p escaper. The rest of the text is copied verbatim.
    [[nodiscard]] std::string formatMarkup(const std::string& text, const SpaceEscaper& escaper) const;

    [[nodiscard]] const TypographyConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::u32string prepare(const std::string& text) const;

    TypographyConfig config_;
};

[[nodiscard]] std::string format_french(const std::string& text, const TypographyConfig& config);
[[nodiscard]] std::string format_french_markup(const std::string& text, const TypographyConfig& config,
                                               const SpaceEscaper& escaper);

} // namespace typokit
