#include "FrenchFormatter.hpp"
#include "PunctuationCleaner.hpp"
#include "QuoteClassifier.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace typokit
{

namespace
{

constexpr char32_t kDegree = U'\u00B0';

bool isDashChar(char32_t c) { return c == kEmDash || c == kEnDash || c == U'-'; }

bool isHighPunctuation(char32_t c) { return c == U'?' || c == U'!' || c == U';' || c == U':'; }

// Spacing decisions for one paragraph, indexed by code point:
// replace[i] turns the space at i into a space class, insert[i] puts one
// before the character at i.
struct SpacingPlan
{
    std::vector<std::optional<SpaceKind>> replace;
    std::vector<std::optional<SpaceKind>> insert;
};

class SpacingPlanner
{
public:
    SpacingPlanner(const std::u32string& text, const TypographyConfig& config)
        : buf_(text)
        , config_(config)
    {
        plan_.replace.resize(buf_.size());
        plan_.insert.resize(buf_.size());
    }

    SpacingPlan run()
    {
        planNumbers();
        for (size_t i = 0; i < buf_.size(); ++i)
        {
            char32_t c = buf_[i];
            if (isHighPunctuation(c))
                planHighPunctuation(i);
            else if (c == kLeftGuillemet)
                planOpeningGuillemet(i);
            else if (c == kRightGuillemet)
                planClosingGuillemet(i);
            else if (isDashChar(c))
                planDash(i);
        }
        return std::move(plan_);
    }

private:
    // "10 000", "50 km", "20 F", "10 000 EUR"
    void planNumbers()
    {
        bool in_number = false;
        for (size_t i = 0; i + 1 < buf_.size(); ++i)
        {
            char32_t c = buf_[i];
            if (isDigit(c))
            {
                if (i == 0 || !isLetter(buf_[i - 1]))
                    in_number = true;
            }
            else if (isWhitespace(c))
            {
                if (in_number && c == U' ' && (isDigit(buf_[i + 1]) || isUnitSymbol(i + 1)))
                    plan_.replace[i] = SpaceKind::NarrowNoBreak;
            }
            else
            {
                in_number = false;
            }
        }
    }

    size_t letterRun(size_t i) const
    {
        size_t end = i;
        while (end < buf_.size() && isLetter(buf_[end]))
            ++end;
        return end - i;
    }

    bool isUnitSymbol(size_t i) const
    {
        char32_t c = buf_[i];
        const bool next_is_letter = i + 1 < buf_.size() && isLetter(buf_[i + 1]);
        if (!next_is_letter)
        {
            if (isLetter(c))
                return isUppercase(c);
            return !isWhitespace(c) && !isOpeningPunct(c);
        }

        if (c == kDegree)
            return true;
        if (!isLetter(c))
            return false;

        size_t len = letterRun(i);
        if (isUppercase(c))
        {
            if (len > config_.threshold_currency)
                return false;
            for (size_t k = i; k < i + len; ++k)
            {
                if (!isUppercase(buf_[k]))
                    return false;
            }
            return true;
        }
        return len <= config_.threshold_unit;
    }

    void planHighPunctuation(size_t i)
    {
        if (i == 0)
            return;

        char32_t c = buf_[i];
        SpaceKind kind = (c == U':' && config_.colon_full_space) ? SpaceKind::NoBreak : SpaceKind::NarrowNoBreak;

        char32_t prev = buf_[i - 1];
        if (prev == U' ')
        {
            plan_.replace[i - 1] = kind;
            return;
        }
        if (isWhitespace(prev) || isOpeningPunct(prev))
            return;
        // ?!, ;:
        if (isHighPunctuation(prev))
            return;

        if (i + 1 < buf_.size())
        {
            char32_t next = buf_[i + 1];
            if (isWordChar(next))
                return;
            // 12:30, http://
            if (c == U':' && !isWhitespace(next))
                return;
        }
        plan_.insert[i] = kind;
    }

    void planOpeningGuillemet(size_t i)
    {
        if (i + 1 >= buf_.size())
            return;
        char32_t next = buf_[i + 1];
        if (next == U' ')
            plan_.replace[i + 1] = SpaceKind::NoBreak;
        else if (!isWhitespace(next))
            plan_.insert[i + 1] = SpaceKind::NoBreak;
    }

    void planClosingGuillemet(size_t i)
    {
        if (i == 0)
            return;
        char32_t prev = buf_[i - 1];
        if (prev == U' ')
            plan_.replace[i - 1] = SpaceKind::NoBreak;
        else if (!isWhitespace(prev))
            plan_.insert[i] = SpaceKind::NoBreak;
    }

    void planDash(size_t i)
    {
        if (i + 1 >= buf_.size() || buf_[i + 1] != U' ')
            return;
        // a hyphen only counts as a dash when it stands alone
        if (buf_[i] == U'-' && i > 0 && !isWhitespace(buf_[i - 1]))
            return;

        if (i <= 1)
        {
            plan_.replace[i + 1] = SpaceKind::Dialog;
            return;
        }

        // closing dash of an incise already bound to its text
        if (buf_[i - 1] == kNoBreakSpace || plan_.replace[i - 1] == SpaceKind::NoBreak)
            return;

        plan_.replace[i + 1] = SpaceKind::NoBreak;
        if (auto closing = findClosingDash(i + 1); closing && buf_[*closing] == U' ')
            plan_.replace[*closing] = SpaceKind::NoBreak;
    }

    bool nextLetterIsUppercase(size_t from) const
    {
        for (size_t k = from; k < buf_.size(); ++k)
        {
            if (isWhitespace(buf_[k]))
                continue;
            if (isUppercase(buf_[k]))
                return true;
            if (isLowercase(buf_[k]))
                return false;
        }
        return false;
    }

    // Position of the space before the dash closing an incise, unless the
    // sentence ends first. "M. Dupuis" does not end a sentence.
    std::optional<size_t> findClosingDash(size_t from) const
    {
        std::u32string word;
        for (size_t j = from; j < buf_.size(); ++j)
        {
            char32_t c = buf_[j];
            if (c == U'!' || c == U'?')
            {
                if (nextLetterIsUppercase(j + 1))
                    return std::nullopt;
            }
            else if (isDashChar(c))
            {
                if (isWhitespace(buf_[j - 1]))
                    return j - 1;
            }
            else if (c == U'.')
            {
                if (!nextLetterIsUppercase(j + 1) || word.empty())
                    continue;
                if (!isUppercase(word.front()) || word.size() > config_.threshold_real_word)
                    return std::nullopt;
            }
            else if (isWhitespace(c))
            {
                word.clear();
            }
            else
            {
                word.push_back(c);
            }
        }
        return std::nullopt;
    }

    const std::u32string& buf_;
    const TypographyConfig& config_;
    SpacingPlan plan_;
};

} // anonymous namespace

char32_t space_glyph(SpaceKind kind) noexcept
{
    switch (kind)
    {
    case SpaceKind::NarrowNoBreak:
        return kNarrowNoBreakSpace;
    case SpaceKind::NoBreak:
        return kNoBreakSpace;
    case SpaceKind::Dialog:
        return kEnSpace;
    }
    return kNoBreakSpace;
}

FrenchFormatter::FrenchFormatter(TypographyConfig config)
    : config_(config)
{
}

std::u32string FrenchFormatter::prepare(const std::string& text) const
{
    std::u32string buf = detail::collapse_whitespace_keeping_fixed(utf8ToUtf32(text));
    if (config_.dashes)
        buf = clean_dashes(buf);
    if (config_.guillemets)
        buf = clean_guillemets(buf);
    if (config_.quotes)
        buf = classify_quotes(buf, config_);
    if (config_.ellipsis)
        buf = clean_ellipsis(buf);
    return buf;
}

std::string FrenchFormatter::format(const std::string& text) const
{
    std::u32string buf = prepare(text);
    SpacingPlan plan = SpacingPlanner(buf, config_).run();

    std::u32string out;
    out.reserve(buf.size() + buf.size() / 8);
    for (size_t i = 0; i < buf.size(); ++i)
    {
        if (plan.insert[i])
            out.push_back(space_glyph(*plan.insert[i]));
        out.push_back(plan.replace[i] ? space_glyph(*plan.replace[i]) : buf[i]);
    }
    return utf32ToUtf8(out);
}

std::string FrenchFormatter::formatMarkup(const std::string& text, const SpaceEscaper& escaper) const
{
    std::u32string buf = prepare(text);
    SpacingPlan plan = SpacingPlanner(buf, config_).run();

    std::string out;
    out.reserve(text.size() + text.size() / 4);
    for (size_t i = 0; i < buf.size(); ++i)
    {
        if (plan.insert[i])
            out += escaper(*plan.insert[i]);
        if (plan.replace[i])
            out += escaper(*plan.replace[i]);
        else
            appendUtf8(out, buf[i]);
    }
    return out;
}

std::string format_french(const std::string& text, const TypographyConfig& config)
{
    return FrenchFormatter(config).format(text);
}

std::string format_french_markup(const std::string& text, const TypographyConfig& config, const SpaceEscaper& escaper)
{
    return FrenchFormatter(config).formatMarkup(text, escaper);
}

} // namespace typokit
