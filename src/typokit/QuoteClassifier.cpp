#include "QuoteClassifier.hpp"
#include "TextUtils.hpp"

#include <string>
#include <utility>
#include <vector>

namespace typokit
{

namespace
{

// Neighbour ranks: an opening quote has a lower rank on its left than on its
// right, a closing quote the reverse.
enum Rank
{
    kSpace = 0,
    kPunct = 1,
    kWord = 2
};

constexpr size_t kNone = static_cast<size_t>(-1);

struct OpenQuote
{
    size_t position;
    size_t partner = kNone; // index of the quote reserved to close it
    bool closed = false;    // closed through its reserved partner, not yet popped
};

struct QuoteGlyphs
{
    char32_t straight;
    char32_t opening;
    char32_t closing;
};

constexpr QuoteGlyphs kDoubleGlyphs{ U'"', kLeftDoubleQuote, kRightDoubleQuote };
constexpr QuoteGlyphs kSingleGlyphs{ U'\'', kLeftSingleQuote, kRightSingleQuote };

// Stack of open quotes of one kind. An entry closed through its reserved
// partner may sit below the top; it is skipped once it surfaces, so back()
// is always a live entry.
class QuoteStack
{
public:
    bool empty() const { return entries_.empty(); }
    const OpenQuote& back() const { return entries_.back(); }
    size_t size() const { return entries_.size(); }

    size_t push(OpenQuote quote)
    {
        entries_.push_back(quote);
        return entries_.size() - 1;
    }

    // Pops the top and returns the partner it had reserved, if any
    size_t pop()
    {
        size_t partner = entries_.back().partner;
        entries_.pop_back();
        trim();
        return partner;
    }

    void close(size_t index)
    {
        entries_[index].closed = true;
        trim();
    }

private:
    void trim()
    {
        while (!entries_.empty() && entries_.back().closed)
            entries_.pop_back();
    }

    std::vector<OpenQuote> entries_;
};

// Scans once left to right. The lookahead questions ("next straight quote of
// this kind", "next plausible closing '") are answered from index arrays
// built in one right-to-left pass, so the whole classification is linear.
class QuoteScanner
{
public:
    QuoteScanner(const std::u32string& text, const TypographyConfig& config)
        : in_(text)
        , threshold_(config.threshold_quote)
        , next_double_(text.size(), kNone)
        , next_single_(text.size(), kNone)
        , next_single_closer_(text.size(), kNone)
        , reserved_by_(text.size(), kNone)
    {
        out_.reserve(in_.size());
        buildLookahead();
    }

    std::u32string run()
    {
        for (size_t i = 0; i < in_.size(); ++i)
        {
            char32_t c = in_[i];
            if (c == kDoubleGlyphs.straight)
                out_.push_back(classify(i, kDoubleGlyphs, open_doubles_, next_double_));
            else if (c == kSingleGlyphs.straight)
                out_.push_back(classify(i, kSingleGlyphs, open_singles_, next_single_));
            else
                out_.push_back(c);
        }
        return std::move(out_);
    }

private:
    // A plausible closing single quote: not preceded by a space, not followed
    // by a word character.
    bool isSingleCloser(size_t j) const
    {
        return in_[j] == kSingleGlyphs.straight && j > 0 && !isWhitespace(in_[j - 1]) &&
               (j + 1 >= in_.size() || !isWordChar(in_[j + 1]));
    }

    void buildLookahead()
    {
        size_t next_double = kNone;
        size_t next_single = kNone;
        size_t next_closer = kNone;
        for (size_t i = in_.size(); i-- > 0;)
        {
            next_double_[i] = next_double;
            next_single_[i] = next_single;
            next_single_closer_[i] = next_closer;
            if (in_[i] == kDoubleGlyphs.straight)
                next_double = i;
            else if (in_[i] == kSingleGlyphs.straight)
            {
                next_single = i;
                if (isSingleCloser(i))
                    next_closer = i;
            }
        }
    }

    // The left neighbour is read from the output so that a quote following a
    // quote already turned into an opening mark sees opening punctuation.
    int leftRank(size_t i) const
    {
        if (i == 0)
            return kSpace;
        char32_t c = out_[i - 1];
        if (isWhitespace(c) || isOpeningPunct(c))
            return kSpace;
        if (isWordChar(c) || isClosingPunct(c))
            return kWord;
        return kPunct;
    }

    int rightRank(size_t i) const
    {
        if (i + 1 >= in_.size())
            return kSpace;
        char32_t c = in_[i + 1];
        if (isWhitespace(c))
            return kSpace;
        if (isWordChar(c))
            return kWord;
        return kPunct;
    }

    bool isReserved(size_t position) const { return reserved_by_[position] != kNone; }

    void pushReserving(QuoteStack& stack, size_t position, size_t partner)
    {
        reserved_by_[partner] = stack.push({ position, partner });
    }

    void popInnermost(QuoteStack& stack)
    {
        size_t partner = stack.pop();
        if (partner != kNone)
            reserved_by_[partner] = kNone;
    }

    // Nearest unreserved quote of the same kind at most threshold_ ahead
    size_t findPartnerAhead(size_t from, const std::vector<size_t>& next_same) const
    {
        for (size_t j = next_same[from]; j != kNone && j - from <= threshold_; j = next_same[j])
        {
            if (!isReserved(j))
                return j;
        }
        return kNone;
    }

    char32_t classify(size_t i, const QuoteGlyphs& glyphs, QuoteStack& stack, const std::vector<size_t>& next_same)
    {
        const bool single = glyphs.straight == kSingleGlyphs.straight;

        if (size_t owner = reserved_by_[i]; owner != kNone)
        {
            reserved_by_[i] = kNone;
            stack.close(owner);
            return glyphs.closing;
        }

        const bool after_digit = i > 0 && isDigit(in_[i - 1]);
        const bool before_letter = i + 1 < in_.size() && isLetter(in_[i + 1]);
        if (after_digit && !before_letter && stack.empty())
            return glyphs.straight;

        const int left = leftRank(i);
        const int right = rightRank(i);

        if (single && left == kWord && right == kWord)
            return kApostrophe;

        if (left == kSpace && right == kSpace)
            return glyphs.straight;

        if (left < right)
        {
            if (!single)
            {
                stack.push({ i });
                return glyphs.opening;
            }

            size_t closer = next_single_closer_[i];
            if (closer != kNone && !isReserved(closer))
            {
                pushReserving(stack, i, closer);
                return glyphs.opening;
            }
            // 'tis, '60s: elision
            return kApostrophe;
        }

        if (left > right)
        {
            if (stack.empty())
                return glyphs.closing;

            const OpenQuote& innermost = stack.back();
            if (single && innermost.partner != kNone && innermost.partner > i)
                return kApostrophe;
            popInnermost(stack);
            return glyphs.closing;
        }

        if (!stack.empty() && stack.back().partner == kNone && i - stack.back().position <= threshold_)
        {
            popInnermost(stack);
            return glyphs.closing;
        }

        if (size_t partner = findPartnerAhead(i, next_same); partner != kNone)
        {
            pushReserving(stack, i, partner);
            return glyphs.opening;
        }

        return glyphs.straight;
    }

    const std::u32string& in_;
    size_t threshold_;
    std::u32string out_;

    std::vector<size_t> next_double_;
    std::vector<size_t> next_single_;
    std::vector<size_t> next_single_closer_;
    std::vector<size_t> reserved_by_; // stack slot of the open quote reserving this position

    QuoteStack open_doubles_;
    QuoteStack open_singles_;
};

} // anonymous namespace

std::u32string classify_quotes(const std::u32string& text, const TypographyConfig& config)
{
    return QuoteScanner(text, config).run();
}

std::string classify_quotes(const std::string& text, const TypographyConfig& config)
{
    return utf32ToUtf8(classify_quotes(utf8ToUtf32(text), config));
}

} // namespace typokit
