#include <catch2/catch_test_macros.hpp>

#include "typokit/QuoteClassifier.hpp"
#include "typokit/TextUtils.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <string>

using namespace typokit;

namespace
{
std::string classify(const std::string& text, std::size_t threshold = 20)
{
    TypographyConfig config;
    config.threshold_quote = threshold;
    return classify_quotes(text, config);
}

std::string repeat(const std::string& unit, std::size_t count)
{
    std::string out;
    out.reserve(unit.size() * count);
    for (std::size_t i = 0; i < count; ++i)
        out += unit;
    return out;
}

// Best of three runs, in microseconds
long long time_classify(const std::string& text)
{
    long long best = std::numeric_limits<long long>::max();
    for (int run = 0; run < 3; ++run)
    {
        auto start = std::chrono::steady_clock::now();
        std::string out = classify(text);
        auto elapsed = std::chrono::steady_clock::now() - start;
        REQUIRE(!out.empty());
        best = std::min<long long>(best, std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    }
    return std::max<long long>(best, 1);
}
} // namespace

TEST_CASE("Quotes in clear positions", "[quotes]") {
    SECTION("Double quotes around a word") {
        REQUIRE(classify("He said \"hello\" to me") == "He said “hello” to me");
    }

    SECTION("Single quotes and an apostrophe") {
        REQUIRE(classify("Un texte à 'formater', n'est-ce pas") == "Un texte à ‘formater’, n’est-ce pas");
    }

    SECTION("Nested quotes of different kinds") {
        REQUIRE(classify("\"She said 'hi' to me\"") == "“She said ‘hi’ to me”");
    }

    SECTION("Quotes inside brackets") {
        REQUIRE(classify("(\"quoted\")") == "(“quoted”)");
    }

    SECTION("Closing quote followed by punctuation") {
        REQUIRE(classify("\"Bonjour\", dit-il.") == "“Bonjour”, dit-il.");
    }
}

TEST_CASE("Apostrophes", "[quotes]") {
    SECTION("Inside a word") {
        REQUIRE(classify("don't") == "don’t");
        REQUIRE(classify("l'autre") == "l’autre");
    }

    SECTION("Leading elision without a closing partner") {
        REQUIRE(classify("'tis the season") == "’tis the season");
    }
}

TEST_CASE("Unit marks stay straight", "[quotes]") {
    REQUIRE(classify("a 12\" pizza") == "a 12\" pizza");
    REQUIRE(classify("he is 6'2\" tall") == "he is 6'2\" tall");
}

TEST_CASE("Undecidable quotes stay straight", "[quotes]") {
    SECTION("Surrounded by spaces") {
        REQUIRE(classify("a \" b") == "a \" b");
    }

    SECTION("Ambiguous pair within the threshold is paired") {
        REQUIRE(classify("a\"b\"c") == "a“b”c");
        REQUIRE(classify("a\"bcdef\"g") == "a“bcdef”g");
    }

    SECTION("Ambiguous pair beyond the threshold is left alone") {
        REQUIRE(classify("a\"bcdef\"g", 3) == "a\"bcdef\"g");
    }

    SECTION("A zero threshold never pairs ambiguous quotes") {
        REQUIRE(classify("a\"b\"c", 0) == "a\"b\"c");
    }

    SECTION("A zero threshold still classifies clear positions") {
        REQUIRE(classify("He said \"hello\" to me", 0) == "He said “hello” to me");
    }
}

TEST_CASE("Quote classification is idempotent", "[quotes]") {
    const std::string input = "\"She said 'hi'\", and l'autre said \"no\".";
    std::string once = classify(input);
    REQUIRE(classify(once) == once);
}

TEST_CASE("Text without quotes is unchanged", "[quotes]") {
    REQUIRE(classify("").empty());
    REQUIRE(classify("plain text, nothing to do.") == "plain text, nothing to do.");
}

TEST_CASE("Malformed input throws", "[quotes]") {
    REQUIRE_THROWS_AS(classify("\"abc\xC3\""), InvalidUtf8Error);
}

TEST_CASE("Double and single quotes pair independently", "[quotes]") {
    REQUIRE(classify("Some \"quoted string\" and 'another one'.") == "Some “quoted string” and ‘another one’.");
}

TEST_CASE("Quotes next to multi-byte characters", "[quotes]") {
    REQUIRE_NOTHROW(classify("«'é'» \"à\"ü 'ß"));
    REQUIRE(classify("«\"été\"»") == "«“été”»");
}

TEST_CASE("Harder quote and apostrophe mixes", "[quotes]") {
    SECTION("Quoted single characters") {
        REQUIRE(classify("'c', '4', '&'") == "‘c’, ‘4’, ‘&’");
    }

    SECTION("Decade elision with a later apostrophe") {
        REQUIRE(classify("The '60s … weren't") == "The ’60s … weren’t");
    }

    SECTION("Plural possessive") {
        REQUIRE(classify("Plurals'") == "Plurals’");
    }

    SECTION("Elision inside a single-quoted title") {
        REQUIRE(classify("\"I like 'That '70s show'\"") == "“I like ‘That ’70s show’”");
    }

    SECTION("Nested doubles inside singles inside doubles") {
        REQUIRE(classify("\"'Let's try \"nested\" quotes,' he said.\"")
                == "“‘Let’s try “nested” quotes,’ he said.”");
    }

    SECTION("Possessive right after a closing double quote") {
        REQUIRE(classify("\"quotes\"'s") == "“quotes”’s");
    }
}

TEST_CASE("Unbounded quote threshold", "[quotes]") {
    const std::size_t unbounded = std::numeric_limits<std::size_t>::max();

    SECTION("Adjacent ambiguous pair") {
        REQUIRE(classify("a\"b\"c", unbounded) == "a“b”c");
    }

    SECTION("Ambiguous pair far apart") {
        const std::string middle(500, 'b');
        REQUIRE(classify("a\"" + middle + "\"c", unbounded) == "a“" + middle + "”c");
    }
}

TEST_CASE("Classification time grows linearly", "[quotes][scaling]") {
    const std::string unit = " 'tis";
    const std::string small = repeat(unit, 5000);
    const std::string large = repeat(unit, 80000);

    REQUIRE(classify(large) == repeat(" ’tis", 80000));

    // 16 times the input: linear stays near 16, quadratic near 256
    long long small_us = time_classify(small);
    long long large_us = time_classify(large);
    REQUIRE(large_us < small_us * 80 + 20000);
}
