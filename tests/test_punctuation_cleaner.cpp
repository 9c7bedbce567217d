#include <catch2/catch_test_macros.hpp>

#include "typokit/PunctuationCleaner.hpp"
#include "typokit/TextUtils.hpp"

#include <string>

using namespace typokit;

namespace
{
const std::string kNbsp = "\xC2\xA0";
}

TEST_CASE("clean_ellipsis", "[punctuation]") {
    SECTION("Three periods or more become one ellipsis") {
        REQUIRE(clean_ellipsis("Wait...") == "Wait…");
        REQUIRE(clean_ellipsis("Wait.... ok") == "Wait… ok");
    }

    SECTION("Spaced dots are bound with no-break spaces") {
        REQUIRE(clean_ellipsis(". . .") == "." + kNbsp + "." + kNbsp + ".");
        REQUIRE(clean_ellipsis("Hmm. . . yes") == "Hmm." + kNbsp + "." + kNbsp + ". yes");
    }

    SECTION("Longer spaced sequences bind their first three dots") {
        const std::string bound = "." + kNbsp + "." + kNbsp + ".";
        REQUIRE(clean_ellipsis(". . . .") == bound + " .");
        REQUIRE(clean_ellipsis("a . . . . . b") == "a " + bound + " . . b");
        REQUIRE(clean_ellipsis(clean_ellipsis(". . . .")) == bound + " .");
    }

    SECTION("One or two periods are kept") {
        REQUIRE(clean_ellipsis("End.") == "End.");
        REQUIRE(clean_ellipsis("a.. b") == "a.. b");
        REQUIRE(clean_ellipsis(". .") == ". .");
    }
}

TEST_CASE("clean_dashes", "[punctuation]") {
    SECTION("Double and triple hyphens") {
        REQUIRE(clean_dashes("a--b") == "a–b");
        REQUIRE(clean_dashes("a---b") == "a—b");
    }

    SECTION("Longer runs are consumed three at a time") {
        REQUIRE(clean_dashes("----") == "—-");
        REQUIRE(clean_dashes("-----") == "—–");
        REQUIRE(clean_dashes("------") == "——");
    }

    SECTION("A single hyphen is never touched") {
        REQUIRE(clean_dashes("a - b") == "a - b");
        REQUIRE(clean_dashes("porte-monnaie") == "porte-monnaie");
    }
}

TEST_CASE("clean_guillemets", "[punctuation]") {
    REQUIRE(clean_guillemets("<<Bonjour>>") == "«Bonjour»");
    REQUIRE(clean_guillemets("a < b > c") == "a < b > c");
    REQUIRE(clean_guillemets("<<<") == "«<");
}

TEST_CASE("clean_punctuation follows the configuration", "[punctuation]") {
    const std::string input = "<<a>> -- b...";

    SECTION("Defaults only clean the ellipsis") {
        TypographyConfig config;
        REQUIRE(clean_punctuation(input, config) == "<<a>> -- b…");
    }

    SECTION("Every rule enabled") {
        TypographyConfig config;
        config.dashes = true;
        config.guillemets = true;
        REQUIRE(clean_punctuation(input, config) == "«a» – b…");
    }

    SECTION("Every rule disabled is a pass-through") {
        TypographyConfig config;
        config.ellipsis = false;
        REQUIRE(clean_punctuation(input, config) == input);
    }

    SECTION("Malformed input throws") {
        TypographyConfig config;
        REQUIRE_THROWS_AS(clean_punctuation("abc\xE2\x80", config), InvalidUtf8Error);
    }
}

TEST_CASE("clean_punctuation is idempotent", "[punctuation]") {
    TypographyConfig config;
    config.dashes = true;
    config.guillemets = true;

    REQUIRE(clean_punctuation("Foo...", config) == "Foo…");
    REQUIRE(clean_punctuation("Foo....", config) == "Foo…");

    const std::string input = "<<Oui>> --- non -- peut-être. . . ou ----";
    std::string once = clean_punctuation(input, config);
    REQUIRE(clean_punctuation(once, config) == once);
}
