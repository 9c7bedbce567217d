#include <catch2/catch_test_macros.hpp>

#include "typokit/FormatEscaper.hpp"
#include "typokit/TextUtils.hpp"

#include <string>

using namespace typokit;

namespace
{
const std::string kNbsp = "\xC2\xA0";
const std::string kNnbsp = "\xE2\x80\xAF";
const std::string kEnSp = "\xE2\x80\x82";
} // namespace

TEST_CASE("escape_html", "[escape]") {
    REQUIRE(escape_html("<foo> & <bar>") == "&lt;foo&gt; &amp; &lt;bar&gt;");
    REQUIRE(escape_html("plain « text »") == "plain « text »");
    REQUIRE(escape_html("").empty());
}

TEST_CASE("escape_tex", "[escape]") {
    SECTION("Reserved characters") {
        REQUIRE(escape_tex("\\foo{bar}") == "\\textbackslash{}foo\\{bar\\}");
        REQUIRE(escape_tex("#2: 20%") == "\\#2: 20\\%");
        REQUIRE(escape_tex("a_b & $c$") == "a\\_b \\& \\$c\\$");
        REQUIRE(escape_tex("~^") == "\\textasciitilde{}\\textasciicircum{}");
    }

    SECTION("Brackets are grouped") {
        REQUIRE(escape_tex("foo[bar]") == "foo{[}bar{]}");
    }

    SECTION("Hyphen runs do not form ligatures") {
        REQUIRE(escape_tex("--foo, ---bar") == "-{}-foo, -{}-{}-bar");
        REQUIRE(escape_tex("single-hyphen") == "single-hyphen");
    }

    SECTION("Non-ASCII text is copied") {
        REQUIRE(escape_tex("été « ok »") == "été « ok »");
    }
}

TEST_CASE("escape_quotes", "[escape]") {
    REQUIRE(escape_quotes("say \"hi\"") == "say 'hi'");
}

TEST_CASE("escape_nb_spaces_tex", "[escape]") {
    REQUIRE(escape_nb_spaces_tex("a" + kNnbsp + "!") == "a\\,!");
    REQUIRE(escape_nb_spaces_tex("«" + kNbsp + "a" + kNbsp + "»") == "«~a~»");
    REQUIRE(escape_nb_spaces_tex("-" + kEnSp + "Oui") == "-\\enspace Oui");
    REQUIRE_THROWS_AS(escape_nb_spaces_tex("a\xC3"), InvalidUtf8Error);
}

TEST_CASE("escape_nb_spaces_html wraps narrow spaces", "[escape]") {
    SECTION("The token holding the narrow space is wrapped") {
        REQUIRE(escape_nb_spaces_html("Dit-il, bonjour" + kNnbsp + "! Oui.") ==
                "Dit-il, <span class = \"nnbsp\">bonjour&#160;!</span> Oui.");
    }

    SECTION("Text without narrow spaces is unchanged") {
        REQUIRE(escape_nb_spaces_html("a" + kNbsp + "b c") == "a" + kNbsp + "b c");
    }
}

TEST_CASE("Format escapers by name", "[escape]") {
    auto html = make_format_escaper("html");
    REQUIRE(html != nullptr);
    REQUIRE(html->name() == "html");
    REQUIRE(html->escape("<") == "&lt;");
    REQUIRE(html->escapeSpace(SpaceKind::NoBreak) == "&#160;");

    auto tex = make_format_escaper("latex");
    REQUIRE(tex != nullptr);
    REQUIRE(tex->name() == "tex");
    REQUIRE(tex->escape("%") == "\\%");
    REQUIRE(tex->escapeSpace(SpaceKind::NarrowNoBreak) == "\\,");
    REQUIRE(tex->escapeNbSpaces("a" + kNbsp + "b") == "a~b");

    REQUIRE(make_format_escaper("rtf") == nullptr);
}
