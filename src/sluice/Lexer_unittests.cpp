#include "sluice/Lexer.hpp"

#include "sluice/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace sluice {

TEST_CASE("Lexer Base Cases") {
    SUBCASE("empty string") {
        Lexer lexer("");
        REQUIRE(lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("whitespace only") {
        Lexer lexer("   \t\n\r  ");
        REQUIRE(lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("comments only") {
        Lexer lexer("// line comment\n/* block\ncomment */\n");
        REQUIRE(lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
}

TEST_CASE("Lexer Identifiers and Keywords") {
    SUBCASE("keywords") {
        const char* code = "interface readonly attribute optional static unsigned";
        Lexer lexer(code);
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 6);
        CHECK(lexer.tokens()[0].name == Token::Name::kInterface);
        CHECK(lexer.tokens()[0].range.data() == code);
        CHECK(lexer.tokens()[0].range.size() == 9);
        CHECK(lexer.tokens()[1].name == Token::Name::kReadonly);
        CHECK(lexer.tokens()[2].name == Token::Name::kAttribute);
        CHECK(lexer.tokens()[3].name == Token::Name::kOptional);
        CHECK(lexer.tokens()[4].name == Token::Name::kStatic);
        CHECK(lexer.tokens()[5].name == Token::Name::kUnsigned);
    }
    SUBCASE("type names are identifiers") {
        Lexer lexer("DOMString long Promise object");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 4);
        for (const auto& token : lexer.tokens()) {
            CHECK(token.name == Token::Name::kIdentifier);
        }
        CHECK(lexer.tokens()[0].range == "DOMString");
    }
    SUBCASE("keyword prefix is an identifier") {
        Lexer lexer("interfaces _readonly static2");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[0].range == "interfaces");
        CHECK(lexer.tokens()[1].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[2].name == Token::Name::kIdentifier);
    }
}

TEST_CASE("Lexer Punctuation") {
    Lexer lexer("{}()[]<>,;=?:");
    REQUIRE(lexer.lex());
    REQUIRE(lexer.tokens().size() == 13);
    CHECK(lexer.tokens()[0].name == Token::Name::kOpenCurly);
    CHECK(lexer.tokens()[1].name == Token::Name::kCloseCurly);
    CHECK(lexer.tokens()[2].name == Token::Name::kOpenParen);
    CHECK(lexer.tokens()[3].name == Token::Name::kCloseParen);
    CHECK(lexer.tokens()[4].name == Token::Name::kOpenSquare);
    CHECK(lexer.tokens()[5].name == Token::Name::kCloseSquare);
    CHECK(lexer.tokens()[6].name == Token::Name::kLessThan);
    CHECK(lexer.tokens()[7].name == Token::Name::kGreaterThan);
    CHECK(lexer.tokens()[8].name == Token::Name::kComma);
    CHECK(lexer.tokens()[9].name == Token::Name::kSemicolon);
    CHECK(lexer.tokens()[10].name == Token::Name::kAssign);
    CHECK(lexer.tokens()[11].name == Token::Name::kQuestion);
    CHECK(lexer.tokens()[12].name == Token::Name::kColon);
}

TEST_CASE("Lexer Numbers") {
    SUBCASE("integer") {
        Lexer lexer("42");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kNumber);
        CHECK(lexer.tokens()[0].range == "42");
    }
    SUBCASE("negative float with exponent") {
        Lexer lexer("-1.5e-3");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kNumber);
        CHECK(lexer.tokens()[0].range == "-1.5e-3");
    }
    SUBCASE("hexadecimal") {
        Lexer lexer("0x1F;");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].name == Token::Name::kNumber);
        CHECK(lexer.tokens()[0].range == "0x1F");
        CHECK(lexer.tokens()[1].name == Token::Name::kSemicolon);
    }
    SUBCASE("hexadecimal without digits") {
        Lexer lexer("0x");
        CHECK_FALSE(lexer.lex());
    }
    SUBCASE("number running into identifier") {
        Lexer lexer("12abc");
        CHECK_FALSE(lexer.lex());
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }
    SUBCASE("malformed exponent") {
        Lexer lexer("3e+");
        CHECK_FALSE(lexer.lex());
    }
}

TEST_CASE("Lexer Strings") {
    SUBCASE("string literal keeps quotes") {
        Lexer lexer("\"low-power\"");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kString);
        CHECK(lexer.tokens()[0].range == "\"low-power\"");
    }
    SUBCASE("unterminated string") {
        Lexer lexer("\n\"never closed");
        CHECK_FALSE(lexer.lex());
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].lineNumber == 2);
    }
}

TEST_CASE("Lexer Comments") {
    SUBCASE("comments between tokens") {
        Lexer lexer("a // trailing\n/* inner */ b");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].range == "a");
        CHECK(lexer.tokens()[1].range == "b");
        CHECK(lexer.tokens()[1].lineNumber == 2);
    }
    SUBCASE("unterminated block comment") {
        Lexer lexer("a /* no end");
        CHECK_FALSE(lexer.lex());
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kSyntax);
    }
    SUBCASE("lone slash") {
        Lexer lexer("a / b");
        CHECK_FALSE(lexer.lex());
    }
}

TEST_CASE("Lexer Line Numbers") {
    SUBCASE("tokens carry their line") {
        Lexer lexer("interface\nGPU\n\n{\r\n};");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 5);
        CHECK(lexer.tokens()[0].lineNumber == 1);
        CHECK(lexer.tokens()[1].lineNumber == 2);
        CHECK(lexer.tokens()[2].lineNumber == 4);
        CHECK(lexer.tokens()[3].lineNumber == 5);
        CHECK(lexer.tokens()[4].lineNumber == 5);
    }
    SUBCASE("block comment advances lines") {
        Lexer lexer("/*\n\n*/ x");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].lineNumber == 3);
    }
    SUBCASE("unexpected character reports its line") {
        auto reporter = std::make_shared<ErrorReporter>(true);
        Lexer lexer("interface GPU {\n  @\n};", reporter);
        CHECK_FALSE(lexer.lex());
        REQUIRE(reporter->errorCount() == 1);
        CHECK(reporter->errors()[0].kind == ErrorReporter::kSyntax);
        CHECK(reporter->errors()[0].lineNumber == 2);
    }
    SUBCASE("lexing twice gives the same tokens") {
        Lexer lexer("a\nb");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[1].lineNumber == 2);
    }
}

} // namespace sluice
