#include <string>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

TEST(lexing, testNextToken)
{
    using enum token_type;
    auto lxr = lexer {R"r(let five = 5;
let ten = 10;
let add = fn(x, y) {
x + y;
};
!-/*5;
5 < 10 > 5;
if (5 < 10) {
return true;
} else {
return false;
}
10 == 10;
10 != 9;
foo_bar
)r"};
    auto expected_tokens = std::vector<token> {
        token {let, "let"},       token {ident, "five"},     token {assign, "="},       token {integer, "5"},
        token {semicolon, ";"},   token {let, "let"},        token {ident, "ten"},      token {assign, "="},
        token {integer, "10"},    token {semicolon, ";"},    token {let, "let"},        token {ident, "add"},
        token {assign, "="},      token {function, "fn"},    token {lparen, "("},       token {ident, "x"},
        token {comma, ","},       token {ident, "y"},        token {rparen, ")"},       token {lsquirly, "{"},
        token {ident, "x"},       token {plus, "+"},         token {ident, "y"},        token {semicolon, ";"},
        token {rsquirly, "}"},    token {semicolon, ";"},    token {exclamation, "!"},  token {minus, "-"},
        token {slash, "/"},       token {asterisk, "*"},     token {integer, "5"},      token {semicolon, ";"},
        token {integer, "5"},     token {less_than, "<"},    token {integer, "10"},     token {greater_than, ">"},
        token {integer, "5"},     token {semicolon, ";"},    token {eef, "if"},         token {lparen, "("},
        token {integer, "5"},     token {less_than, "<"},    token {integer, "10"},     token {rparen, ")"},
        token {lsquirly, "{"},    token {ret, "return"},     token {tru, "true"},       token {semicolon, ";"},
        token {rsquirly, "}"},    token {elze, "else"},      token {lsquirly, "{"},     token {ret, "return"},
        token {fals, "false"},    token {semicolon, ";"},    token {rsquirly, "}"},     token {integer, "10"},
        token {equals, "=="},     token {integer, "10"},     token {semicolon, ";"},    token {integer, "10"},
        token {not_equals, "!="}, token {integer, "9"},      token {semicolon, ";"},    token {ident, "foo_bar"},
        token {eof, ""},
    };
    for (const auto& expected_token : expected_tokens) {
        auto token = lxr.next_token();
        ASSERT_EQ(token, expected_token);
    }
}

TEST(lexing, testIllegalCharacters)
{
    using enum token_type;
    auto lxr = lexer {"a @ 1 $"};
    auto expected_tokens = std::vector<token> {
        token {ident, "a"},
        token {illegal, "@"},
        token {integer, "1"},
        token {illegal, "$"},
        token {eof, ""},
    };
    for (const auto& expected_token : expected_tokens) {
        ASSERT_EQ(lxr.next_token(), expected_token);
    }
}

TEST(lexing, testIllegalMultiByteCharacter)
{
    using enum token_type;
    auto lxr = lexer {"\xc3\xa9"};
    ASSERT_EQ(lxr.next_token(), (token {illegal, "\xc3\xa9"}));
    ASSERT_EQ(lxr.next_token(), (token {eof, ""}));

    lxr = lexer {"x \xe2\x82\xac \x80 1"};
    auto expected_tokens = std::vector<token> {
        token {ident, "x"},
        token {illegal, "\xe2\x82\xac"},
        token {illegal, "\x80"},
        token {integer, "1"},
        token {eof, ""},
    };
    for (const auto& expected_token : expected_tokens) {
        ASSERT_EQ(lxr.next_token(), expected_token);
    }
}

TEST(lexing, testEofIsSticky)
{
    auto lxr = lexer {"x"};
    ASSERT_EQ(lxr.next_token(), (token {token_type::ident, "x"}));
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(lxr.next_token(), (token {token_type::eof, ""}));
    }
}

TEST(lexing, testEmptyAndBlankInput)
{
    for (const auto* input : {"", " \t\r\n  "}) {
        auto lxr = lexer {input};
        ASSERT_EQ(lxr.next_token().type, token_type::eof) << "input: `" << input << "`";
    }
}

TEST(lexing, testSingleCharacterFallback)
{
    using enum token_type;
    auto lxr = lexer {"=!<=>==!=!"};
    auto expected_tokens = std::vector<token> {
        token {assign, "="},
        token {exclamation, "!"},
        token {less_than, "<"},
        token {assign, "="},
        token {greater_than, ">"},
        token {equals, "=="},
        token {not_equals, "!="},
        token {exclamation, "!"},
        token {eof, ""},
    };
    for (const auto& expected_token : expected_tokens) {
        ASSERT_EQ(lxr.next_token(), expected_token);
    }
}

TEST(lexing, testTokenTypeDisplayNames)
{
    using enum token_type;
    EXPECT_EQ(fmt::format("{}", ident), "IDENT");
    EXPECT_EQ(fmt::format("{}", integer), "INT");
    EXPECT_EQ(fmt::format("{}", assign), "=");
    EXPECT_EQ(fmt::format("{}", semicolon), ";");
    EXPECT_EQ(fmt::format("{}", not_equals), "!=");
    EXPECT_EQ(fmt::format("{}", eof), "EOF");
    EXPECT_EQ(fmt::format("{}", illegal), "ILLEGAL");
}
