#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "token_stream.hpp"
#include "tokenizer.hpp"

using zappac::Token;
using zappac::TokenStream;
using zappac::TokenType;
using zappac::Tokenizer;

namespace {

std::vector<TokenType> typesOf(const std::vector<Token>& tokens) {
    std::vector<TokenType> types;
    for (const auto& token : tokens) {
        types.push_back(token.type);
    }
    return types;
}

std::vector<Token> lex(const std::string& input) {
    return Tokenizer(input).tokenize();
}

} // namespace

TEST(TokenizerTest, SimpleExpressionWithSpaces) {
    auto tokens = lex("1 + 2");

    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(typesOf(tokens), (std::vector<TokenType>{
        TokenType::Number, TokenType::Space, TokenType::Add, TokenType::Space, TokenType::Number, TokenType::End}));
    EXPECT_EQ(tokens[0].text, "1");
    EXPECT_EQ(tokens[2].position, 2u);
    EXPECT_EQ(tokens[4].text, "2");
    EXPECT_EQ(tokens[5].position, 5u);
}

TEST(TokenizerTest, WhitespaceRunCollapsesIntoOneSpace) {
    auto tokens = lex("1 \t\r\n 2");

    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].type, TokenType::Space);
    EXPECT_EQ(tokens[1].text, " ");
    EXPECT_EQ(tokens[2].position, 6u);
}

TEST(TokenizerTest, EmptyInputYieldsOnlyEnd) {
    auto tokens = lex("");

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::End);
    EXPECT_EQ(tokens[0].position, 0u);
}

TEST(TokenizerTest, VariableAssignment) {
    auto tokens = lex("$foo = 0xFF");

    EXPECT_EQ(typesOf(tokens), (std::vector<TokenType>{
        TokenType::Variable, TokenType::Space, TokenType::Equals, TokenType::Space, TokenType::Number, TokenType::End}));
    EXPECT_EQ(tokens[0].text, "$foo");
    EXPECT_EQ(tokens[4].text, "0xFF");
    EXPECT_EQ(tokens[4].position, 7u);
}

TEST(TokenizerTest, NumberLiterals) {
    for (const std::string literal : {"0", "7", "0.5", "12.25", "0x1f", "0X1F", "0755", "b101", "b0"}) {
        auto tokens = lex(literal);
        ASSERT_EQ(tokens.size(), 2u) << literal;
        EXPECT_EQ(tokens[0].type, TokenType::Number) << literal;
        EXPECT_EQ(tokens[0].text, literal);
    }
}

TEST(TokenizerTest, SecondDotEndsNumber) {
    auto tokens = lex("1.2.3");

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].text, "1.2");
    EXPECT_EQ(tokens[1].type, TokenType::Error);
    EXPECT_EQ(tokens[1].position, 3u);
}

TEST(TokenizerTest, MultiCharacterOperatorsWin) {
    auto tokens = lex("2**3//4<<1>>2*5/6");

    EXPECT_EQ(typesOf(tokens), (std::vector<TokenType>{
        TokenType::Number, TokenType::Exp, TokenType::Number, TokenType::Fdiv, TokenType::Number,
        TokenType::LShift, TokenType::Number, TokenType::RShift, TokenType::Number, TokenType::Mult,
        TokenType::Number, TokenType::Div, TokenType::Number, TokenType::End}));
}

TEST(TokenizerTest, AllSingleCharacterOperators) {
    auto tokens = lex("()=+-&|^~%");

    EXPECT_EQ(typesOf(tokens), (std::vector<TokenType>{
        TokenType::LParen, TokenType::RParen, TokenType::Equals, TokenType::Add, TokenType::Sub,
        TokenType::And, TokenType::Or, TokenType::Xor, TokenType::Inv, TokenType::Mod, TokenType::End}));
}

TEST(TokenizerTest, KeywordsAndText) {
    auto tokens = lex("abs save load clear dec hex bin oct profile_1");

    std::vector<TokenType> types;
    for (const auto& token : tokens) {
        if (token.type != TokenType::Space) {
            types.push_back(token.type);
        }
    }
    EXPECT_EQ(types, (std::vector<TokenType>{
        TokenType::Abs, TokenType::Save, TokenType::Load, TokenType::Clear, TokenType::Dec, TokenType::Hex,
        TokenType::Bin, TokenType::Oct, TokenType::Text, TokenType::Number, TokenType::End}));
}

TEST(TokenizerTest, BinaryPrefixNeedsBinaryDigit) {
    auto bin = lex("bin");
    ASSERT_EQ(bin.size(), 2u);
    EXPECT_EQ(bin[0].type, TokenType::Bin);

    auto number = lex("b1");
    ASSERT_EQ(number.size(), 2u);
    EXPECT_EQ(number[0].type, TokenType::Number);

    auto text = lex("bar");
    ASSERT_EQ(text.size(), 2u);
    EXPECT_EQ(text[0].type, TokenType::Text);
}

TEST(TokenizerTest, UnknownCharacterStopsScanning) {
    auto tokens = lex("1 @ 2");

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].type, TokenType::Error);
    EXPECT_EQ(tokens[2].position, 2u);
    EXPECT_NE(tokens[2].text.find("@"), std::string::npos);
}

TEST(TokenizerTest, UnknownMultibyteCharacterIsReportedWhole) {
    auto tokens = lex("1 + π");

    ASSERT_EQ(tokens.back().type, TokenType::Error);
    EXPECT_EQ(tokens.back().position, 4u);
    EXPECT_NE(tokens.back().text.find("π"), std::string::npos);
}

TEST(TokenizerTest, NextReturnsNothingAfterEnd) {
    Tokenizer tokenizer("1");

    ASSERT_TRUE(tokenizer.next().has_value());
    auto end = tokenizer.next();
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end->type, TokenType::End);
    EXPECT_FALSE(tokenizer.next().has_value());
    EXPECT_FALSE(tokenizer.next().has_value());
}

TEST(TokenizerTest, OutputKeywordsAreClassified) {
    for (auto type : {TokenType::Dec, TokenType::Hex, TokenType::Bin, TokenType::Oct}) {
        EXPECT_TRUE(zappac::isOutputToken(type));
    }
    EXPECT_FALSE(zappac::isOutputToken(TokenType::Abs));
    EXPECT_FALSE(zappac::isOutputToken(TokenType::Text));
}

TEST(TokenizerTest, DescribeToken) {
    EXPECT_EQ(zappac::describeToken({TokenType::Number, "12", 0}), "<Number>\"12\"");
    EXPECT_EQ(zappac::describeToken({TokenType::End, "", 3}), "EOF");
}

TEST(TokenStreamTest, DeliversSameTokensAsTokenizer) {
    const std::string input = "$foo = (1 + 2) ** 0x10";
    auto expected = lex(input);

    TokenStream stream(input);
    std::vector<Token> received;
    while (auto token = stream.next()) {
        received.push_back(*token);
    }

    ASSERT_EQ(received.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(received[i].type, expected[i].type);
        EXPECT_EQ(received[i].text, expected[i].text);
        EXPECT_EQ(received[i].position, expected[i].position);
    }
}

TEST(TokenStreamTest, StopsAfterError) {
    TokenStream stream("1 ? 2");

    std::vector<TokenType> types;
    while (auto token = stream.next()) {
        types.push_back(token->type);
    }
    EXPECT_EQ(types, (std::vector<TokenType>{TokenType::Number, TokenType::Space, TokenType::Error}));
}

TEST(TokenStreamTest, DestructorDrainsUnreadTokens) {
    for (int i = 0; i < 50; ++i) {
        TokenStream stream("1 + 2 + 3 + 4 + 5 + 6 + 7 + 8");
        auto first = stream.next();
        ASSERT_TRUE(first.has_value());
        EXPECT_EQ(first->text, "1");
    }
}
