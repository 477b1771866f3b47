#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parser.hpp"

using namespace zappac;

namespace {

std::vector<NodeType> typesOf(const ParseResult& result) {
    std::vector<NodeType> types;
    for (const auto& node : result.nodes) {
        types.push_back(node->type());
    }
    return types;
}

std::vector<std::string> textsOf(const ParseResult& result) {
    std::vector<std::string> texts;
    for (const auto& node : result.nodes) {
        texts.push_back(node->toString());
    }
    return texts;
}

// Разбирает строку, которая должна завершиться ошибкой
ParseError parseFailure(const std::string& input) {
    ParseResult result = parse(input);
    EXPECT_FALSE(result.ok()) << input;
    EXPECT_FALSE(result.nodes.empty());
    if (!result.nodes.empty()) {
        EXPECT_TRUE(result.nodes.back()->is(NodeType::ParsingStopped)) << input;
    }
    if (!result.error) {
        return ParseError(ErrorKind::Internal, "нет ошибки", "", 0);
    }
    return *result.error;
}

} // namespace

TEST(ParserTest, EmptyLineIsJustEnd) {
    for (const std::string input : {"", "   "}) {
        ParseResult result = parse(input);
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(typesOf(result), std::vector<NodeType>{NodeType::End});
    }
}

TEST(ParserTest, Subtraction) {
    ParseResult result = parse("2 - 1");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(typesOf(result), (std::vector<NodeType>{NodeType::Number, NodeType::Sub, NodeType::Number, NodeType::End}));
    EXPECT_EQ(textsOf(result), (std::vector<std::string>{"2", "-", "1", "<end>"}));
}

TEST(ParserTest, NegativeLiteralAfterOperator) {
    ParseResult result = parse("2 + -1");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(typesOf(result), (std::vector<NodeType>{NodeType::Number, NodeType::Add, NodeType::Number, NodeType::End}));
    EXPECT_EQ(textsOf(result)[2], "-1");
    EXPECT_EQ(result.nodes[2]->position(), 4u);
}

TEST(ParserTest, NegativeLiteralsOnBothSides) {
    ParseResult result = parse("-1 - -2");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(textsOf(result), (std::vector<std::string>{"-1", "-", "-2", "<end>"}));
}

TEST(ParserTest, NegativeLiteralKeepsRadix) {
    ParseResult result = parse("-0xff");

    ASSERT_TRUE(result.ok());
    const auto& number = static_cast<const NumberNode&>(*result.nodes[0]);
    EXPECT_EQ(number.value(), "-0xff");
    EXPECT_EQ(number.system(), NumberSystem::Hex);
}

TEST(ParserTest, NegativeLiteralAfterPrefixes) {
    EXPECT_TRUE(parse("abs(-3)").ok());
    EXPECT_TRUE(parse("$a = -3").ok());
    EXPECT_TRUE(parse("2 ** -1").ok());
    EXPECT_TRUE(parse("(-1)").ok());
}

TEST(ParserTest, MinusBeforeVariableIsNotFused) {
    ParseError error = parseFailure("-$foo");

    EXPECT_EQ(error.kind(), ErrorKind::Syntax);
    EXPECT_EQ(error.text(), "-");
    EXPECT_EQ(error.position(), 0u);
}

TEST(ParserTest, NestedParentheses) {
    ParseResult result = parse("(1+2)*((3-4)*5)");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.nodes.size(), 16u);
    EXPECT_TRUE(result.nodes.back()->is(NodeType::End));
}

TEST(ParserTest, NumbersAreLowerCased) {
    ParseResult result = parse("0XFF + 1");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.nodes[0]->toString(), "0xff");
}

TEST(ParserTest, Assignment) {
    ParseResult result = parse("$foo = 1");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(typesOf(result), (std::vector<NodeType>{NodeType::Assign, NodeType::Number, NodeType::End}));
    EXPECT_EQ(static_cast<const AssignNode&>(*result.nodes[0]).target(), "$foo");
}

TEST(ParserTest, EqualsOnlyAfterLeadingVariable) {
    EXPECT_EQ(parseFailure("1 = 2").text(), "=");
    EXPECT_EQ(parseFailure("$a + $b = 1").text(), "=");
    EXPECT_EQ(parseFailure("= 1").kind(), ErrorKind::Syntax);
}

TEST(ParserTest, OutputSetter) {
    ParseResult result = parse("hex(255)");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(typesOf(result), (std::vector<NodeType>{
        NodeType::SetOutput, NodeType::LParen, NodeType::Number, NodeType::RParen, NodeType::End}));
    EXPECT_EQ(static_cast<const SetOutputNode&>(*result.nodes[0]).system(), NumberSystem::Hex);
}

TEST(ParserTest, EachOutputKeywordMapsToItsRadix) {
    EXPECT_EQ(static_cast<const SetOutputNode&>(*parse("dec 1").nodes[0]).system(), NumberSystem::Dec);
    EXPECT_EQ(static_cast<const SetOutputNode&>(*parse("hex 1").nodes[0]).system(), NumberSystem::Hex);
    EXPECT_EQ(static_cast<const SetOutputNode&>(*parse("bin 1").nodes[0]).system(), NumberSystem::Bin);
    EXPECT_EQ(static_cast<const SetOutputNode&>(*parse("oct 1").nodes[0]).system(), NumberSystem::Oct);
}

TEST(ParserTest, OutputSetterOnlyAtStart) {
    ParseError error = parseFailure("1 + hex(2)");

    EXPECT_EQ(error.kind(), ErrorKind::Syntax);
    EXPECT_EQ(error.text(), "hex");
    EXPECT_EQ(error.position(), 4u);
}

TEST(ParserTest, ClosingParenthesisWithoutOpening) {
    ParseError error = parseFailure("1 + 2)");

    EXPECT_EQ(error.kind(), ErrorKind::Syntax);
    EXPECT_EQ(error.text(), ")");
    EXPECT_EQ(error.position(), 5u);

    EXPECT_EQ(parseFailure(")").kind(), ErrorKind::Syntax);
}

TEST(ParserTest, UnclosedParenthesisAtEnd) {
    EXPECT_EQ(parseFailure("(1 + 2").kind(), ErrorKind::UnexpectedEnd);
    EXPECT_EQ(parseFailure("((1)").kind(), ErrorKind::UnexpectedEnd);
}

TEST(ParserTest, DanglingOperatorAtEnd) {
    ParseError error = parseFailure("1 +");

    EXPECT_EQ(error.kind(), ErrorKind::UnexpectedEnd);
    EXPECT_EQ(error.position(), 3u);
    EXPECT_EQ(parseFailure("$a =").kind(), ErrorKind::UnexpectedEnd);
    EXPECT_EQ(parseFailure("abs").kind(), ErrorKind::UnexpectedEnd);
}

TEST(ParserTest, AdjacentValuesAreRejected) {
    EXPECT_EQ(parseFailure("2 3").text(), "3");
    EXPECT_EQ(parseFailure("$a $b").text(), "$b");
    EXPECT_EQ(parseFailure("(1)(2)").text(), "(");
    EXPECT_EQ(parseFailure("1 abs(2)").text(), "abs");
}

TEST(ParserTest, OperatorNeedsLeftValue) {
    EXPECT_EQ(parseFailure("* 2").position(), 0u);
    EXPECT_EQ(parseFailure("1 + * 2").text(), "*");
    EXPECT_EQ(parseFailure("(+ 1)").text(), "+");
}

TEST(ParserTest, LexicalErrorCarriesCharacterAndPosition) {
    ParseResult result = parse("1 @ 2");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind(), ErrorKind::Lexical);
    EXPECT_EQ(result.error->text(), "@");
    EXPECT_EQ(result.error->position(), 2u);
    ASSERT_EQ(result.nodes.size(), 2u);
    EXPECT_EQ(result.nodes.back()->position(), 1u);
}

TEST(ParserTest, BareTextIsRejected) {
    ParseError error = parseFailure("foo");

    EXPECT_EQ(error.kind(), ErrorKind::Syntax);
    EXPECT_EQ(error.text(), "foo");
}

TEST(ParserTest, Clear) {
    for (const std::string input : {"clear()", " clear ( ) "}) {
        ParseResult result = parse(input);
        ASSERT_TRUE(result.ok()) << input;
        EXPECT_EQ(typesOf(result), (std::vector<NodeType>{NodeType::Clear, NodeType::End}));
    }
}

TEST(ParserTest, ClearMustBeWholeLine) {
    ParseError trailing = parseFailure("clear()1");
    EXPECT_NE(std::string(trailing.what()).find("clear()"), std::string::npos);

    EXPECT_EQ(parseFailure("1 + clear()").text(), "clear");
    EXPECT_EQ(parseFailure("clear").kind(), ErrorKind::Syntax);
}

TEST(ParserTest, SaveAndLoad) {
    ParseResult save = parse("save(work)");
    ASSERT_TRUE(save.ok());
    EXPECT_EQ(typesOf(save), (std::vector<NodeType>{NodeType::Save, NodeType::End}));
    EXPECT_EQ(static_cast<const DiskOperationNode&>(*save.nodes[0]).profile(), "work");

    ParseResult load = parse("load(work)");
    ASSERT_TRUE(load.ok());
    EXPECT_EQ(load.nodes[0]->type(), NodeType::Load);
}

TEST(ParserTest, SaveWithTrailingTextNamesCanonicalForm) {
    ParseError error = parseFailure("save(x)y");

    EXPECT_EQ(error.kind(), ErrorKind::Syntax);
    EXPECT_NE(std::string(error.what()).find("save(name)"), std::string::npos);
}

TEST(ParserTest, TruncatedVerbNamesCanonicalForm) {
    ParseError error = parseFailure("load(");

    EXPECT_NE(std::string(error.what()).find("load(name)"), std::string::npos);
    EXPECT_EQ(parseFailure("save()").text(), "save");
    EXPECT_EQ(parseFailure("save(1)").text(), "save");
}

TEST(ParserTest, AbsTakesParenthesisedGroup) {
    ParseResult result = parse("2 * abs(-3)");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(typesOf(result), (std::vector<NodeType>{
        NodeType::Number, NodeType::Mult, NodeType::Abs, NodeType::LParen, NodeType::Number,
        NodeType::RParen, NodeType::End}));
}

TEST(ParserTest, ParserCanBeReused) {
    Parser parser("1 + 2");

    ParseResult first = parser.parse();
    ParseResult second = parser.parse();
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.nodes.size(), second.nodes.size());
}
