#include <gtest/gtest.h>

#include <stdexcept>

#include "errors.hpp"
#include "node.hpp"

using namespace zappac;

TEST(NodeTest, NumberTextIsLowerCased) {
    NumberNode number(3, "0XFF", NumberSystem::Hex);

    EXPECT_EQ(number.value(), "0xff");
    EXPECT_EQ(number.position(), 3u);
    EXPECT_EQ(number.toDouble(), 255.0);
}

TEST(NodeTest, FromTextDetectsRadix) {
    EXPECT_EQ(NumberNode::fromText(0, "b11").system(), NumberSystem::Bin);
    EXPECT_EQ(NumberNode::fromText(0, "-0x1").system(), NumberSystem::Hex);
    EXPECT_EQ(NumberNode::fromText(0, "3.5").system(), NumberSystem::Dec);
}

TEST(NodeTest, MalformedNumberThrowsInvalidNumber) {
    NumberNode number(7, "0xzz", NumberSystem::Hex);

    try {
        number.toDouble();
        FAIL() << "ожидалось EvaluationError";
    }
    catch (const EvaluationError& error) {
        EXPECT_EQ(error.kind(), ErrorKind::InvalidNumber);
        EXPECT_EQ(error.text(), "0xzz");
        EXPECT_EQ(error.position(), 7u);
    }
}

TEST(NodeTest, OperatorTypeFollowsSymbol) {
    EXPECT_EQ(OperatorNode(0, "**").type(), NodeType::Exp);
    EXPECT_EQ(OperatorNode(0, "//").type(), NodeType::Fdiv);
    EXPECT_EQ(OperatorNode(0, ">>").type(), NodeType::RShift);
    EXPECT_THROW(OperatorNode(0, "?"), std::invalid_argument);
}

TEST(NodeTest, Classification) {
    EXPECT_TRUE(isValueNode(NodeType::Number));
    EXPECT_TRUE(isValueNode(NodeType::Variable));
    EXPECT_FALSE(isValueNode(NodeType::RParen));

    EXPECT_TRUE(isOperatorNode(NodeType::Add));
    EXPECT_TRUE(isOperatorNode(NodeType::RShift));
    EXPECT_FALSE(isOperatorNode(NodeType::Abs));

    EXPECT_TRUE(isPrefixNode(NodeType::Assign));
    EXPECT_TRUE(isPrefixNode(NodeType::SetOutput));
    EXPECT_FALSE(isPrefixNode(NodeType::Abs));

    EXPECT_TRUE(isFunctionNode(NodeType::Abs));
}

TEST(NodeTest, CanonicalText) {
    NodeList nodes = {
        makeNode<AssignNode>(0, "$a"),
        makeNode<SetOutputNode>(5, NumberSystem::Hex),
        makeNode<MarkerNode>(NodeType::LParen, 8),
        makeNode<NumberNode>(9, "1", NumberSystem::Dec),
        makeNode<OperatorNode>(11, "+"),
        makeNode<VariableNode>(13, "$b"),
        makeNode<MarkerNode>(NodeType::RParen, 15),
        makeNode<MarkerNode>(NodeType::End, 16),
    };

    EXPECT_EQ(describeNodes(nodes), "[$a = hex ( 1 + $b ) <end>]");
    EXPECT_EQ(DiskOperationNode(NodeType::Save, 0, "work").toString(), "save(work)");
    EXPECT_EQ(MarkerNode(NodeType::Clear, 0).toString(), "clear()");
}

TEST(NodeTest, IsOneOf) {
    MarkerNode node(NodeType::LParen, 0);

    EXPECT_TRUE(node.isOneOf({NodeType::Exp, NodeType::LParen}));
    EXPECT_FALSE(node.isOneOf({NodeType::Add, NodeType::Sub}));
}
