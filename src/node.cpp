#include "node.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include "errors.hpp"

namespace zappac {

namespace {

const std::unordered_map<std::string, NodeType> kOperators = {
    {"+", NodeType::Add},
    {"-", NodeType::Sub},
    {"*", NodeType::Mult},
    {"**", NodeType::Exp},
    {"/", NodeType::Div},
    {"//", NodeType::Fdiv},
    {"&", NodeType::And},
    {"|", NodeType::Or},
    {"^", NodeType::Xor},
    {"~", NodeType::Inv},
    {"%", NodeType::Mod},
    {"<<", NodeType::LShift},
    {">>", NodeType::RShift},
};

NodeType operatorType(const std::string& op) {
    auto found = kOperators.find(op);
    if (found == kOperators.end()) {
        throw std::invalid_argument("Неизвестный оператор: " + op);
    }
    return found->second;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

} // namespace

const char* nodeTypeName(NodeType type) {
    switch (type) {
    case NodeType::Assign: return "Assign";
    case NodeType::LParen: return "LParen";
    case NodeType::RParen: return "RParen";
    case NodeType::Number: return "Number";
    case NodeType::Variable: return "Variable";
    case NodeType::Add: return "Add";
    case NodeType::Sub: return "Sub";
    case NodeType::Mult: return "Mult";
    case NodeType::Exp: return "Exp";
    case NodeType::Div: return "Div";
    case NodeType::Fdiv: return "Fdiv";
    case NodeType::And: return "And";
    case NodeType::Or: return "Or";
    case NodeType::Xor: return "Xor";
    case NodeType::Inv: return "Inv";
    case NodeType::Mod: return "Mod";
    case NodeType::LShift: return "LShift";
    case NodeType::RShift: return "RShift";
    case NodeType::Abs: return "Abs";
    case NodeType::SetOutput: return "SetOutput";
    case NodeType::Save: return "Save";
    case NodeType::Load: return "Load";
    case NodeType::Clear: return "Clear";
    case NodeType::End: return "End";
    case NodeType::ParsingStopped: return "ParsingStopped";
    }
    return "Unknown";
}

bool isValueNode(NodeType type) {
    return type == NodeType::Number || type == NodeType::Variable;
}

bool isOperatorNode(NodeType type) {
    return type >= NodeType::Add && type <= NodeType::RShift;
}

bool isPrefixNode(NodeType type) {
    return type == NodeType::LParen || type == NodeType::SetOutput || type == NodeType::Assign;
}

bool isFunctionNode(NodeType type) {
    return type == NodeType::Abs || type == NodeType::SetOutput;
}

bool Node::isOneOf(std::initializer_list<NodeType> types) const {
    return std::find(types.begin(), types.end(), nodeType) != types.end();
}

NumberNode::NumberNode(std::size_t position, std::string value, NumberSystem system)
    : Node(NodeType::Number, position), text(toLower(std::move(value))), numberSystem(system) {}

NumberNode NumberNode::fromText(std::size_t position, std::string value) {
    NumberSystem system = detectNumberSystem(value);
    return NumberNode(position, std::move(value), system);
}

double NumberNode::toDouble() const {
    auto parsed = parseNumber(text, numberSystem);
    if (!parsed) {
        throw EvaluationError(ErrorKind::InvalidNumber,
                              "некорректное число " + text + " (" + numberSystemName(numberSystem) + ")",
                              text, position());
    }
    return *parsed;
}

OperatorNode::OperatorNode(std::size_t position, const std::string& op)
    : Node(operatorType(op), position), op(op) {}

std::string DiskOperationNode::toString() const {
    return std::string(is(NodeType::Save) ? "save" : "load") + "(" + profileName + ")";
}

std::string MarkerNode::toString() const {
    switch (type()) {
    case NodeType::LParen:
        return "(";
    case NodeType::RParen:
        return ")";
    case NodeType::Abs:
        return "abs";
    case NodeType::Clear:
        return "clear()";
    case NodeType::End:
        return "<end>";
    case NodeType::ParsingStopped:
        return "<parsing stopped>";
    default:
        return nodeTypeName(type());
    }
}

std::string describeNodes(const NodeList& nodes) {
    std::string result = "[";
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) {
            result += ' ';
        }
        result += nodes[i]->toString();
    }
    result += ']';
    return result;
}

} // namespace zappac
