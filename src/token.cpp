#include "token.hpp"

namespace zappac {

const char* tokenTypeName(TokenType type) {
    switch (type) {
    case TokenType::Error: return "Error";
    case TokenType::End: return "End";
    case TokenType::Equals: return "Equals";
    case TokenType::Space: return "Space";
    case TokenType::LParen: return "LParen";
    case TokenType::RParen: return "RParen";
    case TokenType::Number: return "Number";
    case TokenType::Variable: return "Variable";
    case TokenType::Add: return "Add";
    case TokenType::Sub: return "Sub";
    case TokenType::Mult: return "Mult";
    case TokenType::Exp: return "Exp";
    case TokenType::Div: return "Div";
    case TokenType::Fdiv: return "Fdiv";
    case TokenType::And: return "And";
    case TokenType::Or: return "Or";
    case TokenType::Xor: return "Xor";
    case TokenType::Inv: return "Inv";
    case TokenType::Mod: return "Mod";
    case TokenType::LShift: return "LShift";
    case TokenType::RShift: return "RShift";
    case TokenType::Text: return "Text";
    case TokenType::Abs: return "Abs";
    case TokenType::Save: return "Save";
    case TokenType::Load: return "Load";
    case TokenType::Clear: return "Clear";
    case TokenType::Dec: return "Dec";
    case TokenType::Hex: return "Hex";
    case TokenType::Bin: return "Bin";
    case TokenType::Oct: return "Oct";
    }
    return "Unknown";
}

bool isOperatorToken(TokenType type) {
    return type >= TokenType::Add && type <= TokenType::RShift;
}

bool isOutputToken(TokenType type) {
    return type == TokenType::Dec || type == TokenType::Hex ||
           type == TokenType::Bin || type == TokenType::Oct;
}

std::size_t utf8Length(char lead) {
    auto byte = static_cast<unsigned char>(lead);
    if ((byte & 0x80) == 0x00) return 1;
    if ((byte & 0xE0) == 0xC0) return 2;
    if ((byte & 0xF0) == 0xE0) return 3;
    if ((byte & 0xF8) == 0xF0) return 4;
    return 1;
}

std::string describeToken(const Token& token) {
    if (token.type == TokenType::End) {
        return "EOF";
    }
    if (token.type == TokenType::Error) {
        return token.text;
    }
    return std::string("<") + tokenTypeName(token.type) + ">\"" + token.text + "\"";
}

} // namespace zappac
