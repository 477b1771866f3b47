#include "parser.hpp"

#include <utility>

namespace zappac {

namespace {

NumberSystem outputSystem(TokenType type) {
    switch (type) {
    case TokenType::Hex:
        return NumberSystem::Hex;
    case TokenType::Bin:
        return NumberSystem::Bin;
    case TokenType::Oct:
        return NumberSystem::Oct;
    default:
        return NumberSystem::Dec;
    }
}

} // namespace

Parser::Parser(std::string sourceText) : source(std::move(sourceText)) {}

// Запуск процесса парсинга.
// Поток токенов всегда дочитывается до конца, даже после ошибки.
ParseResult Parser::parse() {
    tokens.clear();
    nodes.clear();
    current = 0;
    parenthesisDepth = 0;
    lastTokenEnd = 0;
    endReached = false;

    ParseResult result;
    stream = std::make_unique<TokenStream>(source);
    try {
        readNodes();
    }
    catch (const ParseError& error) {
        result.error = error;
    }
    stream.reset();

    if (!result.error && (nodes.empty() || !nodes.back()->is(NodeType::End))) {
        result.error = ParseError(ErrorKind::Internal, "внутренняя ошибка разбора", "", lastTokenEnd);
    }
    if (result.error) {
        nodes.push_back(makeNode<MarkerNode>(NodeType::ParsingStopped, lastTokenEnd));
    }

    result.nodes = std::move(nodes);
    nodes.clear();
    return result;
}

std::optional<Token> Parser::nextToken() {
    // Токен уже был просмотрен через peekToken()
    if (current < tokens.size()) {
        return tokens[current++];
    }
    if (endReached) {
        return std::nullopt;
    }

    while (auto token = stream->next()) {
        // Пробелы для разбора значения не имеют
        if (token->type == TokenType::Space) {
            continue;
        }

        if (token->type == TokenType::End) {
            endReached = true;
            if (parenthesisDepth > 0) {
                throw ParseError(ErrorKind::UnexpectedEnd,
                                 "неожиданный конец ввода: остались незакрытые скобки",
                                 "", token->position);
            }
            return std::nullopt;
        }

        if (token->type == TokenType::Error) {
            std::string offending = source.substr(token->position, utf8Length(source[token->position]));
            throw ParseError(ErrorKind::Lexical,
                             token->text + " на позиции " + std::to_string(token->position),
                             offending, token->position);
        }

        tokens.push_back(*token);
        ++current;
        return token;
    }

    // Лексер всегда завершает поток токеном End или Error
    throw ParseError(ErrorKind::Internal, "поток токенов оборвался без End", "", source.size());
}

std::optional<Token> Parser::peekToken() {
    std::size_t saved = current;
    auto token = nextToken();

    // Откатываемся, чтобы следующий nextToken() вернул этот же токен
    current = saved;
    return token;
}

void Parser::readNodes() {
    while (true) {
        auto token = nextToken();

        if (!token) {
            // Конец ввода: последний узел должен завершать выражение
            if (!nodes.empty() && !isValueNode(left().type()) && !left().is(NodeType::RParen)) {
                throw ParseError(ErrorKind::UnexpectedEnd, "неожиданный конец ввода",
                                 left().toString(), source.size());
            }
            nodes.push_back(makeNode<MarkerNode>(NodeType::End, source.size()));
            return;
        }
        lastTokenEnd = token->end();

        switch (token->type) {
        case TokenType::Equals:
            parseEquals(*token);
            break;
        case TokenType::Variable:
            parseVariable(*token);
            break;
        case TokenType::Number:
            parseNumber(*token);
            break;
        case TokenType::Clear:
        case TokenType::Save:
        case TokenType::Load:
            // Команда проверяет и поглощает всю строку сама
            parseVerb(*token);
            return;
        case TokenType::LParen:
            parseLParen(*token);
            break;
        case TokenType::RParen:
            parseRParen(*token);
            break;
        case TokenType::Abs:
            parseAbs(*token);
            break;
        default:
            if (isOutputToken(token->type)) {
                parseOutput(*token);
                break;
            }
            if (isOperatorToken(token->type)) {
                parseOperator(*token);
                break;
            }
            throw unexpected(*token);
        }
    }
}

// $foo = ... : переменная в начале строки превращается в присваивание
void Parser::parseEquals(const Token& token) {
    if (current != 2 || !nodes[0]->is(NodeType::Variable)) {
        throw unexpected(token, "знак = может стоять только сразу после имени переменной в начале строки, например: $foo = 1");
    }

    const auto& target = static_cast<const VariableNode&>(*nodes[0]);
    nodes[0] = makeNode<AssignNode>(target.position(), target.name());
}

void Parser::parseVariable(const Token& token) {
    if (current != 1 && !isOperatorNode(left().type()) && !isPrefixNode(left().type())) {
        throw unexpected(token, "после " + left().toString());
    }
    nodes.push_back(makeNode<VariableNode>(token.position, token.text));
}

// dec( hex( bin( oct( - только первым узлом строки
void Parser::parseOutput(const Token& token) {
    if (current != 1) {
        throw unexpected(token, "систему счисления вывода можно задать только в начале строки");
    }
    nodes.push_back(makeNode<SetOutputNode>(token.position, outputSystem(token.type)));
}

// Операторы + - * ** / // & | ^ ~ % << >> и минус отрицательного числа
void Parser::parseOperator(const Token& token) {
    if (token.type == TokenType::Sub && startsNegativeNumber()) {
        // Просмотренное число поглощается вместе с минусом
        const Token number = tokens[current++];
        lastTokenEnd = number.end();
        nodes.push_back(makeNode<NumberNode>(token.position, "-" + number.text, detectNumberSystem(number.text)));
        return;
    }

    // Оператору нужно значение слева (справа проверится следующим токеном)
    if (current == 1) {
        throw unexpected(token);
    }
    if (!isValueNode(left().type()) && !left().is(NodeType::RParen)) {
        throw unexpected(token, "оператор должен следовать за числом, переменной или закрывающей скобкой");
    }
    nodes.push_back(makeNode<OperatorNode>(token.position, token.text));
}

// -1 в начале строки, а также 2 + -1, abs(-1), $foo = -1, dec(-7)
bool Parser::startsNegativeNumber() {
    if (current == 1) {
        auto next = peekToken();
        return next && next->type == TokenType::Number;
    }

    const Node& previous = left();
    if (isValueNode(previous.type()) || previous.is(NodeType::RParen)) {
        return false; // 2 - 1 или (1) - 2 - это вычитание
    }
    auto next = peekToken();
    return next && next->type == TokenType::Number &&
           (isOperatorNode(previous.type()) || isPrefixNode(previous.type()));
}

void Parser::parseNumber(const Token& token) {
    if (current != 1 && !isOperatorNode(left().type()) && !isPrefixNode(left().type())) {
        throw unexpected(token, "число должно следовать за оператором, (, = или установкой вывода");
    }
    nodes.push_back(makeNode<NumberNode>(token.position, token.text, detectNumberSystem(token.text)));
}

// clear(), save(name), load(name): форма строго фиксирована,
// поэтому сначала дочитываем всю строку, а потом сверяем её целиком
void Parser::parseVerb(const Token& token) {
    bool isClear = token.type == TokenType::Clear;
    std::string canonical = token.text + (isClear ? "()" : "(name)");
    std::string detail = "строка должна состоять только из " + canonical;

    if (current != 1) {
        throw unexpected(token, detail);
    }

    while (auto rest = nextToken()) {
        lastTokenEnd = rest->end();
    }

    bool valid = isClear
        ? tokens.size() == 3 && tokens[1].type == TokenType::LParen && tokens[2].type == TokenType::RParen
        : tokens.size() == 4 && tokens[1].type == TokenType::LParen && tokens[2].type == TokenType::Text &&
          tokens[3].type == TokenType::RParen;
    if (!valid) {
        throw unexpected(token, detail);
    }

    if (isClear) {
        nodes.push_back(makeNode<MarkerNode>(NodeType::Clear, token.position));
    } else {
        NodeType type = token.type == TokenType::Save ? NodeType::Save : NodeType::Load;
        nodes.push_back(makeNode<DiskOperationNode>(type, token.position, tokens[2].text));
    }
    nodes.push_back(makeNode<MarkerNode>(NodeType::End, source.size()));
}

// ( допустима после abs, dec, hex, bin, oct, =, операторов и других (
void Parser::parseLParen(const Token& token) {
    if (current != 1 && !nodes.empty()) {
        NodeType type = left().type();
        if (!isOperatorNode(type) && !isPrefixNode(type) && !isFunctionNode(type)) {
            throw unexpected(token, "скобка должна следовать за abs, dec, hex, bin, oct, =, оператором или другой (");
        }
    }

    ++parenthesisDepth;
    nodes.push_back(makeNode<MarkerNode>(NodeType::LParen, token.position));
}

void Parser::parseRParen(const Token& token) {
    if (parenthesisDepth == 0) {
        throw unexpected(token, "нет открытых скобок");
    }
    if (!isValueNode(left().type()) && !left().is(NodeType::RParen)) {
        throw unexpected(token, "скобка должна следовать за числом, переменной или другой )");
    }

    --parenthesisDepth;
    nodes.push_back(makeNode<MarkerNode>(NodeType::RParen, token.position));
}

void Parser::parseAbs(const Token& token) {
    if (current != 1 && !isOperatorNode(left().type()) && !isPrefixNode(left().type())) {
        throw unexpected(token, "abs() может следовать за оператором, ( или =");
    }
    nodes.push_back(makeNode<MarkerNode>(NodeType::Abs, token.position));
}

const Node& Parser::left() const {
    return *nodes.back();
}

ParseError Parser::unexpected(const Token& token, const std::string& detail) const {
    std::string message = "неожиданный токен " + token.text + " на позиции " + std::to_string(token.position);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return ParseError(ErrorKind::Syntax, message, token.text, token.position);
}

ParseResult parse(const std::string& input) {
    Parser parser(input);
    return parser.parse();
}

} // namespace zappac
