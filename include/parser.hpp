#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "node.hpp"
#include "token.hpp"
#include "token_stream.hpp"

namespace zappac {

// Результат разбора строки.
// nodes всегда заканчивается маркером: End при успехе или ParsingStopped при ошибке,
// поэтому nodes.back() всегда показывает, почему разбор остановился.
struct ParseResult {
    NodeList nodes;
    std::optional<ParseError> error;

    bool ok() const { return !error.has_value(); }
};

// Синтаксический анализатор (парсер).
// Читает токены из потока по одному и проверяет каждый только по узлу слева от него,
// без построения дерева. На выходе - плоская последовательность узлов.
class Parser {
public:
    // Конструктор принимает исходную строку; лексер запускается в parse()
    explicit Parser(std::string sourceText);

    // Разбирает строку целиком. Не выбрасывает ParseError: ошибка возвращается в результате.
    ParseResult parse();

private:
    const std::string source;
    std::unique_ptr<TokenStream> stream;
    std::vector<Token> tokens;      // Прочитанные значимые токены (без пробелов)
    std::size_t current = 0;        // Количество разобранных токенов
    int parenthesisDepth = 0;       // Текущая глубина вложенности скобок
    std::size_t lastTokenEnd = 0;   // Конец последнего разобранного токена
    bool endReached = false;        // Токен End уже получен из потока
    NodeList nodes;

    // Следующий значимый токен; std::nullopt на конце ввода.
    // Выбрасывает ParseError для ошибки лексера и незакрытых скобок на конце ввода.
    std::optional<Token> nextToken();

    // Заглядывает на один токен вперёд, не теряя его
    std::optional<Token> peekToken();

    // Основной цикл: разбирает токены до конца ввода
    void readNodes();

    void parseEquals(const Token& token);
    void parseVariable(const Token& token);
    void parseOutput(const Token& token);
    void parseOperator(const Token& token);
    void parseNumber(const Token& token);
    void parseVerb(const Token& token);
    void parseLParen(const Token& token);
    void parseRParen(const Token& token);
    void parseAbs(const Token& token);

    // Является ли минус началом отрицательного числа, а не вычитанием
    bool startsNegativeNumber();

    // Узел слева от текущего токена
    const Node& left() const;

    // Ошибка вида "неожиданный токен X на позиции N: detail"
    ParseError unexpected(const Token& token, const std::string& detail = "") const;
};

// Разбирает строку языка калькулятора
ParseResult parse(const std::string& input);

} // namespace zappac
