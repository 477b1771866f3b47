#pragma once

#include <cstddef>
#include <string>

namespace zappac {

// Типы лексем (токенов), которые выдаёт лексер
enum class TokenType {
    Error,    // Ошибка лексера, text содержит сообщение
    End,      // Конец входной строки
    Equals,   // =
    Space,    // Один или несколько пробельных символов
    LParen,   // (
    RParen,   // )
    Number,   // 135, 1.23, 0x7f, b0100, 0755
    Variable, // $foo
    Add,      // +
    Sub,      // -
    Mult,     // *
    Exp,      // **
    Div,      // /
    Fdiv,     // //
    And,      // &
    Or,       // |
    Xor,      // ^
    Inv,      // ~
    Mod,      // %
    LShift,   // <<
    RShift,   // >>
    Text,     // Произвольный идентификатор без $
    // Ключевые слова-функции
    Abs,
    Save,
    Load,
    Clear,
    Dec,
    Hex,
    Bin,
    Oct
};

// Структура токена: тип, исходный текст и позиция начала в байтах
struct Token {
    TokenType type;
    std::string text;
    std::size_t position;

    // Смещение сразу за последним байтом токена
    std::size_t end() const { return position + text.size(); }
};

// Имя типа токена для отладочного вывода
const char* tokenTypeName(TokenType type);

// Является ли токен одним из двенадцати бинарных операторов
bool isOperatorToken(TokenType type);

// Является ли токен установкой системы счисления вывода: dec, hex, bin, oct
bool isOutputToken(TokenType type);

// Длина символа UTF-8 в байтах по его первому байту
std::size_t utf8Length(char lead);

// Представление токена в виде <Тип>"текст" для трассировки
std::string describeToken(const Token& token);

} // namespace zappac
