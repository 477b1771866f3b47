#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace zappac {

// Категория ошибки, по которой вызывающая сторона решает, как её показать
enum class ErrorKind {
    Lexical,         // Неизвестный символ во входной строке
    Syntax,          // Нарушение грамматики
    UnexpectedEnd,   // Строка оборвалась посреди выражения
    UnknownVariable, // Обращение к неприсвоенной переменной
    InvalidNumber,   // Число не удалось разобрать или перевести в систему счисления
    Internal         // Нарушен внутренний инвариант
};

// Название категории для вывода в консоль и CSV
const char* errorKindName(ErrorKind kind);

// Базовая ошибка калькулятора.
// Помимо сообщения хранит фрагмент текста, вызвавший ошибку, и его байтовое смещение.
class CalcError : public std::runtime_error {
public:
    CalcError(ErrorKind kind, const std::string& message, std::string text, std::size_t position);

    ErrorKind kind() const { return errorKind; }
    const std::string& text() const { return offendingText; }
    std::size_t position() const { return offset; }

private:
    ErrorKind errorKind;
    std::string offendingText;
    std::size_t offset;
};

// Ошибка лексического или синтаксического анализа строки
class ParseError final : public CalcError {
public:
    using CalcError::CalcError;
};

// Ошибка вычисления уже разобранной строки
class EvaluationError final : public CalcError {
public:
    using CalcError::CalcError;
};

// Ошибка чтения или записи профиля на диске
class StorageError final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace zappac
