#pragma once

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "token.hpp"

namespace zappac {

// Лексический анализатор (лексер), построенный как конечный автомат.
// Каждое состояние считывает свою категорию символов, выдаёт токен и
// возвращает следующее состояние. Токены отдаются по одному через next(),
// поток конечен и не перезапускается: после End или Error токенов больше нет.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Возвращает следующий токен.
    // std::nullopt означает, что поток уже завершён токеном End или Error.
    std::optional<Token> next();

    // Считывает весь поток до End или Error включительно
    std::vector<Token> tokenize();

private:
    enum class State {
        Base,     // Пробелы и выбор следующей категории
        Variable, // $foo
        Text,     // Идентификаторы и ключевые слова
        Number,   // Числовые литералы
        Fixed,    // Операторы и скобки из таблицы фиксированных строк
        Done      // Выдан End или Error, сканирование остановлено
    };

    const std::string source;  // Исходная строка
    std::size_t start = 0;     // Начало текущего токена
    std::size_t index = 0;     // Текущая позиция чтения
    State state = State::Base;
    std::size_t fixedMatch = 0;  // Индекс совпавшей записи в таблице фиксированных токенов
    std::deque<Token> pending;   // Выданные, но ещё не отданные токены

    State step(State current);

    State lexBase();
    State lexVariable();
    State lexText();
    State lexNumber();
    State lexFixed();

    bool isAtEnd() const;
    char peek() const;

    // Принимает один символ, если он входит в набор valid
    bool accept(std::string_view valid);

    // Принимает максимальную последовательность символов из набора valid
    void acceptRun(std::string_view valid);

    // Выдаёт токен из текста между start и index
    void emit(TokenType type);

    // Выдаёт токен ошибки и останавливает сканирование
    State errorf(const std::string& message);
};

} // namespace zappac
