#include "tokenizer.hpp"

#include <array>
#include <unordered_map>
#include <utility>

namespace zappac {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";
constexpr std::string_view kLetters = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view kIdentifierChars = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ_";
constexpr std::string_view kDigits = "0123456789";
constexpr std::string_view kHexadecimal = "0123456789abcdefABCDEF";
constexpr std::string_view kBinary = "01";

struct FixedToken {
    std::string_view text;
    TokenType type;
};

// Порядок важен: многосимвольные операторы проверяются раньше своих односимвольных префиксов
constexpr std::array<FixedToken, 16> kFixedTokens = {{
    {"(", TokenType::LParen},
    {")", TokenType::RParen},
    {"=", TokenType::Equals},
    {"+", TokenType::Add},
    {"-", TokenType::Sub},
    {"**", TokenType::Exp},
    {"*", TokenType::Mult},
    {"//", TokenType::Fdiv},
    {"/", TokenType::Div},
    {"&", TokenType::And},
    {"|", TokenType::Or},
    {"^", TokenType::Xor},
    {"~", TokenType::Inv},
    {"%", TokenType::Mod},
    {"<<", TokenType::LShift},
    {">>", TokenType::RShift},
}};

const std::unordered_map<std::string, TokenType> kKeywords = {
    {"abs", TokenType::Abs},
    {"save", TokenType::Save},
    {"load", TokenType::Load},
    {"clear", TokenType::Clear},
    {"dec", TokenType::Dec},
    {"hex", TokenType::Hex},
    {"bin", TokenType::Bin},
    {"oct", TokenType::Oct},
};

} // namespace

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

std::optional<Token> Tokenizer::next() {
    // Крутим автомат, пока он не выдаст хотя бы один токен
    while (pending.empty() && state != State::Done) {
        state = step(state);
    }
    if (pending.empty()) {
        return std::nullopt;
    }

    Token token = std::move(pending.front());
    pending.pop_front();
    return token;
}

std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (auto token = next()) {
        tokens.push_back(std::move(*token));
    }
    return tokens;
}

Tokenizer::State Tokenizer::step(State current) {
    switch (current) {
    case State::Base:
        return lexBase();
    case State::Variable:
        return lexVariable();
    case State::Text:
        return lexText();
    case State::Number:
        return lexNumber();
    case State::Fixed:
        return lexFixed();
    case State::Done:
        break;
    }
    return State::Done;
}

// Базовое состояние: схлопывает пробелы и выбирает категорию следующего токена
Tokenizer::State Tokenizer::lexBase() {
    acceptRun(kWhitespace);
    if (index > start) {
        pending.push_back({TokenType::Space, " ", start});
        start = index;
    }

    if (isAtEnd()) {
        emit(TokenType::End);
        return State::Done;
    }

    char ch = peek();
    if (ch == '$') {
        return State::Variable;
    }

    for (std::size_t i = 0; i < kFixedTokens.size(); ++i) {
        const auto& candidate = kFixedTokens[i];
        if (source.compare(index, candidate.text.size(), candidate.text) == 0) {
            fixedMatch = i;
            return State::Fixed;
        }
    }

    // b101 - двоичное число, но bin или bar - идентификаторы
    if (ch == 'b' && index + 1 < source.size() && kBinary.find(source[index + 1]) != std::string_view::npos) {
        return State::Number;
    }
    if (kDigits.find(ch) != std::string_view::npos) {
        return State::Number;
    }
    if (kLetters.find(ch) != std::string_view::npos) {
        return State::Text;
    }

    return errorf("неожиданный символ " + source.substr(index, utf8Length(ch)));
}

Tokenizer::State Tokenizer::lexVariable() {
    accept("$");
    acceptRun(kIdentifierChars);
    emit(TokenType::Variable);
    return State::Base;
}

// Идентификатор: буква, затем буквы и подчёркивания.
// Точное совпадение с ключевым словом меняет тип токена.
Tokenizer::State Tokenizer::lexText() {
    accept(kLetters);
    acceptRun(kIdentifierChars);

    auto keyword = kKeywords.find(source.substr(start, index - start));
    emit(keyword != kKeywords.end() ? keyword->second : TokenType::Text);
    return State::Base;
}

// Разбор числового литерала: b0101, 0xff, 0755, 12, 1.25
Tokenizer::State Tokenizer::lexNumber() {
    if (accept("b")) {
        acceptRun(kBinary);
    } else if (peek() == '0' && index + 1 < source.size() && (source[index + 1] == 'x' || source[index + 1] == 'X')) {
        index += 2;
        acceptRun(kHexadecimal);
    } else {
        bool hasDot = false;
        while (true) {
            if (!hasDot && accept(".")) {
                hasDot = true; // Вторая точка - уже конец числа
            } else if (!accept(kDigits)) {
                break;
            }
        }
    }

    emit(TokenType::Number);
    return State::Base;
}

Tokenizer::State Tokenizer::lexFixed() {
    const auto& matched = kFixedTokens[fixedMatch];
    index += matched.text.size();
    emit(matched.type);
    return State::Base;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

bool Tokenizer::accept(std::string_view valid) {
    if (!isAtEnd() && valid.find(peek()) != std::string_view::npos) {
        ++index;
        return true;
    }
    return false;
}

void Tokenizer::acceptRun(std::string_view valid) {
    while (accept(valid)) {
    }
}

void Tokenizer::emit(TokenType type) {
    pending.push_back({type, source.substr(start, index - start), start});
    start = index;
}

Tokenizer::State Tokenizer::errorf(const std::string& message) {
    pending.push_back({TokenType::Error, message, start});
    start = index = source.size();
    return State::Done;
}

} // namespace zappac
