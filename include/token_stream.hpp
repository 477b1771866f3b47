#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "token.hpp"

namespace zappac {

// Канал передачи токенов между потоками на одну ячейку.
// send() блокируется, пока предыдущий токен не заберут,
// receive() блокируется, пока токен не появится или канал не закроют.
class TokenChannel {
public:
    void send(Token token);
    std::optional<Token> receive();
    void close();

private:
    std::mutex mutex;                    // Мьютекс для синхронизации доступа к ячейке
    std::condition_variable condition;   // Условная переменная для пробуждения обеих сторон
    std::optional<Token> slot;           // Ожидающий токен (не более одного)
    bool closed = false;                 // Производитель выдал последний токен
};

// Поток токенов: лексер работает в отдельном потоке-производителе
// и передаёт токены потребителю (парсеру) через TokenChannel.
// Отмены нет: запущенный лексер всегда доходит до End или Error,
// а деструктор дочитывает остаток потока и дожидается производителя.
class TokenStream {
public:
    explicit TokenStream(std::string sourceText);
    ~TokenStream();

    TokenStream(const TokenStream&) = delete;
    TokenStream& operator=(const TokenStream&) = delete;

    // Следующий токен или std::nullopt после End/Error
    std::optional<Token> next();

private:
    TokenChannel channel;
    std::thread producer;

    // Основной цикл потока-производителя
    void produce(std::string sourceText);
};

} // namespace zappac
