#include "token_stream.hpp"

#include <utility>

#include "tokenizer.hpp"

namespace zappac {

void TokenChannel::send(Token token) {
    std::unique_lock<std::mutex> lock(mutex);

    // Ждём, пока потребитель заберёт предыдущий токен
    condition.wait(lock, [this]() { return !slot.has_value(); });
    slot = std::move(token);
    lock.unlock();

    condition.notify_all();
}

std::optional<Token> TokenChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex);
    condition.wait(lock, [this]() { return slot.has_value() || closed; });

    if (!slot.has_value()) {
        return std::nullopt; // Канал закрыт и пуст
    }

    std::optional<Token> token = std::move(slot);
    slot.reset();
    lock.unlock();

    condition.notify_all(); // Производитель может выдавать следующий токен
    return token;
}

void TokenChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    condition.notify_all();
}

TokenStream::TokenStream(std::string sourceText) {
    producer = std::thread([this, text = std::move(sourceText)]() mutable { produce(std::move(text)); });
}

TokenStream::~TokenStream() {
    // Дочитываем поток, иначе производитель останется заблокирован в send()
    while (channel.receive()) {
    }
    if (producer.joinable()) {
        producer.join();
    }
}

std::optional<Token> TokenStream::next() {
    return channel.receive();
}

void TokenStream::produce(std::string sourceText) {
    Tokenizer tokenizer(std::move(sourceText));
    while (auto token = tokenizer.next()) {
        channel.send(std::move(*token));
    }
    channel.close();
}

} // namespace zappac
