#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "node.hpp"
#include "profile_storage.hpp"

namespace zappac {

// Вычислитель разобранных строк и хранилище переменных.
// Последовательность узлов сводится на месте по приоритетам (PEMDAS):
// скобки и **, затем * / // % & | ^ ~ << >>, затем + -.
// Экземпляр однопоточный; каждая строка вычисляется независимо,
// общим между строками остаётся только набор переменных.
class Evaluator {
public:
    using SaveCallback = std::function<void()>;

    // storage может быть пустым: тогда save() и load() сообщают, что хранилище не настроено
    explicit Evaluator(std::shared_ptr<const ProfileStorage> storage = nullptr, SaveCallback onSave = {});

    // Вычисляет разобранную строку и возвращает текст результата.
    // updateVariables = false вычисляет присваивание, не сохраняя его.
    // Выбрасывает EvaluationError; при ошибке переменные не меняются.
    std::string exec(const NodeList& nodes, bool updateVariables = true);

    // Разбор и вычисление одной строки.
    // Выбрасывает ParseError или EvaluationError.
    // Пример: "$foo = (1 + 2) * 3" -> "9"
    std::string evaluate(const std::string& line, bool updateVariables = true);

    const VariableMap& variables() const { return store; }

    void clear();
    std::string saveProfile(const std::string& profile);
    std::string loadProfile(const std::string& profile);

private:
    std::shared_ptr<const ProfileStorage> storage;
    SaveCallback onSave;
    VariableMap store;

    // Сводит последовательность к одному узлу-значению
    NodePtr pemdas(NodeList nodes) const;

    // Заменяет группу ( ... ), начинающуюся с open, одним числом.
    // Стоящий перед группой abs поглощается вместе с ней.
    void resolveGroup(NodeList& nodes, std::size_t open) const;

    // Заменяет тройку "значение оператор значение" результатом
    void reduceOperator(NodeList& nodes, std::size_t index) const;

    // Число из узла-значения; переменная разыменовывается
    NumberNode readValue(const NodePtr& node) const;

    // Применяет оператор к двум числам
    double calculate(const Node& op, double left, double right) const;
};

} // namespace zappac
