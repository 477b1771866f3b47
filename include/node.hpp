#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "number_system.hpp"

namespace zappac {

// Типы узлов, которые парсер выдаёт в плоскую последовательность
enum class NodeType {
    Assign,    // $foo =
    LParen,    // (
    RParen,    // )
    Number,    // 123, 0.123, 0xff, b001, 0755
    Variable,  // $foo
    Add,       // +
    Sub,       // -
    Mult,      // *
    Exp,       // **
    Div,       // /
    Fdiv,      // //
    And,       // &
    Or,        // |
    Xor,       // ^
    Inv,       // ~
    Mod,       // %
    LShift,    // <<
    RShift,    // >>
    Abs,       // abs()
    SetOutput, // dec() bin() oct() hex()
    Save,      // save(foo)
    Load,      // load(foo)
    Clear,     // clear()
    End,       // Успешный конец строки
    ParsingStopped // Разбор прерван ошибкой
};

// Имя типа узла для отладочного вывода
const char* nodeTypeName(NodeType type);

// Узлы-значения: числа и переменные
bool isValueNode(NodeType type);

// Узлы-операторы между двумя значениями
bool isOperatorNode(NodeType type);

// Узлы, после которых допустимо начало значения: (, установка вывода, присваивание
bool isPrefixNode(NodeType type);

// Узлы-функции, за которыми следует скобка: abs и установка вывода
bool isFunctionNode(NodeType type);

// Базовый класс узла.
// Узлы неизменяемы: вычислитель заменяет диапазоны последовательности новыми узлами,
// а не меняет существующие.
class Node {
public:
    Node(NodeType type, std::size_t position) : nodeType(type), origin(position) {}
    virtual ~Node() = default;

    NodeType type() const { return nodeType; }

    // Байтовое смещение во входной строке, откуда взят узел
    std::size_t position() const { return origin; }

    // Каноническое строковое представление узла
    virtual std::string toString() const = 0;

    bool is(NodeType type) const { return nodeType == type; }
    bool isOneOf(std::initializer_list<NodeType> types) const;

private:
    NodeType nodeType;
    std::size_t origin;
};

using NodePtr = std::shared_ptr<const Node>;
using NodeList = std::vector<NodePtr>;

// Числовой литерал или результат вычисления
class NumberNode final : public Node {
public:
    // Текст приводится к нижнему регистру: 0XFF -> 0xff
    NumberNode(std::size_t position, std::string value, NumberSystem system);

    // Узел с системой счисления, определённой по самому тексту
    static NumberNode fromText(std::size_t position, std::string value);

    const std::string& value() const { return text; }
    NumberSystem system() const { return numberSystem; }

    // Числовое значение; выбрасывает EvaluationError(InvalidNumber)
    double toDouble() const;

    std::string toString() const override { return text; }

private:
    std::string text;
    NumberSystem numberSystem;
};

// Ссылка на переменную $foo
class VariableNode final : public Node {
public:
    VariableNode(std::size_t position, std::string name)
        : Node(NodeType::Variable, position), variableName(std::move(name)) {}

    const std::string& name() const { return variableName; }
    std::string toString() const override { return variableName; }

private:
    std::string variableName;
};

// Присваивание $foo = ...
class AssignNode final : public Node {
public:
    AssignNode(std::size_t position, std::string target)
        : Node(NodeType::Assign, position), targetName(std::move(target)) {}

    const std::string& target() const { return targetName; }
    std::string toString() const override { return targetName + " ="; }

private:
    std::string targetName;
};

// Бинарный оператор + - * ** / // & | ^ ~ % << >>
class OperatorNode final : public Node {
public:
    // Тип узла определяется по тексту оператора
    OperatorNode(std::size_t position, const std::string& op);

    const std::string& symbol() const { return op; }
    std::string toString() const override { return op; }

private:
    std::string op;
};

// Установка системы счисления результата: dec() bin() oct() hex()
class SetOutputNode final : public Node {
public:
    SetOutputNode(std::size_t position, NumberSystem output)
        : Node(NodeType::SetOutput, position), output(output) {}

    NumberSystem system() const { return output; }
    std::string toString() const override { return numberSystemName(output); }

private:
    NumberSystem output;
};

// Операция с профилем на диске: save(name) или load(name)
class DiskOperationNode final : public Node {
public:
    DiskOperationNode(NodeType type, std::size_t position, std::string profile)
        : Node(type, position), profileName(std::move(profile)) {}

    const std::string& profile() const { return profileName; }
    std::string toString() const override;

private:
    std::string profileName;
};

// Узлы без аргументов: ( ) abs clear, а также маркеры End и ParsingStopped
class MarkerNode final : public Node {
public:
    MarkerNode(NodeType type, std::size_t position) : Node(type, position) {}

    std::string toString() const override;
};

// Создаёт неизменяемый узел для NodeList
template <class T, class... Args>
NodePtr makeNode(Args&&... args) {
    return std::make_shared<const T>(std::forward<Args>(args)...);
}

// Узлы через пробел, для трассировки: [$foo = ( 1 + 2 ) ]
std::string describeNodes(const NodeList& nodes);

} // namespace zappac
