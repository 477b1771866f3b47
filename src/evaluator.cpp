#include "evaluator.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <utility>

#include "errors.hpp"
#include "parser.hpp"

namespace zappac {

namespace {

// 2^63 - граница диапазона int64
constexpr double kInt64Bound = 9223372036854775808.0;

const std::initializer_list<NodeType> kMultiplicative = {
    NodeType::Mult, NodeType::Div, NodeType::Fdiv, NodeType::Mod,
    NodeType::And, NodeType::Or, NodeType::Xor, NodeType::Inv,
    NodeType::LShift, NodeType::RShift,
};

const std::initializer_list<NodeType> kAdditive = {NodeType::Add, NodeType::Sub};

std::optional<std::size_t> findFirst(const NodeList& nodes, std::initializer_list<NodeType> types) {
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i]->isOneOf(types)) {
            return i;
        }
    }
    return std::nullopt;
}

EvaluationError internalError(const std::string& message, const NodeList& nodes) {
    std::size_t position = nodes.empty() ? 0 : nodes.front()->position();
    return EvaluationError(ErrorKind::Internal, message + ": " + describeNodes(nodes), "", position);
}

// Операнд сдвига: значение усекается к нулю и должно помещаться в int64
std::int64_t shiftOperand(double value, const Node& op) {
    double truncated = std::trunc(value);
    if (!std::isfinite(truncated) || truncated < -kInt64Bound || truncated >= kInt64Bound) {
        throw EvaluationError(ErrorKind::InvalidNumber,
                              "операнд сдвига " + formatDecimal(value) + " не помещается в 64-битное целое",
                              op.toString(), op.position());
    }
    return static_cast<std::int64_t>(truncated);
}

double shift(double left, double right, const Node& op) {
    std::int64_t value = shiftOperand(left, op);
    std::int64_t count = shiftOperand(right, op);
    if (count < 0) {
        throw EvaluationError(ErrorKind::InvalidNumber,
                              "отрицательная величина сдвига " + std::to_string(count),
                              op.toString(), op.position());
    }

    if (op.is(NodeType::LShift)) {
        if (count >= 64) {
            return 0.0;
        }
        return static_cast<double>(static_cast<std::int64_t>(static_cast<std::uint64_t>(value) << count));
    }

    // Арифметический сдвиг: знак сохраняется
    if (count >= 64) {
        return value < 0 ? -1.0 : 0.0;
    }
    return static_cast<double>(value >> count);
}

} // namespace

Evaluator::Evaluator(std::shared_ptr<const ProfileStorage> storage, SaveCallback onSave)
    : storage(std::move(storage)), onSave(std::move(onSave)) {}

std::string Evaluator::evaluate(const std::string& line, bool updateVariables) {
    ParseResult parsed = parse(line);
    if (parsed.error) {
        throw *parsed.error;
    }
    return exec(parsed.nodes, updateVariables);
}

std::string Evaluator::exec(const NodeList& nodes, bool updateVariables) {
    // Пустая строка
    if (nodes.empty() || (nodes.size() == 1 && nodes.front()->is(NodeType::End))) {
        return "";
    }
    if (nodes.back()->is(NodeType::ParsingStopped)) {
        throw EvaluationError(ErrorKind::Internal, "строка разобрана с ошибкой и не может быть вычислена",
                              "", nodes.back()->position());
    }

    const Node& first = *nodes.front();
    std::optional<NumberSystem> output;
    std::optional<std::string> target;

    // Управляющий узел может стоять только первым
    switch (first.type()) {
    case NodeType::Clear:
        clear();
        return "Переменные очищены";
    case NodeType::Save:
        return saveProfile(static_cast<const DiskOperationNode&>(first).profile());
    case NodeType::Load:
        return loadProfile(static_cast<const DiskOperationNode&>(first).profile());
    case NodeType::SetOutput:
        output = static_cast<const SetOutputNode&>(first).system();
        break;
    case NodeType::Assign:
        target = static_cast<const AssignNode&>(first).target();
        break;
    default:
        break;
    }

    NodeList rest(nodes.begin() + ((output || target) ? 1 : 0), nodes.end());
    NumberNode value = readValue(pemdas(std::move(rest)));

    // Одиночный литерал возвращается как есть, но тоже должен быть корректным числом
    double number = value.toDouble();

    std::string result = value.value();
    if (output) {
        auto formatted = formatNumber(number, *output);
        if (!formatted) {
            throw EvaluationError(ErrorKind::InvalidNumber,
                                  "значение " + result + " нельзя записать в системе " + numberSystemName(*output),
                                  result, first.position());
        }
        result = *formatted;
    }

    if (target && updateVariables) {
        store.insert_or_assign(*target, NumberNode::fromText(first.position(), result));
    }
    return result;
}

NodePtr Evaluator::pemdas(NodeList nodes) const {
    while (nodes.size() > 1) {
        // Скобки и возведение в степень
        if (auto index = findFirst(nodes, {NodeType::LParen, NodeType::Exp})) {
            if (nodes[*index]->is(NodeType::LParen)) {
                resolveGroup(nodes, *index);
                continue;
            }

            // Правый операнд ** ещё может быть группой: 2 ** (1 + 1), 2 ** abs(-2)
            std::size_t right = *index + 1;
            if (right < nodes.size() && nodes[right]->is(NodeType::LParen)) {
                resolveGroup(nodes, right);
            } else if (right + 1 < nodes.size() && nodes[right]->is(NodeType::Abs)) {
                resolveGroup(nodes, right + 1);
            } else {
                reduceOperator(nodes, *index);
            }
            continue;
        }

        if (auto index = findFirst(nodes, kMultiplicative)) {
            reduceOperator(nodes, *index);
            continue;
        }

        if (auto index = findFirst(nodes, kAdditive)) {
            reduceOperator(nodes, *index);
            continue;
        }

        if (nodes[1]->is(NodeType::End)) {
            nodes.erase(nodes.begin() + 1);
            continue;
        }

        throw internalError("не удалось свести выражение", nodes);
    }

    if (nodes.empty()) {
        throw internalError("пустое выражение", nodes);
    }
    return nodes.front();
}

void Evaluator::resolveGroup(NodeList& nodes, std::size_t open) const {
    // Поиск парной закрывающей скобки
    int depth = 0;
    std::size_t close = open;
    for (; close < nodes.size(); ++close) {
        if (nodes[close]->is(NodeType::LParen)) {
            ++depth;
        } else if (nodes[close]->is(NodeType::RParen) && --depth == 0) {
            break;
        }
    }
    if (close == nodes.size()) {
        throw internalError("нет парной скобки", nodes);
    }

    NodeList inner(nodes.begin() + open + 1, nodes.begin() + close);
    NumberNode value = readValue(pemdas(std::move(inner)));

    std::size_t from = open;
    NodePtr replacement;
    if (open > 0 && nodes[open - 1]->is(NodeType::Abs)) {
        from = open - 1;
        replacement = makeNode<NumberNode>(nodes[from]->position(), formatDecimal(std::fabs(value.toDouble())),
                                           NumberSystem::Dec);
    } else {
        replacement = makeNode<NumberNode>(NumberNode::fromText(nodes[open]->position(), value.value()));
    }

    nodes.erase(nodes.begin() + from + 1, nodes.begin() + close + 1);
    nodes[from] = replacement;
}

void Evaluator::reduceOperator(NodeList& nodes, std::size_t index) const {
    if (index == 0 || index + 1 >= nodes.size() ||
        !isValueNode(nodes[index - 1]->type()) || !isValueNode(nodes[index + 1]->type())) {
        throw internalError("оператору не хватает операндов", nodes);
    }

    const Node& op = *nodes[index];
    double left = readValue(nodes[index - 1]).toDouble();
    double right = readValue(nodes[index + 1]).toDouble();
    double result = calculate(op, left, right);
    if (std::isnan(result)) {
        throw EvaluationError(ErrorKind::InvalidNumber,
                              "результат " + formatDecimal(left) + " " + op.toString() + " " + formatDecimal(right) +
                                  " не определён",
                              op.toString(), op.position());
    }

    NodePtr replacement = makeNode<NumberNode>(nodes[index - 1]->position(), formatDecimal(result), NumberSystem::Dec);
    nodes.erase(nodes.begin() + index, nodes.begin() + index + 2);
    nodes[index - 1] = replacement;
}

NumberNode Evaluator::readValue(const NodePtr& node) const {
    if (node->is(NodeType::Number)) {
        return static_cast<const NumberNode&>(*node);
    }
    if (node->is(NodeType::Variable)) {
        const auto& variable = static_cast<const VariableNode&>(*node);
        auto found = store.find(variable.name());
        if (found == store.end()) {
            throw EvaluationError(ErrorKind::UnknownVariable, "неизвестная переменная " + variable.name(),
                                  variable.name(), variable.position());
        }
        return found->second;
    }
    throw EvaluationError(ErrorKind::Internal, "ожидалось значение, получено " + node->toString(),
                          node->toString(), node->position());
}

double Evaluator::calculate(const Node& op, double left, double right) const {
    switch (op.type()) {
    case NodeType::Add:
        return left + right;
    case NodeType::Sub:
        return left - right;
    case NodeType::Mult:
        return left * right;
    case NodeType::Exp:
        return std::pow(left, right);
    case NodeType::Div:
        return left / right; // Деление на ноль даёт inf по IEEE 754
    case NodeType::Fdiv:
        return std::floor(left / right);
    case NodeType::Mod: {
        // Остаток берёт знак делителя: -7 % 3 = 2
        double remainder = std::fmod(left, right);
        if (remainder != 0.0 && (remainder < 0.0) != (right < 0.0)) {
            remainder += right;
        }
        return remainder;
    }
    case NodeType::And:
    case NodeType::Or:
    case NodeType::Xor:
    case NodeType::Inv:
        // TODO: заменить на побитовые операции над int64, пока & | ^ ~ вычисляются как вычитание
        return left - right;
    case NodeType::LShift:
    case NodeType::RShift:
        return shift(left, right, op);
    default:
        throw EvaluationError(ErrorKind::Internal, "неизвестный оператор " + op.toString(),
                              op.toString(), op.position());
    }
}

void Evaluator::clear() {
    store.clear();
}

std::string Evaluator::saveProfile(const std::string& profile) {
    if (!storage) {
        return "Хранилище профилей не настроено";
    }
    try {
        storage->save(profile, store);
    }
    catch (const StorageError& e) {
        return std::string("Не удалось сохранить профиль: ") + e.what();
    }

    if (onSave) {
        onSave();
    }
    return "Профиль " + profile + " сохранён, переменных: " + std::to_string(store.size());
}

std::string Evaluator::loadProfile(const std::string& profile) {
    if (!storage) {
        return "Хранилище профилей не настроено";
    }

    VariableMap loaded;
    try {
        loaded = storage->load(profile);
    }
    catch (const StorageError& e) {
        return std::string("Не удалось загрузить профиль: ") + e.what();
    }

    for (auto& [name, number] : loaded) {
        store.insert_or_assign(name, std::move(number));
    }
    return "Профиль " + profile + " загружен, переменных: " + std::to_string(loaded.size());
}

} // namespace zappac
