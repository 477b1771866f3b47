#include "number_system.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace zappac {

namespace {

// 2^63 - граница диапазона int64
constexpr double kInt64Bound = 9223372036854775808.0;

bool startsWith(std::string_view text, char lower) {
    return !text.empty() && (text.front() == lower || text.front() == lower - 'a' + 'A');
}

} // namespace

NumberSystem detectNumberSystem(std::string_view number) {
    if (!number.empty() && number.front() == '-') {
        number.remove_prefix(1);
    }
    if (number.empty()) {
        return NumberSystem::Dec;
    }

    if (startsWith(number, 'b')) {
        return NumberSystem::Bin;
    }
    if (number.front() == '0' && number.size() > 1) {
        if (number[1] == 'x' || number[1] == 'X') {
            return NumberSystem::Hex;
        }
        // 0.5 - десятичная дробь, а не восьмеричное число
        if (number.find('.') == std::string_view::npos) {
            return NumberSystem::Oct;
        }
    }
    return NumberSystem::Dec;
}

const char* numberSystemName(NumberSystem system) {
    switch (system) {
    case NumberSystem::Dec:
        return "dec";
    case NumberSystem::Hex:
        return "hex";
    case NumberSystem::Bin:
        return "bin";
    case NumberSystem::Oct:
        return "oct";
    }
    return "dec";
}

std::optional<NumberSystem> numberSystemFromName(std::string_view name) {
    if (name == "dec") return NumberSystem::Dec;
    if (name == "hex") return NumberSystem::Hex;
    if (name == "bin") return NumberSystem::Bin;
    if (name == "oct") return NumberSystem::Oct;
    return std::nullopt;
}

std::optional<double> parseNumber(std::string_view text, NumberSystem system) {
    if (system == NumberSystem::Dec) {
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    bool negative = false;
    if (!text.empty() && text.front() == '-') {
        negative = true;
        text.remove_prefix(1);
    }

    // Отрезаем префикс системы счисления; ведущий 0 восьмеричного числа допустим как цифра
    int base = 8;
    if (system == NumberSystem::Hex) {
        if (text.size() < 2 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
            return std::nullopt;
        }
        text.remove_prefix(2);
        base = 16;
    } else if (system == NumberSystem::Bin) {
        if (!startsWith(text, 'b')) {
            return std::nullopt;
        }
        text.remove_prefix(1);
        base = 2;
    }

    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), magnitude, base);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }

    // Диапазон int64: модуль отрицательного числа может быть на единицу больше
    constexpr auto maxPositive = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (magnitude > maxPositive + (negative ? 1 : 0)) {
        return std::nullopt;
    }

    double value = static_cast<double>(magnitude);
    return negative ? -value : value;
}

std::string formatDecimal(double value) {
    // Знак NaN зависит от платформы
    if (std::isnan(value)) {
        return "nan";
    }

    // Фиксированная запись самого длинного double занимает около 330 символов
    std::array<char, 512> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed);
    if (ec != std::errc()) {
        throw std::runtime_error("Не удалось отформатировать число");
    }
    return std::string(buffer.data(), ptr);
}

std::optional<std::string> formatNumber(double value, NumberSystem system) {
    if (system == NumberSystem::Dec) {
        return formatDecimal(value);
    }

    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    double truncated = std::trunc(value);
    if (truncated < -kInt64Bound || truncated >= kInt64Bound) {
        return std::nullopt;
    }

    auto integer = static_cast<std::int64_t>(truncated);
    bool negative = integer < 0;
    // Модуль INT64_MIN не помещается в int64, поэтому считаем его в беззнаковом типе
    std::uint64_t magnitude = negative ? static_cast<std::uint64_t>(-(integer + 1)) + 1
                                       : static_cast<std::uint64_t>(integer);

    int base = 10;
    const char* prefix = "";
    switch (system) {
    case NumberSystem::Hex:
        base = 16;
        prefix = "0x";
        break;
    case NumberSystem::Oct:
        base = 8;
        prefix = "0";
        break;
    case NumberSystem::Bin:
        base = 2;
        prefix = "b";
        break;
    case NumberSystem::Dec:
        break;
    }

    std::array<char, 72> digits{};
    auto [ptr, ec] = std::to_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
    if (ec != std::errc()) {
        return std::nullopt;
    }

    std::string result = negative ? "-" : "";
    result += prefix;
    result.append(digits.data(), ptr);
    return result;
}

} // namespace zappac
