#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace zappac {

// Система счисления: классификация литерала и формат вывода результата
enum class NumberSystem {
    Dec,
    Hex,
    Bin,
    Oct
};

// Определяет систему счисления по префиксу литерала.
// Ведущий знак минус не учитывается: -0xff тоже шестнадцатеричное.
//   0x / 0X                      -> Hex
//   b / B                        -> Bin
//   0 и дальше цифры без точки   -> Oct
//   всё остальное                -> Dec
NumberSystem detectNumberSystem(std::string_view number);

// Короткое имя системы: dec, hex, bin, oct
const char* numberSystemName(NumberSystem system);

// Обратное преобразование имени, std::nullopt для неизвестного имени
std::optional<NumberSystem> numberSystemFromName(std::string_view name);

// Переводит текст литерала в число.
// Dec разбирается как число с плавающей точкой, остальные - как целые со знаком (64 бита).
// std::nullopt, если текст не является числом своей системы.
std::optional<double> parseNumber(std::string_view text, NumberSystem system);

// Кратчайшая точная десятичная запись без экспоненты (0.1, 1024, -15, inf, nan)
std::string formatDecimal(double value);

// Форматирует значение в заданной системе счисления.
// Для Hex, Oct и Bin значение усекается к нулю; нуль выводится как 0x0, 00 и b0,
// чтобы результат снова распознавался в той же системе.
// std::nullopt, если значение не конечно или не помещается в 64-битное целое.
std::optional<std::string> formatNumber(double value, NumberSystem system);

} // namespace zappac
