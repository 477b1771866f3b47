#pragma once

#include <cstddef>
#include <iostream>
#include <string>

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* GRAY = "\033[90m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Вывод краткой справки по языку калькулятора
void printLanguageHelp();

// Красная строка "✗ Ошибка: ..." в std::cerr
void printError(const std::string& message);

// Выводит строку и отмечает позицию ошибки: точки до неё и ^ под ошибочным символом.
// position - байтовое смещение; отступ считается в символах UTF-8.
void printCaret(const std::string& line, std::size_t position);

// Серая строка трассировки (--trace)
void printTrace(const std::string& label, const std::string& text);
