#include "console.hpp"

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    zappac: калькулятор с переменными и системами счисления ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET;
    std::cout << Color::GRAY << "Введите выражение, help для справки или exit для выхода.\n" << Color::RESET << "\n";
}

void printLanguageHelp() {
    std::cout << Color::BOLD << "Выражения:\n" << Color::RESET;
    std::cout << "  1 + 2 * (3 - 4)       операторы + - * / // % ** << >>\n";
    std::cout << "  0xff  0755  b101      шестнадцатеричные, восьмеричные и двоичные числа\n";
    std::cout << "  abs(-5)               модуль\n";
    std::cout << Color::BOLD << "Переменные:\n" << Color::RESET;
    std::cout << "  $foo = 10             присваивание\n";
    std::cout << "  $foo * 2              использование\n";
    std::cout << Color::BOLD << "Система счисления результата:\n" << Color::RESET;
    std::cout << "  hex(255)  oct(8)  bin(2)  dec(0xff)\n";
    std::cout << Color::BOLD << "Профили:\n" << Color::RESET;
    std::cout << "  save(name)  load(name)  clear()\n\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n";
}

void printCaret(const std::string& line, std::size_t position) {
    std::size_t columns = 0;
    for (std::size_t i = 0; i < line.size() && i < position; ++i) {
        // Байты продолжения UTF-8 не занимают отдельной колонки
        if ((static_cast<unsigned char>(line[i]) & 0xC0) != 0x80) {
            ++columns;
        }
    }

    std::cerr << "  " << line << "\n";
    std::cerr << "  " << Color::GRAY << std::string(columns, '.') << Color::RESET
        << Color::RED << Color::BOLD << "^" << Color::RESET << "\n";
}

void printTrace(const std::string& label, const std::string& text) {
    std::cout << Color::GRAY << "  " << label << ": " << text << Color::RESET << "\n";
}
