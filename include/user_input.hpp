#pragma once

#include <filesystem>
#include <optional>
#include <string>

// Режим работы программы
enum class Mode {
    Interactive, // Построчный ввод выражений (REPL)
    Batch,       // zappac run <file>: вычисление файла с отчётом в CSV
    Help         // --help
};

// Параметры командной строки
struct Options {
    Mode mode = Mode::Interactive;
    std::filesystem::path inputPath;                  // Входной файл для run
    std::optional<std::filesystem::path> outputPath;  // -o: путь к CSV-отчёту
    std::optional<std::string> storageRoot;           // --storage: каталог профилей
    std::optional<std::string> profile;               // --profile: профиль для загрузки при старте
    bool dryRun = false;                              // --dry-run: не сохранять присваивания
    bool trace = false;                               // --trace: печатать токены и узлы
};

// Разбор аргументов командной строки.
// Выбрасывает std::runtime_error при неизвестном или неполном аргументе.
Options parseArguments(int argc, char** argv);

// Текст справки по запуску
void printUsage(const char* programName);

// Удаление пробелов по краям строки
std::string trim(const std::string& text);

// Читает строку из std::cin с приглашением; std::nullopt на конце ввода
std::optional<std::string> readLine(const std::string& prompt);
