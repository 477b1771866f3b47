#include "user_input.hpp"
#include "console.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

// Значение опции, которая требует аргумента: --storage DIR
std::string requireValue(const std::vector<std::string>& args, std::size_t& index) {
    if (index + 1 >= args.size()) {
        throw std::runtime_error("Для параметра " + args[index] + " не указано значение");
    }
    return args[++index];
}

} // namespace

Options parseArguments(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Options options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "run" && i == 0) {
            options.mode = Mode::Batch;
            if (i + 1 >= args.size()) {
                throw std::runtime_error("Не указан входной файл: zappac run <file>");
            }
            options.inputPath = args[++i];
        }
        else if (arg == "-o" || arg == "--output") {
            options.outputPath = requireValue(args, i);
        }
        else if (arg == "--storage") {
            options.storageRoot = requireValue(args, i);
        }
        else if (arg == "--profile") {
            options.profile = requireValue(args, i);
        }
        else if (arg == "--dry-run") {
            options.dryRun = true;
        }
        else if (arg == "--trace") {
            options.trace = true;
        }
        else if (arg == "-h" || arg == "--help") {
            options.mode = Mode::Help;
        }
        else {
            throw std::runtime_error("Неизвестный параметр: " + arg);
        }
    }

    if (options.outputPath && options.mode != Mode::Batch) {
        throw std::runtime_error("Параметр -o используется только вместе с run");
    }
    return options;
}

void printUsage(const char* programName) {
    std::cout << Color::BOLD << "Использование:\n" << Color::RESET;
    std::cout << "  " << programName << " [параметры]                    интерактивный режим\n";
    std::cout << "  " << programName << " run <file> [-o out.csv] [параметры]  вычисление файла с отчётом в CSV\n\n";
    std::cout << Color::BOLD << "Параметры:\n" << Color::RESET;
    std::cout << "  --storage <dir>   каталог профилей (по умолчанию ZAPPAC_HOME или ~/.config/zappac)\n";
    std::cout << "  --profile <name>  загрузить профиль при запуске\n";
    std::cout << "  --dry-run         вычислять без сохранения присваиваний\n";
    std::cout << "  --trace           печатать токены и узлы каждой строки\n";
    std::cout << "  -h, --help        эта справка\n\n";
}

std::string trim(const std::string& text) {
    std::size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<std::string> readLine(const std::string& prompt) {
    std::cout << Color::BOLD << Color::CYAN << prompt << Color::RESET << std::flush;

    std::string input;
    if (!std::getline(std::cin, input)) {
        return std::nullopt;
    }
    return input;
}
