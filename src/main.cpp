#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "console.hpp"
#include "csv_writer.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "file_utils.hpp"
#include "parser.hpp"
#include "profile_storage.hpp"
#include "tokenizer.hpp"
#include "user_input.hpp"

namespace {

// Вычислитель с профилями в каталоге из параметров и окружения
zappac::Evaluator makeEvaluator(const Options& options) {
    std::filesystem::path root = resolveStorageRoot(options.storageRoot);
    auto storage = std::make_shared<zappac::YamlProfileStorage>(root);

    zappac::Evaluator evaluator(storage, [root]() {
        std::cout << Color::GRAY << "  каталог профилей: " << root.string() << Color::RESET << "\n";
    });

    if (options.profile) {
        std::cout << Color::GRAY << evaluator.loadProfile(*options.profile) << Color::RESET << "\n";
    }
    return evaluator;
}

// --trace: токены и узлы строки
void traceLine(const std::string& line) {
    zappac::Tokenizer tokenizer(line);
    std::string tokens;
    for (const auto& token : tokenizer.tokenize()) {
        if (!tokens.empty()) {
            tokens += ' ';
        }
        tokens += zappac::describeToken(token);
    }
    printTrace("токены", tokens);
    printTrace("узлы", zappac::describeNodes(zappac::parse(line).nodes));
}

void reportError(const std::string& line, const zappac::CalcError& error) {
    printError(std::string(error.what()) + " [" + zappac::errorKindName(error.kind()) + "]");
    printCaret(line, error.position());
}

// Интерактивный режим: одна строка - одно выражение
int runInteractive(const Options& options) {
    printHeader();
    zappac::Evaluator evaluator = makeEvaluator(options);

    while (auto input = readLine("zappac> ")) {
        std::string line = trim(*input);
        if (line.empty()) {
            continue;
        }
        if (line == "exit" || line == "quit") {
            break;
        }
        if (line == "help") {
            printLanguageHelp();
            continue;
        }

        if (options.trace) {
            traceLine(line);
        }

        try {
            std::string result = evaluator.evaluate(line, !options.dryRun);
            if (!result.empty()) {
                std::cout << Color::GREEN << result << Color::RESET << "\n";
            }
        }
        catch (const zappac::CalcError& error) {
            reportError(line, error);
        }
    }

    std::cout << "\n" << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    return 0;
}

// Пакетный режим: строки файла вычисляются по порядку одним вычислителем,
// поэтому переменные переходят от строки к строке
int runBatch(const Options& options) {
    std::ifstream input(options.inputPath);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + options.inputPath.string());
    }

    std::filesystem::path outputPath = options.outputPath ? *options.outputPath : defaultReportPath(options.inputPath);

    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << options.inputPath << Color::RESET << "\n";
    std::cout << "  Выходной файл: " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    zappac::Evaluator evaluator = makeEvaluator(options);
    zappac::CsvWriter writer(outputPath);

    std::size_t lineNumber = 0;
    std::size_t successCount = 0;
    std::size_t errorCount = 0;
    auto startProcess = std::chrono::high_resolution_clock::now();

    std::string buffer;
    while (std::getline(input, buffer)) {
        ++lineNumber;
        std::string line = trim(buffer);
        if (line.empty()) {
            continue;
        }

        if (options.trace) {
            traceLine(line);
        }

        zappac::EvaluationRecord record{lineNumber, line, "success", "", ""};
        try {
            record.result = evaluator.evaluate(line, !options.dryRun);
            ++successCount;
        }
        catch (const zappac::CalcError& error) {
            record.status = "error";
            record.message = error.what();
            ++errorCount;
        }
        writer.writeRecord(record);
    }

    auto endProcess = std::chrono::high_resolution_clock::now();
    auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(endProcess - startProcess);

    std::cout << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего выражений:  " << Color::CYAN << successCount + errorCount << Color::RESET << "\n";
    std::cout << "  Успешно:          " << Color::GREEN << successCount << Color::RESET << "\n";
    if (errorCount > 0) {
        std::cout << "  Ошибок:           " << Color::RED << errorCount << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << processDuration.count() << " мс\n\n";
    std::cout << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n\n";

    return errorCount == 0 ? 0 : 2;
}

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    try {
        Options options = parseArguments(argc, argv);

        switch (options.mode) {
        case Mode::Help:
            printUsage(argv[0]);
            return 0;
        case Mode::Batch:
            return runBatch(options);
        case Mode::Interactive:
            return runInteractive(options);
        }
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        return 1;
    }
    return 0;
}
