#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace zappac {

// Результат вычисления одной строки входного файла
struct EvaluationRecord {
    std::size_t lineNumber;   // Номер строки в исходном файле
    std::string expression;   // Исходный текст строки
    std::string status;       // success или error
    std::string result;       // Текст результата (пусто при ошибке)
    std::string message;      // Сообщение об ошибке или статус команды
};

// Потоковая запись результатов в CSV: line,expression,status,result,message.
// Текстовые поля заключаются в кавычки, кавычки внутри удваиваются.
class CsvWriter {
public:
    // Открывает файл (перезаписывая его) и записывает заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Дописывает один результат
    void writeRecord(const EvaluationRecord& record);

private:
    std::filesystem::path targetPath;
    std::ofstream stream;
};

} // namespace zappac
