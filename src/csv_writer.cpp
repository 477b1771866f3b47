#include "csv_writer.hpp"

#include <stdexcept>
#include <utility>

namespace zappac {

namespace {

std::string quoted(const std::string& field) {
    std::string result = "\"";
    for (char ch : field) {
        if (ch == '"') {
            result += '"';
        }
        result += ch;
    }
    result += '"';
    return result;
}

} // namespace

CsvWriter::CsvWriter(std::filesystem::path path) : targetPath(std::move(path)) {
    stream.open(targetPath, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + targetPath.string());
    }
    stream << "line,expression,status,result,message\n";
}

void CsvWriter::writeRecord(const EvaluationRecord& record) {
    stream << record.lineNumber << ','
        << quoted(record.expression) << ','
        << record.status << ','
        << quoted(record.result) << ','
        << quoted(record.message) << '\n';

    if (!stream) {
        throw std::runtime_error("Ошибка записи CSV: " + targetPath.string());
    }
}

} // namespace zappac
