#pragma once

#include <filesystem>
#include <optional>
#include <string>

// Каталог профилей.
// Порядок: явный путь (--storage), переменная окружения ZAPPAC_HOME,
// %APPDATA%/zappac в Windows или $HOME/.config/zappac в остальных системах,
// иначе текущий каталог.
std::filesystem::path resolveStorageRoot(const std::optional<std::string>& explicitRoot);

// Имя отчёта по умолчанию: <каталог входного файла>/<имя>_results_<время>.csv
std::filesystem::path defaultReportPath(const std::filesystem::path& inputPath);

// Получение текущего времени в формате для имени файла
std::string getCurrentTimeString();
