#pragma once

#include <filesystem>
#include <map>
#include <string>

#include "node.hpp"

namespace zappac {

// Хранилище переменных: имя ($foo) -> значение
using VariableMap = std::map<std::string, NumberNode>;

// Именованные профили переменных на диске.
// Оба метода выбрасывают StorageError при ошибке ввода-вывода или формата.
class ProfileStorage {
public:
    virtual ~ProfileStorage() = default;

    // Читает профиль целиком
    virtual VariableMap load(const std::string& profile) const = 0;

    // Перезаписывает профиль текущим набором переменных
    virtual void save(const std::string& profile, const VariableMap& variables) const = 0;
};

// Профили в формате YAML, один файл <root>/<profile>.yaml:
//
//   variables:
//     $foo:
//       value: "0xff"
//       system: hex
class YamlProfileStorage final : public ProfileStorage {
public:
    explicit YamlProfileStorage(std::filesystem::path root);

    VariableMap load(const std::string& profile) const override;
    void save(const std::string& profile, const VariableMap& variables) const override;

    // Путь к файлу профиля
    std::filesystem::path profilePath(const std::string& profile) const;

private:
    std::filesystem::path storageRoot;
};

} // namespace zappac
