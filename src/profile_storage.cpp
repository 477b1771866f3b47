#include "profile_storage.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "errors.hpp"

namespace zappac {

namespace fs = std::filesystem;

YamlProfileStorage::YamlProfileStorage(fs::path root) : storageRoot(std::move(root)) {}

fs::path YamlProfileStorage::profilePath(const std::string& profile) const {
    // Имя профиля - это имя файла, а не путь
    if (profile.empty() || profile.find_first_of("/\\") != std::string::npos || profile == "." || profile == "..") {
        throw StorageError("Недопустимое имя профиля: '" + profile + "'");
    }
    return storageRoot / (profile + ".yaml");
}

VariableMap YamlProfileStorage::load(const std::string& profile) const {
    fs::path path = profilePath(profile);
    if (!fs::exists(path)) {
        throw StorageError("Профиль не найден: " + path.string());
    }

    VariableMap variables;
    try {
        YAML::Node document = YAML::LoadFile(path.string());
        YAML::Node entries = document["variables"];
        if (!entries) {
            return variables; // Пустой профиль
        }
        if (!entries.IsMap()) {
            throw StorageError("Некорректный профиль " + path.string() + ": variables должен быть словарём");
        }

        for (const auto& entry : entries) {
            auto name = entry.first.as<std::string>();
            auto value = entry.second["value"].as<std::string>();

            NumberSystem system = detectNumberSystem(value);
            if (entry.second["system"]) {
                auto named = numberSystemFromName(entry.second["system"].as<std::string>());
                if (!named) {
                    throw StorageError("Некорректная система счисления у " + name + " в " + path.string());
                }
                system = *named;
            }
            variables.insert_or_assign(name, NumberNode(0, value, system));
        }
    }
    catch (const YAML::Exception& e) {
        throw StorageError("Не удалось прочитать профиль " + path.string() + ": " + e.what());
    }
    return variables;
}

void YamlProfileStorage::save(const std::string& profile, const VariableMap& variables) const {
    fs::path path = profilePath(profile);

    // Права 0700 выставляются только каталогу, который создан здесь
    std::error_code error;
    bool created = fs::create_directories(storageRoot, error);
    if (error) {
        throw StorageError("Не удалось создать каталог " + storageRoot.string() + ": " + error.message());
    }
    if (created) {
        fs::permissions(storageRoot, fs::perms::owner_all, fs::perm_options::replace, error);
        if (error) {
            throw StorageError("Не удалось изменить права каталога " + storageRoot.string() + ": " + error.message());
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "variables" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, number] : variables) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "value" << YAML::Value << YAML::DoubleQuoted << number.value();
        out << YAML::Key << "system" << YAML::Value << numberSystemName(number.system());
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    if (!out.good()) {
        throw StorageError("Не удалось сериализовать профиль: " + out.GetLastError());
    }

    // Файл усекается при открытии, поэтому права 0600 ставятся ещё пустому файлу
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw StorageError("Не удалось открыть файл " + path.string());
    }
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, error);
    if (error) {
        throw StorageError("Не удалось изменить права файла " + path.string() + ": " + error.message());
    }

    file << out.c_str() << '\n';
    file.close();
    if (file.fail()) {
        throw StorageError("Не удалось записать файл " + path.string());
    }
}

} // namespace zappac
