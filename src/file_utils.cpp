#include "file_utils.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

// Значение переменной окружения, если она задана и не пуста
std::optional<std::string> environment(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

std::filesystem::path resolveStorageRoot(const std::optional<std::string>& explicitRoot) {
    if (explicitRoot && !explicitRoot->empty()) {
        return *explicitRoot;
    }
    if (auto home = environment("ZAPPAC_HOME")) {
        return *home;
    }

#ifdef _WIN32
    if (auto appData = environment("APPDATA")) {
        return std::filesystem::path(*appData) / "zappac";
    }
#else
    if (auto home = environment("HOME")) {
        return std::filesystem::path(*home) / ".config" / "zappac";
    }
#endif

    return ".";
}

std::filesystem::path defaultReportPath(const std::filesystem::path& inputPath) {
    std::string inputStem = inputPath.stem().string();
    return inputPath.parent_path() / (inputStem + "_results_" + getCurrentTimeString() + ".csv");
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}
