// SandCastle Platform Layer
// file_io.cpp - File system helpers implementation

#include <sandcastle/platform/file_io.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace sandcastle::platform {

fs::path FileSystem::get_user_data_directory() {
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data != nullptr && *xdg_data != '\0') {
        return fs::path(xdg_data) / "SandCastle";
    }
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return fs::path(home) / ".local" / "share" / "SandCastle";
    }
    return fs::temp_directory_path() / "SandCastle";
}

fs::path FileSystem::get_user_saves_directory() {
    return get_user_data_directory() / "saves";
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        if (!file && !file.eof()) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return content;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    try {
        if (path.has_parent_path() && !exists(path.parent_path())) {
            create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for writing: {}", path.string());
            return false;
        }

        file << content;

        if (!file) {
            spdlog::warn("Error writing file: {}", path.string());
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::error("Failed to create directories '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileSystem::remove(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove '{}': {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

}  // namespace sandcastle::platform
