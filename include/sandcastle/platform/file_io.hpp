// SandCastle Platform Layer
// file_io.hpp - File system helpers used by config, logging and save files

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sandcastle::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations
class FileSystem {
public:
    // Standard paths
    static fs::path get_user_data_directory();   // $XDG_DATA_HOME/SandCastle or ~/.local/share/SandCastle
    static fs::path get_user_saves_directory();  // Snapshot files

    // Synchronous file operations
    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    // Directory operations
    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool remove(const fs::path& path);

private:
    FileSystem() = delete;  // Static class, no instances
};

}  // namespace sandcastle::platform
