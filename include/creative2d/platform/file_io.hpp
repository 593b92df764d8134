// Creative2D Platform Abstraction Layer
// file_io.hpp - File system helpers used by configuration and logging

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace creative2d::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations.
// Failures are logged and reported through the return value, never thrown.
class FileSystem {
public:
    // Standard paths
    static fs::path get_executable_directory();
    static fs::path get_user_data_directory();    // ~/.local/share/Creative2D on Linux
    static fs::path get_user_config_directory();  // ~/.config/Creative2D on Linux
    static fs::path get_temp_directory();

    // Text files. write_text goes through a sibling temporary file and a rename,
    // so readers never observe a half written file.
    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool is_file(const fs::path& path);
    static bool remove_all(const fs::path& path);

private:
    FileSystem() = delete;
};

}  // namespace creative2d::platform
