// Creative2D Platform Abstraction Layer
// file_io.cpp - File system helpers implementation

#include <creative2d/platform/file_io.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iterator>

#if defined(CREATIVE2D_PLATFORM_MACOS)
#include <mach-o/dyld.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#elif defined(CREATIVE2D_PLATFORM_WINDOWS)
#include <shlobj.h>
#include <windows.h>
#elif defined(CREATIVE2D_PLATFORM_LINUX)
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace creative2d::platform {

namespace {

constexpr const char* APP_DIRECTORY = "Creative2D";

#if defined(CREATIVE2D_PLATFORM_MACOS) || defined(CREATIVE2D_PLATFORM_LINUX)
fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        const struct passwd* pw = getpwuid(getuid());
        if (pw == nullptr) {
            return fs::current_path();
        }
        home = pw->pw_dir;
    }
    return fs::path(home);
}
#endif

}  // namespace

fs::path FileSystem::get_executable_directory() {
#if defined(CREATIVE2D_PLATFORM_MACOS)
    char path[1024];
    uint32_t size = sizeof(path);
    if (_NSGetExecutablePath(path, &size) == 0) {
        return fs::path(path).parent_path();
    }
    return fs::current_path();
#elif defined(CREATIVE2D_PLATFORM_WINDOWS)
    wchar_t path[MAX_PATH];
    if (GetModuleFileNameW(nullptr, path, MAX_PATH) != 0) {
        return fs::path(path).parent_path();
    }
    return fs::current_path();
#elif defined(CREATIVE2D_PLATFORM_LINUX)
    char path[1024];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len != -1) {
        path[len] = '\0';
        return fs::path(path).parent_path();
    }
    return fs::current_path();
#else
    return fs::current_path();
#endif
}

fs::path FileSystem::get_user_data_directory() {
#if defined(CREATIVE2D_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / APP_DIRECTORY;
#elif defined(CREATIVE2D_PLATFORM_WINDOWS)
    wchar_t* path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &path))) {
        fs::path result = fs::path(path) / APP_DIRECTORY;
        CoTaskMemFree(path);
        return result;
    }
    return get_executable_directory() / "data";
#elif defined(CREATIVE2D_PLATFORM_LINUX)
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
        return fs::path(xdg_data) / APP_DIRECTORY;
    }
    return home_directory() / ".local" / "share" / APP_DIRECTORY;
#else
    return get_executable_directory() / "data";
#endif
}

fs::path FileSystem::get_user_config_directory() {
#if defined(CREATIVE2D_PLATFORM_LINUX)
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        return fs::path(xdg_config) / APP_DIRECTORY;
    }
    return home_directory() / ".config" / APP_DIRECTORY;
#elif defined(CREATIVE2D_PLATFORM_MACOS)
    return get_user_data_directory();
#else
    return get_user_data_directory() / "config";
#endif
}

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / APP_DIRECTORY;
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
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
    fs::path temp_path = path;
    temp_path += ".tmp";

    try {
        if (path.has_parent_path() && !exists(path.parent_path())) {
            create_directories(path.parent_path());
        }

        {
            std::ofstream file(temp_path, std::ios::trunc);
            if (!file.is_open()) {
                spdlog::warn("Failed to open file for writing: {}", temp_path.string());
                return false;
            }
            file << content;
            file.flush();
            if (!file) {
                spdlog::warn("Error writing file: {}", temp_path.string());
                return false;
            }
        }

        fs::rename(temp_path, path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        std::error_code ec;
        fs::remove(temp_path, ec);
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
    bool result = fs::exists(path, ec);
    if (ec) {
        spdlog::warn("Error checking existence of '{}': {}", path.string(), ec.message());
        return false;
    }
    return result;
}

bool FileSystem::is_file(const fs::path& path) {
    std::error_code ec;
    bool result = fs::is_regular_file(path, ec);
    return !ec && result;
}

bool FileSystem::remove_all(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::error("Failed to remove '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

}  // namespace creative2d::platform
