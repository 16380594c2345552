#include <siri/utils/path_utils.h>
#include <filesystem>
#include <cstdlib>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <limits.h>
#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif
#endif

namespace fs = std::filesystem;

namespace siri {
namespace utils {

std::string get_executable_dir() {
#ifdef _WIN32
    char buffer[MAX_PATH];
    GetModuleFileNameA(NULL, buffer, MAX_PATH);
    fs::path exe_path(buffer);
    return exe_path.parent_path().string();
#elif defined(__linux__)
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len != -1) {
        buffer[len] = '\0';
        fs::path exe_path(buffer);
        return exe_path.parent_path().string();
    }
    // Fallback: return current directory
    return ".";
#elif defined(__APPLE__)
    char buffer[PATH_MAX];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        fs::path exe_path(buffer);
        return exe_path.parent_path().string();
    }
    // Fallback: return current directory
    return ".";
#else
    // Generic Unix fallback
    return ".";
#endif
}

std::string get_app_data_dir(const std::string& app_name) {
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata && *appdata) {
        return (fs::path(appdata) / app_name).string();
    }
    return (fs::temp_directory_path() / app_name).string();
#else
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data && *xdg_data) {
        return (fs::path(xdg_data) / app_name).string();
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (fs::path(home) / ".local" / "share" / app_name).string();
    }
    return (fs::temp_directory_path() / app_name).string();
#endif
}

std::string find_bundled_executable(const std::string& name) {
#ifdef _WIN32
    std::string binary_name = name + ".exe";
    const char path_separator = ';';
#else
    std::string binary_name = name;
    const char path_separator = ':';
#endif

    std::vector<fs::path> search_paths;

    // First priority: same directory as this executable
    search_paths.push_back(fs::path(get_executable_dir()) / binary_name);

    // Current directory
    search_paths.push_back(fs::path(binary_name));

    // Parent directory
    search_paths.push_back(fs::path("..") / binary_name);

    // PATH entries
    const char* path_env = std::getenv("PATH");
    if (path_env) {
        std::stringstream ss(path_env);
        std::string entry;
        while (std::getline(ss, entry, path_separator)) {
            if (!entry.empty()) {
                search_paths.push_back(fs::path(entry) / binary_name);
            }
        }
    }

    for (const auto& path : search_paths) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            return fs::absolute(path, ec).string();
        }
    }

    return "";
}

} // namespace utils
} // namespace siri
