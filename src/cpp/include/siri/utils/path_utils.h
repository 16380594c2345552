#pragma once

#include <string>
#include <vector>

namespace siri {
namespace utils {

/**
 * Get the directory where the executable is located.
 * This allows us to find the bundled sidecar relative to the executable,
 * regardless of the current working directory.
 */
std::string get_executable_dir();

/**
 * Per-user data directory for the application:
 * %APPDATA%\<app_name> on Windows, $XDG_DATA_HOME/<app_name> or
 * ~/.local/share/<app_name> elsewhere.
 */
std::string get_app_data_dir(const std::string& app_name);

/**
 * Locate a bundled executable by its bare name (".exe" is appended on Windows).
 * Searches next to the executable, the current directory, the parent
 * directory, then PATH.
 * @return Absolute path, or empty string if not found.
 */
std::string find_bundled_executable(const std::string& name);

} // namespace utils
} // namespace siri
