#pragma once

#include <string>

namespace pipali {
namespace utils {

// Per-application directory name under the platform app-data root
inline constexpr char APP_IDENTIFIER[] = "ai.pipali.desktop";
// Directory name used by installations that predate the identifier
inline constexpr char LEGACY_APP_NAME[] = "panini";
// Presence of this file or directory marks a data directory as in use
inline constexpr char DATABASE_MARKER[] = "pipali.db";

struct DataDirectory {
    std::string path;
    bool is_legacy = false;
};

struct ServerResources {
    std::string entry_point;
    std::string resource_root;
};

/**
 * Get the directory where the executable is located.
 * This allows us to find resources relative to the executable,
 * regardless of the current working directory.
 */
std::string get_executable_dir();

/**
 * Strip Windows extended-length prefixes ("\\?\C:\..." -> "C:\...",
 * "\\?\UNC\server\share" -> "\\server\share") so the path can be handed
 * to a child process as-is. Other paths are returned unchanged.
 */
std::string normalize_path(const std::string& path);

// User home (HOME, or USERPROFILE on Windows). Throws ResolutionException if unset.
std::string get_home_dir();

// Platform-managed per-application data path (not created).
std::string get_app_data_dir();

// Historical per-OS data location kept for older installations.
std::string get_legacy_data_dir();

/**
 * Pick the data directory for the sidecar.
 * The legacy candidate wins if it exists and contains DATABASE_MARKER.
 * Otherwise the current candidate is created (with parents) and returned.
 * Nothing is copied or moved between the two.
 * Throws ResolutionException if the current directory cannot be created.
 */
DataDirectory resolve_data_directory(const std::string& legacy_dir,
                                     const std::string& current_dir);

// Same as above with the platform default candidates.
DataDirectory resolve_data_directory();

/**
 * Locate the server entry point under resource_root.
 * Throws InstallationException if the entry point does not exist.
 */
ServerResources resolve_server_resources(const std::string& resource_root);

// Same as above, searching the bundled resource directory of this installation.
ServerResources resolve_server_resources();

// Default bundled runtime that executes the entry point (next to the executable).
std::string find_bundled_runtime();

} // namespace utils
} // namespace pipali
