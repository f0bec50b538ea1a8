#include <pipali/utils/path_utils.h>
#include <pipali/utils/logging.h>
#include <pipali/error_types.h>
#include <filesystem>
#include <system_error>
#include <vector>
#include <string>
#include <cstdlib>

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

namespace pipali {
namespace utils {

static std::string getenv_or_empty(const char* name) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : std::string();
}

std::string get_executable_dir() {
#ifdef _WIN32
    char buffer[MAX_PATH];
    GetModuleFileNameA(NULL, buffer, MAX_PATH);
    fs::path exe_path(normalize_path(buffer));
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
    return fs::current_path().string();
#elif defined(__APPLE__)
    char buffer[PATH_MAX];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        fs::path exe_path(buffer);
        return exe_path.parent_path().string();
    }
    return fs::current_path().string();
#else
    return fs::current_path().string();
#endif
}

std::string normalize_path(const std::string& path) {
    static const std::string unc_prefix = "\\\\?\\UNC\\";
    static const std::string extended_prefix = "\\\\?\\";

    if (path.compare(0, unc_prefix.size(), unc_prefix) == 0) {
        return "\\\\" + path.substr(unc_prefix.size());
    }
    if (path.compare(0, extended_prefix.size(), extended_prefix) == 0) {
        return path.substr(extended_prefix.size());
    }
    return path;
}

std::string get_home_dir() {
#ifdef _WIN32
    std::string home = getenv_or_empty("USERPROFILE");
#else
    std::string home = getenv_or_empty("HOME");
#endif
    if (home.empty()) {
        throw ResolutionException("Failed to get app data dir: home directory is not set");
    }
    return home;
}

std::string get_app_data_dir() {
#ifdef _WIN32
    std::string root = getenv_or_empty("APPDATA");
    if (root.empty()) {
        root = (fs::path(get_home_dir()) / "AppData" / "Roaming").string();
    }
#elif defined(__APPLE__)
    std::string root = (fs::path(get_home_dir()) / "Library" / "Application Support").string();
#else
    std::string root = getenv_or_empty("XDG_DATA_HOME");
    if (root.empty()) {
        root = (fs::path(get_home_dir()) / ".local" / "share").string();
    }
#endif
    return normalize_path((fs::path(root) / APP_IDENTIFIER).string());
}

std::string get_legacy_data_dir() {
#ifdef _WIN32
    fs::path legacy = fs::path(get_home_dir()) / (std::string(".") + LEGACY_APP_NAME);
#elif defined(__APPLE__)
    fs::path legacy = fs::path(get_home_dir()) / "Library" / "Application Support" / LEGACY_APP_NAME;
#else
    std::string config_root = getenv_or_empty("XDG_CONFIG_HOME");
    if (config_root.empty()) {
        config_root = (fs::path(get_home_dir()) / ".config").string();
    }
    fs::path legacy = fs::path(config_root) / LEGACY_APP_NAME;
#endif
    return normalize_path(legacy.string());
}

DataDirectory resolve_data_directory(const std::string& legacy_dir,
                                     const std::string& current_dir) {
    DataDirectory result;

    if (!legacy_dir.empty()) {
        std::error_code ec;
        fs::path marker = fs::path(legacy_dir) / DATABASE_MARKER;
        if (fs::is_directory(legacy_dir, ec) && fs::exists(marker, ec)) {
            PIPALI_LOG_INFO("Sidecar", "Using legacy data directory: " << legacy_dir);
            result.path = normalize_path(fs::absolute(legacy_dir).string());
            result.is_legacy = true;
            return result;
        }
    }

    if (current_dir.empty()) {
        throw ResolutionException("Failed to get app data dir: no data directory configured");
    }

    std::error_code ec;
    fs::create_directories(current_dir, ec);
    if (ec || !fs::is_directory(current_dir)) {
        throw ResolutionException("Failed to create app data dir " + current_dir + ": " +
                                  (ec ? ec.message() : std::string("not a directory")));
    }

    result.path = normalize_path(fs::absolute(current_dir).string());
    result.is_legacy = false;
    return result;
}

DataDirectory resolve_data_directory() {
    return resolve_data_directory(get_legacy_data_dir(), get_app_data_dir());
}

ServerResources resolve_server_resources(const std::string& resource_root) {
    fs::path root = fs::absolute(resource_root);
    fs::path entry_point = root / "server" / "index.js";

    std::error_code ec;
    if (!fs::is_regular_file(entry_point, ec)) {
        throw InstallationException(normalize_path(entry_point.string()));
    }

    ServerResources resources;
    resources.entry_point = normalize_path(entry_point.string());
    resources.resource_root = normalize_path(root.string());
    return resources;
}

ServerResources resolve_server_resources() {
    fs::path exe_dir = get_executable_dir();

    std::vector<fs::path> candidates = {
        exe_dir / "resources",
#ifdef __APPLE__
        // Inside an app bundle: Contents/MacOS/<exe> -> Contents/Resources/resources
        exe_dir.parent_path() / "Resources" / "resources",
#endif
    };

#if !defined(_WIN32) && !defined(__APPLE__)
    // Linux packages install resources under lib/<app>/
    candidates.push_back(exe_dir.parent_path() / "lib" / "pipali" / "resources");
    candidates.push_back("/usr/lib/pipali/resources");
    candidates.push_back("/usr/local/lib/pipali/resources");
#endif

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) {
            return resolve_server_resources(candidate.string());
        }
    }

    // Fallback: the first candidate, which fails with a clear error
    return resolve_server_resources(candidates.front().string());
}

std::string find_bundled_runtime() {
#ifdef _WIN32
    const char* runtime_name = "bun.exe";
#else
    const char* runtime_name = "bun";
#endif
    return normalize_path((fs::path(get_executable_dir()) / runtime_name).string());
}

} // namespace utils
} // namespace pipali
