#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace pipali {

using json = nlohmann::json;

inline constexpr char DEFAULT_HOST[] = "127.0.0.1";
inline constexpr int DEFAULT_PORT = 6464;

struct SidecarConfig {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
    std::string platform_url;   // passed through to the sidecar if set

    // Overrides for development and tests. Empty means "resolve normally".
    std::string runtime;        // executable that runs the entry point
    std::string resource_dir;   // directory containing server/index.js
    std::string data_dir;       // skip legacy/current resolution entirely

    std::string log_level = "info";
    std::string log_file;

    // Load defaults from PIPALI_* environment variables.
    // Invalid numeric values keep the current value.
    void load_env_defaults();

    json to_json() const;
};

} // namespace pipali
