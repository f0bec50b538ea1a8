#include <pipali/sidecar_config.h>
#include <cstdlib>
#include <stdexcept>

namespace pipali {

void SidecarConfig::load_env_defaults() {
    // Helper to get environment variable with fallback
    auto getenv_or_default = [](const char* name, const std::string& default_val) -> std::string {
        const char* val = std::getenv(name);
        return (val && *val) ? std::string(val) : default_val;
    };

    // Helper to get a port number from the environment with fallback
    auto getenv_port_or_default = [](const char* name, int default_val) -> int {
        const char* val = std::getenv(name);
        if (!val || !*val) {
            return default_val;
        }
        try {
            size_t consumed = 0;
            int port = std::stoi(val, &consumed);
            if (val[consumed] != '\0' || port <= 0 || port > 65535) {
                return default_val;
            }
            return port;
        } catch (const std::logic_error&) {
            // Invalid integer, use default
            return default_val;
        }
    };

    host = getenv_or_default("PIPALI_HOST", host);
    port = getenv_port_or_default("PIPALI_PORT", port);
    platform_url = getenv_or_default("PIPALI_PLATFORM_URL", platform_url);
    runtime = getenv_or_default("PIPALI_RUNTIME", runtime);
    resource_dir = getenv_or_default("PIPALI_RESOURCE_DIR", resource_dir);
    data_dir = getenv_or_default("PIPALI_DATA_DIR_OVERRIDE", data_dir);
    log_level = getenv_or_default("PIPALI_LOG_LEVEL", log_level);
}

json SidecarConfig::to_json() const {
    return {
        {"host", host},
        {"port", port}
    };
}

} // namespace pipali
