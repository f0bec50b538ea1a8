#include <pipali_shell/sidecar_commands.h>
#include <pipali/error_types.h>
#include <pipali/utils/logging.h>

namespace pipali_shell {

SidecarCommands::SidecarCommands(pipali::SidecarManager& manager)
    : manager_(manager)
{
}

int SidecarCommands::get_port() const {
    return manager_.get_port();
}

std::string SidecarCommands::get_host() const {
    return manager_.get_host();
}

json SidecarCommands::get_config() const {
    return manager_.get_config();
}

template <typename Operation>
json SidecarCommands::invoke(const char* name, Operation operation) {
    try {
        operation();
        return {{"status", "ok"}};
    } catch (const pipali::PipaliException& e) {
        PIPALI_LOG_ERROR("Shell", "Sidecar " << name << " failed: " << e.what());
        return pipali::ErrorResponse::from_exception(e);
    } catch (const std::exception& e) {
        PIPALI_LOG_ERROR("Shell", "Sidecar " << name << " failed: " << e.what());
        return pipali::ErrorResponse::from_std_exception(e);
    }
}

json SidecarCommands::start() {
    return invoke("start", [this]() { manager_.start(); });
}

json SidecarCommands::stop() {
    return invoke("stop", [this]() { manager_.stop(); });
}

json SidecarCommands::restart() {
    return invoke("restart", [this]() { manager_.restart(); });
}

bool SidecarCommands::is_ok(const json& result) {
    return result.contains("status") && result["status"] == "ok";
}

} // namespace pipali_shell
