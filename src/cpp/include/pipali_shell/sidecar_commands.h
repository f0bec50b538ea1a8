#pragma once

#include <pipali/sidecar_manager.h>
#include <nlohmann/json.hpp>
#include <string>

namespace pipali_shell {

using json = nlohmann::json;

// Operations the UI layer may invoke on the sidecar.
// Mutating commands return {"status": "ok"} or {"error": {"message", "type"}}.
class SidecarCommands {
public:
    explicit SidecarCommands(pipali::SidecarManager& manager);

    int get_port() const;
    std::string get_host() const;
    json get_config() const;

    json start();
    json stop();
    json restart();

    static bool is_ok(const json& result);

private:
    template <typename Operation>
    json invoke(const char* name, Operation operation);

    pipali::SidecarManager& manager_;
};

} // namespace pipali_shell
