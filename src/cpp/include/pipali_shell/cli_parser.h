#pragma once

#include <pipali/sidecar_config.h>
#include <CLI/CLI.hpp>
#include <string>

namespace pipali_shell {

struct ShellOptions {
    std::string command = "run";  // run | config | status
    pipali::SidecarConfig sidecar;
};

class CLIParser {
public:
    // defaults: values already loaded from the environment; the command line overrides them
    explicit CLIParser(const pipali::SidecarConfig& defaults);

    // Parse command line arguments
    // Returns: 0 if should continue, exit code (may be 0) if should exit
    int parse(int argc, char** argv);

    ShellOptions get_options() const { return options_; }

    // Check if we should continue (false means exit cleanly, e.g., after --help)
    bool should_continue() const { return should_continue_; }

    // Get exit code (only valid if should_continue() is false)
    int get_exit_code() const { return exit_code_; }

    bool should_show_version() const { return show_version_; }

private:
    CLI::App app_;
    CLI::App* run_cmd_ = nullptr;
    CLI::App* config_cmd_ = nullptr;
    CLI::App* status_cmd_ = nullptr;
    ShellOptions options_;
    bool show_version_ = false;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace pipali_shell
