#include <pipali_shell/cli_parser.h>

namespace pipali_shell {

CLIParser::CLIParser(const pipali::SidecarConfig& defaults)
    : app_("pipali-shell - Desktop shell for the Pipali server") {

    options_.sidecar = defaults;
    pipali::SidecarConfig& cfg = options_.sidecar;

    // Add version flag (help is automatically added by CLI11)
    app_.add_flag("-v,--version", show_version_, "Show version number");

    // Sidecar options. Values loaded from the environment act as defaults.
    app_.add_option("--port", cfg.port, "Port for the sidecar server (env: PIPALI_PORT)")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();

    app_.add_option("--host", cfg.host, "Address the sidecar binds to (env: PIPALI_HOST)")
        ->capture_default_str();

    app_.add_option("--platform-url", cfg.platform_url,
                    "Remote platform URL passed to the sidecar (env: PIPALI_PLATFORM_URL)");

    app_.add_option("--runtime", cfg.runtime,
                    "Runtime executable that runs the server (default: bundled runtime)");

    app_.add_option("--resource-dir", cfg.resource_dir,
                    "Directory containing server/index.js (default: bundled resources)");

    app_.add_option("--data-dir", cfg.data_dir,
                    "Use this data directory instead of the platform default");

    app_.add_option("--log-level", cfg.log_level, "Log level for the shell")
        ->check(CLI::IsMember({"debug", "info", "warning", "error"}))
        ->capture_default_str();

    app_.add_option("--log-file", cfg.log_file, "Also append log output to this file");

    run_cmd_ = app_.add_subcommand("run", "Start the sidecar and supervise it until interrupted (default)");
    config_cmd_ = app_.add_subcommand("config", "Print the sidecar host/port configuration as JSON");
    status_cmd_ = app_.add_subcommand("status", "Probe the sidecar health endpoint once");

    // Allow global options after the subcommand name
    for (CLI::App* sub : {run_cmd_, config_cmd_, status_cmd_}) {
        sub->fallthrough();
    }
    app_.require_subcommand(0, 1);
}

int CLIParser::parse(int argc, char** argv) {
    try {
        app_.parse(argc, argv);

        if (config_cmd_->parsed()) {
            options_.command = "config";
        } else if (status_cmd_->parsed()) {
            options_.command = "status";
        } else {
            options_.command = "run";
        }

        should_continue_ = true;
        exit_code_ = 0;
        return 0;  // Success, continue
    } catch (const CLI::ParseError& e) {
        // Help requested or parse error occurred
        // Let CLI11 handle printing and get the exit code
        exit_code_ = app_.exit(e);
        should_continue_ = false;  // Don't continue, just exit
        return exit_code_;
    }
}

} // namespace pipali_shell
