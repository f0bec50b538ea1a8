#pragma once

#include "cli_parser.h"
#include "sidecar_commands.h"
#include <pipali/sidecar_manager.h>
#include <memory>
#include <future>
#include <atomic>

namespace pipali_shell {

// Headless stand-in for the window/tray layer: owns the supervisor for the
// lifetime of the application and reacts to exit and restart requests.
class ShellApp {
public:
    ShellApp(int argc, char* argv[]);
    ~ShellApp();

    int run();
    void shutdown();  // Public method for signal handlers

    // Ask the event loop to restart the sidecar (SIGHUP on POSIX)
    void request_restart() { restart_requested_ = true; }
    void request_exit() { should_exit_ = true; }

#ifndef _WIN32
    // Self-pipe written by the signal handler, read by the event loop
    static int signal_pipe_[2];
#endif

private:
    // Initialization
    void print_version();
    bool setup_logging();
    void install_signal_handlers();

    // Command implementations
    int execute_run_command();
    int execute_config_command();
    int execute_status_command();

    // Event loop
    void event_loop();
    void wait_for_event();
    void check_readiness();
    void start_readiness_check();

    // Member variables
    ShellOptions options_;
    bool exit_early_ = false;
    int early_exit_code_ = 0;

    std::unique_ptr<pipali::SidecarManager> manager_;
    std::unique_ptr<SidecarCommands> commands_;
    std::future<int> readiness_;

    std::atomic<bool> should_exit_{false};
    std::atomic<bool> restart_requested_{false};
    bool signal_handlers_installed_ = false;
};

} // namespace pipali_shell
