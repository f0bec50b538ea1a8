#include "pipali_shell/shell_app.h"
#include <pipali/single_instance.h>
#include <pipali/readiness_poller.h>
#include <pipali/error_types.h>
#include <pipali/utils/logging.h>
#include <pipali/version.h>
#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#else
#include <cstring>     // for strerror
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/select.h>
#endif

namespace pipali_shell {

#ifndef _WIN32
// Initialize static signal pipe
int ShellApp::signal_pipe_[2] = {-1, -1};
#endif

// Global pointer to the current ShellApp instance for signal handling
static ShellApp* g_shell_app_instance = nullptr;

#ifdef _WIN32
// Windows Ctrl+C / console close handler
BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
    if (ctrl_type == CTRL_C_EVENT) {
        if (g_shell_app_instance) {
            g_shell_app_instance->request_exit();
        }
        return TRUE;
    }
    if (ctrl_type == CTRL_BREAK_EVENT) {
        // Ctrl+Break plays the role of SIGHUP
        if (g_shell_app_instance) {
            g_shell_app_instance->request_restart();
        }
        return TRUE;
    }
    if (ctrl_type == CTRL_CLOSE_EVENT) {
        // Windows terminates us once this handler returns, so clean up here
        if (g_shell_app_instance) {
            g_shell_app_instance->shutdown();
        }
        std::exit(0);
    }
    return FALSE;
}
#else
// Unix signal handler: defer all work to the event loop.
// write() is async-signal-safe.
void signal_handler(int signal) {
    char sig = static_cast<char>(signal);
    ssize_t written = write(ShellApp::signal_pipe_[1], &sig, 1);
    (void)written;
}
#endif

ShellApp::ShellApp(int argc, char* argv[]) {
    // Load defaults from environment variables before parsing command-line arguments
    pipali::SidecarConfig defaults;
    defaults.load_env_defaults();

    CLIParser parser(defaults);
    parser.parse(argc, argv);

    if (!parser.should_continue()) {
        exit_early_ = true;
        early_exit_code_ = parser.get_exit_code();
        return;
    }

    if (parser.should_show_version()) {
        print_version();
        exit_early_ = true;
        return;
    }

    options_ = parser.get_options();
    setup_logging();

    manager_ = std::make_unique<pipali::SidecarManager>(options_.sidecar);
    commands_ = std::make_unique<SidecarCommands>(*manager_);
}

ShellApp::~ShellApp() {
    shutdown();

#ifndef _WIN32
    if (signal_pipe_[0] != -1) {
        close(signal_pipe_[0]);
        close(signal_pipe_[1]);
        signal_pipe_[0] = signal_pipe_[1] = -1;
    }
#endif

    g_shell_app_instance = nullptr;
}

int ShellApp::run() {
    if (exit_early_) {
        return early_exit_code_;
    }

    PIPALI_LOG_DEBUG("Shell", "Command: " << options_.command);

    if (options_.command == "config") {
        return execute_config_command();
    }
    if (options_.command == "status") {
        return execute_status_command();
    }
    return execute_run_command();
}

void ShellApp::shutdown() {
    if (!commands_ || !manager_->is_running()) {
        return;
    }

    PIPALI_LOG_INFO("App", "Exit requested, stopping sidecar...");
    json result = commands_->stop();
    if (!SidecarCommands::is_ok(result)) {
        PIPALI_LOG_ERROR("App", "Error stopping sidecar on exit: " << result["error"]["message"].get<std::string>());
    }
}

void ShellApp::print_version() {
    std::cout << "pipali-shell version " << PIPALI_VERSION_STRING << std::endl;
}

bool ShellApp::setup_logging() {
    pipali::utils::set_log_level(pipali::utils::parse_log_level(options_.sidecar.log_level));
    if (!options_.sidecar.log_file.empty()) {
        return pipali::utils::set_log_file(options_.sidecar.log_file);
    }
    return true;
}

void ShellApp::install_signal_handlers() {
    if (signal_handlers_installed_) {
        return;
    }
    g_shell_app_instance = this;

#ifdef _WIN32
    SetConsoleCtrlHandler(console_ctrl_handler, TRUE);
#else
    // Create self-pipe for safe signal handling
    if (pipe(signal_pipe_) == -1) {
        throw std::runtime_error(std::string("Failed to create signal pipe: ") + strerror(errno));
    }

    // Set write end to non-blocking to prevent signal handler from blocking
    for (int fd : signal_pipe_) {
        int flags = fcntl(fd, F_GETFL);
        if (flags != -1) {
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
        fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);
    // Broken pipes must not kill the shell; the output pump sees EOF instead
    signal(SIGPIPE, SIG_IGN);
#endif

    signal_handlers_installed_ = true;
    PIPALI_LOG_DEBUG("Shell", "Signal handlers installed");
}

int ShellApp::execute_config_command() {
    std::cout << commands_->get_config().dump(2) << std::endl;
    return 0;
}

int ShellApp::execute_status_command() {
    pipali::HealthStatus status = pipali::probe_health(commands_->get_host(), commands_->get_port());

    json result = commands_->get_config();
    result["health"] = pipali::health_status_name(status);
    std::cout << result.dump(2) << std::endl;

    return status == pipali::HealthStatus::HEALTHY ? 0 : 1;
}

int ShellApp::execute_run_command() {
    pipali::InstanceLock instance_lock("sidecar-" + std::to_string(commands_->get_port()));
    if (!instance_lock.acquired()) {
        PIPALI_LOG_ERROR("Shell", "Another pipali-shell is already supervising a sidecar on port "
                         << commands_->get_port());
        return 1;
    }

    install_signal_handlers();

    // The callback may run on a pump thread after this object is gone, so it captures nothing
    manager_->set_termination_callback([](int pid, const pipali::utils::ExitStatus&, bool unexpected) {
        if (unexpected) {
#ifdef _WIN32
            PIPALI_LOG_WARNING("Shell", "Sidecar (PID " << pid << ") is no longer running; press Ctrl+Break to restart it");
#else
            PIPALI_LOG_WARNING("Shell", "Sidecar (PID " << pid << ") is no longer running; send SIGHUP to restart it");
#endif
        }
    });

    json result = commands_->start();
    if (!SidecarCommands::is_ok(result)) {
        std::cerr << "Failed to start sidecar: " << result["error"]["message"].get<std::string>() << std::endl;
        return 1;
    }

    // Readiness is polled in the background; the event loop stays responsive
    start_readiness_check();

    event_loop();

    shutdown();
    return 0;
}

void ShellApp::start_readiness_check() {
    readiness_ = manager_->wait_until_ready_async();
}

void ShellApp::check_readiness() {
    if (!readiness_.valid() ||
        readiness_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return;
    }

    try {
        readiness_.get();
        PIPALI_LOG_INFO("Shell", "Sidecar ready at " << manager_->get_base_url());
    } catch (const pipali::ReadinessTimeoutException& e) {
        // Not fatal: the sidecar may still come up, the UI shows a connection error meanwhile
        PIPALI_LOG_WARNING("Shell", "Sidecar not ready: " << e.what());
    }
}

void ShellApp::event_loop() {
    PIPALI_LOG_DEBUG("Shell", "Entering event loop");

    while (!should_exit_) {
        wait_for_event();
        check_readiness();

        if (!should_exit_ && restart_requested_.exchange(false)) {
            PIPALI_LOG_INFO("Shell", "Restarting sidecar...");
            json result = commands_->restart();
            if (SidecarCommands::is_ok(result)) {
                start_readiness_check();
            }
        }
    }

    PIPALI_LOG_DEBUG("Shell", "Event loop exited");
}

void ShellApp::wait_for_event() {
#ifdef _WIN32
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
#else
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(signal_pipe_[0], &readfds);

    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100000;  // 100ms

    int result = select(signal_pipe_[0] + 1, &readfds, nullptr, nullptr, &tv);
    if (result <= 0 || !FD_ISSET(signal_pipe_[0], &readfds)) {
        return;
    }

    char sig;
    while (read(signal_pipe_[0], &sig, 1) == 1) {
        if (sig == SIGINT || sig == SIGTERM) {
            std::cout << "\nReceived " << (sig == SIGINT ? "interrupt" : "termination")
                      << " signal, shutting down gracefully..." << std::endl;
            should_exit_ = true;
        } else if (sig == SIGHUP) {
            restart_requested_ = true;
        }
    }
#endif
}

} // namespace pipali_shell
