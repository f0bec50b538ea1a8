#pragma once

#include "sidecar_config.h"
#include "supervisor_state.h"
#include "launch_spec.h"
#include "output_pump.h"
#include "readiness_poller.h"
#include "shutdown_controller.h"
#include "utils/process_manager.h"
#include <string>
#include <memory>
#include <mutex>
#include <chrono>
#include <functional>
#include <future>

namespace pipali {

// Supervises the single sidecar process: launch, readiness, shutdown.
// All operations are safe to call from any thread.
class SidecarManager {
public:
    using Spawner = std::function<utils::SpawnedProcess(const LaunchSpec& spec)>;

    static constexpr std::chrono::milliseconds DEFAULT_SETTLE_DELAY{500};

    explicit SidecarManager(const SidecarConfig& config,
                            std::unique_ptr<TerminationStrategy> termination = make_default_termination_strategy(),
                            Spawner spawner = nullptr,
                            ReadinessPoller poller = ReadinessPoller());
    ~SidecarManager();

    SidecarManager(const SidecarManager&) = delete;
    SidecarManager& operator=(const SidecarManager&) = delete;

    /**
     * Spawn the sidecar unless one is already running (then a no-op).
     * Returns as soon as the child exists; readiness is a separate step.
     * Throws ResolutionException, InstallationException or SpawnException;
     * on failure no child is left behind and the state stays empty.
     */
    void start();

    /**
     * Stop the sidecar if one is running (otherwise a no-op).
     * Throws StopException if the forced kill could not be issued.
     */
    void stop();

    // stop(), settle delay, start()
    void restart();

    // Throws ReadinessTimeoutException. Does not touch the supervisor state.
    int wait_until_ready(int max_attempts = ReadinessPoller::DEFAULT_MAX_ATTEMPTS,
                         std::chrono::milliseconds interval = ReadinessPoller::DEFAULT_INTERVAL) const;

    // Same on a detached background thread. The poll always runs to completion;
    // dropping the future just ignores the result.
    std::future<int> wait_until_ready_async(int max_attempts = ReadinessPoller::DEFAULT_MAX_ATTEMPTS,
                                            std::chrono::milliseconds interval = ReadinessPoller::DEFAULT_INTERVAL) const;

    bool is_running() const { return state_->is_running(); }
    int pid() const { return state_->pid(); }

    int get_port() const { return state_->port(); }
    const std::string& get_host() const { return state_->host(); }
    json get_config() const;

    std::string get_base_url() const;

    // Called from the output pump thread whenever a child terminates
    void set_termination_callback(OutputPump::TerminationCallback callback);

    void set_settle_delay(std::chrono::milliseconds delay) { settle_delay_ = delay; }

    // Assemble the launch spec for the current configuration (resolves paths,
    // creates the data directory). Throws like start().
    LaunchSpec prepare_launch() const;

private:
    SidecarConfig config_;
    std::shared_ptr<SupervisorState> state_;
    std::unique_ptr<TerminationStrategy> termination_;
    Spawner spawner_;
    ReadinessPoller poller_;
    std::chrono::milliseconds settle_delay_;

    // Serializes whole start() calls so concurrent starts spawn at most one child
    std::mutex start_mutex_;

    std::mutex callback_mutex_;
    OutputPump::TerminationCallback termination_callback_;
};

} // namespace pipali
