#include <pipali/sidecar_manager.h>
#include <pipali/error_types.h>
#include <pipali/utils/path_utils.h>
#include <pipali/utils/logging.h>
#include <thread>
#include <stdexcept>

namespace pipali {

SidecarManager::SidecarManager(const SidecarConfig& config,
                               std::unique_ptr<TerminationStrategy> termination,
                               Spawner spawner,
                               ReadinessPoller poller)
    : config_(config)
    , state_(std::make_shared<SupervisorState>(config.host, config.port))
    , termination_(std::move(termination))
    , spawner_(std::move(spawner))
    , poller_(std::move(poller))
    , settle_delay_(DEFAULT_SETTLE_DELAY)
{
    if (!termination_) {
        termination_ = make_default_termination_strategy();
    }
    if (!spawner_) {
        spawner_ = [](const LaunchSpec& spec) {
            return utils::ProcessManager::spawn(spec.executable, spec.args, spec.working_dir, spec.env);
        };
    }
}

SidecarManager::~SidecarManager() {
    try {
        stop();
    } catch (const std::exception& e) {
        PIPALI_LOG_ERROR("SidecarManager", "Error stopping sidecar on exit: " << e.what());
    }
}

LaunchSpec SidecarManager::prepare_launch() const {
    utils::DataDirectory data_dir;
    if (!config_.data_dir.empty()) {
        data_dir = utils::resolve_data_directory("", config_.data_dir);
    } else {
        data_dir = utils::resolve_data_directory();
    }

    utils::ServerResources resources = config_.resource_dir.empty()
        ? utils::resolve_server_resources()
        : utils::resolve_server_resources(config_.resource_dir);

    std::string runtime = config_.runtime.empty()
        ? utils::find_bundled_runtime()
        : config_.runtime;

    PIPALI_LOG_INFO("Sidecar", "Data directory: " << data_dir.path
                    << (data_dir.is_legacy ? " (legacy)" : ""));
    PIPALI_LOG_DEBUG("Sidecar", "Entry point: " << resources.entry_point);
    PIPALI_LOG_DEBUG("Sidecar", "Runtime: " << runtime);

    return build_launch_spec(runtime, resources, data_dir,
                             state_->host(), state_->port(), config_.platform_url);
}

void SidecarManager::start() {
    std::lock_guard<std::mutex> start_lock(start_mutex_);

    if (state_->is_running()) {
        PIPALI_LOG_INFO("Sidecar", "Already running");
        return;
    }

    PIPALI_LOG_INFO("Sidecar", "Starting on port " << state_->port() << "...");

    // Resolution errors propagate before anything is spawned
    LaunchSpec spec = prepare_launch();

    utils::SpawnedProcess spawned = [&]() {
        try {
            return spawner_(spec);
        } catch (const PipaliException&) {
            throw;
        } catch (const std::exception& e) {
            throw SpawnException(e.what());
        }
    }();

    int pid = spawned.handle.pid();
    if (!state_->install(std::move(spawned.handle))) {
        // Only reachable if the state was filled outside of start()
        PIPALI_LOG_ERROR("Sidecar", "State already holds a process, discarding PID " << pid);
        termination_->terminate(spawned.handle);
        OutputPump::start_detached(std::move(spawned.events), state_);
        throw SpawnException("a sidecar process is already registered");
    }

    OutputPump::TerminationCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = termination_callback_;
    }
    OutputPump::start_detached(std::move(spawned.events), state_, callback);

    PIPALI_LOG_INFO("Sidecar", "Process spawned (PID: " << pid << "), waiting for server to be ready...");
}

void SidecarManager::stop() {
    std::optional<ProcessHandle> handle = state_->take();
    if (!handle) {
        return;
    }

    PIPALI_LOG_INFO("Sidecar", "Stopping (PID: " << handle->pid() << ", " << termination_->name() << ")...");
    termination_->terminate(*handle);
    PIPALI_LOG_INFO("Sidecar", "Stopped");
}

void SidecarManager::restart() {
    stop();
    // Give the OS time to release the listening port
    std::this_thread::sleep_for(settle_delay_);
    start();
}

int SidecarManager::wait_until_ready(int max_attempts, std::chrono::milliseconds interval) const {
    return poller_.wait_until_ready(state_->host(), state_->port(), max_attempts, interval);
}

std::future<int> SidecarManager::wait_until_ready_async(int max_attempts,
                                                       std::chrono::milliseconds interval) const {
    auto promise = std::make_shared<std::promise<int>>();
    std::future<int> result = promise->get_future();

    // Copies only, so the poll may outlive this manager
    ReadinessPoller poller = poller_;
    std::string host = state_->host();
    int port = state_->port();

    std::thread([promise, poller, host, port, max_attempts, interval]() {
        try {
            promise->set_value(poller.wait_until_ready(host, port, max_attempts, interval));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    return result;
}

json SidecarManager::get_config() const {
    return {
        {"host", state_->host()},
        {"port", state_->port()}
    };
}

std::string SidecarManager::get_base_url() const {
    return "http://" + state_->host() + ":" + std::to_string(state_->port());
}

void SidecarManager::set_termination_callback(OutputPump::TerminationCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    termination_callback_ = std::move(callback);
}

} // namespace pipali
