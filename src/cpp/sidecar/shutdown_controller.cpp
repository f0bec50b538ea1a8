#include <pipali/shutdown_controller.h>
#include <pipali/error_types.h>
#include <pipali/utils/logging.h>
#include <thread>
#include <algorithm>
#include <memory>

namespace pipali {

// Forced kill shared by both strategies. A child that is already gone counts as success.
static void force_kill(ProcessHandle& handle) {
    if (handle.kill()) {
        PIPALI_LOG_INFO("Sidecar", "Forced kill issued (PID: " << handle.pid() << ")");
        return;
    }
    if (!handle.is_alive()) {
        return;
    }
    throw StopException("kill failed for PID " + std::to_string(handle.pid()));
}

GracefulThenForced::GracefulThenForced(std::chrono::milliseconds grace_period,
                                       std::chrono::milliseconds poll_interval)
    : grace_period_(grace_period)
    , poll_interval_(poll_interval)
{
}

void GracefulThenForced::terminate(ProcessHandle& handle) {
    using clock = std::chrono::steady_clock;

    if (!handle.terminate()) {
        if (!handle.is_alive()) {
            PIPALI_LOG_DEBUG("Sidecar", "Process already exited (PID: " << handle.pid() << ")");
            return;
        }
        PIPALI_LOG_WARNING("Sidecar", "Failed to send SIGTERM, forcing termination...");
        force_kill(handle);
        return;
    }

    auto deadline = clock::now() + grace_period_;
    while (true) {
        if (!handle.is_alive()) {
            PIPALI_LOG_DEBUG("Sidecar", "Process exited gracefully (PID: " << handle.pid() << ")");
            return;
        }

        auto now = clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(poll_interval_, remaining + std::chrono::milliseconds(1)));
    }

    PIPALI_LOG_WARNING("Sidecar", "Process did not exit within " << grace_period_.count()
                       << "ms, forcing termination...");
    force_kill(handle);
}

void ForcedOnly::terminate(ProcessHandle& handle) {
    force_kill(handle);
}

std::unique_ptr<TerminationStrategy> make_default_termination_strategy() {
#ifdef _WIN32
    return std::make_unique<ForcedOnly>();
#else
    return std::make_unique<GracefulThenForced>();
#endif
}

} // namespace pipali
