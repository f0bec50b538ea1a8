#include <pipali/supervisor_state.h>

namespace pipali {

SupervisorState::SupervisorState(const std::string& host, int port)
    : host_(host)
    , port_(port)
{
}

bool SupervisorState::install(ProcessHandle&& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        return false;
    }
    handle_.emplace(std::move(handle));
    return true;
}

std::optional<ProcessHandle> SupervisorState::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<ProcessHandle> taken(std::move(handle_));
    handle_.reset();
    return taken;
}

bool SupervisorState::release(int pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_ || handle_->pid() != pid) {
        return false;
    }
    handle_.reset();
    return true;
}

bool SupervisorState::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_.has_value();
}

int SupervisorState::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ ? handle_->pid() : 0;
}

} // namespace pipali
