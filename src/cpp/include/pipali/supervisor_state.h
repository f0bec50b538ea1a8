#pragma once

#include "utils/process_manager.h"
#include <string>
#include <mutex>
#include <optional>

namespace pipali {

using utils::ProcessHandle;

// The one record of "is a sidecar running, and what is its handle".
// The lock is only held for the handle swaps below, never across blocking work.
class SupervisorState {
public:
    SupervisorState(const std::string& host, int port);

    SupervisorState(const SupervisorState&) = delete;
    SupervisorState& operator=(const SupervisorState&) = delete;

    // Store the handle of a freshly spawned child.
    // Returns false if a handle is already present; the argument is then left untouched.
    bool install(ProcessHandle&& handle);

    // Move the handle out, leaving the state empty. Empty result if nothing was running.
    std::optional<ProcessHandle> take();

    // Clear the handle only if it belongs to the child with this PID.
    // Returns true if this call removed it.
    bool release(int pid);

    bool is_running() const;

    // PID of the current child, or 0 if none
    int pid() const;

    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    const std::string host_;
    const int port_;

    mutable std::mutex mutex_;
    std::optional<ProcessHandle> handle_;
};

} // namespace pipali
