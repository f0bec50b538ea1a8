#pragma once

#include "utils/process_manager.h"
#include <chrono>
#include <memory>
#include <string>

namespace pipali {

using utils::ProcessHandle;

// How a taken process handle is brought down.
// Implementations throw StopException only if the forced kill cannot be issued.
class TerminationStrategy {
public:
    virtual ~TerminationStrategy() = default;

    virtual void terminate(ProcessHandle& handle) = 0;

    virtual std::string name() const = 0;
};

// SIGTERM, poll liveness until a deadline, then SIGKILL.
class GracefulThenForced : public TerminationStrategy {
public:
    static constexpr std::chrono::milliseconds DEFAULT_GRACE_PERIOD{3000};
    static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{100};

    explicit GracefulThenForced(std::chrono::milliseconds grace_period = DEFAULT_GRACE_PERIOD,
                                std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

    void terminate(ProcessHandle& handle) override;
    std::string name() const override { return "graceful-then-forced"; }

    std::chrono::milliseconds grace_period() const { return grace_period_; }
    std::chrono::milliseconds poll_interval() const { return poll_interval_; }

private:
    std::chrono::milliseconds grace_period_;
    std::chrono::milliseconds poll_interval_;
};

// Immediate unconditional kill, for platforms without a cooperative signal.
class ForcedOnly : public TerminationStrategy {
public:
    void terminate(ProcessHandle& handle) override;
    std::string name() const override { return "forced-only"; }
};

// GracefulThenForced on POSIX systems, ForcedOnly on Windows.
std::unique_ptr<TerminationStrategy> make_default_termination_strategy();

} // namespace pipali
