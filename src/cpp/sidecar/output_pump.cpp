#include <pipali/output_pump.h>
#include <pipali/utils/logging.h>
#include <thread>

namespace pipali {

// Health polls would otherwise flood the log during startup
static bool should_filter_line(const std::string& line) {
    return line.find("GET /api/health") != std::string::npos;
}

OutputPump::OutputPump(std::unique_ptr<ProcessEventStream> events,
                       std::weak_ptr<SupervisorState> state,
                       TerminationCallback on_terminated)
    : events_(std::move(events))
    , state_(std::move(state))
    , on_terminated_(std::move(on_terminated))
    , pid_(events_ ? events_->pid() : 0)
{
}

void OutputPump::run() {
    if (!events_) {
        return;
    }

    ProcessEvent event;
    while (events_->next(event)) {
        handle_event(event);
        if (event.type == ProcessEvent::Type::TERMINATED) {
            break;
        }
    }
}

void OutputPump::handle_event(const ProcessEvent& event) {
    switch (event.type) {
        case ProcessEvent::Type::STDOUT_LINE:
            if (!should_filter_line(event.text)) {
                PIPALI_LOG_INFO("Sidecar", event.text);
            }
            break;
        case ProcessEvent::Type::STDERR_LINE:
            if (!should_filter_line(event.text)) {
                PIPALI_LOG_WARNING("Sidecar", event.text);
            }
            break;
        case ProcessEvent::Type::READ_ERROR:
            PIPALI_LOG_ERROR("Sidecar", "Error: " << event.text);
            break;
        case ProcessEvent::Type::TERMINATED: {
            if (event.exit_status.signal != 0) {
                PIPALI_LOG_INFO("Sidecar", "Terminated with signal: " << event.exit_status.signal
                                << " (PID: " << pid_ << ")");
            } else {
                PIPALI_LOG_INFO("Sidecar", "Terminated with code: " << event.exit_status.exit_code
                                << " (PID: " << pid_ << ")");
            }

            // Only clears the handle if an explicit stop has not already taken it
            bool unexpected = false;
            if (auto state = state_.lock()) {
                unexpected = state->release(pid_);
                if (unexpected) {
                    PIPALI_LOG_WARNING("Sidecar", "Process exited unexpectedly, state cleared");
                }
            }

            if (on_terminated_) {
                on_terminated_(pid_, event.exit_status, unexpected);
            }
            break;
        }
    }
}

void OutputPump::start_detached(std::unique_ptr<ProcessEventStream> events,
                                std::weak_ptr<SupervisorState> state,
                                TerminationCallback on_terminated) {
    auto pump = std::make_shared<OutputPump>(std::move(events), std::move(state), std::move(on_terminated));
    std::thread([pump]() {
        pump->run();
    }).detach();
}

} // namespace pipali
