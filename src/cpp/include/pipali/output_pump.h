#pragma once

#include "supervisor_state.h"
#include "utils/process_manager.h"
#include <memory>
#include <functional>

namespace pipali {

using utils::ProcessEvent;
using utils::ProcessEventStream;

// Drains one child's event stream for its whole lifetime, republishing each
// line as a log event. On termination it clears the child's handle from the
// supervisor state (if still there) and stops.
class OutputPump {
public:
    // Invoked once with the exit status after the state was reconciled.
    // unexpected is true when the exit cleared the state (no stop() was in progress).
    using TerminationCallback = std::function<void(int pid, const utils::ExitStatus& status, bool unexpected)>;

    OutputPump(std::unique_ptr<ProcessEventStream> events,
               std::weak_ptr<SupervisorState> state,
               TerminationCallback on_terminated = nullptr);

    // Consume events until TERMINATED. Blocks; normally run on its own thread.
    void run();

    // Run on a detached background thread. The pump keeps no reference to its creator.
    static void start_detached(std::unique_ptr<ProcessEventStream> events,
                               std::weak_ptr<SupervisorState> state,
                               TerminationCallback on_terminated = nullptr);

private:
    void handle_event(const ProcessEvent& event);

    std::unique_ptr<ProcessEventStream> events_;
    std::weak_ptr<SupervisorState> state_;
    TerminationCallback on_terminated_;
    int pid_;
};

} // namespace pipali
