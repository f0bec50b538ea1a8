#pragma once

#include <string>
#include <vector>
#include <map>
#include <deque>
#include <memory>
#include <mutex>

namespace pipali {
namespace utils {

struct ExitStatus {
    int exit_code = -1;  // -1 if killed by a signal or unknown
    int signal = 0;      // 0 if exited normally
};

// Bookkeeping for one spawned child, shared by its handle and its event stream.
// Signal delivery and reaping are serialized here so a signal is never sent
// to a PID that was already reaped (and may have been reused).
class ChildRecord {
public:
#ifdef _WIN32
    ChildRecord(int pid, void* process_handle);
#else
    explicit ChildRecord(int pid);
#endif
    ~ChildRecord();

    ChildRecord(const ChildRecord&) = delete;
    ChildRecord& operator=(const ChildRecord&) = delete;

    int pid() const { return pid_; }

    // True until the child has exited. Never reaps.
    bool is_alive();

    // Graceful termination request (SIGTERM). Always false on Windows.
    bool request_termination();

    // Forced, unconditional kill (SIGKILL / TerminateProcess).
    bool force_kill();

    // Block until the child exits, then reap it.
    ExitStatus wait_for_exit();

private:
    const int pid_;
    std::mutex mutex_;
    bool reaped_ = false;
    ExitStatus status_;
#ifdef _WIN32
    void* process_handle_;
#endif
};

// Exclusively owned handle to a running child: PID plus kill capability.
class ProcessHandle {
public:
    explicit ProcessHandle(std::shared_ptr<ChildRecord> child);

    ProcessHandle(ProcessHandle&&) = default;
    ProcessHandle& operator=(ProcessHandle&&) = default;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    int pid() const { return child_->pid(); }
    bool is_alive() const { return child_->is_alive(); }
    bool terminate() { return child_->request_termination(); }
    bool kill() { return child_->force_kill(); }

private:
    std::shared_ptr<ChildRecord> child_;
};

struct ProcessEvent {
    enum class Type {
        STDOUT_LINE,
        STDERR_LINE,
        READ_ERROR,
        TERMINATED
    };

    Type type = Type::STDOUT_LINE;
    std::string text;        // line content or error description
    ExitStatus exit_status;  // only for TERMINATED
};

// Lines from the child's stdout/stderr in arrival order, followed by exactly
// one TERMINATED event once the child has exited. Pipes still held open by
// the child's descendants are closed at that point.
class ProcessEventStream {
public:
#ifdef _WIN32
    ProcessEventStream(std::shared_ptr<ChildRecord> child, void* stdout_pipe, void* stderr_pipe);
#else
    ProcessEventStream(std::shared_ptr<ChildRecord> child, int stdout_fd, int stderr_fd);
#endif
    ~ProcessEventStream();

    ProcessEventStream(const ProcessEventStream&) = delete;
    ProcessEventStream& operator=(const ProcessEventStream&) = delete;

    // Blocks until the next event is available.
    // Returns false once the TERMINATED event has been delivered.
    bool next(ProcessEvent& event);

    int pid() const { return child_->pid(); }

private:
    struct PipeState {
#ifdef _WIN32
        void* pipe = nullptr;
#else
        int fd = -1;
#endif
        bool open = false;
        std::string buffer;
        ProcessEvent::Type line_type;
    };

    // Waits up to timeout_ms for output. Returns true if data was read or a pipe closed.
    bool read_available(int timeout_ms);
    void drain_after_exit();
    void append_output(PipeState& pipe, const char* data, size_t length);
    void close_pipe(PipeState& pipe);

    std::shared_ptr<ChildRecord> child_;
    PipeState stdout_;
    PipeState stderr_;
    std::deque<ProcessEvent> pending_;
    bool terminated_ = false;
};

struct SpawnedProcess {
    ProcessHandle handle;
    std::unique_ptr<ProcessEventStream> events;
};

class ProcessManager {
public:
    // Start a process with piped stdout/stderr.
    // env_vars are merged over the inherited environment.
    // Throws std::runtime_error if the process cannot be created or executed.
    static SpawnedProcess spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const std::string& working_dir = "",
        const std::map<std::string, std::string>& env_vars = {});

    // Liveness of an arbitrary PID (not necessarily our child)
    static bool is_pid_alive(int pid);
};

} // namespace utils
} // namespace pipali
