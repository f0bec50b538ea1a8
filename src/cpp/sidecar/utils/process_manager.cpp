#include <pipali/utils/process_manager.h>
#include <pipali/utils/logging.h>
#include <stdexcept>
#include <algorithm>
#include <thread>
#include <chrono>
#include <string>
#include <cstring>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <fstream>

extern char** environ;
#endif

namespace pipali {
namespace utils {

static constexpr size_t READ_CHUNK_SIZE = 4096;
static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;
// Liveness is rechecked at least this often while the pipes are quiet
static constexpr int POLL_TIMEOUT_MS = 100;
// Upper bound for collecting output that was still buffered when the child exited
static constexpr int DRAIN_TIMEOUT_MS = 250;

// ---------------------------------------------------------------------------
// ChildRecord
// ---------------------------------------------------------------------------

#ifdef _WIN32

ChildRecord::ChildRecord(int pid, void* process_handle)
    : pid_(pid)
    , process_handle_(process_handle)
{
}

ChildRecord::~ChildRecord() {
    if (process_handle_) {
        CloseHandle(static_cast<HANDLE>(process_handle_));
    }
}

bool ChildRecord::is_alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_ || !process_handle_) {
        return false;
    }
    return WaitForSingleObject(static_cast<HANDLE>(process_handle_), 0) == WAIT_TIMEOUT;
}

bool ChildRecord::request_termination() {
    // No cooperative termination signal for console-less children on Windows
    return false;
}

bool ChildRecord::force_kill() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_ || !process_handle_) {
        return false;
    }
    return TerminateProcess(static_cast<HANDLE>(process_handle_), 1) != 0;
}

ExitStatus ChildRecord::wait_for_exit() {
    HANDLE handle = static_cast<HANDLE>(process_handle_);
    WaitForSingleObject(handle, INFINITE);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_) {
        DWORD exit_code = 0;
        if (GetExitCodeProcess(handle, &exit_code)) {
            status_.exit_code = static_cast<int>(exit_code);
        }
        reaped_ = true;
    }
    return status_;
}

#else  // Unix/Linux/macOS

ChildRecord::ChildRecord(int pid)
    : pid_(pid)
{
}

ChildRecord::~ChildRecord() = default;

bool ChildRecord::is_alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
        return false;
    }

    // WNOWAIT leaves the child waitable so the event stream can still reap it
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
        return info.si_pid == 0;
    }

    // Not waitable by us (ECHILD); fall back to a plain existence check
    return ProcessManager::is_pid_alive(pid_);
}

bool ChildRecord::request_termination() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
        return false;
    }
    return ::kill(pid_, SIGTERM) == 0;
}

bool ChildRecord::force_kill() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
        return false;
    }
    return ::kill(pid_, SIGKILL) == 0;
}

ExitStatus ChildRecord::wait_for_exit() {
    // Wait without reaping so signals can still be delivered safely meanwhile
    siginfo_t info;
    int result;
    do {
        std::memset(&info, 0, sizeof(info));
        result = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (result == -1 && errno == EINTR);

    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
        return status_;
    }

    int status = 0;
    pid_t reaped;
    do {
        reaped = waitpid(pid_, &status, 0);
    } while (reaped == -1 && errno == EINTR);

    if (reaped == pid_) {
        if (WIFEXITED(status)) {
            status_.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            status_.signal = WTERMSIG(status);
        }
    }
    // ECHILD: somebody else reaped it, exit status is unknown
    reaped_ = true;
    return status_;
}

#endif

// ---------------------------------------------------------------------------
// ProcessHandle
// ---------------------------------------------------------------------------

ProcessHandle::ProcessHandle(std::shared_ptr<ChildRecord> child)
    : child_(std::move(child))
{
}

// ---------------------------------------------------------------------------
// ProcessEventStream
// ---------------------------------------------------------------------------

#ifdef _WIN32
ProcessEventStream::ProcessEventStream(std::shared_ptr<ChildRecord> child, void* stdout_pipe, void* stderr_pipe)
    : child_(std::move(child))
{
    stdout_.pipe = stdout_pipe;
    stdout_.open = stdout_pipe != nullptr;
    stdout_.line_type = ProcessEvent::Type::STDOUT_LINE;
    stderr_.pipe = stderr_pipe;
    stderr_.open = stderr_pipe != nullptr;
    stderr_.line_type = ProcessEvent::Type::STDERR_LINE;
}
#else
ProcessEventStream::ProcessEventStream(std::shared_ptr<ChildRecord> child, int stdout_fd, int stderr_fd)
    : child_(std::move(child))
{
    stdout_.fd = stdout_fd;
    stdout_.open = stdout_fd >= 0;
    stdout_.line_type = ProcessEvent::Type::STDOUT_LINE;
    stderr_.fd = stderr_fd;
    stderr_.open = stderr_fd >= 0;
    stderr_.line_type = ProcessEvent::Type::STDERR_LINE;
}
#endif

ProcessEventStream::~ProcessEventStream() {
    close_pipe(stdout_);
    close_pipe(stderr_);
}

bool ProcessEventStream::next(ProcessEvent& event) {
    while (true) {
        if (!pending_.empty()) {
            event = std::move(pending_.front());
            pending_.pop_front();
            return true;
        }

        if (terminated_) {
            return false;
        }

        if (!stdout_.open && !stderr_.open) {
            ProcessEvent exit_event;
            exit_event.type = ProcessEvent::Type::TERMINATED;
            exit_event.exit_status = child_->wait_for_exit();
            pending_.push_back(std::move(exit_event));
            terminated_ = true;
            continue;
        }

        // Processes started by the child may inherit its pipes and keep them
        // open long after the child is gone, so EOF alone is not an exit signal
        if (!child_->is_alive()) {
            drain_after_exit();
            continue;
        }

        read_available(POLL_TIMEOUT_MS);
    }
}

void ProcessEventStream::drain_after_exit() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(DRAIN_TIMEOUT_MS);
    while ((stdout_.open || stderr_.open) &&
           std::chrono::steady_clock::now() < deadline &&
           read_available(0)) {
    }

    if (stdout_.open || stderr_.open) {
        PIPALI_LOG_DEBUG("ProcessManager", "Process " << child_->pid()
                         << " exited with its output still held open by another process");
    }
    close_pipe(stdout_);
    close_pipe(stderr_);
}

void ProcessEventStream::append_output(PipeState& pipe, const char* data, size_t length) {
    pipe.buffer.append(data, length);

    size_t pos;
    while ((pos = pipe.buffer.find('\n')) != std::string::npos) {
        std::string line = pipe.buffer.substr(0, pos);
        pipe.buffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        ProcessEvent event;
        event.type = pipe.line_type;
        event.text = std::move(line);
        pending_.push_back(std::move(event));
    }

    // Output without newlines is split into MAX_LINE_LENGTH pieces
    while (pipe.buffer.size() >= MAX_LINE_LENGTH) {
        ProcessEvent event;
        event.type = pipe.line_type;
        event.text = pipe.buffer.substr(0, MAX_LINE_LENGTH);
        pipe.buffer.erase(0, MAX_LINE_LENGTH);
        pending_.push_back(std::move(event));
    }
}

void ProcessEventStream::close_pipe(PipeState& pipe) {
    if (!pipe.open) {
        return;
    }

    // Flush any remaining partial line
    if (!pipe.buffer.empty()) {
        ProcessEvent event;
        event.type = pipe.line_type;
        event.text = std::move(pipe.buffer);
        pipe.buffer.clear();
        pending_.push_back(std::move(event));
    }

#ifdef _WIN32
    CloseHandle(static_cast<HANDLE>(pipe.pipe));
    pipe.pipe = nullptr;
#else
    close(pipe.fd);
    pipe.fd = -1;
#endif
    pipe.open = false;
}

#ifdef _WIN32

bool ProcessEventStream::read_available(int timeout_ms) {
    char buffer[READ_CHUNK_SIZE];
    bool progress = false;

    for (PipeState* pipe : {&stdout_, &stderr_}) {
        if (!pipe->open) {
            continue;
        }

        DWORD available = 0;
        if (!PeekNamedPipe(static_cast<HANDLE>(pipe->pipe), nullptr, 0, nullptr, &available, nullptr)) {
            // ERROR_BROKEN_PIPE: the child closed its end
            close_pipe(*pipe);
            progress = true;
            continue;
        }
        if (available == 0) {
            continue;
        }

        DWORD to_read = available < sizeof(buffer) ? available : static_cast<DWORD>(sizeof(buffer));
        DWORD bytes_read = 0;
        if (!ReadFile(static_cast<HANDLE>(pipe->pipe), buffer, to_read, &bytes_read, nullptr) || bytes_read == 0) {
            close_pipe(*pipe);
            progress = true;
            continue;
        }
        append_output(*pipe, buffer, bytes_read);
        progress = true;
    }

    if (!progress && timeout_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 20)));
    }
    return progress;
}

#else

bool ProcessEventStream::read_available(int timeout_ms) {
    PipeState* pipes[2];
    struct pollfd fds[2];
    nfds_t count = 0;

    for (PipeState* pipe : {&stdout_, &stderr_}) {
        if (pipe->open) {
            pipes[count] = pipe;
            fds[count].fd = pipe->fd;
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            ++count;
        }
    }

    int result = poll(fds, count, timeout_ms);
    if (result < 0) {
        if (errno == EINTR) {
            return false;
        }
        ProcessEvent event;
        event.type = ProcessEvent::Type::READ_ERROR;
        event.text = std::string("poll failed: ") + std::strerror(errno);
        pending_.push_back(std::move(event));
        close_pipe(stdout_);
        close_pipe(stderr_);
        return true;
    }
    if (result == 0) {
        return false;
    }

    bool progress = false;
    char buffer[READ_CHUNK_SIZE];
    for (nfds_t i = 0; i < count; ++i) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL))) {
            continue;
        }

        // Read until EOF rather than trusting POLLHUP; data may still be buffered
        ssize_t bytes_read = read(pipes[i]->fd, buffer, sizeof(buffer));
        if (bytes_read > 0) {
            append_output(*pipes[i], buffer, static_cast<size_t>(bytes_read));
            progress = true;
        } else if (bytes_read == 0) {
            close_pipe(*pipes[i]);
            progress = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            ProcessEvent event;
            event.type = ProcessEvent::Type::READ_ERROR;
            event.text = std::string("read failed: ") + std::strerror(errno);
            pending_.push_back(std::move(event));
            close_pipe(*pipes[i]);
            progress = true;
        }
    }
    return progress;
}

#endif

// ---------------------------------------------------------------------------
// ProcessManager
// ---------------------------------------------------------------------------

#ifdef _WIN32

static std::string format_windows_error(DWORD error) {
    char error_msg[256] = {0};
    FormatMessageA(
        FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        error,
        0,
        error_msg,
        sizeof(error_msg),
        nullptr
    );
    return std::string(error_msg) + " (Error code: " + std::to_string(error) + ")";
}

// Build a double-NUL terminated environment block: inherited variables
// not overridden, followed by the overrides.
static std::string build_environment_block(const std::map<std::string, std::string>& env_vars) {
    std::string block;

    LPCH inherited = GetEnvironmentStringsA();
    if (inherited) {
        for (LPCH entry = inherited; *entry; entry += std::strlen(entry) + 1) {
            std::string var(entry);
            // Skip per-drive entries like "=C:=C:\"
            size_t eq = var.find('=', 1);
            std::string key = var.substr(0, eq);
            if (env_vars.find(key) == env_vars.end()) {
                block += var;
                block.push_back('\0');
            }
        }
        FreeEnvironmentStringsA(inherited);
    }

    for (const auto& env_pair : env_vars) {
        block += env_pair.first + "=" + env_pair.second;
        block.push_back('\0');
    }
    block.push_back('\0');
    return block;
}

SpawnedProcess ProcessManager::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& working_dir,
    const std::map<std::string, std::string>& env_vars) {

    std::string cmdline = "\"" + executable + "\"";
    for (const auto& arg : args) {
        cmdline += " \"" + arg + "\"";
    }

    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(SECURITY_ATTRIBUTES);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    HANDLE stdout_read = nullptr;
    HANDLE stdout_write = nullptr;
    HANDLE stderr_read = nullptr;
    HANDLE stderr_write = nullptr;

    if (!CreatePipe(&stdout_read, &stdout_write, &sa, 0)) {
        throw std::runtime_error("Failed to create stdout pipe");
    }
    if (!CreatePipe(&stderr_read, &stderr_write, &sa, 0)) {
        CloseHandle(stdout_read);
        CloseHandle(stdout_write);
        throw std::runtime_error("Failed to create stderr pipe");
    }

    // Make sure the read handles are not inherited
    SetHandleInformation(stdout_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderr_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    ZeroMemory(&pi, sizeof(pi));
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = stdout_write;
    si.hStdError = stderr_write;

    std::string env_block = build_environment_block(env_vars);

    PIPALI_LOG_DEBUG("ProcessManager", "Starting process: " << cmdline);

    BOOL success = CreateProcessA(
        nullptr,
        const_cast<char*>(cmdline.c_str()),
        nullptr,
        nullptr,
        TRUE,  // Inherit handles
        CREATE_NO_WINDOW,
        env_block.data(),
        working_dir.empty() ? nullptr : working_dir.c_str(),
        &si,
        &pi
    );

    CloseHandle(stdout_write);
    CloseHandle(stderr_write);

    if (!success) {
        DWORD error = GetLastError();
        CloseHandle(stdout_read);
        CloseHandle(stderr_read);

        std::string full_error = "Failed to start process '" + executable + "': " + format_windows_error(error);
        PIPALI_LOG_ERROR("ProcessManager", full_error);
        throw std::runtime_error(full_error);
    }

    CloseHandle(pi.hThread);

    int pid = static_cast<int>(pi.dwProcessId);
    PIPALI_LOG_DEBUG("ProcessManager", "Process started successfully, PID: " << pid);

    auto child = std::make_shared<ChildRecord>(pid, pi.hProcess);
    SpawnedProcess spawned{
        ProcessHandle(child),
        std::make_unique<ProcessEventStream>(child, stdout_read, stderr_read)
    };
    return spawned;
}

bool ProcessManager::is_pid_alive(int pid) {
    if (pid <= 0) return false;

    HANDLE process = OpenProcess(SYNCHRONIZE, FALSE, static_cast<DWORD>(pid));
    if (!process) {
        return false;
    }
    bool alive = WaitForSingleObject(process, 0) == WAIT_TIMEOUT;
    CloseHandle(process);
    return alive;
}

#else  // Unix/Linux/macOS

static void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags != -1) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

// Search PATH for a bare command name; paths containing '/' are used as-is
static std::string resolve_executable(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        return executable;
    }

    const char* path_env = std::getenv("PATH");
    std::string search_path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= search_path.size()) {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos) {
            end = search_path.size();
        }
        std::string dir = search_path.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + executable;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return executable;
}

SpawnedProcess ProcessManager::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& working_dir,
    const std::map<std::string, std::string>& env_vars) {

    // Everything the child needs is prepared before fork(); after fork() the
    // child only calls async-signal-safe functions.
    std::string exec_path = resolve_executable(executable);

    std::vector<char*> argv_ptrs;
    argv_ptrs.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv_ptrs.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_ptrs.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (char** env = environ; env && *env; ++env) {
        std::string env_str(*env);
        std::string key = env_str.substr(0, env_str.find('='));
        if (env_vars.find(key) == env_vars.end()) {
            env_strings.push_back(env_str);
        }
    }
    for (const auto& env_pair : env_vars) {
        env_strings.push_back(env_pair.first + "=" + env_pair.second);
    }
    std::vector<char*> envp_ptrs;
    for (auto& env_str : env_strings) {
        envp_ptrs.push_back(const_cast<char*>(env_str.c_str()));
    }
    envp_ptrs.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};  // reports exec/chdir failure back to the parent

    if (pipe(stdout_pipe) == -1) {
        throw std::runtime_error(std::string("Failed to create stdout pipe: ") + std::strerror(errno));
    }
    if (pipe(stderr_pipe) == -1) {
        int saved = errno;
        close_pair(stdout_pipe);
        throw std::runtime_error(std::string("Failed to create stderr pipe: ") + std::strerror(saved));
    }
    if (pipe(error_pipe) == -1) {
        int saved = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        throw std::runtime_error(std::string("Failed to create error pipe: ") + std::strerror(saved));
    }
    // dup2() clears FD_CLOEXEC on the child's stdout/stderr, so every end can
    // be close-on-exec and none leaks into a concurrently spawned process
    for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1], error_pipe[0], error_pipe[1]}) {
        set_cloexec(fd);
    }

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);

    PIPALI_LOG_DEBUG("ProcessManager", "Starting process: " << exec_path);

    pid_t pid = fork();

    if (pid < 0) {
        int saved = errno;
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(error_pipe);
        if (null_fd >= 0) close(null_fd);
        throw std::runtime_error(std::string("Failed to fork process: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child process
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t written = write(error_pipe[1], &err, sizeof(err));
            (void)written;
            _exit(127);
        }

        execve(exec_path.c_str(), argv_ptrs.data(), envp_ptrs.data());

        // If execve returns, it failed
        int err = errno;
        ssize_t written = write(error_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(error_pipe[1]);
    if (null_fd >= 0) close(null_fd);

    // The error pipe closes on a successful exec; otherwise it carries errno
    int child_errno = 0;
    ssize_t bytes_read;
    do {
        bytes_read = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (bytes_read == -1 && errno == EINTR);
    close(error_pipe[0]);

    if (bytes_read == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        std::string full_error = "Failed to execute '" + executable + "': " + std::strerror(child_errno);
        PIPALI_LOG_ERROR("ProcessManager", full_error);
        throw std::runtime_error(full_error);
    }

    PIPALI_LOG_DEBUG("ProcessManager", "Process started successfully, PID: " << pid);

    auto child = std::make_shared<ChildRecord>(static_cast<int>(pid));
    SpawnedProcess spawned{
        ProcessHandle(child),
        std::make_unique<ProcessEventStream>(child, stdout_pipe[0], stderr_pipe[0])
    };
    return spawned;
}

bool ProcessManager::is_pid_alive(int pid) {
    if (pid <= 0) return false;

    // First check if process exists at all
    if (::kill(pid, 0) != 0) {
        return errno == EPERM;  // Exists but owned by someone else
    }

#ifdef __linux__
    // Zombies count as dead. Format: PID (name) STATE ...
    std::string stat_path = "/proc/" + std::to_string(pid) + "/stat";
    std::ifstream stat_file(stat_path);
    if (!stat_file) {
        return false;
    }

    std::string line;
    std::getline(stat_file, line);

    size_t paren_pos = line.rfind(')');
    if (paren_pos != std::string::npos && paren_pos + 2 < line.length()) {
        char state = line[paren_pos + 2];
        return (state != 'Z');
    }
#endif

    // If we can't parse the state, assume alive to be safe
    return true;
}

#endif

} // namespace utils
} // namespace pipali
