#include <pipali/single_instance.h>
#include <pipali/utils/logging.h>
#include <filesystem>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <cerrno>
#endif

namespace pipali {

#ifdef _WIN32

InstanceLock::InstanceLock(const std::string& name)
    : path_("Local\\Pipali-" + name)
{
    HANDLE mutex = CreateMutexA(nullptr, TRUE, path_.c_str());
    if (!mutex) {
        PIPALI_LOG_WARNING("Shell", "Failed to create instance mutex " << path_);
        return;
    }
    if (GetLastError() == ERROR_ALREADY_EXISTS) {
        CloseHandle(mutex);
        return;
    }
    mutex_ = mutex;
    acquired_ = true;
}

InstanceLock::~InstanceLock() {
    if (mutex_) {
        ReleaseMutex(static_cast<HANDLE>(mutex_));
        CloseHandle(static_cast<HANDLE>(mutex_));
    }
}

#else

InstanceLock::InstanceLock(const std::string& name)
    : path_((std::filesystem::temp_directory_path() / ("pipali_" + name + ".lock")).string())
{
    fd_ = open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666);
    if (fd_ == -1) {
        // Can't create the lock file; don't block startup over it
        PIPALI_LOG_WARNING("Shell", "Failed to open lock file " << path_ << ": " << std::strerror(errno));
        acquired_ = true;
        return;
    }

    if (flock(fd_, LOCK_EX | LOCK_NB) == -1) {
        int err = errno;
        close(fd_);
        fd_ = -1;
        // Only EWOULDBLOCK means another instance holds the lock
        acquired_ = (err != EWOULDBLOCK);
        return;
    }
    acquired_ = true;
}

InstanceLock::~InstanceLock() {
    if (fd_ != -1) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
}

#endif

} // namespace pipali
