#pragma once

#include <string>

namespace pipali {

// Process-wide lock so that two shells never supervise two sidecars on the
// same host:port. The lock is held for the lifetime of the object.
class InstanceLock {
public:
    // name: short identifier, e.g. "sidecar-6464"
    explicit InstanceLock(const std::string& name);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    // False if another process already holds the lock
    bool acquired() const { return acquired_; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool acquired_ = false;
#ifdef _WIN32
    void* mutex_ = nullptr;
#else
    int fd_ = -1;
#endif
};

} // namespace pipali
