#pragma once

#include <string>
#include <chrono>
#include <functional>

namespace pipali {

inline constexpr char HEALTH_PATH[] = "/api/health";

enum class HealthStatus {
    HEALTHY,      // HTTP 200
    UNHEALTHY,    // reachable, any other status
    UNREACHABLE   // connection refused, timeout, ...
};

std::string health_status_name(HealthStatus status);

// One GET http://host:port/api/health with short connect/total timeouts.
HealthStatus probe_health(const std::string& host, int port,
                          std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(500),
                          std::chrono::milliseconds total_timeout = std::chrono::milliseconds(2000));

// Fixed-interval readiness polling. No backoff: sidecar startup is short and bounded.
class ReadinessPoller {
public:
    using HealthProbe = std::function<HealthStatus(const std::string& host, int port)>;

    static constexpr int DEFAULT_MAX_ATTEMPTS = 50;
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{200};

    explicit ReadinessPoller(HealthProbe probe = nullptr);

    /**
     * Probe until healthy, at most max_attempts times, sleeping interval
     * between attempts (not after the last one).
     * Throws ReadinessTimeoutException when the attempts are exhausted.
     * Returns the number of attempts it took.
     */
    int wait_until_ready(const std::string& host, int port,
                         int max_attempts = DEFAULT_MAX_ATTEMPTS,
                         std::chrono::milliseconds interval = DEFAULT_INTERVAL) const;

private:
    HealthProbe probe_;
};

} // namespace pipali
