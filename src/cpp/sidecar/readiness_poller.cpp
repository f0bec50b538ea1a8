#include <pipali/readiness_poller.h>
#include <pipali/error_types.h>
#include <pipali/utils/logging.h>
#include <thread>

// Not using OpenSSL support since the sidecar only listens locally
#include <httplib.h>

namespace pipali {

std::string health_status_name(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY: return "healthy";
        case HealthStatus::UNHEALTHY: return "unhealthy";
        case HealthStatus::UNREACHABLE: return "unreachable";
    }
    return "unreachable";
}

HealthStatus probe_health(const std::string& host, int port,
                          std::chrono::milliseconds connect_timeout,
                          std::chrono::milliseconds total_timeout) {
    httplib::Client cli(host, port);
    cli.set_connection_timeout(connect_timeout);
    cli.set_read_timeout(total_timeout);
    cli.set_write_timeout(total_timeout);

    auto res = cli.Get(HEALTH_PATH);
    if (!res) {
        PIPALI_LOG_DEBUG("Readiness", "Health request failed: " << httplib::to_string(res.error()));
        return HealthStatus::UNREACHABLE;
    }

    if (res->status != 200) {
        PIPALI_LOG_DEBUG("Readiness", "Health request returned status " << res->status);
        return HealthStatus::UNHEALTHY;
    }
    return HealthStatus::HEALTHY;
}

ReadinessPoller::ReadinessPoller(HealthProbe probe)
    : probe_(std::move(probe))
{
    if (!probe_) {
        probe_ = [](const std::string& host, int port) {
            return probe_health(host, port);
        };
    }
}

int ReadinessPoller::wait_until_ready(const std::string& host, int port,
                                      int max_attempts,
                                      std::chrono::milliseconds interval) const {
    PIPALI_LOG_DEBUG("Readiness", "Will check health at: http://" << host << ":" << port << HEALTH_PATH);

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        HealthStatus status = probe_(host, port);
        if (status == HealthStatus::HEALTHY) {
            PIPALI_LOG_INFO("Sidecar", "Server ready after " << attempt << " attempts");
            return attempt;
        }

        PIPALI_LOG_DEBUG("Readiness", "Health check attempt " << attempt << "/" << max_attempts
                         << ": " << health_status_name(status));

        if (attempt < max_attempts) {
            std::this_thread::sleep_for(interval);
        }
    }

    throw ReadinessTimeoutException(max_attempts);
}

} // namespace pipali
