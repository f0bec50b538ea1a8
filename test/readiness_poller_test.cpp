#include <gtest/gtest.h>
#include <pipali/readiness_poller.h>
#include <pipali/error_types.h>
#include "test_helpers.h"
#include <httplib.h>
#include <atomic>
#include <thread>

using namespace pipali;
using namespace std::chrono;

namespace {

// Health endpoint on an ephemeral local port, answering 503 for the first
// unhealthy_responses requests and 200 afterwards.
class FakeHealthServer {
public:
    explicit FakeHealthServer(int unhealthy_responses)
        : remaining_unhealthy_(unhealthy_responses)
    {
        server_.Get(HEALTH_PATH, [this](const httplib::Request&, httplib::Response& res) {
            requests_++;
            if (remaining_unhealthy_.fetch_sub(1) > 0) {
                res.status = 503;
                res.set_content("{\"status\":\"starting\"}", "application/json");
                return;
            }
            res.status = 200;
            res.set_content("{\"status\":\"ok\"}", "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        pipali_test::wait_for([this]() { return server_.is_running(); });
    }

    ~FakeHealthServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }
    int requests() const { return requests_; }

private:
    httplib::Server server_;
    std::thread thread_;
    std::atomic<int> remaining_unhealthy_;
    std::atomic<int> requests_{0};
    int port_ = 0;
};

} // namespace

TEST(ReadinessPoller, Defaults) {
    EXPECT_EQ(ReadinessPoller::DEFAULT_MAX_ATTEMPTS, 50);
    EXPECT_EQ(ReadinessPoller::DEFAULT_INTERVAL, milliseconds(200));
    EXPECT_STREQ(HEALTH_PATH, "/api/health");
}

TEST(ReadinessPoller, ReturnsOnFirstHealthyProbe) {
    int calls = 0;
    ReadinessPoller poller([&](const std::string&, int) {
        calls++;
        return calls < 3 ? HealthStatus::UNREACHABLE : HealthStatus::HEALTHY;
    });

    auto started = steady_clock::now();
    int attempts = poller.wait_until_ready("127.0.0.1", 6464, 50, milliseconds(20));
    auto elapsed = steady_clock::now() - started;

    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(calls, 3);
    EXPECT_GE(elapsed, milliseconds(40));
}

TEST(ReadinessPoller, UnhealthyResponsesKeepPolling) {
    int calls = 0;
    ReadinessPoller poller([&](const std::string&, int) {
        calls++;
        return calls < 4 ? HealthStatus::UNHEALTHY : HealthStatus::HEALTHY;
    });

    EXPECT_EQ(poller.wait_until_ready("127.0.0.1", 6464, 10, milliseconds(1)), 4);
}

TEST(ReadinessPoller, GivesUpAfterMaxAttempts) {
    int calls = 0;
    std::string probed_host;
    int probed_port = 0;
    ReadinessPoller poller([&](const std::string& host, int port) {
        calls++;
        probed_host = host;
        probed_port = port;
        return HealthStatus::UNREACHABLE;
    });

    auto started = steady_clock::now();
    try {
        poller.wait_until_ready("localhost", 7777, 50, milliseconds(10));
        FAIL() << "expected ReadinessTimeoutException";
    } catch (const ReadinessTimeoutException& e) {
        EXPECT_EQ(e.attempts(), 50);
        EXPECT_EQ(e.type(), ErrorType::READINESS_TIMEOUT);
    }
    auto elapsed = steady_clock::now() - started;

    EXPECT_EQ(calls, 50);
    EXPECT_EQ(probed_host, "localhost");
    EXPECT_EQ(probed_port, 7777);
    // 49 sleeps: none after the final attempt
    EXPECT_GE(elapsed, milliseconds(49 * 10));
}

TEST(ReadinessPoller, SingleAttemptDoesNotSleep) {
    ReadinessPoller poller([](const std::string&, int) { return HealthStatus::UNREACHABLE; });

    auto started = steady_clock::now();
    EXPECT_THROW(poller.wait_until_ready("127.0.0.1", 6464, 1, milliseconds(2000)), ReadinessTimeoutException);
    EXPECT_LT(steady_clock::now() - started, milliseconds(1000));
}

TEST(ProbeHealth, HealthyServer) {
    FakeHealthServer server(0);
    EXPECT_EQ(probe_health("127.0.0.1", server.port()), HealthStatus::HEALTHY);
}

TEST(ProbeHealth, NonSuccessStatusIsUnhealthy) {
    FakeHealthServer server(1);
    EXPECT_EQ(probe_health("127.0.0.1", server.port()), HealthStatus::UNHEALTHY);
    EXPECT_EQ(probe_health("127.0.0.1", server.port()), HealthStatus::HEALTHY);
}

TEST(ProbeHealth, ClosedPortIsUnreachable) {
    EXPECT_EQ(probe_health("127.0.0.1", 1, milliseconds(200), milliseconds(500)), HealthStatus::UNREACHABLE);
}

TEST(ReadinessPoller, WaitsForRealHealthEndpoint) {
    FakeHealthServer server(2);

    ReadinessPoller poller;
    int attempts = poller.wait_until_ready("127.0.0.1", server.port(), 10, milliseconds(20));

    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(server.requests(), 3);
}

TEST(HealthStatus, Names) {
    EXPECT_EQ(health_status_name(HealthStatus::HEALTHY), "healthy");
    EXPECT_EQ(health_status_name(HealthStatus::UNHEALTHY), "unhealthy");
    EXPECT_EQ(health_status_name(HealthStatus::UNREACHABLE), "unreachable");
}
