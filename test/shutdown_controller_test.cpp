#include <gtest/gtest.h>
#include <pipali/shutdown_controller.h>
#include "test_helpers.h"
#include <csignal>

using namespace pipali;
using namespace pipali::utils;
using namespace std::chrono;

#ifndef _WIN32

namespace {

// Spawn an entry script directly under /bin/sh and wait for its first line,
// so its signal disposition is in place before the test signals it.
SpawnedProcess spawn_script(const pipali_test::TempDir& dir, const char* body) {
    pipali_test::write_file(dir.path() / "server.sh", body);
    SpawnedProcess child = ProcessManager::spawn("/bin/sh", {(dir.path() / "server.sh").string()}, dir.str());

    ProcessEvent event;
    EXPECT_TRUE(child.events->next(event));
    EXPECT_EQ(event.type, ProcessEvent::Type::STDOUT_LINE);
    EXPECT_EQ(event.text, "server starting");
    return child;
}

ExitStatus wait_exit(ProcessEventStream& events) {
    ExitStatus status;
    ProcessEvent event;
    while (events.next(event)) {
        if (event.type == ProcessEvent::Type::TERMINATED) {
            status = event.exit_status;
        }
    }
    return status;
}

} // namespace

TEST(GracefulThenForced, Defaults) {
    GracefulThenForced strategy;
    EXPECT_EQ(strategy.grace_period(), milliseconds(3000));
    EXPECT_EQ(strategy.poll_interval(), milliseconds(100));
    EXPECT_EQ(make_default_termination_strategy()->name(), "graceful-then-forced");
}

TEST(GracefulThenForced, CooperativeChildExitsWithoutKill) {
    pipali_test::TempDir dir;
    SpawnedProcess child = spawn_script(dir, pipali_test::GRACEFUL_SERVER);

    GracefulThenForced strategy(milliseconds(3000), milliseconds(100));
    auto started = steady_clock::now();
    strategy.terminate(child.handle);
    auto elapsed = steady_clock::now() - started;

    EXPECT_LT(elapsed, milliseconds(2000));
    ExitStatus status = wait_exit(*child.events);
    EXPECT_EQ(status.exit_code, 0);
    EXPECT_EQ(status.signal, 0);
}

TEST(GracefulThenForced, EscalatesAfterGracePeriod) {
    pipali_test::TempDir dir;
    SpawnedProcess child = spawn_script(dir, pipali_test::STUBBORN_SERVER);

    GracefulThenForced strategy(milliseconds(600), milliseconds(100));
    auto started = steady_clock::now();
    strategy.terminate(child.handle);
    auto elapsed = steady_clock::now() - started;

    EXPECT_GE(elapsed, milliseconds(600));
    EXPECT_LT(elapsed, milliseconds(600 + 100 + 500));

    ExitStatus status = wait_exit(*child.events);
    EXPECT_EQ(status.signal, SIGKILL);
}

TEST(GracefulThenForced, AlreadyExitedChildIsNotAnError) {
    SpawnedProcess child = ProcessManager::spawn("/bin/sh", {"-c", "exit 0"});
    wait_exit(*child.events);

    GracefulThenForced strategy(milliseconds(200), milliseconds(50));
    EXPECT_NO_THROW(strategy.terminate(child.handle));
}

TEST(ForcedOnly, KillsImmediately) {
    pipali_test::TempDir dir;
    SpawnedProcess child = spawn_script(dir, pipali_test::GRACEFUL_SERVER);

    ForcedOnly strategy;
    auto started = steady_clock::now();
    strategy.terminate(child.handle);
    EXPECT_LT(steady_clock::now() - started, milliseconds(500));

    // Not given the chance to run its TERM handler
    ExitStatus status = wait_exit(*child.events);
    EXPECT_EQ(status.signal, SIGKILL);
}

TEST(ForcedOnly, ZombieChildIsNotAnError) {
    SpawnedProcess child = ProcessManager::spawn("/bin/sh", {"-c", "exit 0"});
    ASSERT_TRUE(pipali_test::wait_for([&]() { return !child.handle.is_alive(); }));

    ForcedOnly strategy;
    EXPECT_NO_THROW(strategy.terminate(child.handle));
}

#endif
