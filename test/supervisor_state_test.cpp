#include <gtest/gtest.h>
#include <pipali/supervisor_state.h>
#include <memory>
#include <thread>
#include <vector>
#include <atomic>

using pipali::SupervisorState;
using pipali::utils::ChildRecord;
using pipali::utils::ProcessHandle;

namespace {

// Handle for bookkeeping only; no signal is ever sent through it
ProcessHandle make_handle(int pid) {
#ifdef _WIN32
    return ProcessHandle(std::make_shared<ChildRecord>(pid, nullptr));
#else
    return ProcessHandle(std::make_shared<ChildRecord>(pid));
#endif
}

} // namespace

TEST(SupervisorState, StartsEmpty) {
    SupervisorState state("127.0.0.1", 6464);

    EXPECT_FALSE(state.is_running());
    EXPECT_EQ(state.pid(), 0);
    EXPECT_FALSE(state.take().has_value());
    EXPECT_EQ(state.host(), "127.0.0.1");
    EXPECT_EQ(state.port(), 6464);
}

TEST(SupervisorState, InstallRefusesSecondHandle) {
    SupervisorState state("127.0.0.1", 6464);

    ProcessHandle first = make_handle(4242);
    ASSERT_TRUE(state.install(std::move(first)));

    ProcessHandle second = make_handle(4343);
    EXPECT_FALSE(state.install(std::move(second)));
    // Rejected handle is still usable by the caller
    EXPECT_EQ(second.pid(), 4343);
    EXPECT_EQ(state.pid(), 4242);
}

TEST(SupervisorState, TakeEmptiesState) {
    SupervisorState state("127.0.0.1", 6464);
    ProcessHandle handle = make_handle(4242);
    ASSERT_TRUE(state.install(std::move(handle)));

    std::optional<ProcessHandle> taken = state.take();
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->pid(), 4242);
    EXPECT_FALSE(state.is_running());
    EXPECT_FALSE(state.take().has_value());
}

TEST(SupervisorState, ReleaseOnlyClearsMatchingChild) {
    SupervisorState state("127.0.0.1", 6464);
    ProcessHandle handle = make_handle(5000);
    ASSERT_TRUE(state.install(std::move(handle)));

    // Late termination notice from an older child
    EXPECT_FALSE(state.release(4999));
    EXPECT_TRUE(state.is_running());

    EXPECT_TRUE(state.release(5000));
    EXPECT_FALSE(state.is_running());
    EXPECT_FALSE(state.release(5000));
}

TEST(SupervisorState, ConcurrentTakeYieldsHandleOnce) {
    SupervisorState state("127.0.0.1", 6464);
    ProcessHandle handle = make_handle(6000);
    ASSERT_TRUE(state.install(std::move(handle)));

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (state.take()) {
                ++winners;
            }
            if (state.release(6000)) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_FALSE(state.is_running());
}
