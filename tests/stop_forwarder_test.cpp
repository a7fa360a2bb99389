#include <gtest/gtest.h>
#include "../imgsan_cli/src/utils/stop_forwarder.hpp"
#include "../libimgsan/include/engine_config.hpp"
#include "../libimgsan/include/logger.hpp"
#include "../libimgsan/include/sanitize_engine.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using namespace imgsan;
using namespace imgsan::test;

namespace {

std::atomic<bool> g_flag{false};

void set_flag(int) {
    g_flag.store(true);
}

template <typename Pred>
bool wait_for(Pred pred) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > until) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

} // namespace

class StopForwarderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        g_flag.store(false);
    }

    void TearDown() override
    {
        std::signal(SIGINT, SIG_DFL);
    }
};

TEST_F(StopForwarderTest, CallsOnceWhenTheFlagIsSet)
{
    std::atomic<int> calls{0};
    const StopForwarder forwarder(g_flag, [&calls] { ++calls; }, std::chrono::milliseconds(1));

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(calls.load(), 0);

    g_flag.store(true);
    EXPECT_TRUE(wait_for([&] { return calls.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(StopForwarderTest, DestructionWithoutFlagDoesNotCall)
{
    std::atomic<int> calls{0};
    {
        const StopForwarder forwarder(g_flag, [&calls] { ++calls; });
    }
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(StopForwarderTest, SignalReachesTheEngineThroughTheFlag)
{
    TempDir dir;
    std::filesystem::create_directories(dir / "in");
    write_jpeg(dir / "in" / "a.jpg");

    EngineConfig config;
    config.source_root = dir / "in";
    Logger logger;
    SanitizeEngine engine(config, logger);

    std::atomic<bool> forwarded{false};
    std::signal(SIGINT, set_flag);
    const StopForwarder forwarder(g_flag, [&] {
        engine.request_stop();
        forwarded.store(true);
    }, std::chrono::milliseconds(1));
    std::raise(SIGINT);
    EXPECT_TRUE(g_flag.load());
    ASSERT_TRUE(wait_for([&] { return forwarded.load(); }));

    // a stop requested before run() leaves every file undispatched
    const auto report = engine.run();
    EXPECT_TRUE(report.cancelled_early());
    EXPECT_EQ(report.summary().skipped, 1u);
}
