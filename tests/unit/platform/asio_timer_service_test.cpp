#include <gtest/gtest.h>

#include <gcrdl/platform/timer_service.h>

#include <atomic>
#include <thread>

using namespace gcrdl::platform;
using namespace std::chrono_literals;

namespace {

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds limit = 3s) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST(AsioTimerServiceTest, RecurringCallbackFiresRepeatedly) {
    auto timers = makeAsioTimerService();
    std::atomic<int> ticks{0};
    timers->scheduleRecurring("tick", 20ms, [&] { ++ticks; });
    EXPECT_TRUE(timers->isScheduled("tick"));
    EXPECT_TRUE(waitUntil([&] { return ticks.load() >= 3; }));
}

TEST(AsioTimerServiceTest, CancelStopsFurtherCallbacks) {
    auto timers = makeAsioTimerService();
    std::atomic<int> ticks{0};
    timers->scheduleRecurring("tick", 20ms, [&] { ++ticks; });
    ASSERT_TRUE(waitUntil([&] { return ticks.load() >= 1; }));

    timers->cancel("tick");
    EXPECT_FALSE(timers->isScheduled("tick"));
    std::this_thread::sleep_for(50ms);
    const int afterCancel = ticks.load();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(ticks.load(), afterCancel);
}

TEST(AsioTimerServiceTest, RescheduleReplacesSameNamedTimer) {
    auto timers = makeAsioTimerService();
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    timers->scheduleRecurring("job", 10min, [&] { ++first; });
    timers->scheduleRecurring("job", 20ms, [&] { ++second; });

    EXPECT_TRUE(waitUntil([&] { return second.load() >= 2; }));
    EXPECT_EQ(first.load(), 0);
}

TEST(AsioTimerServiceTest, ThrowingCallbackKeepsTimerAlive) {
    auto timers = makeAsioTimerService();
    std::atomic<int> ticks{0};
    timers->scheduleRecurring("flaky", 20ms, [&] {
        ++ticks;
        throw std::runtime_error("boom");
    });
    EXPECT_TRUE(waitUntil([&] { return ticks.load() >= 2; }));
}

TEST(AsioTimerServiceTest, CancelUnknownNameIsHarmless) {
    auto timers = makeAsioTimerService();
    timers->cancel("never-scheduled");
    EXPECT_FALSE(timers->isScheduled("never-scheduled"));
}
