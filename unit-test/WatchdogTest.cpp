#include <pthread.h>
#include <unistd.h>
#include <chrono>
#include <thread>
#include "gtest/gtest.h"
#include "judgebox/watchdog.hpp"

using namespace std;
using namespace judgebox;

class WatchdogTest : public ::testing::Test {
protected:
    // 等待看门狗设置标志，最多等待 timeout
    static bool wait_for(const watchdog &dog, int flag, chrono::milliseconds timeout) {
        auto deadline = chrono::steady_clock::now() + timeout;
        while (chrono::steady_clock::now() < deadline) {
            if (dog.pending() & flag) return true;
            this_thread::sleep_for(chrono::milliseconds(5));
        }
        return false;
    }

    accounting acct = accounting::rusage();
};

TEST_F(WatchdogTest, Deadline) {
    wakeup_signal_guard guard;
    watchdog dog(chrono::milliseconds(50), -1, acct);
    auto started = chrono::steady_clock::now();
    dog.start(getpid(), pthread_self(), started);

    EXPECT_TRUE(wait_for(dog, watchdog::DEADLINE, chrono::seconds(2)));
    EXPECT_GE(chrono::steady_clock::now() - started, chrono::milliseconds(50));
    EXPECT_FALSE(dog.pending() & watchdog::MEMORY_EXCEEDED);

    dog.acknowledge(watchdog::DEADLINE);
    EXPECT_EQ(dog.pending(), 0);
    dog.stop();
}

TEST_F(WatchdogTest, Cancel) {
    wakeup_signal_guard guard;
    watchdog dog(chrono::seconds(60), -1, acct);
    dog.start(getpid(), pthread_self(), chrono::steady_clock::now());

    thread canceller([&] { dog.cancel(); });
    canceller.join();
    EXPECT_TRUE(wait_for(dog, watchdog::CANCELLED, chrono::seconds(1)));
    EXPECT_FALSE(dog.pending() & watchdog::DEADLINE);

    // 重复取消不会产生新的事件
    dog.acknowledge(watchdog::CANCELLED);
    dog.cancel();
    EXPECT_EQ(dog.pending(), 0);
    dog.stop();
}

TEST_F(WatchdogTest, MemorySampling) {
    wakeup_signal_guard guard;
    // 测试进程本身的内存一定超过 1KB
    watchdog dog(chrono::seconds(60), 1, acct);
    dog.start(getpid(), pthread_self(), chrono::steady_clock::now());

    // 开始采样之前不会检查内存
    this_thread::sleep_for(chrono::milliseconds(50));
    EXPECT_EQ(dog.pending(), 0);
    EXPECT_EQ(dog.peak_memory(), 0);

    dog.begin_sampling(true);
    EXPECT_TRUE(wait_for(dog, watchdog::MEMORY_EXCEEDED, chrono::seconds(2)));
    EXPECT_GT(dog.peak_memory(), 1);
    dog.stop();
}

TEST_F(WatchdogTest, StopWithoutStart) {
    watchdog dog(chrono::seconds(1), -1, acct);
    dog.stop();
    EXPECT_EQ(dog.pending(), 0);
}
