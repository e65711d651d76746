#pragma once

#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include "judgebox/cgroup.hpp"

namespace judgebox {

/**
 * @brief 在作用域内安装唤醒监控线程用的信号处理函数
 * 处理函数什么也不做，并且不设置 SA_RESTART，这样阻塞在 wait4 上的监控线程
 * 会因为 EINTR 返回。析构时恢复原来的处理函数和信号掩码。
 * 同一进程内同时只能有一个沙箱在运行。
 */
struct wakeup_signal_guard {
    /**
     * @throw internal_error 当无法安装信号处理函数时
     */
    wakeup_signal_guard();
    ~wakeup_signal_guard();

    wakeup_signal_guard(const wakeup_signal_guard &) = delete;
    wakeup_signal_guard &operator=(const wakeup_signal_guard &) = delete;

    static const int SIGNAL = SIGALRM;

private:
    struct sigaction previous_action;
    sigset_t previous_mask;
};

/**
 * @brief 独立于 ptrace 循环的看门狗
 *
 * 看门狗线程每隔 WATCHDOG_TICK 检查一次时钟时间并采样内存，
 * 发现超限时设置对应的标志并向监控线程发送唤醒信号。标志被确认之前
 * 每个周期都会重新发送信号，因此唤醒不会丢失。
 * 看门狗从不直接操作子进程，只有监控线程会杀死子进程。
 */
struct watchdog {
    enum flag {
        DEADLINE = 1,
        MEMORY_EXCEEDED = 2,
        CANCELLED = 4
    };

    /**
     * @param wall_limit 时钟时间限制
     * @param memory_limit 内存限制，单位为 KB，-1 表示不限制
     * @param acct 内存采样方式
     */
    watchdog(std::chrono::milliseconds wall_limit, int64_t memory_limit, const accounting &acct);

    /**
     * @brief 停止看门狗线程
     */
    ~watchdog();

    watchdog(const watchdog &) = delete;
    watchdog &operator=(const watchdog &) = delete;

    /**
     * @brief 启动看门狗线程
     * @param pid 被监视的子进程
     * @param controller 需要唤醒的监控线程
     * @param started 计时的起点
     */
    void start(pid_t pid, pthread_t controller, std::chrono::steady_clock::time_point started);

    /**
     * @brief 停止看门狗线程，可以重复调用
     */
    void stop();

    /**
     * @brief 请求取消运行，可以在任意线程调用，可以重复调用
     */
    void cancel();

    /**
     * @brief 用户程序开始执行后才采样内存
     * exec 之前的子进程是评测进程的副本，它的内存占用不应该计入用户程序
     * @param proc 子进程未能加入 cgroup 时改为采样 /proc/<pid>/status
     */
    void begin_sampling(bool proc);

    /**
     * @brief 已经设置但尚未确认的标志
     */
    int pending() const;

    /**
     * @brief 确认标志，确认后不再为该标志发送唤醒信号
     */
    void acknowledge(int mask);

    /**
     * @brief 采样得到的内存峰值，单位为 KB，没有采样时为 0
     */
    int64_t peak_memory() const;

private:
    void loop();
    void raise_flag(int flag);
    void wake();

    std::chrono::milliseconds wall_limit;
    int64_t memory_limit;
    const accounting &acct;

    pid_t pid = -1;
    pthread_t controller;
    std::chrono::steady_clock::time_point started;

    std::atomic<int> flags{0};
    std::atomic<int> acknowledged{0};
    std::atomic<bool> started_flag{false};
    std::atomic<bool> sampling{false};
    std::atomic<bool> proc_sampling{false};
    std::atomic<int64_t> peak{0};

    std::mutex mut;
    std::condition_variable cond;
    bool stopping = false;
    std::thread thd;
};

}  // namespace judgebox
