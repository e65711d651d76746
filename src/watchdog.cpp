#include "judgebox/watchdog.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <cstring>
#include "judgebox/common/exceptions.hpp"
#include "judgebox/config.hpp"

namespace judgebox {
using namespace std;

static void wakeup_handler(int /* signal */) {
}

wakeup_signal_guard::wakeup_signal_guard() {
    struct sigaction sigact;
    sigact.sa_handler = wakeup_handler;
    sigact.sa_flags = 0;  // no SA_RESTART
    if (sigemptyset(&sigact.sa_mask) != 0)
        throw internal_error(fmt::format("creating empty signal mask: {}", strerror(errno)));
    if (sigaction(SIGNAL, &sigact, &previous_action) != 0)
        throw internal_error(fmt::format("installing wakeup signal handler: {}", strerror(errno)));

    sigset_t sigmask;
    sigemptyset(&sigmask);
    sigaddset(&sigmask, SIGNAL);
    int ret = pthread_sigmask(SIG_UNBLOCK, &sigmask, &previous_mask);
    if (ret != 0) {
        sigaction(SIGNAL, &previous_action, nullptr);
        throw internal_error(fmt::format("unmasking wakeup signal: {}", strerror(ret)));
    }
}

wakeup_signal_guard::~wakeup_signal_guard() {
    if (pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr) != 0)
        LOG(WARNING) << "could not restore signal mask";
    if (sigaction(SIGNAL, &previous_action, nullptr) != 0)
        LOG(WARNING) << "could not restore signal handler";
}

watchdog::watchdog(chrono::milliseconds wall_limit, int64_t memory_limit, const accounting &acct)
    : wall_limit(wall_limit), memory_limit(memory_limit), acct(acct) {}

watchdog::~watchdog() {
    stop();
}

void watchdog::start(pid_t pid, pthread_t controller, chrono::steady_clock::time_point started) {
    CHECK(!thd.joinable()) << "watchdog started twice";
    this->pid = pid;
    this->controller = controller;
    this->started = started;
    started_flag = true;
    thd = thread([this] { loop(); });
}

void watchdog::stop() {
    {
        lock_guard<mutex> guard(mut);
        stopping = true;
    }
    cond.notify_all();
    if (thd.joinable()) thd.join();
}

void watchdog::cancel() {
    raise_flag(CANCELLED);
    wake();
}

void watchdog::begin_sampling(bool proc) {
    proc_sampling = proc;
    sampling = true;
}

int watchdog::pending() const {
    return flags.load() & ~acknowledged.load();
}

void watchdog::acknowledge(int mask) {
    acknowledged.fetch_or(mask);
}

int64_t watchdog::peak_memory() const {
    return peak.load();
}

void watchdog::raise_flag(int flag) {
    if (!(flags.fetch_or(flag) & flag))
        VLOG(1) << "watchdog raised flag " << flag;
}

void watchdog::wake() {
    if (started_flag && pending()) {
        int ret = pthread_kill(controller, wakeup_signal_guard::SIGNAL);
        if (ret != 0) LOG(WARNING) << "unable to wake up monitor thread: " << strerror(ret);
    }
}

void watchdog::loop() {
    unique_lock<mutex> lock(mut);
    while (!stopping) {
        if (chrono::steady_clock::now() - started >= wall_limit)
            raise_flag(DEADLINE);

        if (sampling) {
            int64_t usage = proc_sampling ? proc_peak_memory(pid) : acct.sample_memory(pid);
            if (usage > peak) peak = usage;
            if (memory_limit >= 0 && usage > memory_limit)
                raise_flag(MEMORY_EXCEEDED);
        }

        // 监控线程确认之前每个周期都重新唤醒一次
        wake();

        cond.wait_for(lock, WATCHDOG_TICK);
    }
}

}  // namespace judgebox
