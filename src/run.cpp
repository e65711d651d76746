#include "judgebox/run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/ptrace.h>
#include <sys/types.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <system_error>
#include "judgebox/common/defer.hpp"
#include "judgebox/common/exceptions.hpp"
#include "judgebox/isolation.hpp"
#include "judgebox/limits.hpp"
#include "judgebox/monitor.hpp"

namespace judgebox {
using namespace std;

/**
 * @brief 通过状态管道告知父进程，子进程中不能使用日志
 */
static void report_to_parent(int status_fd, const char *kind, const string &message) {
    string line = fmt::format("{}: {}\n", kind, message);
    if (write(status_fd, line.data(), line.size()) != (ssize_t)line.size())
        _exit(EXIT_FAILURE);
}

[[noreturn]] static void run_child(const execution_policy &policy, const accounting &acct, int status_fd) {
    try {
        sigset_t emptymask;
        if (sigemptyset(&emptymask) != 0 || sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0)
            throw internal_error(fmt::format("unable to reset signal mask: {}", strerror(errno)));

        if (ptrace(PTRACE_TRACEME, 0, nullptr, nullptr) != 0)
            throw trace_error(fmt::format("unable to request tracing: {}", strerror(errno)));
        // 等待监控线程设置跟踪选项
        if (raise(SIGSTOP) != 0)
            throw trace_error("unable to stop for tracer");

        redirect_io(policy);

        vector<int> membership;
        try {
            membership = acct.open_membership();
        } catch (system_error &e) {
            report_to_parent(status_fd, "degraded", e.what());
        }

        privileges_dropped isolated = isolation_builder(policy)
                                          .unshare_mounts()
                                          .mount_filesystems()
                                          .enter_root()
                                          .drop_privileges();

        governed process = govern(move(isolated), membership);
        if (!process.joined())
            report_to_parent(status_fd, "degraded", "unable to join cgroup");

        exec(move(process));
    } catch (exception &e) {
        report_to_parent(status_fd, "error", e.what());
    }
    _exit(EXIT_FAILURE);
}

sandbox::sandbox(const execution_policy &policy, const accounting &acct)
    : policy(policy),
      acct(acct),
      dog(chrono::milliseconds(policy.wall_time_limit.amount()),
          policy.memory_limit.is_unlimited() ? -1 : policy.memory_limit.amount(),
          this->acct) {}

void sandbox::cancel() {
    dog.cancel();
}

execution_report sandbox::run() {
    if (report) return *report;

    wakeup_signal_guard wakeup;

    resource_usage baseline;
    if (acct.mode() == accounting::CGROUP) {
        try {
            acct.reset_peak();
            baseline = acct.read_usage();
        } catch (exception &e) {
            LOG(WARNING) << "unable to read cgroup " << acct.handle().name << ": " << e.what()
                         << ", falling back to rusage accounting";
            acct = accounting::rusage();
            degraded = true;
        }
    }

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0)
        throw internal_error(fmt::format("creating status pipe: {}", strerror(errno)));

    sandboxed_process process;
    process.started = chrono::steady_clock::now();
    process.pid = fork();
    if (process.pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw internal_error(fmt::format("unable to fork: {}", strerror(err)));
    }

    if (process.pid == 0) {
        close(status_pipe[0]);
        run_child(policy, acct, status_pipe[1]);
    }

    close(status_pipe[1]);
    defer { close(status_pipe[0]); };
    LOG(INFO) << "started child " << process.pid << " for " << policy.program;

    syscall_monitor monitor(policy, dog, status_pipe[0]);
    monitor.attach(process);
    dog.start(process.pid, pthread_self(), process.started);
    monitor.trace(process);
    dog.stop();
    LOG(INFO) << "child " << process.pid << " " << state_name(process.state);

    run_outcome outcome;
    outcome.wall_time = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - process.started);
    outcome.state = process.state;
    outcome.exit_code = process.exit_code;
    outcome.signal = process.term_signal;
    outcome.reason = process.reason;
    outcome.restricted_syscall = process.restricted_syscall;
    outcome.cpu_limit_signal = process.cpu_limit_signal;
    outcome.internal_error = monitor.status().error;

    if (monitor.degraded()) degraded = true;
    outcome.accounting_mode = accounting::RUSAGE;
    if (acct.mode() == accounting::CGROUP && !degraded) {
        try {
            resource_usage usage = acct.read_usage();
            outcome.usage.user_time = usage.user_time - baseline.user_time;
            outcome.usage.sys_time = usage.sys_time - baseline.sys_time;
            outcome.usage.peak_memory = max(usage.peak_memory, dog.peak_memory());
            outcome.usage.oom_kills = usage.oom_kills - baseline.oom_kills;
            outcome.accounting_mode = accounting::CGROUP;
        } catch (exception &e) {
            LOG(WARNING) << "unable to read cgroup usage: " << e.what() << ", falling back to rusage accounting";
            degraded = true;
        }
    }

    if (outcome.accounting_mode == accounting::RUSAGE) {
        outcome.usage.user_time = chrono::seconds(process.usage.ru_utime.tv_sec) + chrono::microseconds(process.usage.ru_utime.tv_usec);
        outcome.usage.sys_time = chrono::seconds(process.usage.ru_stime.tv_sec) + chrono::microseconds(process.usage.ru_stime.tv_usec);
        // ru_maxrss 的单位为 KB
        outcome.usage.peak_memory = max((int64_t)process.usage.ru_maxrss, dog.peak_memory());
    }
    outcome.degraded = degraded || outcome.accounting_mode == accounting::RUSAGE;

    report = build_report(policy, outcome);

    LOG(INFO) << fmt::format("run time: real {}ms, user {}ms, sys {}ms, memory {}KB, verdict {}",
                             report->wall_time, report->user_time, report->sys_time, report->memory,
                             verdict_name(report->result));
    return *report;
}

execution_report run(const execution_policy &policy, const accounting &acct) {
    sandbox box(policy, acct);
    return box.run();
}

}  // namespace judgebox
