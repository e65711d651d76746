#include <signal.h>
#include <sys/ptrace.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <string>
#include <thread>
#include "gtest/gtest.h"
#include "judgebox/monitor.hpp"

using namespace std;
using namespace judgebox;

class MonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = syscall_registry::with_defaults();
        run_request request;
        request.program = "/usr/bin/true";
        request.uid = 65534;
        request.gid = 65534;
        policy = resolve_policy(request, registry);
    }

    syscall_registry registry;
    execution_policy policy;
};

TEST_F(MonitorTest, AllowedSyscall) {
    syscall_decision decision = evaluate_syscall(policy, SYS_write, syscall_abi::NATIVE);
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.syscall, SYS_write);
}

TEST_F(MonitorTest, DeniedSyscall) {
    syscall_decision decision = evaluate_syscall(policy, SYS_socket, syscall_abi::NATIVE);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.syscall, SYS_socket);
    EXPECT_NE(decision.reason.find("socket"), string::npos);
}

TEST_F(MonitorTest, CompatSyscallDenied) {
    // int 0x80 发起的调用即使编号在白名单中也拒绝
    EXPECT_FALSE(evaluate_syscall(policy, SYS_write, syscall_abi::COMPAT).allowed);
    EXPECT_TRUE(evaluate_syscall(policy, SYS_write, syscall_abi::UNKNOWN).allowed);
}

TEST_F(MonitorTest, SignalTargets) {
    pid_t self = 1000;
    auto check = [&](long nr, unsigned long long arg0, unsigned long long arg1) {
        syscall_call call;
        call.syscall = nr;
        call.args[0] = arg0;
        call.args[1] = arg1;
        return evaluate_syscall(policy, call, syscall_abi::NATIVE, self).allowed;
    };

    // abort() 给自己发送 SIGABRT
    EXPECT_TRUE(check(SYS_tgkill, self, self));
    EXPECT_FALSE(check(SYS_tgkill, self - 1, self - 1));
    EXPECT_FALSE(check(SYS_tgkill, self, self - 1));
    EXPECT_FALSE(check(SYS_tgkill, self - 1, self));
    // 负数进程号只取低 32 位
    EXPECT_FALSE(check(SYS_tgkill, (unsigned long long)-1, self));
}

TEST_F(MonitorTest, ResourceLimitTargets) {
    pid_t self = 1000;
    syscall_call call;
    call.syscall = SYS_prlimit64;
    call.args[1] = RLIMIT_STACK;

    call.args[0] = 0;
    EXPECT_TRUE(evaluate_syscall(policy, call, syscall_abi::NATIVE, self).allowed);
    call.args[0] = self;
    EXPECT_TRUE(evaluate_syscall(policy, call, syscall_abi::NATIVE, self).allowed);
    call.args[0] = self - 1;
    syscall_decision decision = evaluate_syscall(policy, call, syscall_abi::NATIVE, self);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.syscall, SYS_prlimit64);
    EXPECT_NE(decision.reason.find("prlimit64"), string::npos);
}

TEST_F(MonitorTest, ArgumentsOfOtherSyscallsIgnored) {
    syscall_call call;
    call.syscall = SYS_write;
    call.args = {1, 0, 0, 0, 0, 0};
    EXPECT_TRUE(evaluate_syscall(policy, call, syscall_abi::NATIVE, 1000).allowed);

    // 编号不在白名单中时参数不影响结果
    call.syscall = SYS_socket;
    EXPECT_FALSE(evaluate_syscall(policy, call, syscall_abi::NATIVE, 1000).allowed);
    call.syscall = SYS_execve;
    EXPECT_FALSE(evaluate_syscall(policy, call, syscall_abi::NATIVE, 1000).allowed);
}

TEST_F(MonitorTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(process_state::CREATED));
    EXPECT_FALSE(is_terminal(process_state::RUNNING));
    EXPECT_FALSE(is_terminal(process_state::KILLING));
    EXPECT_TRUE(is_terminal(process_state::KILLED));
    EXPECT_TRUE(is_terminal(process_state::EXITED));
    EXPECT_TRUE(is_terminal(process_state::SIGNALED));
}

TEST_F(MonitorTest, ChildStatus) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    string content = "degraded: unable to join cgroup\nerror: chroot failed: Operation not permitted\n";
    ASSERT_EQ(write(fds[1], content.data(), content.size()), (ssize_t)content.size());
    close(fds[1]);

    child_status status;
    status.read_from(fds[0]);
    close(fds[0]);

    EXPECT_EQ(status.error, "chroot failed: Operation not permitted");
    ASSERT_EQ(status.degraded.size(), 1);
    EXPECT_EQ(status.degraded[0], "unable to join cgroup");
}

TEST_F(MonitorTest, EmptyChildStatus) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[1]);

    child_status status;
    status.read_from(fds[0]);
    close(fds[0]);

    EXPECT_TRUE(status.error.empty());
    EXPECT_TRUE(status.degraded.empty());
}

/**
 * 子进程请求跟踪后停止，父进程用 WNOWAIT 确认停止已经到达但不取走它，
 * 这时看门狗的标志与子进程的停止同时存在。
 */
TEST_F(MonitorTest, ArrivedStopBeatsWatchdogFlags) {
    wakeup_signal_guard guard;

    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        ptrace(PTRACE_TRACEME, 0, nullptr, nullptr);
        raise(SIGSTOP);
        _exit(0);
    }

    siginfo_t info;
    ASSERT_EQ(waitid(P_PID, pid, &info, WSTOPPED | WNOWAIT | __WALL), 0);

    accounting acct = accounting::rusage();
    watchdog dog(chrono::milliseconds(1), 1, acct);
    dog.start(pid, pthread_self(), chrono::steady_clock::now() - chrono::seconds(1));
    dog.begin_sampling(true);
    dog.cancel();

    int all = watchdog::CANCELLED | watchdog::DEADLINE | watchdog::MEMORY_EXCEEDED;
    auto deadline = chrono::steady_clock::now() + chrono::seconds(2);
    while ((dog.pending() & all) != all && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(5));
    ASSERT_EQ(dog.pending() & all, all);

    syscall_monitor monitor(policy, dog, -1);
    sandboxed_process process;
    process.pid = pid;
    process.state = process_state::RUNNING;

    // 已经到达的停止优先于全部标志
    monitor_event event = monitor.next_event(process);
    EXPECT_EQ(event.type, monitor_event::SIGNAL_STOP);
    EXPECT_EQ(event.signal, SIGSTOP);

    // 子进程仍然停止，之后按照取消、时钟超时、内存超限的顺序处理标志
    event = monitor.next_event(process);
    EXPECT_EQ(event.type, monitor_event::CANCELLED);
    dog.acknowledge(watchdog::CANCELLED);

    event = monitor.next_event(process);
    EXPECT_EQ(event.type, monitor_event::DEADLINE);
    dog.acknowledge(watchdog::DEADLINE);

    event = monitor.next_event(process);
    EXPECT_EQ(event.type, monitor_event::MEMORY_EXCEEDED);
    dog.acknowledge(watchdog::MEMORY_EXCEEDED);
    EXPECT_EQ(dog.pending(), 0);

    dog.stop();
    kill(pid, SIGKILL);
    int status;
    ASSERT_EQ(waitpid(pid, &status, __WALL), pid);
    EXPECT_TRUE(WIFSIGNALED(status));
}
