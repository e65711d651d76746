#include "judgebox/monitor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/ptrace.h>
#include <sys/syscall.h>
#include <sys/user.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstring>
#if defined(__aarch64__)
#include <elf.h>
#include <sys/uio.h>
#endif
#include "judgebox/common/exceptions.hpp"

namespace judgebox {
using namespace std;

bool is_terminal(process_state state) {
    return state == process_state::KILLED ||
           state == process_state::EXITED ||
           state == process_state::SIGNALED;
}

const char *state_name(process_state state) {
    switch (state) {
        case process_state::CREATED: return "created";
        case process_state::RUNNING: return "running";
        case process_state::KILLING: return "killing";
        case process_state::KILLED: return "killed";
        case process_state::EXITED: return "exited";
        case process_state::SIGNALED: return "signaled";
    }
    return "unknown";
}

syscall_decision syscall_decision::allow(long syscall) {
    return {true, syscall, ""};
}

syscall_decision syscall_decision::deny(long syscall, string reason) {
    return {false, syscall, move(reason)};
}

syscall_decision evaluate_syscall(const execution_policy &policy, long syscall, syscall_abi abi) {
    if (abi == syscall_abi::COMPAT)
        return syscall_decision::deny(syscall, fmt::format("32-bit syscall {} is not allowed", syscall));
    if (!policy.allows(syscall))
        return syscall_decision::deny(syscall, fmt::format("syscall {} is not allowed for language {}", syscall_display_name(syscall), policy.language));
    return syscall_decision::allow(syscall);
}

/**
 * @brief 进程号参数的位置，-1 表示该调用没有需要检查的进程号
 */
static int target_pid_arg(long syscall) {
    switch (syscall) {
        case SYS_kill:
        case SYS_tkill:
        case SYS_tgkill:
        case SYS_prlimit64:
            return 0;
        default:
            return -1;
    }
}

syscall_decision evaluate_syscall(const execution_policy &policy, const syscall_call &call, syscall_abi abi, pid_t self) {
    syscall_decision decision = evaluate_syscall(policy, call.syscall, abi);
    if (!decision.allowed) return decision;

    int index = target_pid_arg(call.syscall);
    if (index < 0) return decision;

    // 进程号是 int，寄存器的高位没有意义
    pid_t target = (pid_t)(int)call.args[index];
    // prlimit64 的 0 表示调用者自己；kill 的 0 表示整个进程组，评测进程也在其中
    bool self_target = target == self || (call.syscall == SYS_prlimit64 && target == 0);
    if (call.syscall == SYS_tgkill && (pid_t)(int)call.args[1] != self)
        self_target = false;
    if (!self_target)
        return syscall_decision::deny(call.syscall, fmt::format("syscall {} targeting process {} is not allowed", syscall_display_name(call.syscall), target));
    return decision;
}

void child_status::read_from(int fd) {
    string content;
    char buf[512];
    while (true) {
        ssize_t nread = read(fd, buf, sizeof(buf));
        if (nread == -1 && errno == EINTR) continue;
        if (nread <= 0) break;
        content.append(buf, nread);
    }

    vector<string> lines;
    boost::algorithm::split(lines, content, boost::is_any_of("\n"));
    for (auto &line : lines) {
        if (boost::algorithm::starts_with(line, "error: "))
            error = line.substr(7);
        else if (boost::algorithm::starts_with(line, "degraded: "))
            degraded.push_back(line.substr(10));
    }
}

static void read_syscall(pid_t pid, syscall_call &call, unsigned long long &instruction_pointer) {
    struct user_regs_struct regs;
#if defined(__x86_64__)
    if (ptrace(PTRACE_GETREGS, pid, nullptr, &regs) != 0)
        throw trace_error(fmt::format("unable to read registers of {}: {}", pid, strerror(errno)));
    call.syscall = (long)regs.orig_rax;
    call.args = {regs.rdi, regs.rsi, regs.rdx, regs.r10, regs.r8, regs.r9};
    instruction_pointer = regs.rip;
#elif defined(__aarch64__)
    struct iovec iov;
    iov.iov_base = &regs;
    iov.iov_len = sizeof(regs);
    if (ptrace(PTRACE_GETREGSET, pid, (void *)NT_PRSTATUS, &iov) != 0)
        throw trace_error(fmt::format("unable to read registers of {}: {}", pid, strerror(errno)));
    call.syscall = (long)regs.regs[8];
    for (size_t i = 0; i < call.args.size(); ++i)
        call.args[i] = regs.regs[i];
    instruction_pointer = regs.pc;
#else
#error "unsupported architecture"
#endif
}

syscall_monitor::syscall_monitor(const execution_policy &policy, watchdog &dog, int status_fd)
    : policy(policy), dog(dog), status_fd(status_fd) {}

const child_status &syscall_monitor::status() const {
    return status_;
}

bool syscall_monitor::degraded() const {
    return !status_.degraded.empty();
}

void syscall_monitor::collect_status() {
    if (status_fd < 0) return;
    status_.read_from(status_fd);
    close(status_fd);
    status_fd = -1;
}

void syscall_monitor::attach(sandboxed_process &process) {
    int status = 0;
    struct rusage usage;
    while (wait4(process.pid, &status, __WALL, &usage) < 0) {
        if (errno != EINTR) {
            fail(process, fmt::format("waiting on child {}: {}", process.pid, strerror(errno)));
            return;
        }
    }

    if (WIFEXITED(status) || WIFSIGNALED(status)) {
        // 子进程在请求跟踪之前就失败了，原因在状态管道中
        record_termination(process, status, usage);
        return;
    }

    if (!WIFSTOPPED(status) || WSTOPSIG(status) != SIGSTOP) {
        fail(process, fmt::format("unexpected initial status {:#x} of child {}", status, process.pid));
        return;
    }

    long options = PTRACE_O_TRACESYSGOOD | PTRACE_O_TRACEEXEC | PTRACE_O_EXITKILL;
    if (ptrace(PTRACE_SETOPTIONS, process.pid, nullptr, options) != 0) {
        fail(process, fmt::format("unable to set ptrace options of {}: {}", process.pid, strerror(errno)));
        return;
    }

    process.state = process_state::RUNNING;
    try {
        resume(process, 0);
    } catch (trace_error &e) {
        fail(process, e.what());
    }
}

void syscall_monitor::fail(sandboxed_process &process, const string &message) {
    LOG(ERROR) << "tracing child " << process.pid << " failed: " << message;
    if (status_.error.empty()) status_.error = message;
    if (!is_terminal(process.state)) kill_child(process, kill_reason::INTERNAL_ERROR);
}

monitor_event syscall_monitor::next_event(sandboxed_process &process) {
    while (true) {
        int flags = dog.pending();
        int status = 0;
        struct rusage usage;
        pid_t pid = wait4(process.pid, &status, __WALL | (flags ? WNOHANG : 0), &usage);

        if (pid == process.pid) {
            monitor_event event;
            event.status = status;
            if (WIFEXITED(status)) {
                event.type = monitor_event::EXITED;
                record_termination(process, status, usage);
            } else if (WIFSIGNALED(status)) {
                event.type = monitor_event::SIGNALED;
                event.signal = WTERMSIG(status);
                record_termination(process, status, usage);
            } else if (WSTOPSIG(status) == (SIGTRAP | 0x80)) {
                event.type = monitor_event::SYSCALL_STOP;
            } else if (WSTOPSIG(status) == SIGTRAP && (status >> 16) == PTRACE_EVENT_EXEC) {
                event.type = monitor_event::EXEC;
            } else {
                event.type = monitor_event::SIGNAL_STOP;
                event.signal = WSTOPSIG(status);
            }
            return event;
        }

        if (pid == 0) {
            // 没有已经到达的 wait4 结果，处理看门狗的标志
            monitor_event event;
            if (flags & watchdog::CANCELLED)
                event.type = monitor_event::CANCELLED;
            else if (flags & watchdog::DEADLINE)
                event.type = monitor_event::DEADLINE;
            else
                event.type = monitor_event::MEMORY_EXCEEDED;
            return event;
        }

        // 看门狗的唤醒信号会打断 wait4
        if (errno == EINTR) continue;
        throw trace_error(fmt::format("waiting on child {}: {}", process.pid, strerror(errno)));
    }
}

void syscall_monitor::trace(sandboxed_process &process) {
    try {
        while (!is_terminal(process.state))
            step(process, next_event(process));
    } catch (trace_error &e) {
        fail(process, e.what());
    }
    collect_status();
}

void syscall_monitor::step(sandboxed_process &process, const monitor_event &event) {
    switch (event.type) {
        case monitor_event::EXITED:
        case monitor_event::SIGNALED:
            break;
        case monitor_event::EXEC:
            collect_status();
            if (!status_.error.empty()) {
                kill_child(process, kill_reason::INTERNAL_ERROR);
                break;
            }
            for (auto &message : status_.degraded)
                LOG(WARNING) << "child degraded: " << message;
            dog.begin_sampling(degraded());

            // 从这里开始执行的是用户程序，之后停在 execve 的出口
            process.armed = true;
            process.in_syscall = true;
            resume(process, 0);
            break;
        case monitor_event::SYSCALL_STOP:
            handle_syscall_stop(process);
            break;
        case monitor_event::SIGNAL_STOP:
            switch (event.signal) {
                case SIGXCPU:
                    process.cpu_limit_signal = true;
                    LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
                    kill_child(process, kill_reason::TIME_LIMIT_EXCEEDED);
                    break;
                case SIGSTOP:
                case SIGTSTP:
                case SIGTTIN:
                case SIGTTOU:
                    // 不允许用户程序暂停自己
                    resume(process, 0);
                    break;
                default:
                    resume(process, event.signal);
                    break;
            }
            break;
        case monitor_event::CANCELLED:
            dog.acknowledge(watchdog::CANCELLED);
            LOG(WARNING) << "run cancelled";
            kill_child(process, kill_reason::CANCELLED);
            break;
        case monitor_event::DEADLINE:
            dog.acknowledge(watchdog::DEADLINE);
            LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
            kill_child(process, kill_reason::TIME_LIMIT_EXCEEDED);
            break;
        case monitor_event::MEMORY_EXCEEDED:
            dog.acknowledge(watchdog::MEMORY_EXCEEDED);
            LOG(WARNING) << "memory limit exceeded: aborting command";
            kill_child(process, kill_reason::MEMORY_LIMIT_EXCEEDED);
            break;
    }
}

void syscall_monitor::handle_syscall_stop(sandboxed_process &process) {
    process.in_syscall = !process.in_syscall;
    if (process.in_syscall && process.armed) {
        syscall_call call;
        unsigned long long instruction_pointer;
        read_syscall(process.pid, call, instruction_pointer);
        syscall_abi abi = syscall_type(process.pid, instruction_pointer);

        syscall_decision decision = evaluate_syscall(policy, call, abi, process.pid);
        VLOG(1) << "syscall " << syscall_display_name(call.syscall) << (decision.allowed ? " allowed" : " denied");
        if (!decision.allowed) {
            LOG(WARNING) << "Restricted Function: " << decision.reason;
            process.restricted_syscall = call.syscall;
            kill_child(process, kill_reason::RESTRICTED_FUNCTION);
            return;
        }
    }
    resume(process, 0);
}

void syscall_monitor::resume(sandboxed_process &process, int signal) {
    enum __ptrace_request request = process.armed ? PTRACE_SYSCALL : PTRACE_CONT;
    if (ptrace(request, process.pid, nullptr, (void *)(long)signal) != 0) {
        // 子进程可能已经被外部杀死（如 OOM killer），下一次 wait4 会得到它的终止状态
        if (errno == ESRCH) return;
        throw trace_error(fmt::format("unable to resume child {}: {}", process.pid, strerror(errno)));
    }
}

void syscall_monitor::kill_child(sandboxed_process &process, kill_reason reason) {
    process.state = process_state::KILLING;
    process.reason = reason;

    if (kill(process.pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to child " << process.pid << ": " << strerror(errno);

    // SIGKILL 能够唤醒处于 ptrace-stop 的子进程，一直等到它真正终止
    while (true) {
        int status = 0;
        struct rusage usage;
        pid_t pid = wait4(process.pid, &status, __WALL, &usage);
        if (pid < 0) {
            if (errno == EINTR) continue;
            LOG(ERROR) << "waiting on killed child " << process.pid << ": " << strerror(errno);
            break;
        }
        if (WIFEXITED(status) || WIFSIGNALED(status)) {
            process.usage = usage;
            if (WIFSIGNALED(status)) process.term_signal = WTERMSIG(status);
            else process.exit_code = WEXITSTATUS(status);
            break;
        }
    }

    process.state = process_state::KILLED;
}

void syscall_monitor::record_termination(sandboxed_process &process, int status, const struct rusage &usage) {
    process.usage = usage;
    if (WIFEXITED(status)) {
        process.exit_code = WEXITSTATUS(status);
        process.state = process_state::EXITED;
    } else {
        process.term_signal = WTERMSIG(status);
        process.state = process_state::SIGNALED;
        LOG(INFO) << "Command terminated with signal (" << process.term_signal << ", " << strsignal(process.term_signal) << ")";
    }
}

}  // namespace judgebox
