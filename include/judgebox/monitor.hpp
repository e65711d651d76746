#pragma once

#include <sys/resource.h>
#include <sys/types.h>
#include <array>
#include <chrono>
#include <string>
#include <vector>
#include "judgebox/cgroup.hpp"
#include "judgebox/policy.hpp"
#include "judgebox/syscall_table.hpp"
#include "judgebox/watchdog.hpp"

namespace judgebox {

/**
 * @brief 子进程的状态
 * CREATED -> RUNNING -> (KILLING ->) KILLED | EXITED | SIGNALED
 * KILLED、EXITED、SIGNALED 为终止状态，每次运行恰好到达其中一个
 */
enum class process_state {
    CREATED,
    RUNNING,
    KILLING,
    KILLED,
    EXITED,
    SIGNALED
};

bool is_terminal(process_state state);

const char *state_name(process_state state);

/**
 * @brief 监控线程杀死子进程的原因
 */
enum class kill_reason {
    NONE,
    RESTRICTED_FUNCTION,
    TIME_LIMIT_EXCEEDED,
    MEMORY_LIMIT_EXCEEDED,
    CANCELLED,
    INTERNAL_ERROR
};

/**
 * @brief 对一次系统调用的判定结果
 */
struct syscall_decision {
    bool allowed;
    long syscall;
    std::string reason;

    static syscall_decision allow(long syscall);
    static syscall_decision deny(long syscall, std::string reason);
};

/**
 * @brief 根据执行策略判定一次系统调用
 * 非本机调用约定（如 x86_64 上的 int 0x80）发起的系统调用一律拒绝
 */
syscall_decision evaluate_syscall(const execution_policy &policy, long syscall, syscall_abi abi);

/**
 * @brief 系统调用入口时读取到的编号与参数
 */
struct syscall_call {
    long syscall = -1;
    std::array<unsigned long long, 6> args{};
};

/**
 * @brief 在编号检查之外再检查参数
 * 白名单中以进程号为目标的调用（tgkill、tkill、kill、prlimit64）只能作用于子进程自己，
 * 否则用户程序能够向评测进程发送信号或者修改评测进程的资源限制。
 * @param self 被监控的子进程
 */
syscall_decision evaluate_syscall(const execution_policy &policy, const syscall_call &call, syscall_abi abi, pid_t self);

/**
 * @brief 被监控的子进程，只由监控线程访问
 */
struct sandboxed_process {
    pid_t pid = -1;
    process_state state = process_state::CREATED;
    std::chrono::steady_clock::time_point started;

    /**
     * @brief 是否已经执行了用户程序，之后的每个系统调用都要检查
     */
    bool armed = false;

    /**
     * @brief 下一次系统调用停止是否为出口
     */
    bool in_syscall = false;

    bool cpu_limit_signal = false;

    kill_reason reason = kill_reason::NONE;
    long restricted_syscall = -1;

    int exit_code = -1;
    int term_signal = 0;

    /**
     * @brief wait4 回收子进程时得到的资源使用
     */
    struct rusage usage {};
};

/**
 * @brief 监控线程等待到的一个事件
 * 合并了 wait4 的结果与看门狗的标志
 */
struct monitor_event {
    enum type_t {
        SYSCALL_STOP,
        EXEC,
        SIGNAL_STOP,
        EXITED,
        SIGNALED,
        DEADLINE,
        MEMORY_EXCEEDED,
        CANCELLED
    };

    type_t type;
    int status = 0;
    int signal = 0;
};

/**
 * @brief 子进程通过状态管道报告的信息
 * 子进程在 exec 之前的失败与降级都通过带有 O_CLOEXEC 的管道告知父进程，
 * 每行为 "error: <message>" 或 "degraded: <message>"。exec 成功后管道自动关闭。
 */
struct child_status {
    std::string error;
    std::vector<std::string> degraded;

    /**
     * @brief 读取管道直到 EOF
     */
    void read_from(int fd);
};

/**
 * @brief 系统调用监控
 *
 * 子进程在隔离之前调用 PTRACE_TRACEME 并用 SIGSTOP 暂停自己，监控线程等到该停止后
 * 设置 PTRACE_O_TRACESYSGOOD、PTRACE_O_TRACEEXEC、PTRACE_O_EXITKILL。
 * 在 exec 事件之前执行的是评测进程自己的代码，使用 PTRACE_CONT 运行；
 * exec 事件之后的每一个系统调用入口都按照执行策略检查，被拒绝的系统调用不会真正执行。
 *
 * 拒绝系统调用优先于同时到达的看门狗事件；看门狗事件中取消优先，其次时钟超时，最后内存超限。
 */
struct syscall_monitor {
    syscall_monitor(const execution_policy &policy, watchdog &dog, int status_fd);

    /**
     * @brief 等待子进程的初始停止并设置跟踪选项
     * 子进程在此之前已经退出时直接进入终止状态。
     * 无法设置跟踪选项时杀死子进程并记录到 child_status::error。
     */
    void attach(sandboxed_process &process);

    /**
     * @brief 驱动状态机直到子进程进入终止状态
     * 跟踪失败时杀死子进程并记录到 child_status::error，不会抛出 trace_error
     */
    void trace(sandboxed_process &process);

    /**
     * @brief 等待下一个事件
     * 看门狗有未确认的标志时不阻塞，优先返回已经到达的 wait4 结果
     * @throw trace_error 当 wait4 失败时
     */
    monitor_event next_event(sandboxed_process &process);

    const child_status &status() const;

    /**
     * @brief 子进程是否成功加入了 cgroup
     */
    bool degraded() const;

private:
    void step(sandboxed_process &process, const monitor_event &event);
    void handle_syscall_stop(sandboxed_process &process);
    void resume(sandboxed_process &process, int signal);
    void kill_child(sandboxed_process &process, kill_reason reason);
    void fail(sandboxed_process &process, const std::string &message);
    void record_termination(sandboxed_process &process, int status, const struct rusage &usage);
    void collect_status();

    const execution_policy &policy;
    watchdog &dog;
    int status_fd;
    child_status status_;
};

}  // namespace judgebox
