#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include "judgebox/cgroup.hpp"
#include "judgebox/config.hpp"
#include "judgebox/monitor.hpp"
#include "judgebox/policy.hpp"

namespace judgebox {

/**
 * @brief 运行结果的判定
 * 优先级从高到低为 INTERNAL_ERROR、RESTRICTED_FUNCTION、MEMORY_LIMIT_EXCEEDED、
 * TIME_LIMIT_EXCEEDED、RUNTIME_ERROR、OK
 */
enum class verdict {
    OK,
    TIME_LIMIT_EXCEEDED,
    MEMORY_LIMIT_EXCEEDED,
    RESTRICTED_FUNCTION,
    RUNTIME_ERROR,
    INTERNAL_ERROR
};

const char *verdict_name(verdict v);

/**
 * @brief judgebox run 在该判定下的返回值
 */
error_codes verdict_exit_code(verdict v);

/**
 * @brief 一次运行结束时的全部原始数据，由监控线程汇总
 */
struct run_outcome {
    process_state state = process_state::CREATED;
    int exit_code = -1;
    int signal = 0;
    kill_reason reason = kill_reason::NONE;
    long restricted_syscall = -1;

    /**
     * @brief 是否观察到了 RLIMIT_CPU 软限制触发的 SIGXCPU
     */
    bool cpu_limit_signal = false;

    std::chrono::milliseconds wall_time{0};
    resource_usage usage;

    accounting::mode_t accounting_mode = accounting::RUSAGE;
    bool degraded = false;

    std::string internal_error;
};

/**
 * @brief 运行报告，运行结束时创建一次，之后不再修改
 */
struct execution_report {
    /**
     * @brief 用户程序正常退出时的返回值
     */
    std::optional<int> status;

    /**
     * @brief 用户程序被信号终止时的信号
     */
    std::optional<int> signal;

    /**
     * @brief 所有时间单位为毫秒，内存单位为 KB
     */
    int64_t wall_time = 0;
    int64_t user_time = 0;
    int64_t sys_time = 0;
    int64_t memory = 0;

    verdict result = verdict::OK;
    std::string accounting = "rusage";
    bool degraded = false;
    std::string restricted_syscall;
    std::string internal_error;
};

/**
 * @brief 根据执行策略汇总运行结果
 * 1. 引擎无法保证结果可信（内部错误、被取消）时为 INTERNAL_ERROR
 * 2. 因为拒绝系统调用被杀死时为 RESTRICTED_FUNCTION
 * 3. 因为内存被杀死、cgroup 发生 OOM 或者内存峰值超过限制时为 MEMORY_LIMIT_EXCEEDED
 * 4. 因为时间被杀死、收到 SIGXCPU 或者用户态与内核态时间之和超过限制时为 TIME_LIMIT_EXCEEDED
 * 5. 被信号终止时为 RUNTIME_ERROR
 * 6. 否则为 OK，返回值记录在报告中
 */
execution_report build_report(const execution_policy &policy, const run_outcome &outcome);

enum class report_format {
    META,
    JSON
};

/**
 * @brief 输出运行报告
 * META 格式每行为 "key: value"，字段顺序固定为
 * status、signal、wall-time、user-time、sys-time、memory、verdict、accounting、degraded，
 * 之后是可选的 restricted-syscall 与 internal-error。
 */
void write_report(std::ostream &os, const execution_report &report, report_format format);

/**
 * @brief 读取 META 格式的运行报告
 * @throw std::runtime_error 当文件无法读取或字段格式错误时
 */
execution_report read_report_meta(const std::filesystem::path &path);

}  // namespace judgebox
