#pragma once

#include <optional>
#include "judgebox/cgroup.hpp"
#include "judgebox/policy.hpp"
#include "judgebox/report.hpp"
#include "judgebox/watchdog.hpp"

namespace judgebox {

/**
 * @brief 在沙箱中运行一次用户程序
 *
 * 1. 安装唤醒信号处理函数，CGROUP 模式下清零内存峰值并记录运行前的累计读数
 * 2. 创建状态管道并 fork 出子进程
 *    1. 子进程请求被跟踪并暂停自己，等待监控线程设置跟踪选项
 *    2. 重定向标准输入输出，在 chroot 之前打开 cgroup 的 tasks 文件
 *    3. 进入私有 mount namespace，挂载文件系统，chroot，降低权限
 *    4. 设置资源限制，加入 cgroup，执行用户程序
 *    以上任一步骤失败都会通过状态管道告知父进程并立即退出
 * 3. 监控线程跟踪子进程的系统调用，看门狗线程检查时钟时间与内存
 * 4. 子进程终止后读取资源使用，生成运行报告
 *
 * 同一进程内同时只能运行一个沙箱，并发运行必须使用不同的用户与 cgroup。
 */
struct sandbox {
    sandbox(const execution_policy &policy, const accounting &acct);

    sandbox(const sandbox &) = delete;
    sandbox &operator=(const sandbox &) = delete;

    /**
     * @brief 运行用户程序并生成报告
     * 重复调用返回第一次运行的报告
     * @throw internal_error 当子进程还未创建就失败时（fork、pipe、信号处理函数）
     */
    execution_report run();

    /**
     * @brief 取消运行，可以在任意线程调用，可以重复调用
     * 子进程会被杀死并回收，报告为 INTERNAL_ERROR
     */
    void cancel();

private:
    const execution_policy &policy;
    accounting acct;
    bool degraded = false;
    watchdog dog;
    std::optional<execution_report> report;
};

/**
 * @brief 运行一次用户程序
 * @see sandbox
 */
execution_report run(const execution_policy &policy, const accounting &acct);

}  // namespace judgebox
