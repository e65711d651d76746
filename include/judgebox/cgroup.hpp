#pragma once

#include <sys/types.h>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

struct cgroup;
struct cgroup_controller;

namespace judgebox {

struct cgroup_exception : public std::exception {
    cgroup_exception(std::string cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(std::string cgroup_op, int err);
private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 *
 * judgebox 只使用统计用途的 controller：
 * 1. cpu - 与 cpuacct 一起挂载在同一 mount 上
 * 2. cpuacct - 自动生成 cgroup 中任务占用 CPU 资源的报告
 * 3. memory - 自动生成 cgroup 中任务占用内存资源的报告
 * 4. pids - 统计 cgroup 中的进程数
 *
 * https://access.redhat.com/documentation/zh-cn/red_hat_enterprise_linux/7/html/resource_management_guide/ch-subsystems_and_tunable_parameters
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    int64_t get_value_int64(const std::string &name);

    bool has_value(const std::string &name);
};

/**
 * @brief 读取已有 cgroup 的管理器
 * 在析构时释放内存以确保没有内存泄漏。judgebox 从不创建或删除 cgroup，
 * 这些目录由外部初始化脚本预先创建。
 */
struct cgroup_guard {
    /**
     * @brief 构造函数，调用 libcgroup 的创建函数
     * @param cgroup_name cgroup 的内核名称
     */
    cgroup_guard(const std::string &cgroup_name);

    /**
     * @brief 析构函数，调用 libcgroup 的释放函数
     */
    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 从 cgroup 中获得指定的 controller
     * 必须是根据 get_cgroup 从内核中获得的已有的 controller
     * @see cgroup_ctrl
     * @param name 控制器的名称，如 "memory"
     * @return 已有的 cgroup controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 的所有信息。
     * 将会读入 cgroup 绑定的所有 controller、所有的 parameter 和对应的值。
     */
    void get_cgroup();

    static void init();

    /**
     * @brief 查找 controller 在宿主机上的挂载点
     * @throw cgroup_exception 当 controller 未挂载时
     */
    static std::filesystem::path mount_point(const std::string &controller);

private:
    struct cgroup *cg;
};

/**
 * @brief 预先创建的 cgroup 在各个统计子系统下的目录
 */
struct cgroup_handle {
    /**
     * @brief libcgroup 使用的 cgroup 名称，相对于各子系统的挂载点
     */
    std::string name;

    /**
     * @brief 子系统名称到 <挂载点>/<name> 目录的映射
     */
    std::map<std::string, std::filesystem::path> subsystems;

    std::filesystem::path path_of(const std::string &subsystem, const std::string &file) const;
};

/**
 * @brief 一次运行的资源使用统计
 */
struct resource_usage {
    std::chrono::microseconds user_time{0};
    std::chrono::microseconds sys_time{0};

    /**
     * @brief 峰值内存，单位为 KB
     */
    int64_t peak_memory = 0;

    /**
     * @brief OOM killer 触发的次数，rusage 模式下总为 0
     */
    int64_t oom_kills = 0;
};

/**
 * @brief 资源统计方式
 * CGROUP 模式读取实时的 cgroup 计数器；RUSAGE 模式在回收子进程时读取 wait4
 * 返回的 rusage，并在运行期间采样 /proc/<pid>/status，精度较低，报告中会标记为 degraded。
 * 在运行前一次性解析后作为数据传入引擎。
 */
struct accounting {
    enum mode_t {
        CGROUP,
        RUSAGE
    };

    static accounting rusage();
    static accounting cgroup(cgroup_handle handle);

    mode_t mode() const;

    /**
     * @brief "cgroup" 或 "rusage"
     */
    const char *mode_name() const;

    /**
     * @brief 仅在 CGROUP 模式下有效
     */
    const cgroup_handle &handle() const;

    /**
     * @brief 打开各子系统的 tasks 文件
     * 在子进程 chroot 之前调用，此时仍有权限访问宿主机上的 cgroup 目录。
     * RUSAGE 模式下返回空列表。
     * @return 打开的文件描述符，带有 O_CLOEXEC
     * @throw std::system_error 当文件无法打开时
     */
    std::vector<int> open_membership() const;

    /**
     * @brief 将运行前的内存峰值清零
     * @throw std::system_error 当计数器无法写入时
     */
    void reset_peak() const;

    /**
     * @brief 读取 cgroup 累计的资源使用
     * 时间是 cgroup 创建以来的累计值，调用者需要和运行前的读数相减
     * @throw cgroup_exception 当 libcgroup 读取失败时
     */
    resource_usage read_usage() const;

    /**
     * @brief 采样当前的内存使用，单位为 KB
     * CGROUP 模式读取 memory.usage_in_bytes，RUSAGE 模式读取 pid 的 VmHWM
     * @return 无法读取时返回 -1
     */
    int64_t sample_memory(pid_t pid) const;

    /**
     * @brief 读取 memory.oom_control 中的 oom_kill 计数
     * @return RUSAGE 模式或者内核不支持时返回 0
     */
    int64_t oom_kill_count() const;

private:
    mode_t mode_ = RUSAGE;
    cgroup_handle handle_;
};

/**
 * @brief 将进程加入 cgroup
 * 子进程降权后调用，向 open_membership 打开的 tasks 文件写入自己的 pid。
 * @return 写入失败的文件描述符个数，为 0 表示全部加入成功
 */
int join_membership(const std::vector<int> &fds, pid_t pid);

/**
 * @brief 解析 cgroup 的位置
 * 任一统计子系统未挂载、目录不存在或者不可写时退化为 RUSAGE 模式，不会抛出异常
 * @param name 预先创建的 cgroup 名称
 */
accounting resolve_accounting(const std::string &name) noexcept;

/**
 * @brief 读取 /proc/<pid>/status 中的 VmHWM，单位为 KB
 * @return 进程不存在或者无法读取时返回 -1
 */
int64_t proc_peak_memory(pid_t pid);

}  // namespace judgebox
