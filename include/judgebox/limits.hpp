#pragma once

#include <sys/resource.h>
#include <string>
#include <vector>
#include "judgebox/isolation.hpp"

namespace judgebox {

/**
 * @brief 表示资源限制已经生效，可以执行用户程序
 */
struct governed {
    governed(const governed &) = delete;
    governed(governed &&) = default;

    const execution_policy &get_policy() const;

    /**
     * @brief 是否成功加入了全部统计用的 cgroup 子系统
     */
    bool joined() const;

private:
    friend governed govern(privileges_dropped &&isolated, const std::vector<int> &membership);
    governed(const execution_policy &policy, bool joined);

    const execution_policy *policy;
    bool joined_;
};

/**
 * @brief 设置资源限制
 * @throw std::system_error 当 setrlimit 失败时
 */
void set_rlimit(int resource, rlim_t cur, rlim_t max);

/**
 * @brief 按照执行策略设置当前进程的资源限制
 * 1. RLIMIT_CPU: 软限制为向上取整的秒数，硬限制再多 1 秒
 * 2. RLIMIT_AS: 内存限制的 ADDRESS_SPACE_FACTOR 倍
 * 3. RLIMIT_STACK、RLIMIT_FSIZE: 栈空间与输出文件大小限制
 * 4. RLIMIT_NPROC: 仅在限制了进程数时设置
 * 5. RLIMIT_CORE: 禁止生成 core 文件
 * @throw resource_setup_error 当任一限制设置失败时
 */
void apply_limits(const execution_policy &policy);

/**
 * @brief 子进程降权后设置资源限制并加入 cgroup
 * 加入 cgroup 失败不会抛出异常，由 governed::joined 返回
 * @param membership accounting::open_membership 在 chroot 前打开的 tasks 文件，函数会关闭它们
 * @throw resource_setup_error 当资源限制设置失败时
 */
governed govern(privileges_dropped &&isolated, const std::vector<int> &membership);

/**
 * @brief 计算用户程序的环境变量
 * 默认只保留 PATH，再追加策略中的变量；只有键名的变量从当前环境中读取值。
 */
std::vector<std::string> build_environment(const execution_policy &policy);

/**
 * @brief 执行用户程序，成功时不会返回
 * @throw internal_error 当 execve 失败时
 */
[[noreturn]] void exec(governed &&process);

}  // namespace judgebox
