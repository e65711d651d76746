#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace judgebox {

/**
 * @brief judgebox run 的进程返回值
 * 返回值反映的是沙箱的判定结果，而不是用户程序自己的返回值
 */
enum error_codes {
    E_SUCCESS = 0,
    E_POLICY_ERROR = 1,
    E_INTERNAL_ERROR = 2,

    E_RUNTIME_ERROR = 48,
    E_TIME_LIMIT = 52,
    E_MEM_LIMIT = 53,
    E_RESTRICTED_FUNCTION = 55
};

/**
 * @brief 默认 CPU 时间限制，单位为毫秒
 */
extern int64_t DEFAULT_CPU_TIME_LIMIT;

/**
 * @brief 未指定时钟时间限制且 CPU 时间无限制时的默认时钟时间限制，单位为毫秒
 */
extern int64_t DEFAULT_WALL_TIME_LIMIT;

/**
 * @brief 时钟时间限制相对 CPU 时间限制的余量，单位为毫秒
 * 用户程序可能阻塞在 IO 或者 sleep 上，此时 CPU 时间不会增长
 */
extern int64_t WALL_TIME_GRACE;

/**
 * @brief 默认内存限制，单位为 KB
 */
extern int64_t DEFAULT_MEMORY_LIMIT;

/**
 * @brief 默认输出文件大小限制，单位为 KB
 */
extern int64_t DEFAULT_OUTPUT_LIMIT;

/**
 * @brief 设置 RLIMIT_AS 时相对于内存限制的倍数
 * 真正的内存超限判定依靠 cgroup 或者 /proc 的统计，地址空间限制只防止
 * 失控的大块内存申请。
 */
extern int ADDRESS_SPACE_FACTOR;

/**
 * @brief 看门狗轮询内存和检查时限的间隔
 */
extern std::chrono::milliseconds WATCHDOG_TICK;

/**
 * @brief 设置 chroot 时默认只读挂载的目录
 */
extern std::vector<std::filesystem::path> DEFAULT_READ_MOUNTS;

/**
 * @brief 需要统计的 cgroup 子系统
 * 这些子系统下的 <cgroup name> 目录由外部初始化脚本预先创建，
 * 并将所有者设置为运行用户程序的用户，judgebox 不会创建或删除它们。
 */
extern std::vector<std::string> ACCOUNTED_SUBSYSTEMS;

}  // namespace judgebox
