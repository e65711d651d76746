#pragma once

#include <sys/resource.h>
#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "judgebox/syscall_table.hpp"

namespace judgebox {

/**
 * @brief 运行请求中的一项资源限制
 * 可能未指定（使用默认值）、显式指定为不限制，或者给出一个数值。
 * 数值在这里不做检查，非正数由 resolve_policy 拒绝。
 */
struct requested_limit {
    enum kind_t {
        UNSET,
        AMOUNT,
        UNLIMITED
    };

    kind_t kind = UNSET;
    int64_t amount = 0;

    static requested_limit of(int64_t amount);
    static requested_limit unlimited();
};

/**
 * @brief 解析后的资源限制，要么是正数，要么是不限制
 */
struct limit {
    limit();

    static limit of(int64_t amount);
    static limit unlimited();

    bool is_unlimited() const;

    /**
     * @brief 限制的数值
     * 对不限制的 limit 调用属于编程错误
     */
    int64_t amount() const;

    /**
     * @brief 换算为 setrlimit 使用的值
     * @param scale 单位换算倍数，如 KB 到字节为 1024
     * @return 不限制时返回 RLIM_INFINITY
     */
    rlim_t as_rlimit(int64_t scale = 1) const;

    bool operator==(const limit &other) const;
    bool operator!=(const limit &other) const;

private:
    explicit limit(int64_t value);

    // -1 表示不限制
    int64_t value;
};

/**
 * @brief 一个挂载点
 * src 为宿主机上的路径，dst 为沙箱内的绝对路径
 */
struct mount_point {
    std::filesystem::path src;
    std::filesystem::path dst;
    bool writable = false;

    /**
     * @brief 为 false 时宿主机上不存在 src 则跳过该挂载点，用于默认挂载点
     */
    bool required = true;
};

/**
 * @brief 解析 "SRC[:DST]" 形式的挂载点描述
 * 省略 DST 时，沙箱内路径与宿主机路径相同
 * @throw policy_error 当 SRC 为空时
 */
mount_point parse_mount_point(const std::string &spec, bool writable);

/**
 * @brief 外部传入的运行请求
 * 字段与命令行参数一一对应，未经检查。
 */
struct run_request {
    std::filesystem::path program;
    std::vector<std::string> args;

    /**
     * @brief 语言标识，决定系统调用白名单，支持别名
     */
    std::string language = "c";

    requested_limit cpu_time_limit;     // ms
    requested_limit wall_time_limit;    // ms
    requested_limit memory_limit;       // KB
    requested_limit stack_limit;        // KB
    requested_limit output_size_limit;  // KB
    requested_limit process_limit;

    std::filesystem::path chroot_dir;
    std::vector<mount_point> mounts;
    bool default_mounts = true;
    std::filesystem::path work_dir;

    std::optional<uid_t> uid;
    std::optional<gid_t> gid;

    std::filesystem::path stdin_path;
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;

    /**
     * @brief 传递给用户程序的环境变量，形如 KEY=VALUE
     */
    std::vector<std::string> env;
    bool preserve_env = false;
};

/**
 * @brief 一次运行的执行策略
 * 只能通过 resolve_policy 构造，构造后不再修改，各组件只持有 const 引用。
 */
struct execution_policy {
    std::filesystem::path program;
    std::vector<std::string> args;

    limit cpu_time_limit;     // ms
    limit wall_time_limit;    // ms，一定不是不限制
    limit memory_limit;       // KB
    limit stack_limit;        // KB
    limit output_size_limit;  // KB
    limit process_limit;

    /**
     * @brief chroot 根目录，为空时不进行文件系统隔离
     */
    std::filesystem::path chroot_dir;

    /**
     * @brief 只读挂载点，按挂载顺序排列，包含默认挂载点
     */
    std::vector<mount_point> read_mounts;

    /**
     * @brief 可写挂载点，按挂载顺序排列，在只读挂载点之后挂载
     */
    std::vector<mount_point> write_mounts;

    /**
     * @brief 沙箱内的工作目录，为空时为根目录
     */
    std::filesystem::path work_dir;

    uid_t uid = 0;
    gid_t gid = 0;

    /**
     * @brief 归一化后的语言标识
     */
    std::string language;
    std::shared_ptr<const syscall_set> allowed_syscalls;

    std::filesystem::path stdin_path;
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;

    std::vector<std::string> env;
    bool preserve_env = false;

    /**
     * @brief 判断系统调用是否在白名单中
     */
    bool allows(long syscall) const;
};

/**
 * @brief 检查运行请求，填充默认值，得到执行策略
 * 不访问文件系统，不查询用户数据库，也不修改请求。
 * 1. 程序路径不能为空
 * 2. 所有限制必须为正数或者显式不限制，时钟时间不能不限制
 * 3. 挂载点必须配合 chroot 使用，沙箱内路径必须是绝对路径且不能跳出根目录
 * 4. uid 和 gid 必须指定且不能为 0
 * 5. 语言必须注册了系统调用白名单
 * @throw policy_error 当请求不合法时
 */
execution_policy resolve_policy(const run_request &request, const syscall_registry &registry);

}  // namespace judgebox
