#pragma once

#include <sys/types.h>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace judgebox {

/**
 * @brief 一个语言允许使用的系统调用号集合，构造后不再修改
 */
typedef std::set<long> syscall_set;

/**
 * @brief 系统调用的调用约定
 * x86_64 下用户程序可以通过 int 0x80 或 sysenter 以 32 位约定发起系统调用，
 * 此时 orig_rax 中的调用号属于 32 位系统调用表，不能按 64 位表判定。
 */
enum class syscall_abi {
    NATIVE,
    COMPAT,
    UNKNOWN
};

/**
 * @brief 查找系统调用名称
 * @return 当前架构下的名称，找不到时返回 nullptr
 */
const char *syscall_name(long nr);

/**
 * @brief 返回便于输出的系统调用名称，未知调用返回 "syscall_<nr>"
 */
std::string syscall_display_name(long nr);

/**
 * @brief 根据名称查找当前架构下的系统调用号
 * @return 系统调用号，当前架构没有该系统调用时返回 -1
 */
long syscall_number(const std::string &name);

/**
 * @brief 判断被跟踪进程在系统调用入口处使用的调用约定
 * x86_64 下读取触发系统调用的指令（位于 ip 之前 2 字节），其他架构总是 NATIVE
 * @param pid 被跟踪进程，必须处于 ptrace-stop
 * @param instruction_pointer 系统调用入口时的 ip
 * @throw trace_error 无法读取被跟踪进程的内存时
 */
syscall_abi syscall_type(pid_t pid, unsigned long long instruction_pointer);

/**
 * @brief 各语言的系统调用白名单
 * 语言标识到系统调用号集合的映射，在构造执行策略时一次性解析，
 * 运行时判定只做集合查找。未注册的系统调用一律拒绝。
 */
struct syscall_registry {
    /**
     * @brief 注册内置的 c、cpp、python3 白名单以及常见别名
     */
    static syscall_registry with_defaults();

    /**
     * @brief 注册一个语言的白名单
     * @param tag 语言标识
     * @param names 允许的系统调用名称，当前架构不存在的名称会被忽略
     * @param base 若非空，则在该语言白名单的基础上追加
     * @throw policy_error 当 base 未注册时
     */
    void register_language(const std::string &tag, const std::vector<std::string> &names, const std::string &base = "");

    /**
     * @brief 注册语言别名，如 "c++" -> "cpp"
     */
    void register_alias(const std::string &alias, const std::string &tag);

    /**
     * @brief 从 JSON 文件追加白名单
     * @code{.json}
     * {
     *     "languages": { "pascal": { "extends": "c", "allow": ["getdents64"] } },
     *     "aliases": { "pas": "pascal" }
     * }
     * @endcode
     * @throw policy_error 当文件无法读取或格式错误时
     */
    void load_json(const std::filesystem::path &file);

    /**
     * @brief 将别名归一化为语言标识
     */
    std::string canonical_tag(const std::string &tag) const;

    /**
     * @brief 查找语言的白名单
     * @return 白名单，语言未注册时返回 nullptr
     */
    std::shared_ptr<const syscall_set> find(const std::string &tag) const;

    std::vector<std::string> languages() const;

private:
    std::map<std::string, std::shared_ptr<const syscall_set>> tables;
    std::map<std::string, std::string> aliases;
};

}  // namespace judgebox
