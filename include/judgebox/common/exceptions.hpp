#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace judgebox {

struct judgebox_exception : std::exception {
    judgebox_exception();
    explicit judgebox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judgebox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示运行请求不合法
 * 在创建任何进程之前抛出，此时不会生成运行报告
 */
struct policy_error : public judgebox_exception {
    policy_error();
    explicit policy_error(const std::string &message);
};

/**
 * @brief 表示隔离环境搭建失败
 * 包括 mount namespace、bind mount、chroot、降权失败，一定在用户程序运行前发生
 */
struct isolation_error : public judgebox_exception {
    isolation_error();
    explicit isolation_error(const std::string &message);
};

/**
 * @brief 表示资源限制设置失败
 * setrlimit 失败是致命的；cgroup 加入失败不会抛出此异常，而是降级为 rusage 统计
 */
struct resource_setup_error : public judgebox_exception {
    resource_setup_error();
    explicit resource_setup_error(const std::string &message);
};

/**
 * @brief 表示 ptrace 跟踪失败
 * attach 失败或者在系统调用入口无法读取寄存器
 */
struct trace_error : public judgebox_exception {
    trace_error();
    explicit trace_error(const std::string &message);
};

/**
 * @brief 表示沙箱自身的内部错误
 * 一般是 fork、pipe 等系统资源不足
 */
struct internal_error : public judgebox_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

}  // namespace judgebox
