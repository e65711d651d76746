#pragma once

#include "judgebox/policy.hpp"

namespace judgebox {

struct mount_namespace;
struct filesystem_mounted;
struct chrooted;
struct privileges_dropped;

/**
 * @brief 隔离环境搭建的起点，只在 fork 出的子进程中构造
 *
 * 隔离分为以下几步，每一步都只能在上一步完成后进行：
 * 1. unshare_mounts: 进入私有的 mount namespace，避免挂载传播回宿主机
 * 2. mount_filesystems: 将 chroot 根目录绑定到自身，再按顺序绑定只读、可写挂载点
 * 3. enter_root: chroot 并切换到工作目录
 * 4. drop_privileges: 清除附加组，设置 gid，再设置 uid
 *
 * 每一步都是右值限定的成员函数，消耗当前对象并返回下一步的对象，
 * 这样调用顺序在编译期就确定了，资源限制只接受 privileges_dropped。
 * 没有设置 chroot 根目录时前三步不做任何事。
 * 所有步骤失败时都抛出 isolation_error。
 */
struct isolation_builder {
    explicit isolation_builder(const execution_policy &policy);

    isolation_builder(const isolation_builder &) = delete;
    isolation_builder(isolation_builder &&) = default;

    mount_namespace unshare_mounts() &&;

private:
    const execution_policy *policy;
};

struct mount_namespace {
    mount_namespace(const mount_namespace &) = delete;
    mount_namespace(mount_namespace &&) = default;

    filesystem_mounted mount_filesystems() &&;

private:
    friend struct isolation_builder;
    explicit mount_namespace(const execution_policy &policy);

    const execution_policy *policy;
};

struct filesystem_mounted {
    filesystem_mounted(const filesystem_mounted &) = delete;
    filesystem_mounted(filesystem_mounted &&) = default;

    chrooted enter_root() &&;

private:
    friend struct mount_namespace;
    explicit filesystem_mounted(const execution_policy &policy);

    const execution_policy *policy;
};

struct chrooted {
    chrooted(const chrooted &) = delete;
    chrooted(chrooted &&) = default;

    /**
     * @brief 降低权限
     * 以 root 运行时切换到策略指定的用户和组；否则只检查当前身份与策略一致。
     * 完成后检查真实 uid 和有效 uid 都不是 0。
     */
    privileges_dropped drop_privileges() &&;

private:
    friend struct filesystem_mounted;
    explicit chrooted(const execution_policy &policy);

    const execution_policy *policy;
};

/**
 * @brief 表示隔离已经完成，进程已经不再拥有特权
 */
struct privileges_dropped {
    privileges_dropped(const privileges_dropped &) = delete;
    privileges_dropped(privileges_dropped &&) = default;

    const execution_policy &get_policy() const;

private:
    friend struct chrooted;
    explicit privileges_dropped(const execution_policy &policy);

    const execution_policy *policy;
};

/**
 * @brief 将子进程的标准输入输出重定向到策略指定的文件
 * 在隔离之前调用，因此路径相对于宿主机解析，并且以评测进程的权限打开。
 * 标准输出与标准错误指向同一个文件时共享同一个文件描述符。
 * @throw isolation_error 当文件无法打开时
 */
void redirect_io(const execution_policy &policy);

}  // namespace judgebox
