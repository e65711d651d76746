#include "judgebox/isolation.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <grp.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstring>
#include <system_error>
#include "judgebox/common/exceptions.hpp"

namespace judgebox {
using namespace std;
namespace fs = std::filesystem;

template <typename... Args>
static void ensure(int ret, const char *format, Args &&...args) {
    if (ret != 0) {
        int err = errno;
        throw isolation_error(fmt::format("{}: {}", fmt::format(fmt::runtime(format), args...), strerror(err)));
    }
}

isolation_builder::isolation_builder(const execution_policy &policy) : policy(&policy) {}

mount_namespace isolation_builder::unshare_mounts() && {
    if (!policy->chroot_dir.empty()) {
        ensure(unshare(CLONE_NEWNS), "unable to unshare mount namespace");
        // 挂载传播设为私有，沙箱内的挂载不会出现在宿主机上
        ensure(mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr), "unable to make mounts private");
    }
    return mount_namespace(*policy);
}

mount_namespace::mount_namespace(const execution_policy &policy) : policy(&policy) {}

/**
 * @brief 创建绑定挂载的目标，目录对应目录，文件对应空文件
 */
static void create_mount_target(const fs::path &src, const fs::path &target) {
    error_code ec;
    if (fs::is_directory(src, ec)) {
        fs::create_directories(target, ec);
        if (ec) throw isolation_error(fmt::format("unable to create mount target {}: {}", target.string(), ec.message()));
    } else {
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw isolation_error(fmt::format("unable to create mount target {}: {}", target.string(), ec.message()));
        int fd = open(target.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        ensure(fd < 0 ? -1 : 0, "unable to create mount target {}", target.string());
        close(fd);
    }
}

static void bind_mount(const fs::path &root, const mount_point &point) {
    error_code ec;
    if (!fs::exists(point.src, ec)) {
        if (!point.required) return;
        throw isolation_error(fmt::format("mount source {} does not exist", point.src.string()));
    }

    fs::path target = root / point.dst.relative_path();
    create_mount_target(point.src, target);

    ensure(mount(point.src.c_str(), target.c_str(), nullptr, MS_BIND | MS_REC, nullptr),
           "unable to bind {} to {}", point.src.string(), target.string());
    if (!point.writable) {
        // 绑定挂载时 MS_RDONLY 会被忽略，只能通过 remount 设置只读
        ensure(mount(nullptr, target.c_str(), nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID, nullptr),
               "unable to remount {} read-only", target.string());
    }
}

filesystem_mounted mount_namespace::mount_filesystems() && {
    if (!policy->chroot_dir.empty()) {
        const fs::path &root = policy->chroot_dir;
        ensure(mount(root.c_str(), root.c_str(), nullptr, MS_BIND | MS_REC, nullptr),
               "unable to bind root directory {}", root.string());

        for (auto &point : policy->read_mounts) bind_mount(root, point);
        for (auto &point : policy->write_mounts) bind_mount(root, point);
    }
    return filesystem_mounted(*policy);
}

filesystem_mounted::filesystem_mounted(const execution_policy &policy) : policy(&policy) {}

chrooted filesystem_mounted::enter_root() && {
    if (!policy->chroot_dir.empty()) {
        ensure(chroot(policy->chroot_dir.c_str()), "unable to chroot to {}", policy->chroot_dir.string());
        ensure(chdir("/"), "unable to chdir to / in chroot");

        if (!policy->work_dir.empty())
            ensure(chdir(policy->work_dir.c_str()), "unable to chdir to {} in chroot", policy->work_dir.string());
    }
    return chrooted(*policy);
}

chrooted::chrooted(const execution_policy &policy) : policy(&policy) {}

privileges_dropped chrooted::drop_privileges() && {
    if (geteuid() == 0) {
        ensure(setgroups(0, nullptr), "unable to clear auxiliary groups");
        ensure(setgid(policy->gid), "unable to set group id {}", policy->gid);
        ensure(setuid(policy->uid), "unable to set user id {}", policy->uid);
    } else if (getuid() != policy->uid || getgid() != policy->gid) {
        throw isolation_error(fmt::format("cannot switch to user {} group {} without root privilege", policy->uid, policy->gid));
    }

    if (geteuid() == 0 || getuid() == 0)
        throw isolation_error("you cannot run user command as root");

    return privileges_dropped(*policy);
}

privileges_dropped::privileges_dropped(const execution_policy &policy) : policy(&policy) {}

const execution_policy &privileges_dropped::get_policy() const {
    return *policy;
}

static void redirect(const fs::path &path, int target, int flags) {
    int fd = open(path.c_str(), flags | O_CLOEXEC, 0644);
    ensure(fd < 0 ? -1 : 0, "unable to open {}", path.string());
    if (fd == target) {
        ensure(fcntl(fd, F_SETFD, 0), "unable to clear close-on-exec of fd {}", target);
        return;
    }
    // dup2 得到的描述符不带 O_CLOEXEC
    ensure(dup2(fd, target) < 0 ? -1 : 0, "unable to redirect fd {} to {}", target, path.string());
    close(fd);
}

void redirect_io(const execution_policy &policy) {
    redirect(policy.stdin_path, STDIN_FILENO, O_RDONLY);
    redirect(policy.stdout_path, STDOUT_FILENO, O_WRONLY | O_CREAT | O_TRUNC);
    if (policy.stderr_path == policy.stdout_path)
        ensure(dup2(STDOUT_FILENO, STDERR_FILENO) < 0 ? -1 : 0, "unable to redirect stderr to stdout");
    else
        redirect(policy.stderr_path, STDERR_FILENO, O_WRONLY | O_CREAT | O_TRUNC);
}

}  // namespace judgebox
