#include "judgebox/syscall_table.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/ptrace.h>
#include <sys/syscall.h>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <utility>
#include "judgebox/common/exceptions.hpp"

namespace judgebox {
using namespace std;

// 当前架构下可识别的系统调用，只有部分架构存在的调用用 #ifdef 保护
static const vector<pair<const char *, long>> syscall_entries = {
    {"read", SYS_read},
    {"write", SYS_write},
    {"close", SYS_close},
    {"fstat", SYS_fstat},
    {"lseek", SYS_lseek},
    {"mmap", SYS_mmap},
    {"mprotect", SYS_mprotect},
    {"munmap", SYS_munmap},
    {"brk", SYS_brk},
    {"rt_sigaction", SYS_rt_sigaction},
    {"rt_sigprocmask", SYS_rt_sigprocmask},
    {"rt_sigreturn", SYS_rt_sigreturn},
    {"ioctl", SYS_ioctl},
    {"pread64", SYS_pread64},
    {"pwrite64", SYS_pwrite64},
    {"readv", SYS_readv},
    {"writev", SYS_writev},
    {"sched_yield", SYS_sched_yield},
    {"mremap", SYS_mremap},
    {"msync", SYS_msync},
    {"mincore", SYS_mincore},
    {"madvise", SYS_madvise},
    {"dup", SYS_dup},
    {"dup3", SYS_dup3},
    {"nanosleep", SYS_nanosleep},
    {"getitimer", SYS_getitimer},
    {"setitimer", SYS_setitimer},
    {"getpid", SYS_getpid},
    {"sendfile", SYS_sendfile},
    {"socket", SYS_socket},
    {"connect", SYS_connect},
    {"accept", SYS_accept},
    {"sendto", SYS_sendto},
    {"recvfrom", SYS_recvfrom},
    {"sendmsg", SYS_sendmsg},
    {"recvmsg", SYS_recvmsg},
    {"shutdown", SYS_shutdown},
    {"bind", SYS_bind},
    {"listen", SYS_listen},
    {"getsockname", SYS_getsockname},
    {"getpeername", SYS_getpeername},
    {"socketpair", SYS_socketpair},
    {"setsockopt", SYS_setsockopt},
    {"getsockopt", SYS_getsockopt},
    {"clone", SYS_clone},
    {"execve", SYS_execve},
    {"exit", SYS_exit},
    {"wait4", SYS_wait4},
    {"kill", SYS_kill},
    {"uname", SYS_uname},
    {"fcntl", SYS_fcntl},
    {"flock", SYS_flock},
    {"fsync", SYS_fsync},
    {"fdatasync", SYS_fdatasync},
    {"truncate", SYS_truncate},
    {"ftruncate", SYS_ftruncate},
    {"getcwd", SYS_getcwd},
    {"chdir", SYS_chdir},
    {"fchdir", SYS_fchdir},
    {"fchmod", SYS_fchmod},
    {"fchown", SYS_fchown},
    {"umask", SYS_umask},
    {"gettimeofday", SYS_gettimeofday},
    {"getrlimit", SYS_getrlimit},
    {"getrusage", SYS_getrusage},
    {"sysinfo", SYS_sysinfo},
    {"times", SYS_times},
    {"ptrace", SYS_ptrace},
    {"getuid", SYS_getuid},
    {"getgid", SYS_getgid},
    {"setuid", SYS_setuid},
    {"setgid", SYS_setgid},
    {"geteuid", SYS_geteuid},
    {"getegid", SYS_getegid},
    {"setpgid", SYS_setpgid},
    {"getppid", SYS_getppid},
    {"setsid", SYS_setsid},
    {"setreuid", SYS_setreuid},
    {"setregid", SYS_setregid},
    {"getgroups", SYS_getgroups},
    {"setgroups", SYS_setgroups},
    {"setresuid", SYS_setresuid},
    {"getresuid", SYS_getresuid},
    {"setresgid", SYS_setresgid},
    {"getresgid", SYS_getresgid},
    {"getpgid", SYS_getpgid},
    {"getsid", SYS_getsid},
    {"capget", SYS_capget},
    {"capset", SYS_capset},
    {"rt_sigpending", SYS_rt_sigpending},
    {"rt_sigtimedwait", SYS_rt_sigtimedwait},
    {"rt_sigqueueinfo", SYS_rt_sigqueueinfo},
    {"rt_sigsuspend", SYS_rt_sigsuspend},
    {"sigaltstack", SYS_sigaltstack},
    {"personality", SYS_personality},
    {"statfs", SYS_statfs},
    {"fstatfs", SYS_fstatfs},
    {"getpriority", SYS_getpriority},
    {"setpriority", SYS_setpriority},
    {"sched_setparam", SYS_sched_setparam},
    {"sched_getparam", SYS_sched_getparam},
    {"sched_setscheduler", SYS_sched_setscheduler},
    {"sched_getscheduler", SYS_sched_getscheduler},
    {"mlock", SYS_mlock},
    {"munlock", SYS_munlock},
    {"mlockall", SYS_mlockall},
    {"munlockall", SYS_munlockall},
    {"pivot_root", SYS_pivot_root},
    {"prctl", SYS_prctl},
    {"setrlimit", SYS_setrlimit},
    {"chroot", SYS_chroot},
    {"sync", SYS_sync},
    {"mount", SYS_mount},
    {"umount2", SYS_umount2},
    {"sethostname", SYS_sethostname},
    {"setdomainname", SYS_setdomainname},
    {"gettid", SYS_gettid},
    {"tkill", SYS_tkill},
    {"futex", SYS_futex},
    {"sched_setaffinity", SYS_sched_setaffinity},
    {"sched_getaffinity", SYS_sched_getaffinity},
    {"set_tid_address", SYS_set_tid_address},
    {"restart_syscall", SYS_restart_syscall},
    {"timer_create", SYS_timer_create},
    {"timer_settime", SYS_timer_settime},
    {"timer_gettime", SYS_timer_gettime},
    {"timer_getoverrun", SYS_timer_getoverrun},
    {"timer_delete", SYS_timer_delete},
    {"clock_gettime", SYS_clock_gettime},
    {"clock_getres", SYS_clock_getres},
    {"clock_nanosleep", SYS_clock_nanosleep},
    {"exit_group", SYS_exit_group},
    {"epoll_ctl", SYS_epoll_ctl},
    {"tgkill", SYS_tgkill},
    {"waitid", SYS_waitid},
    {"inotify_add_watch", SYS_inotify_add_watch},
    {"inotify_rm_watch", SYS_inotify_rm_watch},
    {"openat", SYS_openat},
    {"mkdirat", SYS_mkdirat},
    {"mknodat", SYS_mknodat},
    {"fchownat", SYS_fchownat},
    {"unlinkat", SYS_unlinkat},
    {"linkat", SYS_linkat},
    {"symlinkat", SYS_symlinkat},
    {"readlinkat", SYS_readlinkat},
    {"fchmodat", SYS_fchmodat},
    {"faccessat", SYS_faccessat},
    {"pselect6", SYS_pselect6},
    {"ppoll", SYS_ppoll},
    {"unshare", SYS_unshare},
    {"set_robust_list", SYS_set_robust_list},
    {"get_robust_list", SYS_get_robust_list},
    {"splice", SYS_splice},
    {"tee", SYS_tee},
    {"vmsplice", SYS_vmsplice},
    {"utimensat", SYS_utimensat},
    {"epoll_pwait", SYS_epoll_pwait},
    {"timerfd_create", SYS_timerfd_create},
    {"fallocate", SYS_fallocate},
    {"timerfd_settime", SYS_timerfd_settime},
    {"timerfd_gettime", SYS_timerfd_gettime},
    {"accept4", SYS_accept4},
    {"signalfd4", SYS_signalfd4},
    {"eventfd2", SYS_eventfd2},
    {"epoll_create1", SYS_epoll_create1},
    {"pipe2", SYS_pipe2},
    {"inotify_init1", SYS_inotify_init1},
    {"preadv", SYS_preadv},
    {"pwritev", SYS_pwritev},
    {"perf_event_open", SYS_perf_event_open},
    {"recvmmsg", SYS_recvmmsg},
    {"prlimit64", SYS_prlimit64},
    {"sendmmsg", SYS_sendmmsg},
    {"setns", SYS_setns},
    {"getcpu", SYS_getcpu},
    {"process_vm_readv", SYS_process_vm_readv},
    {"process_vm_writev", SYS_process_vm_writev},
    {"getdents64", SYS_getdents64},
    {"newfstatat", SYS_newfstatat},
#ifdef SYS_open
    {"open", SYS_open},
#endif
#ifdef SYS_stat
    {"stat", SYS_stat},
#endif
#ifdef SYS_lstat
    {"lstat", SYS_lstat},
#endif
#ifdef SYS_poll
    {"poll", SYS_poll},
#endif
#ifdef SYS_access
    {"access", SYS_access},
#endif
#ifdef SYS_pipe
    {"pipe", SYS_pipe},
#endif
#ifdef SYS_select
    {"select", SYS_select},
#endif
#ifdef SYS_dup2
    {"dup2", SYS_dup2},
#endif
#ifdef SYS_pause
    {"pause", SYS_pause},
#endif
#ifdef SYS_alarm
    {"alarm", SYS_alarm},
#endif
#ifdef SYS_fork
    {"fork", SYS_fork},
#endif
#ifdef SYS_vfork
    {"vfork", SYS_vfork},
#endif
#ifdef SYS_getdents
    {"getdents", SYS_getdents},
#endif
#ifdef SYS_rename
    {"rename", SYS_rename},
#endif
#ifdef SYS_mkdir
    {"mkdir", SYS_mkdir},
#endif
#ifdef SYS_rmdir
    {"rmdir", SYS_rmdir},
#endif
#ifdef SYS_creat
    {"creat", SYS_creat},
#endif
#ifdef SYS_link
    {"link", SYS_link},
#endif
#ifdef SYS_unlink
    {"unlink", SYS_unlink},
#endif
#ifdef SYS_symlink
    {"symlink", SYS_symlink},
#endif
#ifdef SYS_readlink
    {"readlink", SYS_readlink},
#endif
#ifdef SYS_chmod
    {"chmod", SYS_chmod},
#endif
#ifdef SYS_chown
    {"chown", SYS_chown},
#endif
#ifdef SYS_lchown
    {"lchown", SYS_lchown},
#endif
#ifdef SYS_getpgrp
    {"getpgrp", SYS_getpgrp},
#endif
#ifdef SYS_mknod
    {"mknod", SYS_mknod},
#endif
#ifdef SYS_arch_prctl
    {"arch_prctl", SYS_arch_prctl},
#endif
#ifdef SYS_iopl
    {"iopl", SYS_iopl},
#endif
#ifdef SYS_ioperm
    {"ioperm", SYS_ioperm},
#endif
#ifdef SYS_modify_ldt
    {"modify_ldt", SYS_modify_ldt},
#endif
#ifdef SYS_time
    {"time", SYS_time},
#endif
#ifdef SYS_epoll_create
    {"epoll_create", SYS_epoll_create},
#endif
#ifdef SYS_epoll_wait
    {"epoll_wait", SYS_epoll_wait},
#endif
#ifdef SYS_inotify_init
    {"inotify_init", SYS_inotify_init},
#endif
#ifdef SYS_utimes
    {"utimes", SYS_utimes},
#endif
#ifdef SYS_signalfd
    {"signalfd", SYS_signalfd},
#endif
#ifdef SYS_eventfd
    {"eventfd", SYS_eventfd},
#endif
#ifdef SYS_renameat
    {"renameat", SYS_renameat},
#endif
#ifdef SYS_kcmp
    {"kcmp", SYS_kcmp},
#endif
#ifdef SYS_finit_module
    {"finit_module", SYS_finit_module},
#endif
#ifdef SYS_renameat2
    {"renameat2", SYS_renameat2},
#endif
#ifdef SYS_seccomp
    {"seccomp", SYS_seccomp},
#endif
#ifdef SYS_getrandom
    {"getrandom", SYS_getrandom},
#endif
#ifdef SYS_memfd_create
    {"memfd_create", SYS_memfd_create},
#endif
#ifdef SYS_bpf
    {"bpf", SYS_bpf},
#endif
#ifdef SYS_execveat
    {"execveat", SYS_execveat},
#endif
#ifdef SYS_userfaultfd
    {"userfaultfd", SYS_userfaultfd},
#endif
#ifdef SYS_membarrier
    {"membarrier", SYS_membarrier},
#endif
#ifdef SYS_mlock2
    {"mlock2", SYS_mlock2},
#endif
#ifdef SYS_copy_file_range
    {"copy_file_range", SYS_copy_file_range},
#endif
#ifdef SYS_preadv2
    {"preadv2", SYS_preadv2},
#endif
#ifdef SYS_pwritev2
    {"pwritev2", SYS_pwritev2},
#endif
#ifdef SYS_statx
    {"statx", SYS_statx},
#endif
#ifdef SYS_io_pgetevents
    {"io_pgetevents", SYS_io_pgetevents},
#endif
#ifdef SYS_rseq
    {"rseq", SYS_rseq},
#endif
#ifdef SYS_pidfd_send_signal
    {"pidfd_send_signal", SYS_pidfd_send_signal},
#endif
#ifdef SYS_io_uring_setup
    {"io_uring_setup", SYS_io_uring_setup},
#endif
#ifdef SYS_io_uring_enter
    {"io_uring_enter", SYS_io_uring_enter},
#endif
#ifdef SYS_io_uring_register
    {"io_uring_register", SYS_io_uring_register},
#endif
#ifdef SYS_pidfd_open
    {"pidfd_open", SYS_pidfd_open},
#endif
#ifdef SYS_clone3
    {"clone3", SYS_clone3},
#endif
#ifdef SYS_close_range
    {"close_range", SYS_close_range},
#endif
#ifdef SYS_openat2
    {"openat2", SYS_openat2},
#endif
#ifdef SYS_pidfd_getfd
    {"pidfd_getfd", SYS_pidfd_getfd},
#endif
#ifdef SYS_faccessat2
    {"faccessat2", SYS_faccessat2},
#endif
#ifdef SYS_epoll_pwait2
    {"epoll_pwait2", SYS_epoll_pwait2},
#endif
};

static const unordered_map<long, const char *> &names_by_number() {
    static const unordered_map<long, const char *> table = [] {
        unordered_map<long, const char *> result;
        for (auto &[name, nr] : syscall_entries) result.emplace(nr, name);
        return result;
    }();
    return table;
}

static const unordered_map<string, long> &numbers_by_name() {
    static const unordered_map<string, long> table = [] {
        unordered_map<string, long> result;
        for (auto &[name, nr] : syscall_entries) result.emplace(name, nr);
        return result;
    }();
    return table;
}

const char *syscall_name(long nr) {
    auto &table = names_by_number();
    auto it = table.find(nr);
    return it == table.end() ? nullptr : it->second;
}

string syscall_display_name(long nr) {
    const char *name = syscall_name(nr);
    return name ? string(name) : fmt::format("syscall_{}", nr);
}

long syscall_number(const string &name) {
    auto &table = numbers_by_name();
    auto it = table.find(name);
    return it == table.end() ? -1 : it->second;
}

syscall_abi syscall_type(pid_t pid, unsigned long long instruction_pointer) {
#if defined(__x86_64__)
    long ret;
    unsigned char primary, secondary;

    // 系统调用入口处 rip 已经越过了 2 字节的系统调用指令
    errno = 0;
    ret = ptrace(PTRACE_PEEKTEXT, pid, (void *)(instruction_pointer - 2), nullptr);
    if (ret == -1 && errno != 0) {
        // 指令位于映射区域的末尾时，从 rip 往前读取一个字
        errno = 0;
        ret = ptrace(PTRACE_PEEKTEXT, pid, (void *)(instruction_pointer - sizeof(long)), nullptr);
        if (ret == -1 && errno != 0)
            throw trace_error(fmt::format("unable to peek syscall instruction of {}: {}", pid, strerror(errno)));
        ret = (unsigned long)ret >> ((sizeof(long) - 2) * 8);
    }

    primary = (unsigned)0xFF & ret;
    secondary = (unsigned)0xFF & (ret >> 8);
    if (primary == 0xCD && secondary == 0x80) {
        // 0xCD: instruction interrupt
        // 0x80: 0x80 interrupt
        return syscall_abi::COMPAT;
    } else if (primary == 0x0F && secondary == 0x34) {
        // 0x0F34: sysenter
        return syscall_abi::COMPAT;
    } else if (primary == 0x0F && secondary == 0x05) {
        // 0x0F05: syscall
        return syscall_abi::NATIVE;
    } else {
        return syscall_abi::UNKNOWN;
    }
#else
    (void)pid;
    (void)instruction_pointer;
    return syscall_abi::NATIVE;
#endif
}

// 静态链接或动态链接的 C/C++ 程序在 glibc 下完成启动、IO、内存管理所需的系统调用
static const vector<string> native_syscalls = {
    // 文件读写
    "read", "write", "readv", "writev", "pread64", "pwrite64", "lseek", "close",
    "fstat", "newfstatat", "statx", "stat", "lstat",
    "open", "openat", "access", "faccessat", "faccessat2", "readlink", "readlinkat",
    "ioctl", "fcntl", "dup", "dup2", "dup3", "getdents64", "getcwd",
    // 内存
    "brk", "mmap", "munmap", "mremap", "mprotect", "madvise",
    // 进程启动，用户程序本身的 execve 发生在开始检查之前，之后不能再次 execve
    "arch_prctl", "set_tid_address", "set_robust_list", "rseq",
    "prlimit64", "getrlimit", "getrandom", "uname", "sysinfo",
    // 信号，tgkill 用于 abort() 给自己发送 SIGABRT，只能以自己为目标
    "rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "sigaltstack", "tgkill",
    // 线程同步与调度
    "futex", "sched_yield", "sched_getaffinity",
    // 时间
    "clock_gettime", "clock_getres", "gettimeofday", "time", "nanosleep", "clock_nanosleep",
    "times", "getrusage",
    // 身份
    "getpid", "gettid", "getppid", "getuid", "geteuid", "getgid", "getegid",
    // 退出
    "exit", "exit_group", "restart_syscall"};

static const vector<string> python_syscalls = {
    "getdents", "fstatfs", "statfs", "pipe2", "poll", "ppoll", "select", "pselect6",
    "getgroups", "getresuid", "getresgid", "mincore"};

syscall_registry syscall_registry::with_defaults() {
    syscall_registry registry;
    registry.register_language("c", native_syscalls);
    registry.register_language("cpp", native_syscalls);
    registry.register_language("python3", python_syscalls, "c");

    registry.register_alias("cc", "cpp");
    registry.register_alias("c++", "cpp");
    registry.register_alias("cxx", "cpp");
    registry.register_alias("py", "python3");
    registry.register_alias("python", "python3");
    return registry;
}

void syscall_registry::register_language(const string &tag, const vector<string> &names, const string &base) {
    syscall_set allowed;
    if (!base.empty()) {
        auto parent = find(base);
        if (!parent) throw policy_error(fmt::format("language {} extends unknown language {}", tag, base));
        allowed = *parent;
    }

    for (auto &name : names) {
        long nr = syscall_number(name);
        if (nr < 0) {
            VLOG(1) << "syscall " << name << " is not available on this architecture, skipped for " << tag;
            continue;
        }
        allowed.insert(nr);
    }

    tables[tag] = make_shared<const syscall_set>(move(allowed));
}

void syscall_registry::register_alias(const string &alias, const string &tag) {
    aliases[alias] = tag;
}

void syscall_registry::load_json(const filesystem::path &file) {
    ifstream fin(file);
    if (!fin) throw policy_error(fmt::format("unable to open syscall configuration {}", file.string()));

    nlohmann::json config;
    try {
        fin >> config;

        if (config.count("languages")) {
            for (auto &[tag, language] : config.at("languages").items()) {
                vector<string> names = language.value("allow", vector<string>());
                string base = language.value("extends", string());
                for (auto &name : names)
                    if (syscall_number(name) < 0)
                        LOG(WARNING) << "unknown syscall " << name << " in " << file.string() << ", ignored";
                register_language(tag, names, base);
                LOG(INFO) << "registered syscall allow-list for language " << tag;
            }
        }

        if (config.count("aliases")) {
            for (auto &[alias, tag] : config.at("aliases").items())
                register_alias(alias, tag.get<string>());
        }
    } catch (nlohmann::json::exception &e) {
        throw policy_error(fmt::format("malformed syscall configuration {}: {}", file.string(), e.what()));
    }
}

string syscall_registry::canonical_tag(const string &tag) const {
    auto it = aliases.find(tag);
    return it == aliases.end() ? tag : it->second;
}

shared_ptr<const syscall_set> syscall_registry::find(const string &tag) const {
    auto it = tables.find(canonical_tag(tag));
    return it == tables.end() ? nullptr : it->second;
}

vector<string> syscall_registry::languages() const {
    vector<string> result;
    for (auto &[tag, table] : tables) result.push_back(tag);
    return result;
}

}  // namespace judgebox
