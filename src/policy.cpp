#include "judgebox/policy.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "judgebox/common/exceptions.hpp"
#include "judgebox/common/io_utils.hpp"
#include "judgebox/config.hpp"

namespace judgebox {
using namespace std;
namespace fs = std::filesystem;

requested_limit requested_limit::of(int64_t amount) {
    requested_limit result;
    result.kind = AMOUNT;
    result.amount = amount;
    return result;
}

requested_limit requested_limit::unlimited() {
    requested_limit result;
    result.kind = UNLIMITED;
    return result;
}

limit::limit() : value(-1) {}

limit::limit(int64_t value) : value(value) {}

limit limit::of(int64_t amount) {
    CHECK(amount > 0) << "limit must be positive";
    return limit(amount);
}

limit limit::unlimited() {
    return limit(-1);
}

bool limit::is_unlimited() const {
    return value < 0;
}

int64_t limit::amount() const {
    CHECK(!is_unlimited()) << "amount of an unlimited limit";
    return value;
}

rlim_t limit::as_rlimit(int64_t scale) const {
    if (is_unlimited()) return RLIM_INFINITY;
    return (rlim_t)value * (rlim_t)scale;
}

bool limit::operator==(const limit &other) const {
    return value == other.value;
}

bool limit::operator!=(const limit &other) const {
    return value != other.value;
}

mount_point parse_mount_point(const string &spec, bool writable) {
    mount_point result;
    auto colon = spec.find(':');
    result.src = spec.substr(0, colon);
    result.dst = colon == string::npos ? result.src : fs::path(spec.substr(colon + 1));
    result.writable = writable;
    if (result.src.empty())
        throw policy_error(fmt::format("mount point {} has an empty source", spec));
    if (result.dst.empty())
        throw policy_error(fmt::format("mount point {} has an empty destination", spec));
    return result;
}

bool execution_policy::allows(long syscall) const {
    return allowed_syscalls && allowed_syscalls->count(syscall);
}

static limit resolve_limit(const char *name, const requested_limit &requested, const limit &def) {
    switch (requested.kind) {
        case requested_limit::UNSET:
            return def;
        case requested_limit::UNLIMITED:
            return limit::unlimited();
        case requested_limit::AMOUNT:
            if (requested.amount <= 0)
                throw policy_error(fmt::format("{} must be positive or unlimited, got {}", name, requested.amount));
            return limit::of(requested.amount);
    }
    throw policy_error(fmt::format("{} is malformed", name));
}

static void check_mount_point(const mount_point &mount) {
    if (!mount.dst.is_absolute())
        throw policy_error(fmt::format("mount destination {} must be an absolute path", mount.dst.string()));
    if (!is_contained_path(mount.dst))
        throw policy_error(fmt::format("mount destination {} escapes the root directory", mount.dst.string()));
}

execution_policy resolve_policy(const run_request &request, const syscall_registry &registry) {
    execution_policy policy;

    if (request.program.empty())
        throw policy_error("program path is empty");
    policy.program = request.program;
    policy.args = request.args;

    policy.cpu_time_limit = resolve_limit("cpu time limit", request.cpu_time_limit, limit::of(DEFAULT_CPU_TIME_LIMIT));

    if (request.wall_time_limit.kind == requested_limit::UNLIMITED)
        throw policy_error("wall time limit cannot be unlimited");
    limit default_wall = policy.cpu_time_limit.is_unlimited()
                             ? limit::of(DEFAULT_WALL_TIME_LIMIT)
                             : limit::of(policy.cpu_time_limit.amount() + WALL_TIME_GRACE);
    policy.wall_time_limit = resolve_limit("wall time limit", request.wall_time_limit, default_wall);

    policy.memory_limit = resolve_limit("memory limit", request.memory_limit, limit::of(DEFAULT_MEMORY_LIMIT));
    // 栈空间默认可以用满全部内存
    policy.stack_limit = resolve_limit("stack limit", request.stack_limit, policy.memory_limit);
    policy.output_size_limit = resolve_limit("output size limit", request.output_size_limit, limit::of(DEFAULT_OUTPUT_LIMIT));
    policy.process_limit = resolve_limit("process limit", request.process_limit, limit::unlimited());

    policy.chroot_dir = request.chroot_dir;
    if (policy.chroot_dir.empty()) {
        if (!request.mounts.empty())
            throw policy_error("mount points require a root directory");
        if (!request.work_dir.empty())
            throw policy_error("working directory requires a root directory");
    } else {
        if (request.default_mounts) {
            for (auto &dir : DEFAULT_READ_MOUNTS)
                policy.read_mounts.push_back({dir, dir, false, false});
        }

        for (auto &mount : request.mounts) {
            check_mount_point(mount);
            if (mount.writable)
                policy.write_mounts.push_back(mount);
            else
                policy.read_mounts.push_back(mount);
        }

        if (!request.work_dir.empty()) {
            if (!request.work_dir.is_absolute() || !is_contained_path(request.work_dir))
                throw policy_error(fmt::format("working directory {} must be an absolute path inside the root directory", request.work_dir.string()));
            policy.work_dir = request.work_dir;
        }
    }

    if (!request.uid) throw policy_error("run-as user is required");
    if (!request.gid) throw policy_error("run-as group is required");
    if (*request.uid == 0) throw policy_error("user program cannot run as root");
    if (*request.gid == 0) throw policy_error("user program cannot run in the root group");
    policy.uid = *request.uid;
    policy.gid = *request.gid;

    policy.language = registry.canonical_tag(request.language);
    policy.allowed_syscalls = registry.find(policy.language);
    if (!policy.allowed_syscalls)
        throw policy_error(fmt::format("no syscall allow-list registered for language {}", request.language));

    policy.stdin_path = request.stdin_path.empty() ? fs::path("/dev/null") : request.stdin_path;
    policy.stdout_path = request.stdout_path.empty() ? fs::path("/dev/null") : request.stdout_path;
    policy.stderr_path = request.stderr_path.empty() ? fs::path("/dev/null") : request.stderr_path;

    for (auto &entry : request.env) {
        if (entry.empty() || entry[0] == '=')
            throw policy_error(fmt::format("environment variable '{}' has an empty key", entry));
    }
    policy.env = request.env;
    policy.preserve_env = request.preserve_env;

    return policy;
}

}  // namespace judgebox
