#include "judgebox/limits.hpp"
#include <fmt/core.h>
#include <math.h>
#include <unistd.h>
#include <cstring>
#include <map>
#include <system_error>
#include "judgebox/cgroup.hpp"
#include "judgebox/common/exceptions.hpp"
#include "judgebox/common/utils.hpp"
#include "judgebox/config.hpp"

extern char **environ;

namespace judgebox {
using namespace std;

static const char *DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

governed::governed(const execution_policy &policy, bool joined) : policy(&policy), joined_(joined) {}

const execution_policy &governed::get_policy() const {
    return *policy;
}

bool governed::joined() const {
    return joined_;
}

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

void apply_limits(const execution_policy &policy) {
    try {
        if (!policy.cpu_time_limit.is_unlimited()) {
            /* Setting the real hard limit one second
               higher: at the soft limit the kernel will send SIGXCPU at
               the hard limit a SIGKILL. The SIGXCPU can be caught, but is
               not by default and gives us a reliable way to detect if the
               CPU-time limit was reached. */
            rlim_t cputime_limit = (rlim_t)ceil(policy.cpu_time_limit.amount() / 1000.0);
            set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
        }

        // 不限制的资源沿用评测进程自身的限制，非 root 时无法提高硬限制
        if (!policy.memory_limit.is_unlimited()) {
            // 真正的内存限制由 cgroup 或者 /proc 采样判定
            rlim_t address_space = policy.memory_limit.as_rlimit(1024 * ADDRESS_SPACE_FACTOR);
            set_rlimit(RLIMIT_AS, address_space, address_space);
        }

        if (!policy.stack_limit.is_unlimited()) {
            rlim_t stack = policy.stack_limit.as_rlimit(1024);
            set_rlimit(RLIMIT_STACK, stack, stack);
        }

        if (!policy.output_size_limit.is_unlimited()) {
            rlim_t file_size = policy.output_size_limit.as_rlimit(1024);
            set_rlimit(RLIMIT_FSIZE, file_size, file_size);
        }

        if (!policy.process_limit.is_unlimited()) {
            rlim_t nproc = policy.process_limit.as_rlimit();
            set_rlimit(RLIMIT_NPROC, nproc, nproc);
        }

        set_rlimit(RLIMIT_CORE, 0, 0);
    } catch (system_error &e) {
        throw resource_setup_error(fmt::format("unable to apply resource limits: {}", e.what()));
    }
}

governed govern(privileges_dropped &&isolated, const vector<int> &membership) {
    const execution_policy &policy = isolated.get_policy();
    apply_limits(policy);

    // put child process in the control group
    bool joined = join_membership(membership, getpid()) == 0;
    return governed(policy, joined);
}

vector<string> build_environment(const execution_policy &policy) {
    map<string, string> variables;

    if (policy.preserve_env) {
        for (char **entry = environ; entry && *entry; ++entry) {
            string env = *entry;
            auto idx = env.find('=');
            if (idx == string::npos) continue;
            variables[env.substr(0, idx)] = env.substr(idx + 1);
        }
    } else {
        variables["PATH"] = get_env("PATH", DEFAULT_PATH);
    }

    for (auto &entry : policy.env) {
        auto idx = entry.find('=');
        if (idx == string::npos) {
            const char *value = getenv(entry.c_str());
            if (value) variables[entry] = value;
        } else {
            variables[entry.substr(0, idx)] = entry.substr(idx + 1);
        }
    }

    vector<string> result;
    for (auto &[key, value] : variables)
        result.push_back(key + "=" + value);
    return result;
}

void exec(governed &&process) {
    const execution_policy &policy = process.get_policy();

    vector<string> cmd;
    cmd.push_back(policy.program.string());
    cmd.insert(cmd.end(), policy.args.begin(), policy.args.end());
    vector<string> env = build_environment(policy);

    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);

    vector<char *> envp;
    for (auto &entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);

    execvpe(args[0], args.data(), envp.data());
    throw internal_error(fmt::format("unable to start command {}: {}", policy.program.string(), strerror(errno)));
}

}  // namespace judgebox
