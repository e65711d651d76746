#include "judgebox/cgroup.hpp"

#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <set>
#include <stdexcept>
#include <system_error>
#include "judgebox/common/io_utils.hpp"
#include "judgebox/config.hpp"

namespace judgebox {
using namespace std;
namespace fs = std::filesystem;

cgroup_exception::cgroup_exception(std::string cgroup_op, int err) {
    if (err == ECGOTHER) {
        errmsg += "libcgroup: ";
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(cgroup_get_last_errno());
    } else {
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(err);
    }
}

const char *cgroup_exception::what() const noexcept {
    return errmsg.c_str();
}

void cgroup_exception::ensure(std::string cgroup_op, int err) {
    if (err != 0) {
        throw cgroup_exception(cgroup_op, err);
    }
}

void cgroup_guard::init() {
    cgroup_exception::ensure(
        "cgroup_init",
        cgroup_init());
}

fs::path cgroup_guard::mount_point(const string &controller) {
    char *path = nullptr;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_subsys_mount_point({})", controller),
        cgroup_get_subsys_mount_point(controller.c_str(), &path));
    fs::path result(path);
    free(path);
    return result;
}

int64_t cgroup_ctrl::get_value_int64(const std::string &name) {
    int64_t value;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_value_int64({})", name),
        cgroup_get_value_int64(ctrl, name.c_str(), &value));
    return value;
}

bool cgroup_ctrl::has_value(const std::string &name) {
    int count = cgroup_get_value_name_count(ctrl);
    for (int i = 0; i < count; ++i) {
        char *value_name = cgroup_get_value_name(ctrl, i);
        if (value_name && name == value_name) return true;
    }
    return false;
}

cgroup_guard::cgroup_guard(const std::string &cgroup_name) {
    cg = cgroup_new_cgroup(cgroup_name.c_str());
    if (!cg)
        throw cgroup_exception(
            fmt::format("cgroup_new_cgroup({})", cgroup_name),
            cgroup_get_last_errno());
}

cgroup_guard::~cgroup_guard() {
    cgroup_free(&cg);
}

cgroup_ctrl cgroup_guard::get_controller(const std::string &name) {
    struct cgroup_controller *cg_controller = cgroup_get_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_get_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

void cgroup_guard::get_cgroup() {
    cgroup_exception::ensure(
        "cgroup_get_cgroup",
        cgroup_get_cgroup(cg));
}

fs::path cgroup_handle::path_of(const string &subsystem, const string &file) const {
    return subsystems.at(subsystem) / file;
}

accounting accounting::rusage() {
    return accounting();
}

accounting accounting::cgroup(cgroup_handle handle) {
    accounting result;
    result.mode_ = CGROUP;
    result.handle_ = move(handle);
    return result;
}

accounting::mode_t accounting::mode() const {
    return mode_;
}

const char *accounting::mode_name() const {
    return mode_ == CGROUP ? "cgroup" : "rusage";
}

const cgroup_handle &accounting::handle() const {
    CHECK(mode_ == CGROUP) << "cgroup handle requested in rusage mode";
    return handle_;
}

vector<int> accounting::open_membership() const {
    vector<int> fds;
    if (mode_ != CGROUP) return fds;

    // cpu 和 cpuacct 通常挂载在同一个目录下，只需要加入一次
    set<fs::path> opened;
    for (auto &[subsystem, dir] : handle_.subsystems) {
        fs::path tasks = dir / "tasks";
        if (!opened.insert(tasks).second) continue;

        int fd = open(tasks.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0) {
            int err = errno;
            for (int opened_fd : fds) close(opened_fd);
            throw system_error(err, system_category(), fmt::format("unable to open {}", tasks.string()));
        }
        fds.push_back(fd);
    }
    return fds;
}

static void write_counter(const fs::path &path, const string &value) {
    ofstream fout(path);
    fout << value << endl;
    if (!fout)
        throw system_error(errno, system_category(), fmt::format("unable to write {}", path.string()));
}

void accounting::reset_peak() const {
    if (mode_ != CGROUP) return;

    write_counter(handle_.path_of("memory", "memory.max_usage_in_bytes"), "0");
    fs::path memsw = handle_.path_of("memory", "memory.memsw.max_usage_in_bytes");
    error_code ec;
    if (fs::exists(memsw, ec)) write_counter(memsw, "0");
}

resource_usage accounting::read_usage() const {
    resource_usage usage;
    if (mode_ != CGROUP) return usage;

    cgroup_guard guard(handle_.name);
    guard.get_cgroup();  // prepare for get_controller

    {
        cgroup_ctrl ctrl = guard.get_controller("memory");
        // 交换分区开启时 memsw 同时统计了被换出的内存
        int64_t max_usage = ctrl.has_value("memory.memsw.max_usage_in_bytes")
                                ? ctrl.get_value_int64("memory.memsw.max_usage_in_bytes")
                                : ctrl.get_value_int64("memory.max_usage_in_bytes");
        usage.peak_memory = max_usage / 1024;
    }
    {
        cgroup_ctrl ctrl = guard.get_controller("cpuacct");
        usage.user_time = chrono::duration_cast<chrono::microseconds>(chrono::nanoseconds(ctrl.get_value_int64("cpuacct.usage_user")));
        usage.sys_time = chrono::duration_cast<chrono::microseconds>(chrono::nanoseconds(ctrl.get_value_int64("cpuacct.usage_sys")));
    }

    usage.oom_kills = oom_kill_count();
    return usage;
}

static int64_t parse_counter(const string &content) {
    string value = boost::algorithm::trim_copy(content);
    if (value.empty()) return -1;
    try {
        return stoll(value);
    } catch (logic_error &) {
        return -1;
    }
}

int64_t accounting::sample_memory(pid_t pid) const {
    if (mode_ != CGROUP) return proc_peak_memory(pid);

    int64_t usage = parse_counter(read_file_content(handle_.path_of("memory", "memory.usage_in_bytes"), ""));
    return usage < 0 ? -1 : usage / 1024;
}

int64_t accounting::oom_kill_count() const {
    if (mode_ != CGROUP) return 0;

    int64_t count = 0;
    ifstream fin(handle_.path_of("memory", "memory.oom_control"));
    while (fin.good()) {
        string token;
        fin >> token;
        if (token == "oom_kill")
            fin >> count;
    }
    return count;
}

int join_membership(const vector<int> &fds, pid_t pid) {
    int failures = 0;
    string content = to_string(pid);
    for (int fd : fds) {
        if (write(fd, content.data(), content.size()) != (ssize_t)content.size())
            ++failures;
        close(fd);
    }
    return failures;
}

accounting resolve_accounting(const string &name) noexcept {
    try {
        cgroup_guard::init();

        cgroup_handle handle;
        handle.name = name;
        for (auto &subsystem : ACCOUNTED_SUBSYSTEMS) {
            fs::path dir = cgroup_guard::mount_point(subsystem) / fs::path(name).relative_path();
            if (access((dir / "tasks").c_str(), W_OK) != 0) {
                LOG(WARNING) << "cgroup " << dir << " is not available: " << strerror(errno)
                             << ", falling back to rusage accounting";
                return accounting::rusage();
            }
            handle.subsystems[subsystem] = dir;
        }

        LOG(INFO) << "using cgroup " << name << " for accounting";
        return accounting::cgroup(move(handle));
    } catch (exception &e) {
        LOG(WARNING) << "cgroup " << name << " cannot be resolved: " << e.what()
                     << ", falling back to rusage accounting";
        return accounting::rusage();
    }
}

int64_t proc_peak_memory(pid_t pid) {
    ifstream fin(fmt::format("/proc/{}/status", pid));
    string line;
    while (getline(fin, line)) {
        if (boost::algorithm::starts_with(line, "VmHWM:")) {
            // VmHWM:	    1234 kB
            return parse_counter(line.substr(6, line.find("kB") - 6));
        }
    }
    return -1;
}

}  // namespace judgebox
