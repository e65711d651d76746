#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include "judgebox/common/exceptions.hpp"
#include "judgebox/common/system.hpp"
#include "judgebox/common/utils.hpp"
#include "judgebox/config.hpp"
#include "judgebox/run.hpp"

using namespace std;
using namespace judgebox;

namespace judgebox {

/**
 * @brief 命令行中的一项限制，接受正整数或者 "unlimited"
 */
void validate(boost::any &v, const vector<string> &values, requested_limit *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const &s = validators::get_single_string(values);
    if (s == "unlimited") {
        v = requested_limit::unlimited();
        return;
    }
    if (!is_number(s))
        throw validation_error(validation_error::invalid_option_value);

    try {
        v = requested_limit::of(boost::lexical_cast<int64_t>(s));
    } catch (boost::bad_lexical_cast &) {
        throw validation_error(validation_error::invalid_option_value);
    }
}

}  // namespace judgebox

static int parse_user(const string &user) {
    int uid = is_number(user) ? boost::lexical_cast<int>(user) : get_userid(user.c_str());
    if (uid < 0) throw policy_error("unknown user " + user);
    return uid;
}

static int parse_group(const string &group) {
    int gid = is_number(group) ? boost::lexical_cast<int>(group) : get_groupid(group.c_str());
    if (gid < 0) throw policy_error("unknown group " + group);
    return gid;
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("judgebox options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("time,t", po::value<requested_limit>(), "set maximum CPU time of the program in milliseconds, or 'unlimited'")
        ("wall-time,T", po::value<requested_limit>(), "kill the program after wall clock milliseconds, defaults to CPU time plus 1 second")
        ("memory,m", po::value<requested_limit>(), "set maximum memory consumption of the program in KB, or 'unlimited'")
        ("stack", po::value<requested_limit>(), "set maximum stack size of the program in KB, defaults to the memory limit")
        ("output-limit", po::value<requested_limit>(), "set maximum created file size of the program in KB")
        ("process", po::value<requested_limit>(), "set maximum process living simultaneously under the run-as user")
        ("stdin,i", po::value<string>(), "redirect program standard input fd to file")
        ("stdout,o", po::value<string>(), "redirect program standard output fd to file")
        ("stderr,e", po::value<string>(), "redirect program standard error fd to file")
        ("root,r", po::value<string>(), "run program with root directory set to root")
        ("read,R", po::value<vector<string>>()->composing(), "bind SRC[:DST] read-only into the root directory")
        ("write,W", po::value<vector<string>>()->composing(), "bind SRC[:DST] writable into the root directory")
        ("no-default-mounts", "do not bind /bin, /usr, /lib, /lib64 and /etc into the root directory")
        ("cwd", po::value<string>(), "working directory of the program, relative to the root directory")
        ("user,u", po::value<string>(), "run program as user with username or user id, defaults to $JUDGEBOX_USER")
        ("group,g", po::value<string>(), "run program under group with groupname or group id, defaults to $JUDGEBOX_GROUP")
        ("language,l", po::value<string>()->default_value("c"), "language of the program, selects the system call allow-list")
        ("syscall-config", po::value<vector<string>>()->composing(), "load additional system call allow-lists from json file")
        ("env,E", po::value<vector<string>>()->composing(), "add environment variable KEY=VALUE, or pass KEY through")
        ("preserve-env", "preserve system environment variables (or only PATH is loaded)")
        ("cgroup", po::value<string>(), "cgroup used for accounting, defaults to $JUDGEBOX_CGROUP or the run-as user name")
        ("report,M", po::value<string>(), "write run results (run time, exitcode, memory usage, ...) to file")
        ("json", "print run results as json to standard output")
        ("verbose,v", "log every system call decision")
        ("cmd", po::value<vector<string>>()->composing()->required(), "run -- program [args...]")
        ("help", "display this help text");
    // clang-format on
    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "judgebox: run an untrusted program with filesystem isolation, resource limits and system call filtering." << endl
                 << "This app requires root privilege if either 'root' or 'user' option is provided." << endl
                 << "Usage: " << argv[0] << " run [options] -- program [args...]" << endl;
            cout << desc << endl;
            return E_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_POLICY_ERROR;
    }

    if (vm.count("verbose") || !get_env("DEBUG", "").empty()) {
        FLAGS_v = 1;
        FLAGS_alsologtostderr = true;
    }

    vector<string> cmd = vm["cmd"].as<vector<string>>();
    if (cmd.empty() || cmd[0] != "run" || cmd.size() < 2) {
        cerr << "Usage: " << argv[0] << " run [options] -- program [args...]" << endl;
        return E_POLICY_ERROR;
    }

    run_request request;
    execution_policy policy;
    try {
        request.program = cmd[1];
        request.args.assign(cmd.begin() + 2, cmd.end());
        request.language = vm["language"].as<string>();

        if (vm.count("time")) request.cpu_time_limit = vm["time"].as<requested_limit>();
        if (vm.count("wall-time")) request.wall_time_limit = vm["wall-time"].as<requested_limit>();
        if (vm.count("memory")) request.memory_limit = vm["memory"].as<requested_limit>();
        if (vm.count("stack")) request.stack_limit = vm["stack"].as<requested_limit>();
        if (vm.count("output-limit")) request.output_size_limit = vm["output-limit"].as<requested_limit>();
        if (vm.count("process")) request.process_limit = vm["process"].as<requested_limit>();

        if (vm.count("stdin")) request.stdin_path = vm["stdin"].as<string>();
        if (vm.count("stdout")) request.stdout_path = vm["stdout"].as<string>();
        if (vm.count("stderr")) request.stderr_path = vm["stderr"].as<string>();

        if (vm.count("root")) request.chroot_dir = vm["root"].as<string>();
        if (vm.count("read"))
            for (auto &spec : vm["read"].as<vector<string>>())
                request.mounts.push_back(parse_mount_point(spec, false));
        if (vm.count("write"))
            for (auto &spec : vm["write"].as<vector<string>>())
                request.mounts.push_back(parse_mount_point(spec, true));
        if (vm.count("no-default-mounts")) request.default_mounts = false;
        if (vm.count("cwd")) request.work_dir = vm["cwd"].as<string>();

        identity fallback = default_identity();
        string user = vm.count("user") ? vm["user"].as<string>() : get_env("JUDGEBOX_USER", "");
        string group = vm.count("group") ? vm["group"].as<string>() : get_env("JUDGEBOX_GROUP", "");
        request.uid = user.empty() ? fallback.uid : parse_user(user);
        if (!group.empty())
            request.gid = parse_group(group);
        else if (!user.empty() && get_primary_groupid(*request.uid) >= 0)
            request.gid = get_primary_groupid(*request.uid);
        else
            request.gid = fallback.gid;

        if (vm.count("env")) request.env = vm["env"].as<vector<string>>();
        if (vm.count("preserve-env")) request.preserve_env = true;

        syscall_registry registry = syscall_registry::with_defaults();
        if (vm.count("syscall-config"))
            for (auto &file : vm["syscall-config"].as<vector<string>>())
                registry.load_json(file);

        policy = resolve_policy(request, registry);
    } catch (policy_error &e) {
        cerr << e.what() << endl;
        return E_POLICY_ERROR;
    }

    string cgroup_name = vm.count("cgroup")
                             ? vm["cgroup"].as<string>()
                             : get_env("JUDGEBOX_CGROUP", get_username(policy.uid));
    accounting acct = resolve_accounting(cgroup_name);
    LOG(INFO) << "using " << acct.mode_name() << " accounting for " << policy.program;

    execution_report report;
    try {
        report = run(policy, acct);
    } catch (judgebox_exception &e) {
        LOG(ERROR) << e;
        cerr << e.what() << endl;
        return E_INTERNAL_ERROR;
    }

    if (vm.count("report")) {
        ofstream fout(vm["report"].as<string>());
        if (!fout) {
            cerr << "unable to write report " << vm["report"].as<string>() << endl;
            return E_INTERNAL_ERROR;
        }
        write_report(fout, report, report_format::META);
    }
    if (vm.count("json")) write_report(cout, report, report_format::JSON);

    return verdict_exit_code(report.result);
}
