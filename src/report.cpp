#include "judgebox/report.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace judgebox {
using namespace std;

const char *verdict_name(verdict v) {
    switch (v) {
        case verdict::OK: return "OK";
        case verdict::TIME_LIMIT_EXCEEDED: return "TIME_LIMIT_EXCEEDED";
        case verdict::MEMORY_LIMIT_EXCEEDED: return "MEMORY_LIMIT_EXCEEDED";
        case verdict::RESTRICTED_FUNCTION: return "RESTRICTED_FUNCTION";
        case verdict::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case verdict::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

static verdict verdict_from_name(const string &name) {
    for (verdict v : {verdict::OK, verdict::TIME_LIMIT_EXCEEDED, verdict::MEMORY_LIMIT_EXCEEDED,
                      verdict::RESTRICTED_FUNCTION, verdict::RUNTIME_ERROR, verdict::INTERNAL_ERROR})
        if (name == verdict_name(v)) return v;
    throw runtime_error(fmt::format("unknown verdict {}", name));
}

error_codes verdict_exit_code(verdict v) {
    switch (v) {
        case verdict::OK: return E_SUCCESS;
        case verdict::TIME_LIMIT_EXCEEDED: return E_TIME_LIMIT;
        case verdict::MEMORY_LIMIT_EXCEEDED: return E_MEM_LIMIT;
        case verdict::RESTRICTED_FUNCTION: return E_RESTRICTED_FUNCTION;
        case verdict::RUNTIME_ERROR: return E_RUNTIME_ERROR;
        case verdict::INTERNAL_ERROR: return E_INTERNAL_ERROR;
    }
    return E_INTERNAL_ERROR;
}

static bool memory_exceeded(const execution_policy &policy, const run_outcome &outcome) {
    if (outcome.reason == kill_reason::MEMORY_LIMIT_EXCEEDED) return true;
    if (outcome.usage.oom_kills > 0) return true;
    return !policy.memory_limit.is_unlimited() && outcome.usage.peak_memory > policy.memory_limit.amount();
}

static bool time_exceeded(const execution_policy &policy, const run_outcome &outcome) {
    if (outcome.reason == kill_reason::TIME_LIMIT_EXCEEDED) return true;
    if (outcome.cpu_limit_signal) return true;
    if (policy.cpu_time_limit.is_unlimited()) return false;
    auto cpu_time = outcome.usage.user_time + outcome.usage.sys_time;
    return cpu_time > chrono::milliseconds(policy.cpu_time_limit.amount());
}

execution_report build_report(const execution_policy &policy, const run_outcome &outcome) {
    execution_report report;

    if (outcome.state == process_state::EXITED)
        report.status = outcome.exit_code;
    else if (outcome.signal != 0)
        report.signal = outcome.signal;

    report.wall_time = outcome.wall_time.count();
    report.user_time = chrono::duration_cast<chrono::milliseconds>(outcome.usage.user_time).count();
    report.sys_time = chrono::duration_cast<chrono::milliseconds>(outcome.usage.sys_time).count();
    report.memory = outcome.usage.peak_memory;
    report.accounting = outcome.accounting_mode == accounting::CGROUP ? "cgroup" : "rusage";
    report.degraded = outcome.degraded;

    if (outcome.restricted_syscall >= 0)
        report.restricted_syscall = syscall_display_name(outcome.restricted_syscall);

    report.internal_error = outcome.internal_error;
    if (outcome.reason == kill_reason::CANCELLED && report.internal_error.empty())
        report.internal_error = "cancelled";

    if (!report.internal_error.empty() || outcome.reason == kill_reason::INTERNAL_ERROR ||
        outcome.reason == kill_reason::CANCELLED || !is_terminal(outcome.state)) {
        if (report.internal_error.empty()) report.internal_error = "run did not terminate";
        report.result = verdict::INTERNAL_ERROR;
    } else if (outcome.reason == kill_reason::RESTRICTED_FUNCTION) {
        report.result = verdict::RESTRICTED_FUNCTION;
    } else if (memory_exceeded(policy, outcome)) {
        report.result = verdict::MEMORY_LIMIT_EXCEEDED;
    } else if (time_exceeded(policy, outcome)) {
        report.result = verdict::TIME_LIMIT_EXCEEDED;
    } else if (outcome.state != process_state::EXITED) {
        report.result = verdict::RUNTIME_ERROR;
    } else {
        report.result = verdict::OK;
    }

    return report;
}

template <typename T>
static void append_meta(ostream &os, const char *key, const T &message) {
    os << key << ": " << message << endl;
}

template <typename T>
static string optional_string(const optional<T> &value) {
    return value ? boost::lexical_cast<string>(*value) : string();
}

void write_report(ostream &os, const execution_report &report, report_format format) {
    if (format == report_format::META) {
        append_meta(os, "status", optional_string(report.status));
        append_meta(os, "signal", optional_string(report.signal));
        append_meta(os, "wall-time", report.wall_time);
        append_meta(os, "user-time", report.user_time);
        append_meta(os, "sys-time", report.sys_time);
        append_meta(os, "memory", report.memory);
        append_meta(os, "verdict", verdict_name(report.result));
        append_meta(os, "accounting", report.accounting);
        append_meta(os, "degraded", report.degraded ? "true" : "false");
        if (!report.restricted_syscall.empty())
            append_meta(os, "restricted-syscall", report.restricted_syscall);
        if (!report.internal_error.empty())
            append_meta(os, "internal-error", report.internal_error);
    } else {
        nlohmann::ordered_json json;
        json["status"] = report.status ? nlohmann::ordered_json(*report.status) : nlohmann::ordered_json(nullptr);
        json["signal"] = report.signal ? nlohmann::ordered_json(*report.signal) : nlohmann::ordered_json(nullptr);
        json["wall_time"] = report.wall_time;
        json["user_time"] = report.user_time;
        json["sys_time"] = report.sys_time;
        json["memory"] = report.memory;
        json["verdict"] = verdict_name(report.result);
        json["accounting"] = report.accounting;
        json["degraded"] = report.degraded;
        if (!report.restricted_syscall.empty())
            json["restricted_syscall"] = report.restricted_syscall;
        if (!report.internal_error.empty())
            json["internal_error"] = report.internal_error;
        os << json.dump(2) << endl;
    }
}

execution_report read_report_meta(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) throw runtime_error(fmt::format("unable to open report {}", path.string()));

    map<string, string> fields;
    string line;
    while (getline(fin, line)) {
        auto colon = line.find(':');
        if (colon == string::npos) continue;
        fields[line.substr(0, colon)] = boost::algorithm::trim_copy(line.substr(colon + 1));
    }

    auto field = [&](const string &key) -> const string & {
        auto it = fields.find(key);
        if (it == fields.end()) throw runtime_error(fmt::format("report {} has no field {}", path.string(), key));
        return it->second;
    };

    execution_report report;
    try {
        if (!field("status").empty()) report.status = boost::lexical_cast<int>(field("status"));
        if (!field("signal").empty()) report.signal = boost::lexical_cast<int>(field("signal"));
        report.wall_time = boost::lexical_cast<int64_t>(field("wall-time"));
        report.user_time = boost::lexical_cast<int64_t>(field("user-time"));
        report.sys_time = boost::lexical_cast<int64_t>(field("sys-time"));
        report.memory = boost::lexical_cast<int64_t>(field("memory"));
    } catch (boost::bad_lexical_cast &e) {
        throw runtime_error(fmt::format("malformed report {}: {}", path.string(), e.what()));
    }
    report.result = verdict_from_name(field("verdict"));
    report.accounting = field("accounting");
    report.degraded = field("degraded") == "true";
    if (fields.count("restricted-syscall")) report.restricted_syscall = fields["restricted-syscall"];
    if (fields.count("internal-error")) report.internal_error = fields["internal-error"];
    return report;
}

}  // namespace judgebox
