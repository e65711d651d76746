#include <signal.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include "gtest/gtest.h"
#include "judgebox/report.hpp"

using namespace std;
using namespace judgebox;
namespace fs = std::filesystem;

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = syscall_registry::with_defaults();
        run_request request;
        request.program = "/usr/bin/true";
        request.uid = 65534;
        request.gid = 65534;
        request.cpu_time_limit = requested_limit::of(1000);
        request.memory_limit = requested_limit::of(65536);
        policy = resolve_policy(request, registry);

        outcome.state = process_state::EXITED;
        outcome.exit_code = 0;
        outcome.wall_time = chrono::milliseconds(120);
        outcome.usage.user_time = chrono::milliseconds(80);
        outcome.usage.sys_time = chrono::milliseconds(10);
        outcome.usage.peak_memory = 2048;
    }

    run_outcome killed(kill_reason reason) {
        run_outcome result = outcome;
        result.state = process_state::KILLED;
        result.exit_code = -1;
        result.signal = SIGKILL;
        result.reason = reason;
        return result;
    }

    syscall_registry registry;
    execution_policy policy;
    run_outcome outcome;
};

TEST_F(ReportTest, Accepted) {
    execution_report report = build_report(policy, outcome);
    EXPECT_EQ(report.result, verdict::OK);
    ASSERT_TRUE(report.status);
    EXPECT_EQ(*report.status, 0);
    EXPECT_FALSE(report.signal);
    EXPECT_EQ(report.wall_time, 120);
    EXPECT_EQ(report.user_time, 80);
    EXPECT_EQ(report.sys_time, 10);
    EXPECT_EQ(report.memory, 2048);
    EXPECT_EQ(report.accounting, "rusage");
    EXPECT_EQ(verdict_exit_code(report.result), E_SUCCESS);
}

TEST_F(ReportTest, NonZeroExitIsNotAnError) {
    outcome.exit_code = 42;
    execution_report report = build_report(policy, outcome);
    EXPECT_EQ(report.result, verdict::OK);
    EXPECT_EQ(*report.status, 42);
}

TEST_F(ReportTest, SignaledIsRuntimeError) {
    outcome.state = process_state::SIGNALED;
    outcome.signal = SIGSEGV;
    execution_report report = build_report(policy, outcome);
    EXPECT_EQ(report.result, verdict::RUNTIME_ERROR);
    EXPECT_FALSE(report.status);
    EXPECT_EQ(*report.signal, SIGSEGV);
    EXPECT_EQ(verdict_exit_code(report.result), E_RUNTIME_ERROR);
}

TEST_F(ReportTest, CpuTimeExceeded) {
    outcome.usage.user_time = chrono::milliseconds(990);
    outcome.usage.sys_time = chrono::milliseconds(20);
    EXPECT_EQ(build_report(policy, outcome).result, verdict::TIME_LIMIT_EXCEEDED);

    run_outcome xcpu = killed(kill_reason::TIME_LIMIT_EXCEEDED);
    xcpu.cpu_limit_signal = true;
    EXPECT_EQ(build_report(policy, xcpu).result, verdict::TIME_LIMIT_EXCEEDED);
}

TEST_F(ReportTest, WallTimeOverrunWithoutKillIsNotTimeLimit) {
    outcome.wall_time = chrono::milliseconds(5000);
    EXPECT_EQ(build_report(policy, outcome).result, verdict::OK);
}

TEST_F(ReportTest, MemoryExceeded) {
    outcome.usage.peak_memory = 65537;
    EXPECT_EQ(build_report(policy, outcome).result, verdict::MEMORY_LIMIT_EXCEEDED);

    run_outcome oom = outcome;
    oom.usage.peak_memory = 1024;
    oom.usage.oom_kills = 1;
    oom.state = process_state::SIGNALED;
    oom.signal = SIGKILL;
    EXPECT_EQ(build_report(policy, oom).result, verdict::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(ReportTest, Precedence) {
    // 内存超限优先于时间超限
    run_outcome both = killed(kill_reason::TIME_LIMIT_EXCEEDED);
    both.usage.peak_memory = 100000;
    EXPECT_EQ(build_report(policy, both).result, verdict::MEMORY_LIMIT_EXCEEDED);

    // 拒绝系统调用优先于资源超限
    run_outcome restricted = killed(kill_reason::RESTRICTED_FUNCTION);
    restricted.restricted_syscall = SYS_socket;
    restricted.usage.peak_memory = 100000;
    restricted.cpu_limit_signal = true;
    execution_report report = build_report(policy, restricted);
    EXPECT_EQ(report.result, verdict::RESTRICTED_FUNCTION);
    EXPECT_EQ(report.restricted_syscall, "socket");
    EXPECT_EQ(verdict_exit_code(report.result), E_RESTRICTED_FUNCTION);

    // 内部错误优先于一切
    restricted.internal_error = "unable to read registers";
    report = build_report(policy, restricted);
    EXPECT_EQ(report.result, verdict::INTERNAL_ERROR);
    EXPECT_EQ(report.internal_error, "unable to read registers");
}

TEST_F(ReportTest, Cancelled) {
    execution_report report = build_report(policy, killed(kill_reason::CANCELLED));
    EXPECT_EQ(report.result, verdict::INTERNAL_ERROR);
    EXPECT_EQ(report.internal_error, "cancelled");
    EXPECT_EQ(verdict_exit_code(report.result), E_INTERNAL_ERROR);
}

TEST_F(ReportTest, NotTerminated) {
    outcome.state = process_state::RUNNING;
    execution_report report = build_report(policy, outcome);
    EXPECT_EQ(report.result, verdict::INTERNAL_ERROR);
    EXPECT_FALSE(report.internal_error.empty());
}

TEST_F(ReportTest, MetaFormat) {
    outcome.accounting_mode = accounting::CGROUP;
    execution_report report = build_report(policy, outcome);

    stringstream ss;
    write_report(ss, report, report_format::META);
    EXPECT_EQ(ss.str(),
              "status: 0\n"
              "signal: \n"
              "wall-time: 120\n"
              "user-time: 80\n"
              "sys-time: 10\n"
              "memory: 2048\n"
              "verdict: OK\n"
              "accounting: cgroup\n"
              "degraded: false\n");
}

TEST_F(ReportTest, ReadMeta) {
    run_outcome restricted = killed(kill_reason::RESTRICTED_FUNCTION);
    restricted.restricted_syscall = SYS_socket;
    restricted.degraded = true;
    execution_report report = build_report(policy, restricted);

    fs::path path = fs::temp_directory_path() / ("judgebox-report-" + to_string(getpid()) + ".meta");
    {
        ofstream fout(path);
        write_report(fout, report, report_format::META);
    }

    execution_report parsed = read_report_meta(path);
    fs::remove(path);

    EXPECT_FALSE(parsed.status);
    ASSERT_TRUE(parsed.signal);
    EXPECT_EQ(*parsed.signal, SIGKILL);
    EXPECT_EQ(parsed.wall_time, report.wall_time);
    EXPECT_EQ(parsed.memory, report.memory);
    EXPECT_EQ(parsed.result, verdict::RESTRICTED_FUNCTION);
    EXPECT_TRUE(parsed.degraded);
    EXPECT_EQ(parsed.restricted_syscall, "socket");
    EXPECT_TRUE(parsed.internal_error.empty());
}

TEST_F(ReportTest, ReadMetaErrors) {
    fs::path path = fs::temp_directory_path() / ("judgebox-report-" + to_string(getpid()) + ".meta");
    EXPECT_THROW(read_report_meta(path), runtime_error);

    {
        ofstream fout(path);
        fout << "status: 0\nsignal: \nwall-time: abc\n";
    }
    EXPECT_THROW(read_report_meta(path), runtime_error);
    fs::remove(path);
}

TEST_F(ReportTest, JsonFormat) {
    outcome.state = process_state::SIGNALED;
    outcome.signal = SIGSEGV;
    execution_report report = build_report(policy, outcome);

    stringstream ss;
    write_report(ss, report, report_format::JSON);
    nlohmann::json json = nlohmann::json::parse(ss.str());

    EXPECT_TRUE(json["status"].is_null());
    EXPECT_EQ(json["signal"], SIGSEGV);
    EXPECT_EQ(json["wall_time"], 120);
    EXPECT_EQ(json["verdict"], "RUNTIME_ERROR");
    EXPECT_EQ(json["accounting"], "rusage");
    EXPECT_FALSE(json.contains("restricted_syscall"));
}
