#include "gtest/gtest.h"
#include "judgebox/common/exceptions.hpp"
#include "judgebox/config.hpp"
#include "judgebox/policy.hpp"

using namespace std;
using namespace judgebox;

class PolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = syscall_registry::with_defaults();
        request.program = "/usr/bin/true";
        request.uid = 65534;
        request.gid = 65534;
    }

    syscall_registry registry;
    run_request request;
};

TEST_F(PolicyTest, DefaultLimits) {
    execution_policy policy = resolve_policy(request, registry);
    EXPECT_EQ(policy.cpu_time_limit, limit::of(DEFAULT_CPU_TIME_LIMIT));
    EXPECT_EQ(policy.wall_time_limit, limit::of(DEFAULT_CPU_TIME_LIMIT + WALL_TIME_GRACE));
    EXPECT_EQ(policy.memory_limit, limit::of(DEFAULT_MEMORY_LIMIT));
    // 栈空间默认与内存限制相同
    EXPECT_EQ(policy.stack_limit, policy.memory_limit);
    EXPECT_EQ(policy.output_size_limit, limit::of(DEFAULT_OUTPUT_LIMIT));
    EXPECT_TRUE(policy.process_limit.is_unlimited());
    EXPECT_EQ(policy.stdin_path, "/dev/null");
    EXPECT_EQ(policy.stdout_path, "/dev/null");
    EXPECT_EQ(policy.stderr_path, "/dev/null");
    EXPECT_EQ(policy.language, "c");
    EXPECT_TRUE(policy.read_mounts.empty());
}

TEST_F(PolicyTest, WallTimeFollowsCpuTime) {
    request.cpu_time_limit = requested_limit::of(3000);
    EXPECT_EQ(resolve_policy(request, registry).wall_time_limit, limit::of(3000 + WALL_TIME_GRACE));

    request.cpu_time_limit = requested_limit::unlimited();
    execution_policy policy = resolve_policy(request, registry);
    EXPECT_TRUE(policy.cpu_time_limit.is_unlimited());
    EXPECT_EQ(policy.wall_time_limit, limit::of(DEFAULT_WALL_TIME_LIMIT));

    request.wall_time_limit = requested_limit::of(500);
    EXPECT_EQ(resolve_policy(request, registry).wall_time_limit, limit::of(500));
}

TEST_F(PolicyTest, UnlimitedWallTimeRejected) {
    request.wall_time_limit = requested_limit::unlimited();
    EXPECT_THROW(resolve_policy(request, registry), policy_error);
}

TEST_F(PolicyTest, NonPositiveLimitRejected) {
    request.memory_limit = requested_limit::of(0);
    EXPECT_THROW(resolve_policy(request, registry), policy_error);

    request.memory_limit = requested_limit::of(-1);
    EXPECT_THROW(resolve_policy(request, registry), policy_error);

    request.memory_limit = requested_limit::unlimited();
    execution_policy policy = resolve_policy(request, registry);
    EXPECT_TRUE(policy.memory_limit.is_unlimited());
    EXPECT_TRUE(policy.stack_limit.is_unlimited());
}

TEST_F(PolicyTest, EmptyProgramRejected) {
    request.program.clear();
    EXPECT_THROW(resolve_policy(request, registry), policy_error);
}

TEST_F(PolicyTest, RootIdentityRejected) {
    request.uid = 0;
    EXPECT_THROW(resolve_policy(request, registry), policy_error);

    request.uid = 65534;
    request.gid = 0;
    EXPECT_THROW(resolve_policy(request, registry), policy_error);

    request.gid.reset();
    EXPECT_THROW(resolve_policy(request, registry), policy_error);
}

TEST_F(PolicyTest, MountsRequireRoot) {
    request.mounts.push_back(parse_mount_point("/tmp/data:/data", false));
    EXPECT_THROW(resolve_policy(request, registry), policy_error);

    request.mounts.clear();
    request.work_dir = "/data";
    EXPECT_THROW(resolve_policy(request, registry), policy_error);
}

TEST_F(PolicyTest, MountPoints) {
    request.chroot_dir = "/srv/sandbox";
    request.mounts.push_back(parse_mount_point("/tmp/data:/data", false));
    request.mounts.push_back(parse_mount_point("/tmp/work:/work", true));
    request.work_dir = "/work";

    execution_policy policy = resolve_policy(request, registry);
    ASSERT_EQ(policy.read_mounts.size(), DEFAULT_READ_MOUNTS.size() + 1);
    for (size_t i = 0; i < DEFAULT_READ_MOUNTS.size(); ++i) {
        EXPECT_EQ(policy.read_mounts[i].dst, DEFAULT_READ_MOUNTS[i]);
        EXPECT_FALSE(policy.read_mounts[i].required);
    }
    EXPECT_EQ(policy.read_mounts.back().src, "/tmp/data");
    EXPECT_EQ(policy.read_mounts.back().dst, "/data");
    ASSERT_EQ(policy.write_mounts.size(), 1);
    EXPECT_TRUE(policy.write_mounts[0].writable);
    EXPECT_EQ(policy.work_dir, "/work");

    request.default_mounts = false;
    EXPECT_EQ(resolve_policy(request, registry).read_mounts.size(), 1);
}

TEST_F(PolicyTest, EscapingMountRejected) {
    request.chroot_dir = "/srv/sandbox";
    request.mounts.push_back(parse_mount_point("/tmp/work:/../../etc", true));
    EXPECT_THROW(resolve_policy(request, registry), policy_error);

    request.mounts.clear();
    request.mounts.push_back(parse_mount_point("/tmp/work:work", true));
    EXPECT_THROW(resolve_policy(request, registry), policy_error);
}

TEST_F(PolicyTest, ParseMountPoint) {
    mount_point same = parse_mount_point("/usr/share", false);
    EXPECT_EQ(same.src, "/usr/share");
    EXPECT_EQ(same.dst, "/usr/share");
    EXPECT_FALSE(same.writable);
    EXPECT_TRUE(same.required);

    EXPECT_THROW(parse_mount_point(":/data", false), policy_error);
    EXPECT_THROW(parse_mount_point("/data:", false), policy_error);
}

TEST_F(PolicyTest, LanguageAliases) {
    request.language = "c++";
    EXPECT_EQ(resolve_policy(request, registry).language, "cpp");

    request.language = "py";
    EXPECT_EQ(resolve_policy(request, registry).language, "python3");

    request.language = "brainfuck";
    EXPECT_THROW(resolve_policy(request, registry), policy_error);
}

TEST_F(PolicyTest, EnvironmentKeys) {
    request.env = {"ONLINE_JUDGE=true", "HOME"};
    EXPECT_EQ(resolve_policy(request, registry).env, request.env);

    request.env = {"=value"};
    EXPECT_THROW(resolve_policy(request, registry), policy_error);
}

TEST_F(PolicyTest, RequestNotModified) {
    run_request copy = request;
    resolve_policy(request, registry);
    EXPECT_EQ(copy.program, request.program);
    EXPECT_EQ(copy.cpu_time_limit.kind, request.cpu_time_limit.kind);
    EXPECT_TRUE(request.mounts.empty());
}

TEST_F(PolicyTest, AllowedSyscalls) {
    execution_policy policy = resolve_policy(request, registry);
    EXPECT_TRUE(policy.allows(syscall_number("read")));
    EXPECT_TRUE(policy.allows(syscall_number("exit_group")));
    EXPECT_FALSE(policy.allows(syscall_number("socket")));
    EXPECT_FALSE(policy.allows(syscall_number("fork")));
}
