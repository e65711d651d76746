#include <unistd.h>
#include "gtest/gtest.h"
#include "judgebox/cgroup.hpp"

using namespace std;
using namespace judgebox;

TEST(CgroupTest, MissingCgroupFallsBackToRusage) {
    accounting acct = resolve_accounting("judgebox-no-such-cgroup-" + to_string(getpid()));
    EXPECT_EQ(acct.mode(), accounting::RUSAGE);
    EXPECT_STREQ(acct.mode_name(), "rusage");
}

TEST(CgroupTest, RusageAccounting) {
    accounting acct = accounting::rusage();
    EXPECT_TRUE(acct.open_membership().empty());
    EXPECT_EQ(acct.oom_kill_count(), 0);
    EXPECT_GT(acct.sample_memory(getpid()), 0);
    EXPECT_EQ(join_membership({}, getpid()), 0);
}

TEST(CgroupTest, ProcPeakMemory) {
    EXPECT_GT(proc_peak_memory(getpid()), 0);
    EXPECT_EQ(proc_peak_memory(-1), -1);
}
