#include <sys/syscall.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "gtest/gtest.h"
#include "judgebox/common/exceptions.hpp"
#include "judgebox/syscall_table.hpp"

using namespace std;
using namespace judgebox;
namespace fs = std::filesystem;

class SyscallTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = fs::temp_directory_path() / ("judgebox-syscalls-" + to_string(getpid()) + ".json");
    }

    void TearDown() override {
        fs::remove(config);
    }

    void write_config(const string &content) {
        ofstream fout(config);
        fout << content;
    }

    fs::path config;
};

TEST_F(SyscallTableTest, NameLookup) {
    EXPECT_STREQ(syscall_name(SYS_read), "read");
    EXPECT_STREQ(syscall_name(SYS_socket), "socket");
    EXPECT_EQ(syscall_number("write"), SYS_write);
    EXPECT_EQ(syscall_number("no_such_syscall"), -1);
    EXPECT_EQ(syscall_name(100000), nullptr);
    EXPECT_EQ(syscall_display_name(SYS_socket), "socket");
    EXPECT_EQ(syscall_display_name(100000), "syscall_100000");
}

TEST_F(SyscallTableTest, DefaultLanguages) {
    syscall_registry registry = syscall_registry::with_defaults();
    EXPECT_EQ(registry.languages(), (vector<string>{"c", "cpp", "python3"}));

    auto c = registry.find("c");
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->count(SYS_exit_group));
    EXPECT_FALSE(c->count(SYS_socket));

    auto python = registry.find("python");
    ASSERT_NE(python, nullptr);
    // python3 的白名单在 c 的基础上追加
    for (long nr : *c) EXPECT_TRUE(python->count(nr));
    EXPECT_GT(python->size(), c->size());

    EXPECT_EQ(registry.find("cc"), registry.find("cpp"));
    EXPECT_EQ(registry.find("java"), nullptr);
}

TEST_F(SyscallTableTest, LoadJson) {
    write_config(R"({
        "languages": {
            "pascal": { "extends": "c", "allow": ["socket", "not_a_syscall"] }
        },
        "aliases": { "pas": "pascal" }
    })");

    syscall_registry registry = syscall_registry::with_defaults();
    registry.load_json(config);

    EXPECT_EQ(registry.canonical_tag("pas"), "pascal");
    auto pascal = registry.find("pas");
    ASSERT_NE(pascal, nullptr);
    EXPECT_TRUE(pascal->count(SYS_socket));
    EXPECT_TRUE(pascal->count(SYS_read));
    EXPECT_EQ(pascal->size(), registry.find("c")->size() + 1);
}

TEST_F(SyscallTableTest, LoadJsonErrors) {
    syscall_registry registry = syscall_registry::with_defaults();
    EXPECT_THROW(registry.load_json(config), policy_error);

    write_config("{ not json");
    EXPECT_THROW(registry.load_json(config), policy_error);

    write_config(R"({ "languages": { "ruby": { "extends": "perl", "allow": [] } } })");
    EXPECT_THROW(registry.load_json(config), policy_error);
}
