#include <gtest/gtest.h>
#include <liveness_oracle.hpp>
#ifdef __linux__
#include <linux/linux_process_table.hpp>
#endif
#include "fake_process_table.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace kiosk;

TEST(ImageNameRuleTest, KnownPlatforms) {
    EXPECT_EQ(image_name_rule("linux").command_name_limit, 15u);
    EXPECT_EQ(image_name_rule("freebsd").command_name_limit, 19u);
    EXPECT_EQ(image_name_rule("sunos").command_name_limit, 15u);
    EXPECT_EQ(image_name_rule("plan9").command_name_limit, 0u);
}

TEST(LivenessOracleTest, InvalidPidIsDead) {
    FakeProcessTable table;
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_FALSE(oracle.is_alive_and_same_app(0));
    EXPECT_FALSE(oracle.is_alive_and_same_app(-1));
    EXPECT_EQ(table.lookups(), 0);
}

TEST(LivenessOracleTest, MissingPidIsDead) {
    FakeProcessTable table;
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_FALSE(oracle.is_alive_and_same_app(1234));
}

TEST(LivenessOracleTest, SameExecutableIsAlive) {
    FakeProcessTable table;
    table.add(1234, "kiosk", "/usr/bin/kiosk");
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_TRUE(oracle.is_alive_and_same_app(1234));
}

TEST(LivenessOracleTest, ForeignExecutableIsNotSameApp) {
    FakeProcessTable table;
    table.add(1234, "bash", "/usr/bin/bash");
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_FALSE(oracle.is_alive_and_same_app(1234));
}

TEST(LivenessOracleTest, ZombieIsDead) {
    FakeProcessTable table;
    table.add(1234, "kiosk", "/usr/bin/kiosk", 'Z');
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_FALSE(oracle.is_alive_and_same_app(1234));
}

TEST(LivenessOracleTest, DeletedExecutableStillMatches) {
    // Binary replaced by a package upgrade while running
    FakeProcessTable table;
    table.add(1234, "kiosk", "/usr/bin/kiosk (deleted)");
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_TRUE(oracle.is_alive_and_same_app(1234));
}

TEST(LivenessOracleTest, TruncatedCommandNameMatchesWithoutExe) {
    FakeProcessTable table;
    table.add(1234, "kiosk-launcher-");  // 15 chars
    const LivenessOracle oracle(&table, "kiosk-launcher-signage", image_name_rule("linux"));
    EXPECT_TRUE(oracle.is_alive_and_same_app(1234));
}

TEST(LivenessOracleTest, GenericRuleNeedsFullCommandName) {
    FakeProcessTable table;
    table.add(1234, "kiosk-launcher-");
    const LivenessOracle oracle(&table, "kiosk-launcher-signage", image_name_rule("generic"));
    EXPECT_FALSE(oracle.is_alive_and_same_app(1234));
}

TEST(LivenessOracleTest, ImageNameOfPrefersExecutable) {
    ProcessInfo info;
    info.name = "short";
    EXPECT_EQ(LivenessOracle::image_name_of(info), "short");
    info.executable_path = "/opt/kiosk/bin/kiosk";
    EXPECT_EQ(LivenessOracle::image_name_of(info), "kiosk");
}

TEST(LivenessOracleTest, OwnImageNameFallsBackToArgv0) {
    FakeProcessTable table;
    EXPECT_EQ(LivenessOracle::resolve_own_image_name(table, "/usr/local/bin/kiosk"), "kiosk");
}

#ifdef __linux__

TEST(LivenessOracleTest, OwnProcessIsAliveOnLinux) {
    LinuxProcessTable table;
    const std::string own = LivenessOracle::resolve_own_image_name(table, "");
    ASSERT_FALSE(own.empty());

    const LivenessOracle oracle(&table, own);
    EXPECT_TRUE(oracle.is_alive_and_same_app(static_cast<int>(getpid())));
}

TEST(LivenessOracleTest, NonexistentPidIsDeadOnLinux) {
    LinuxProcessTable table;
    const LivenessOracle oracle(&table, "kiosk");
    // Above the kernel's pid_max ceiling (4194304)
    EXPECT_FALSE(oracle.is_alive_and_same_app(99999999));
}

class FakeProcfsTest : public ::testing::Test {
protected:
    fs::path proc_root;

    void SetUp() override {
        proc_root = fs::temp_directory_path() / ("kiosk_fake_proc_" + std::to_string(getpid()));
        fs::remove_all(proc_root);
    }

    void TearDown() override {
        fs::remove_all(proc_root);
    }

    void add_process(int pid, const std::string& comm, char state, const std::string& exe_target = {}) {
        const fs::path dir = proc_root / std::to_string(pid);
        fs::create_directories(dir);
        std::ofstream(dir / "stat") << pid << " (" << comm << ") " << state << " 1 " << pid << " 0";
        if (!exe_target.empty()) {
            fs::create_symlink(exe_target, dir / "exe");
        }
    }
};

TEST_F(FakeProcfsTest, ParsesCommWithParentheses) {
    add_process(300, "kiosk (x) y", 'S', "/usr/bin/kiosk");
    LinuxProcessTable table(proc_root);

    const auto info = table.find_process(300);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->pid, 300);
    EXPECT_EQ(info->name, "kiosk (x) y");
    EXPECT_EQ(info->state_char, 'S');
    EXPECT_EQ(info->executable_path, "/usr/bin/kiosk");
}

TEST_F(FakeProcfsTest, ZombieFromStat) {
    add_process(301, "kiosk", 'Z', "/usr/bin/kiosk");
    LinuxProcessTable table(proc_root);
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_FALSE(oracle.is_alive_and_same_app(301));
}

TEST_F(FakeProcfsTest, DeletedExeLink) {
    add_process(302, "kiosk", 'S', "/usr/bin/kiosk (deleted)");
    LinuxProcessTable table(proc_root);
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_TRUE(oracle.is_alive_and_same_app(302));
}

TEST_F(FakeProcfsTest, ReusedPidBelongsToOtherProgram) {
    add_process(303, "sshd", 'S', "/usr/sbin/sshd");
    LinuxProcessTable table(proc_root);
    const LivenessOracle oracle(&table, "kiosk");
    EXPECT_FALSE(oracle.is_alive_and_same_app(303));
}

TEST_F(FakeProcfsTest, MalformedStatIsNotFound) {
    fs::create_directories(proc_root / "304");
    std::ofstream(proc_root / "304" / "stat") << "garbage";
    LinuxProcessTable table(proc_root);
    EXPECT_FALSE(table.find_process(304).has_value());
}

#endif
