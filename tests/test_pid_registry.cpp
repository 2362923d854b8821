#include <gtest/gtest.h>
#include "daemon/pid_registry.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <sys/wait.h>

namespace fs = std::filesystem;

class PidRegistryTest : public ::testing::Test {
protected:
    std::string dir_;

    void SetUp() override {
        dir_ = "/tmp/craft_pid_" + std::to_string(::getpid());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write_raw(const std::string& text) {
        std::ofstream out(dir_ + "/craft.pid");
        out << text;
    }
};

TEST_F(PidRegistryTest, SaveAndLoad) {
    PidRegistry reg(dir_, "craft");
    ASSERT_TRUE(reg.save(::getpid()));
    EXPECT_TRUE(reg.exists());
    EXPECT_EQ(reg.load(), ::getpid());
}

TEST_F(PidRegistryTest, FileHoldsPlainDecimal) {
    PidRegistry reg(dir_, "craft");
    ASSERT_TRUE(reg.save(::getpid()));
    std::ifstream in(reg.path());
    std::string text;
    std::getline(in, text);
    EXPECT_EQ(text, std::to_string(::getpid()));
}

TEST_F(PidRegistryTest, LoadMissingReturnsNullopt) {
    PidRegistry reg(dir_, "craft");
    EXPECT_FALSE(reg.load().has_value());
}

TEST_F(PidRegistryTest, SaveRefusesNonexistentPid) {
    pid_t child = fork();
    if (child == 0) _exit(0);
    ASSERT_GT(child, 0);
    waitpid(child, nullptr, 0);

    PidRegistry reg(dir_, "craft");
    EXPECT_FALSE(reg.save(child));
    EXPECT_FALSE(reg.exists());
}

TEST_F(PidRegistryTest, SaveRefusesOutOfRange) {
    PidRegistry reg(dir_, "craft");
    EXPECT_FALSE(reg.save(0));
    EXPECT_FALSE(reg.save(-5));
    EXPECT_FALSE(reg.save(PidRegistry::kMaxPid + 1));
    EXPECT_FALSE(reg.exists());
}

TEST_F(PidRegistryTest, CorruptFileIsClearedOnLoad) {
    write_raw("abc");
    PidRegistry reg(dir_, "craft");
    EXPECT_FALSE(reg.load().has_value());
    EXPECT_FALSE(reg.exists());
}

TEST_F(PidRegistryTest, OutOfRangeFileIsClearedOnLoad) {
    write_raw("99999999");
    PidRegistry reg(dir_, "craft");
    EXPECT_FALSE(reg.load().has_value());
    EXPECT_FALSE(reg.exists());
}

TEST_F(PidRegistryTest, WhitespaceAroundPidIsAccepted) {
    write_raw("  1234\n");
    PidRegistry reg(dir_, "craft");
    EXPECT_EQ(reg.load(), 1234);
}

TEST_F(PidRegistryTest, ClearAbsentFileSucceeds) {
    PidRegistry reg(dir_, "craft");
    EXPECT_TRUE(reg.clear());
    ASSERT_TRUE(reg.save(::getpid()));
    EXPECT_TRUE(reg.clear());
    EXPECT_FALSE(reg.exists());
}

TEST(PidParse, Bounds) {
    EXPECT_EQ(PidRegistry::parse_pid("1"), 1);
    EXPECT_EQ(PidRegistry::parse_pid("4194304"), 4194304);
    EXPECT_FALSE(PidRegistry::parse_pid("0").has_value());
    EXPECT_FALSE(PidRegistry::parse_pid("4194305").has_value());
    EXPECT_FALSE(PidRegistry::parse_pid("-1").has_value());
    EXPECT_FALSE(PidRegistry::parse_pid("").has_value());
    EXPECT_FALSE(PidRegistry::parse_pid("12 34").has_value());
    EXPECT_FALSE(PidRegistry::parse_pid("0x10").has_value());
}
