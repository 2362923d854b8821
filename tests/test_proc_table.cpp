#include <gtest/gtest.h>
#include "daemon/proc_table.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

static pid_t spawn_shell(const char* script) {
    pid_t pid = fork();
    if (pid == 0) {
        execl("/bin/sh", "sh", "-c", script, static_cast<char*>(nullptr));
        _exit(127);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    return pid;
}

static void reap(pid_t pid) {
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
}

TEST(ProcTable, SelfExistsAndIsAlive) {
    EXPECT_TRUE(ProcTable::exists(::getpid()));
    EXPECT_TRUE(ProcTable::is_alive(::getpid()));
    EXPECT_FALSE(ProcTable::exists(0));
    EXPECT_FALSE(ProcTable::exists(-1));
}

TEST(ProcTable, ReadStatOfSelf) {
    auto st = ProcTable::read_stat(::getpid());
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->pid, ::getpid());
    EXPECT_EQ(st->ppid, ::getppid());
    EXPECT_GE(st->num_threads, 1);
    EXPECT_GT(st->rss_pages, 0);
    EXPECT_FALSE(st->comm.empty());
}

TEST(ProcTable, ReadStatOfChild) {
    pid_t pid = fork();
    if (pid == 0) {
        execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        _exit(127);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto st = ProcTable::read_stat(pid);
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->comm, "sleep");
    EXPECT_EQ(st->ppid, ::getpid());
    reap(pid);
}

TEST(ProcTable, ZombieExistsButIsNotAlive) {
    pid_t pid = fork();
    if (pid == 0) _exit(0);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(ProcTable::exists(pid));
    EXPECT_FALSE(ProcTable::is_alive(pid));
    waitpid(pid, nullptr, 0);
    EXPECT_FALSE(ProcTable::exists(pid));
}

TEST(ProcTable, CmdlineAndCwd) {
    pid_t pid = fork();
    if (pid == 0) {
        if (chdir("/tmp") != 0) _exit(126);
        execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        _exit(127);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto argv = ProcTable::cmdline(pid);
    ASSERT_EQ(argv.size(), 2u);
    EXPECT_EQ(argv[0], "sleep");
    EXPECT_EQ(argv[1], "30");
    EXPECT_EQ(ProcTable::cmdline_string(pid), "sleep 30");
    EXPECT_EQ(ProcTable::cwd(pid), fs::canonical("/tmp").string());
    reap(pid);
}

TEST(ProcTable, ListPidsContainsSelf) {
    auto pids = ProcTable::list_pids();
    EXPECT_NE(std::find(pids.begin(), pids.end(), ::getpid()), pids.end());
}

TEST(ProcTable, DescendantsIncludeGrandchildren) {
    pid_t root = spawn_shell("sh -c 'sleep 30; true' & sleep 30; wait");
    auto kids = ProcTable::descendants(root);
    // Inner shell, its sleep, and the outer sleep
    EXPECT_GE(kids.size(), 3u);
    EXPECT_EQ(std::find(kids.begin(), kids.end(), root), kids.end());

    for (pid_t p : kids) kill(p, SIGKILL);
    reap(root);
}

TEST(ProcTable, OpenFilesAndConnectionsOfSelf) {
    EXPECT_GE(ProcTable::count_open_files(::getpid()), 0);
    EXPECT_GE(ProcTable::count_connections(::getpid()), 0);
}

TEST(ProcTable, SystemValues) {
    EXPECT_GT(ProcTable::total_memory_kb(), 0u);
    EXPECT_GT(ProcTable::clock_ticks(), 0);
    EXPECT_GT(ProcTable::page_size(), 0);
}

TEST(ProcTable, StartTimeIsInThePast) {
    auto started = ProcTable::start_time(::getpid());
    ASSERT_TRUE(started.has_value());
    auto now = std::chrono::system_clock::now();
    EXPECT_LE(*started, now + std::chrono::seconds(2));
    EXPECT_GT(*started, now - std::chrono::hours(24 * 365));
}
