#include <gtest/gtest.h>
#include "daemon/process_controller.hpp"
#include "daemon/process_lock.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono;

class ProcessControllerTest : public ::testing::Test {
protected:
    std::string dir_;
    std::string marker_;
    std::vector<pid_t> strays_;
    std::unique_ptr<ResourceSampler> sampler_;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = "/tmp/craft_pc_" + std::to_string(::getpid()) + "_" + info->name();
        fs::create_directories(dir_);
        marker_ = "craft_marker_" + std::to_string(::getpid());

        SamplerOptions so;
        so.cpu_sample_interval = milliseconds(10);
        sampler_ = std::make_unique<ResourceSampler>(so);
    }

    void TearDown() override {
        for (pid_t p : strays_) {
            kill(p, SIGKILL);
            waitpid(p, nullptr, 0);
        }
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    ControllerOptions options() {
        ControllerOptions o;
        o.server_dir = dir_;
        o.artifact_name = marker_;
        o.require_jar_flag = false;
        o.startup_timeout = milliseconds(2000);
        o.startup_grace = milliseconds(200);
        o.term_grace = milliseconds(2000);
        o.kill_grace = milliseconds(2000);
        o.poll_interval = milliseconds(20);
        return o;
    }

    std::unique_ptr<ProcessController> make(std::vector<std::string> argv,
                                            ControllerOptions o) {
        return std::make_unique<ProcessController>(
            std::move(o), [argv] { return argv; }, *sampler_);
    }

    std::unique_ptr<ProcessController> make(std::vector<std::string> argv) {
        return make(std::move(argv), options());
    }

    /// Start a shell in dir_ that is not a child of any controller
    pid_t spawn_stray(const std::string& script) {
        pid_t pid = fork();
        if (pid == 0) {
            if (chdir(dir_.c_str()) != 0) _exit(126);
            execl("/bin/sh", "sh", "-c", script.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }
        strays_.push_back(pid);
        // Let the shell get going
        std::this_thread::sleep_for(milliseconds(200));
        return pid;
    }

    static bool eventually(const std::function<bool()>& pred, milliseconds timeout = milliseconds(3000)) {
        auto deadline = steady_clock::now() + timeout;
        while (steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(milliseconds(20));
        }
        return pred();
    }

    std::string pid_file() const { return dir_ + "/craft.pid"; }
    std::string lock_file() const { return dir_ + "/craft.lock"; }
};

// ── start ───────────────────────────────────────────────────

TEST_F(ProcessControllerTest, StartAndStopSleep) {
    auto pc = make({"/bin/sleep", "60"});
    EXPECT_FALSE(pc->is_running());

    auto started = pc->start();
    ASSERT_TRUE(started.ok) << started.error;
    EXPECT_GT(started.pid, 0);
    EXPECT_TRUE(pc->is_running());
    EXPECT_EQ(pc->pid(), started.pid);
    EXPECT_EQ(pc->handle_kind(), HandleKind::Direct);
    EXPECT_TRUE(pc->can_send_commands());
    EXPECT_TRUE(fs::exists(pid_file()));
    EXPECT_TRUE(fs::exists(lock_file()));
    EXPECT_EQ(sampler_->attached_pid(), started.pid);

    // sleep ignores the stop command, so this escalates to signals
    auto stopped = pc->stop(false, milliseconds(300));
    EXPECT_TRUE(stopped.ok) << stopped.error;
    EXPECT_TRUE(stopped.forced);
    EXPECT_FALSE(pc->is_running());
    EXPECT_FALSE(fs::exists(pid_file()));
    EXPECT_FALSE(fs::exists(lock_file()));
    EXPECT_EQ(pc->handle_kind(), HandleKind::None);
    EXPECT_EQ(sampler_->attached_pid(), -1);
}

TEST_F(ProcessControllerTest, StartWhileRunningReportsAlreadyRunning) {
    auto pc = make({"/bin/sleep", "60"});
    auto first = pc->start();
    ASSERT_TRUE(first.ok);

    auto second = pc->start();
    EXPECT_FALSE(second.ok);
    EXPECT_EQ(second.kind, StartError::AlreadyRunning);
    EXPECT_EQ(second.pid, first.pid);

    pc->stop(true, milliseconds(0));
}

TEST_F(ProcessControllerTest, StartFailsWhenLockHeldElsewhere) {
    ProcessLock other(dir_, "craft");
    ASSERT_TRUE(other.acquire());

    auto pc = make({"/bin/sleep", "60"});
    auto result = pc->start();
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, StartError::LockUnavailable);
    EXPECT_FALSE(fs::exists(pid_file()));
}

TEST_F(ProcessControllerTest, ExecFailureIsReported) {
    auto pc = make({"/nonexistent/binary"});
    auto result = pc->start();
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, StartError::ExitedDuringStartup);
    EXPECT_NE(result.error.find("127"), std::string::npos);

    EXPECT_FALSE(pc->is_running());
    EXPECT_FALSE(fs::exists(pid_file()));
    EXPECT_FALSE(fs::exists(lock_file()));
    EXPECT_EQ(pc->debug_info().last_exit_code, 127);
}

TEST_F(ProcessControllerTest, EmptyCommandIsSpawnFailure) {
    auto pc = make({});
    auto result = pc->start();
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, StartError::SpawnFailed);
    EXPECT_FALSE(fs::exists(lock_file()));
}

TEST_F(ProcessControllerTest, ReadinessProbeTimeoutKillsServer) {
    auto o = options();
    o.startup_timeout = milliseconds(300);
    auto pc = make({"/bin/sleep", "60"}, o);
    pc->readiness_probe = [](pid_t) { return false; };

    auto result = pc->start();
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, StartError::StartupTimeout);
    EXPECT_FALSE(pc->is_running());
    EXPECT_FALSE(fs::exists(pid_file()));
    EXPECT_FALSE(fs::exists(lock_file()));
}

TEST_F(ProcessControllerTest, ReadinessProbeSuccess) {
    auto o = options();
    o.startup_grace = seconds(30);
    auto pc = make({"/bin/sleep", "60"}, o);
    int probes = 0;
    pc->readiness_probe = [&probes](pid_t) { return ++probes >= 3; };

    auto begin = steady_clock::now();
    auto result = pc->start();
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(probes, 3);
    EXPECT_LT(steady_clock::now() - begin, seconds(5));

    pc->stop(true, milliseconds(0));
}

// ── stop ────────────────────────────────────────────────────

TEST_F(ProcessControllerTest, StopWhenNotRunningIsNoop) {
    auto pc = make({"/bin/sleep", "60"});
    auto result = pc->stop(false, seconds(1));
    EXPECT_TRUE(result.ok);
    EXPECT_FALSE(result.forced);
    EXPECT_FALSE(fs::exists(pid_file()));

    result = pc->stop(true, milliseconds(0));
    EXPECT_TRUE(result.ok);
}

TEST_F(ProcessControllerTest, GracefulStopViaConsole) {
    auto pc = make({"/bin/sh", "-c", "read line; exit 0"});
    ASSERT_TRUE(pc->start().ok);

    auto result = pc->stop(false, seconds(5));
    EXPECT_TRUE(result.ok) << result.error;
    EXPECT_FALSE(result.forced);
    EXPECT_FALSE(pc->is_running());
    EXPECT_EQ(pc->debug_info().last_exit_code, 0);
}

TEST_F(ProcessControllerTest, ForceStopKillsImmediately) {
    auto pc = make({"/bin/sh", "-c", "trap '' TERM; sleep 60"});
    auto started = pc->start();
    ASSERT_TRUE(started.ok);

    auto begin = steady_clock::now();
    auto result = pc->stop(true, milliseconds(0));
    EXPECT_TRUE(result.ok) << result.error;
    EXPECT_TRUE(result.forced);
    EXPECT_LT(steady_clock::now() - begin, seconds(2));
    EXPECT_FALSE(pc->is_running());
}

TEST_F(ProcessControllerTest, GracefulStopEscalatesWhenIgnored) {
    auto o = options();
    o.term_grace = milliseconds(300);
    auto pc = make({"/bin/sh", "-c", "trap '' TERM; sleep 60"}, o);
    ASSERT_TRUE(pc->start().ok);

    // Neither the stop command nor SIGTERM ends it; only SIGKILL does
    auto result = pc->stop(false, milliseconds(300));
    EXPECT_TRUE(result.ok) << result.error;
    EXPECT_TRUE(result.forced);
    EXPECT_FALSE(pc->is_running());
    EXPECT_EQ(pc->debug_info().last_exit_code, 128 + SIGKILL);
    EXPECT_FALSE(fs::exists(pid_file()));
    EXPECT_FALSE(fs::exists(lock_file()));
}

TEST_F(ProcessControllerTest, ForceStopSendsTermBeforeKill) {
    auto pc = make({"/bin/sleep", "60"});
    ASSERT_TRUE(pc->start().ok);

    auto result = pc->stop(true, seconds(1));
    EXPECT_TRUE(result.ok) << result.error;
    EXPECT_FALSE(result.forced);
    EXPECT_FALSE(pc->is_running());
    EXPECT_EQ(pc->debug_info().last_exit_code, 128 + SIGTERM);
}

TEST_F(ProcessControllerTest, CrashedChildIsNotRunning) {
    auto pc = make({"/bin/sh", "-c", "sleep 0.5; exit 3"});
    ASSERT_TRUE(pc->start().ok);
    EXPECT_TRUE(eventually([&] { return !pc->is_running(); }));
    EXPECT_EQ(pc->debug_info().last_exit_code, 3);
    EXPECT_FALSE(fs::exists(pid_file()));
}

// ── console ─────────────────────────────────────────────────

TEST_F(ProcessControllerTest, CommandRoundTripThroughConsole) {
    auto pc = make({"/bin/sh", "-c", "echo ready; read line; echo got $line; read x"});
    ASSERT_TRUE(pc->start().ok);

    EXPECT_EQ(pc->send_command("ping"), CommandResult::Sent);
    EXPECT_TRUE(eventually([&] {
        auto tail = pc->console_tail(10);
        return !tail.empty() && tail.back() == "got ping";
    }));
    auto tail = pc->console_tail(10);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail.front(), "ready");

    pc->stop(false, seconds(5));
}

TEST_F(ProcessControllerTest, ConsoleHistoryIsBounded) {
    auto o = options();
    o.console_history = 2;
    auto pc = make({"/bin/sh", "-c", "echo one; echo two; echo three; sleep 60"}, o);
    ASSERT_TRUE(pc->start().ok);

    EXPECT_TRUE(eventually([&] {
        auto tail = pc->console_tail(10);
        return !tail.empty() && tail.back() == "three";
    }));
    auto tail = pc->console_tail(10);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0], "two");

    pc->stop(true, milliseconds(0));
}

TEST_F(ProcessControllerTest, BlankCommandIsRejected) {
    auto pc = make({"/bin/sleep", "60"});
    EXPECT_EQ(pc->send_command("   "), CommandResult::Empty);
    EXPECT_EQ(pc->send_command("say hi"), CommandResult::NotRunning);
}

TEST_F(ProcessControllerTest, ClosedConsoleIsBrokenPipe) {
    auto pc = make({"/bin/sh", "-c", "exec 0<&-; sleep 60"});
    ASSERT_TRUE(pc->start().ok);
    EXPECT_EQ(pc->send_command("say hi"), CommandResult::BrokenPipe);
    pc->stop(true, milliseconds(0));
}

// ── adoption ────────────────────────────────────────────────

TEST_F(ProcessControllerTest, AdoptsMatchingProcessWithoutConsole) {
    pid_t stray = spawn_stray("sleep 60; : " + marker_);
    auto pc = make({"/bin/sleep", "60"});

    auto candidates = pc->find_candidates();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0], stray);

    EXPECT_TRUE(pc->is_running());
    EXPECT_EQ(pc->pid(), stray);
    EXPECT_EQ(pc->handle_kind(), HandleKind::Adopted);
    EXPECT_FALSE(pc->can_send_commands());
    EXPECT_EQ(pc->send_command("stop"), CommandResult::NotAttached);

    auto st = pc->status();
    EXPECT_TRUE(st.running);
    EXPECT_TRUE(st.adopted);
    EXPECT_FALSE(st.can_send_commands);

    // The adopted process gets recorded so the next lookup is direct
    EXPECT_TRUE(fs::exists(pid_file()));

    auto stopped = pc->stop(false, seconds(2));
    EXPECT_TRUE(stopped.ok) << stopped.error;
    EXPECT_FALSE(pc->is_running());
}

TEST_F(ProcessControllerTest, ProcessInOtherDirectoryIsNotAdopted) {
    auto o = options();
    o.server_dir = dir_ + "/elsewhere";
    fs::create_directories(o.server_dir);
    spawn_stray("sleep 60; : " + marker_);

    auto pc = make({"/bin/sleep", "60"}, o);
    EXPECT_TRUE(pc->find_candidates().empty());
    EXPECT_FALSE(pc->is_running());
}

TEST_F(ProcessControllerTest, PidFileProcessIsTracked) {
    pid_t stray = spawn_stray("sleep 60");
    {
        std::ofstream out(pid_file());
        out << stray;
    }

    auto pc = make({"/bin/sleep", "60"});
    EXPECT_EQ(pc->pid(), stray);
    EXPECT_EQ(pc->handle_kind(), HandleKind::Adopted);
    EXPECT_EQ(pc->send_command("list"), CommandResult::NotAttached);
    EXPECT_EQ(sampler_->attached_pid(), stray);
}

// ── tree kill / repairs ─────────────────────────────────────

TEST_F(ProcessControllerTest, TerminateTreeKillsDescendants) {
    pid_t root = spawn_stray("sleep 60 & sleep 60; wait");
    auto pc = make({"/bin/sleep", "60"});

    auto result = pc->terminate_tree(root, seconds(2));
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.escalated);
    EXPECT_GE(result.killed.size(), 2u);
    EXPECT_NE(std::find(result.killed.begin(), result.killed.end(), root), result.killed.end());
}

TEST_F(ProcessControllerTest, TerminateTreeEscalatesToKill) {
    pid_t root = spawn_stray("trap '' TERM; sleep 60");
    auto pc = make({"/bin/sleep", "60"});

    auto result = pc->terminate_tree(root, milliseconds(300));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.escalated);
    EXPECT_NE(std::find(result.killed.begin(), result.killed.end(), root), result.killed.end());
}

TEST_F(ProcessControllerTest, TerminateTreeOfMissingPidIsEmpty) {
    auto pc = make({"/bin/sleep", "60"});
    auto result = pc->terminate_tree(PidRegistry::kMaxPid, seconds(1));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.killed.empty());
}

TEST_F(ProcessControllerTest, FixClearsStalePidFile) {
    pid_t child = fork();
    if (child == 0) _exit(0);
    ASSERT_GT(child, 0);
    waitpid(child, nullptr, 0);
    {
        std::ofstream out(pid_file());
        out << child;
    }

    auto pc = make({"/bin/sleep", "60"});
    auto fixes = pc->fix_common_issues();
    ASSERT_EQ(fixes.size(), 1u);
    EXPECT_NE(fixes[0].find("stale PID file"), std::string::npos);
    EXPECT_FALSE(fs::exists(pid_file()));

    EXPECT_TRUE(pc->fix_common_issues().empty());
}

TEST_F(ProcessControllerTest, FixClearsCorruptPidFile) {
    {
        std::ofstream out(pid_file());
        out << "garbage";
    }
    auto pc = make({"/bin/sleep", "60"});
    auto fixes = pc->fix_common_issues();
    ASSERT_EQ(fixes.size(), 1u);
    EXPECT_EQ(fixes[0], "Cleared corrupt PID file");
    EXPECT_FALSE(fs::exists(pid_file()));
}

TEST_F(ProcessControllerTest, DebugInfoWhenIdle) {
    auto pc = make({"/bin/sleep", "60"});
    auto info = pc->debug_info();
    EXPECT_FALSE(info.pid_file_exists);
    EXPECT_FALSE(info.saved_pid.has_value());
    EXPECT_EQ(info.handle_kind, HandleKind::None);
    EXPECT_FALSE(info.can_send_commands);
    EXPECT_TRUE(info.candidate_pids.empty());
    EXPECT_FALSE(info.lock_file_exists);
}

TEST_F(ProcessControllerTest, StatusOfRunningServer) {
    auto pc = make({"/bin/sleep", "60"});
    auto started = pc->start();
    ASSERT_TRUE(started.ok);

    auto st = pc->status();
    EXPECT_TRUE(st.running);
    EXPECT_FALSE(st.adopted);
    EXPECT_TRUE(st.can_send_commands);
    EXPECT_EQ(st.pid, started.pid);
    EXPECT_GE(st.threads, 1);
    EXPECT_GE(st.uptime_seconds, 0.0);
    EXPECT_EQ(st.debug.saved_pid, started.pid);
    EXPECT_EQ(st.debug.lock_holder_pid, ::getpid());

    pc->stop(true, milliseconds(0));
    EXPECT_FALSE(pc->status().running);
}
