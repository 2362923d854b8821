#include <gtest/gtest.h>
#include "daemon/process_lock.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

class ProcessLockTest : public ::testing::Test {
protected:
    std::string dir_;

    void SetUp() override {
        dir_ = "/tmp/craft_lock_" + std::to_string(::getpid());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string lock_path() const { return dir_ + "/craft.lock"; }
};

TEST_F(ProcessLockTest, AcquireWritesPid) {
    ProcessLock lock(dir_, "craft");
    ASSERT_TRUE(lock.acquire());
    EXPECT_TRUE(lock.held());
    EXPECT_TRUE(lock.file_exists());
    ASSERT_TRUE(lock.holder_pid().has_value());
    EXPECT_EQ(*lock.holder_pid(), ::getpid());
}

TEST_F(ProcessLockTest, SecondHolderInSameProcessIsRefused) {
    ProcessLock first(dir_, "craft");
    ProcessLock second(dir_, "craft");
    ASSERT_TRUE(first.acquire());
    EXPECT_FALSE(second.acquire());
    EXPECT_FALSE(second.held());

    // The refused attempt must not wipe the holder's PID
    EXPECT_EQ(first.holder_pid(), ::getpid());
}

TEST_F(ProcessLockTest, ReleaseLetsAnotherAcquire) {
    ProcessLock first(dir_, "craft");
    ProcessLock second(dir_, "craft");
    ASSERT_TRUE(first.acquire());
    first.release();
    EXPECT_FALSE(first.held());
    EXPECT_FALSE(fs::exists(lock_path()));
    EXPECT_TRUE(second.acquire());
}

TEST_F(ProcessLockTest, ReleaseIsIdempotent) {
    ProcessLock lock(dir_, "craft");
    lock.release();
    ASSERT_TRUE(lock.acquire());
    lock.release();
    lock.release();
    EXPECT_FALSE(lock.held());
}

TEST_F(ProcessLockTest, AcquireTwiceByHolderSucceeds) {
    ProcessLock lock(dir_, "craft");
    ASSERT_TRUE(lock.acquire());
    EXPECT_TRUE(lock.acquire());
}

TEST_F(ProcessLockTest, DestructorReleases) {
    {
        ProcessLock lock(dir_, "craft");
        ASSERT_TRUE(lock.acquire());
    }
    EXPECT_FALSE(fs::exists(lock_path()));
    ProcessLock again(dir_, "craft");
    EXPECT_TRUE(again.acquire());
}

TEST_F(ProcessLockTest, WaiterOnOldFileSeesItUnlinked) {
    ProcessLock holder(dir_, "craft");
    ASSERT_TRUE(holder.acquire());

    // A contender that opened the file before the release and blocks on it
    int old_fd = open(lock_path().c_str(), O_RDONLY | O_CLOEXEC);
    ASSERT_GE(old_fd, 0);
    struct stat old_st;
    ASSERT_EQ(fstat(old_fd, &old_st), 0);

    std::atomic<bool> woke{false};
    std::atomic<bool> path_still_same{false};
    std::thread waiter([&] {
        if (flock(old_fd, LOCK_EX) == 0) {
            struct stat now_st;
            path_still_same = stat(lock_path().c_str(), &now_st) == 0 &&
                              now_st.st_ino == old_st.st_ino && now_st.st_dev == old_st.st_dev;
            woke = true;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(woke.load());
    holder.release();
    waiter.join();
    close(old_fd);

    EXPECT_TRUE(woke.load());
    EXPECT_FALSE(path_still_same.load());
}

TEST_F(ProcessLockTest, ConcurrentContendersNeverOverlap) {
    std::atomic<int> holders{0};
    std::atomic<int> max_holders{0};
    std::atomic<int> acquisitions{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 300; ++i) {
                ProcessLock lock(dir_, "craft");
                if (!lock.acquire()) continue;
                int now = ++holders;
                int seen = max_holders.load();
                while (now > seen && !max_holders.compare_exchange_weak(seen, now)) {}
                ++acquisitions;
                std::this_thread::yield();
                --holders;
                lock.release();
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_GT(acquisitions.load(), 0);
    EXPECT_EQ(max_holders.load(), 1);
    EXPECT_FALSE(fs::exists(lock_path()));
}

TEST_F(ProcessLockTest, StaleFileWithDeadPidIsReclaimed) {
    // Reap a child so its PID is known to be gone
    pid_t child = fork();
    if (child == 0) _exit(0);
    ASSERT_GT(child, 0);
    waitpid(child, nullptr, 0);

    {
        std::ofstream out(lock_path());
        out << child;
    }

    ProcessLock lock(dir_, "craft");
    EXPECT_TRUE(lock.acquire());
    EXPECT_EQ(lock.holder_pid(), ::getpid());
}

TEST_F(ProcessLockTest, GarbageFileNobodyHoldsIsReclaimed) {
    {
        std::ofstream out(lock_path());
        out << "not a pid";
    }
    ProcessLock lock(dir_, "craft");
    EXPECT_TRUE(lock.acquire());
}

TEST_F(ProcessLockTest, HeldByOtherProcessIsRefused) {
    int ready[2];
    ASSERT_EQ(pipe(ready), 0);

    pid_t child = fork();
    if (child == 0) {
        close(ready[0]);
        ProcessLock lock(dir_, "craft");
        char ok = lock.acquire() ? '1' : '0';
        if (write(ready[1], &ok, 1) != 1) _exit(2);
        pause();
        _exit(0);
    }
    ASSERT_GT(child, 0);
    close(ready[1]);

    char ok = 0;
    ASSERT_EQ(read(ready[0], &ok, 1), 1);
    close(ready[0]);
    ASSERT_EQ(ok, '1');

    ProcessLock mine(dir_, "craft");
    EXPECT_FALSE(mine.acquire());
    EXPECT_EQ(mine.holder_pid(), child);

    kill(child, SIGKILL);
    waitpid(child, nullptr, 0);

    // The kernel dropped the dead holder's flock; the file is now stale
    ProcessLock after(dir_, "craft");
    EXPECT_TRUE(after.acquire());
}

TEST_F(ProcessLockTest, MissingDirectoryFails) {
    ProcessLock lock(dir_ + "/nope", "craft");
    EXPECT_FALSE(lock.acquire());
    EXPECT_FALSE(lock.held());
}
