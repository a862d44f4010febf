#include "core/error_codes.h"
#include "daemon/core/pid_lock.h"
#include "gtest/gtest.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;
using segue::EngineError;
using segue::ErrorCode;
using segue::daemon_core::PidLock;

namespace {

// PID of a child that has already been reaped.
pid_t deadPid() {
    const pid_t child = fork();
    if (child == 0) {
        _exit(0);
    }
    int status = 0;
    waitpid(child, &status, 0);
    return child;
}

void writePidFile(const fs::path& path, pid_t pid) {
    std::ofstream out(path);
    out << pid << '\n';
}

}  // namespace

class PidLockTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path lockPath;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info ? info->name() : "pid_lock";
        for (char& c : name) {
            if (!std::isalnum(static_cast<unsigned char>(c))) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("segue_pid_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        lockPath = tempDir / "segue_daemon.pid";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }
};

TEST_F(PidLockTest, AcquireRecordsPidAndReleaseRemovesFile) {
    {
        PidLock lock = PidLock::acquire(lockPath.string());
        EXPECT_EQ(lock.path(), lockPath.string());
        EXPECT_FALSE(lock.reclaimedFrom().has_value());
        EXPECT_EQ(PidLock::recordedPid(lockPath.string()), getpid());
    }
    EXPECT_FALSE(fs::exists(lockPath));
}

TEST_F(PidLockTest, SecondInstanceIsReportedAsAlreadyRunning) {
    PidLock lock = PidLock::acquire(lockPath.string());

    const pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        try {
            PidLock second = PidLock::acquire(lockPath.string());
            _exit(1);
        } catch (const EngineError& e) {
            const bool namesHolder =
                std::string(e.what()).find(std::to_string(getppid())) != std::string::npos;
            _exit(e.code() == ErrorCode::RESOURCE_ALREADY_RUNNING && namesHolder ? 0 : 2);
        }
    }

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_EQ(PidLock::recordedPid(lockPath.string()), getpid());
}

TEST_F(PidLockTest, StaleFileIsReclaimedByDefault) {
    const pid_t gone = deadPid();
    ASSERT_FALSE(PidLock::isProcessAlive(gone));
    writePidFile(lockPath, gone);

    PidLock lock = PidLock::acquire(lockPath.string());
    ASSERT_TRUE(lock.reclaimedFrom().has_value());
    EXPECT_EQ(*lock.reclaimedFrom(), gone);
    EXPECT_EQ(PidLock::recordedPid(lockPath.string()), getpid());
}

TEST_F(PidLockTest, StaleFileIsRefusedWhenReclaimDisabled) {
    const pid_t gone = deadPid();
    writePidFile(lockPath, gone);

    PidLock::Policy policy;
    policy.reclaimStale = false;
    try {
        PidLock lock = PidLock::acquire(lockPath.string(), policy);
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RESOURCE_PID_FILE);
    }
    // Left untouched for the operator.
    EXPECT_EQ(PidLock::recordedPid(lockPath.string()), gone);
}

TEST_F(PidLockTest, GarbageContentIsOverwritten) {
    {
        std::ofstream out(lockPath);
        out << "not a pid\n";
    }
    PidLock lock = PidLock::acquire(lockPath.string());
    EXPECT_FALSE(lock.reclaimedFrom().has_value());
    EXPECT_EQ(PidLock::recordedPid(lockPath.string()), getpid());
}

TEST_F(PidLockTest, MovedLockReleasesOnce) {
    std::optional<PidLock> lock(PidLock::acquire(lockPath.string()));
    PidLock moved = std::move(*lock);
    lock.reset();
    EXPECT_TRUE(fs::exists(lockPath));

    {
        PidLock sink = std::move(moved);
        EXPECT_EQ(sink.path(), lockPath.string());
    }
    EXPECT_FALSE(fs::exists(lockPath));
    EXPECT_NO_THROW(PidLock::acquire(lockPath.string()));
}

TEST_F(PidLockTest, MissingDirectoryIsPidFileError) {
    const fs::path missing = tempDir / "missing" / "segue_daemon.pid";
    try {
        PidLock lock = PidLock::acquire(missing.string());
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RESOURCE_PID_FILE);
        EXPECT_NE(std::string(e.what()).find(missing.string()), std::string::npos);
    }
}
