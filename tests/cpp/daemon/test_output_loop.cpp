#include "daemon/output/output_loop.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <deque>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace segue::daemon_output;
using segue::ErrorCode;

namespace {

// Scripted sink: open() and write() consume queued results, then succeed.
class FakeSink : public AudioSink {
   public:
    std::deque<bool> openResults;
    std::deque<long> writeResults;
    std::vector<std::vector<std::int32_t>> writes;
    int opens = 0;
    int closes = 0;

    bool open(int sampleRate, unsigned int channels) override {
        ++opens;
        lastRate = sampleRate;
        lastChannels = channels;
        bool ok = true;
        if (!openResults.empty()) {
            ok = openResults.front();
            openResults.pop_front();
        }
        open_ = ok;
        return ok;
    }
    void close() override {
        ++closes;
        open_ = false;
    }
    bool isOpen() const override {
        return open_;
    }
    bool alive() const override {
        return open_;
    }
    long write(const std::int32_t* interleaved, size_t frames) override {
        long result = static_cast<long>(frames);
        if (!writeResults.empty()) {
            result = writeResults.front();
            writeResults.pop_front();
        }
        if (result >= 0) {
            writes.emplace_back(interleaved, interleaved + frames * 2);
        }
        return result;
    }
    size_t periodFrames() const override {
        return open_ ? 20 : 0;
    }
    const std::string& device() const override {
        return name_;
    }

    int lastRate = 0;
    unsigned int lastChannels = 0;

   private:
    bool open_ = false;
    std::string name_ = "fake";
};

OutputLoop::Config loopConfig() {
    OutputLoop::Config config;
    config.sampleRate = 1000;  // 1 frame per ms
    config.periodFrames = 20;
    config.retryAttempts = 3;
    config.retryDelayMs = 0;
    config.resumeRamp.resumeFadeMs = 10;
    config.resumeRamp.resumeCurve = segue::audio::FadeCurve::Linear;
    config.realtime.enabled = false;
    return config;
}

}  // namespace

class OutputLoopTest : public ::testing::Test {
   protected:
    FakeSink sink;
    int renders = 0;
    std::vector<std::pair<ErrorCode, std::string>> failures;

    std::unique_ptr<OutputLoop> makeLoop(OutputLoop::Config config = loopConfig()) {
        return std::make_unique<OutputLoop>(
            sink, config,
            [this](float* out, size_t frames) {
                ++renders;
                std::fill(out, out + frames * 2, 1.0f);
            },
            [this](ErrorCode code, const std::string& message) {
                failures.emplace_back(code, message);
            });
    }
};

TEST(OutputLoopConversion, FloatToS32ClampsAndScales) {
    const std::vector<float> in = {0.0f, 1.0f, -1.0f, 2.0f, -3.0f, 0.5f};
    std::vector<std::int32_t> out(in.size(), 0);
    floatToS32(in.data(), out.data(), in.size());
    EXPECT_EQ(out[0], 0);
    EXPECT_EQ(out[1], std::numeric_limits<std::int32_t>::max());
    EXPECT_EQ(out[2], -std::numeric_limits<std::int32_t>::max());
    EXPECT_EQ(out[3], std::numeric_limits<std::int32_t>::max());
    EXPECT_EQ(out[4], -std::numeric_limits<std::int32_t>::max());
    EXPECT_EQ(out[5], 1073741824);
}

TEST_F(OutputLoopTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(OutputLoop(sink, loopConfig(), nullptr, nullptr), std::invalid_argument);
    OutputLoop::Config config = loopConfig();
    config.periodFrames = 0;
    EXPECT_THROW(makeLoop(config), std::invalid_argument);
}

TEST_F(OutputLoopTest, RendersAndWritesPeriods) {
    auto loop = makeLoop();
    EXPECT_EQ(loop->state(), OutputState::Stopped);
    loop->open();
    EXPECT_EQ(loop->state(), OutputState::Running);
    EXPECT_EQ(sink.lastRate, 1000);
    EXPECT_EQ(sink.lastChannels, 2u);

    loop->runOnce();
    loop->runOnce();
    EXPECT_EQ(renders, 2);
    EXPECT_EQ(loop->periodsWritten(), 2u);
    ASSERT_EQ(sink.writes.size(), 2u);
    EXPECT_EQ(sink.writes[0].size(), 40u);
    EXPECT_EQ(sink.writes[0][0], std::numeric_limits<std::int32_t>::max());
}

TEST_F(OutputLoopTest, StoppedLoopDoesNothing) {
    auto loop = makeLoop();
    loop->runOnce();
    EXPECT_EQ(renders, 0);
    EXPECT_TRUE(sink.writes.empty());
}

TEST_F(OutputLoopTest, FailedWriteKeepsPeriodAndFadesItInAfterReopen) {
    auto loop = makeLoop();
    loop->open();
    sink.writeResults = {-EIO};

    loop->runOnce();
    EXPECT_EQ(loop->state(), OutputState::Recovering);
    EXPECT_EQ(renders, 1);
    EXPECT_TRUE(sink.writes.empty());

    loop->runOnce();
    EXPECT_EQ(loop->state(), OutputState::Running);
    EXPECT_EQ(renders, 1);
    EXPECT_EQ(loop->recoveries(), 1u);
    ASSERT_EQ(sink.writes.size(), 1u);
    const auto& period = sink.writes[0];
    EXPECT_EQ(period[0], 0);
    EXPECT_EQ(period[5 * 2], 1073741824);
    EXPECT_EQ(period[15 * 2], std::numeric_limits<std::int32_t>::max());
    EXPECT_TRUE(failures.empty());
}

TEST_F(OutputLoopTest, OpenFailureEntersRecovery) {
    sink.openResults = {false, false};
    auto loop = makeLoop();
    loop->open();
    EXPECT_EQ(loop->state(), OutputState::Recovering);

    loop->runOnce();
    EXPECT_EQ(loop->state(), OutputState::Recovering);
    loop->runOnce();
    EXPECT_EQ(loop->state(), OutputState::Running);
    EXPECT_EQ(renders, 0);
    loop->runOnce();
    EXPECT_EQ(renders, 1);
}

TEST_F(OutputLoopTest, ExhaustedRetriesHaltAndReportOnce) {
    auto loop = makeLoop();
    loop->open();
    sink.writeResults = {-ENODEV};
    sink.openResults = {false, false, false, false};

    loop->runOnce();  // write fails
    loop->runOnce();
    loop->runOnce();
    EXPECT_EQ(loop->state(), OutputState::Recovering);
    loop->runOnce();
    EXPECT_EQ(loop->state(), OutputState::Halted);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].first, ErrorCode::DAC_DEVICE_LOST);

    // Halted: device checks continue without rendering or reporting again.
    loop->runOnce();
    EXPECT_EQ(loop->state(), OutputState::Halted);
    EXPECT_EQ(renders, 1);
    EXPECT_EQ(failures.size(), 1u);

    // Device returns: output resumes, the dropped period is not replayed.
    loop->runOnce();
    EXPECT_EQ(loop->state(), OutputState::Running);
    EXPECT_TRUE(sink.writes.empty());
    loop->runOnce();
    EXPECT_EQ(renders, 2);
    ASSERT_EQ(sink.writes.size(), 1u);
    EXPECT_EQ(sink.writes[0][0], 0);
}

TEST_F(OutputLoopTest, StopClosesSink) {
    auto loop = makeLoop();
    loop->open();
    loop->stop();
    EXPECT_EQ(loop->state(), OutputState::Stopped);
    EXPECT_FALSE(sink.isOpen());
}

TEST_F(OutputLoopTest, ThreadWritesUntilStopped) {
    auto loop = makeLoop();
    loop->start();
    while (loop->periodsWritten() < 3) {
        std::this_thread::yield();
    }
    loop->stop();
    EXPECT_GE(renders, 3);
    EXPECT_EQ(loop->state(), OutputState::Stopped);
}

TEST_F(OutputLoopTest, InvalidRealtimePriorityIsReportedAndLoopStillRuns) {
    OutputLoop::Config config = loopConfig();
    config.realtime.enabled = true;
    config.realtime.priority = 0;
    auto loop = makeLoop(config);
    loop->start();
    while (loop->periodsWritten() < 1) {
        std::this_thread::yield();
    }
    loop->stop();
    EXPECT_EQ(loop->realtimeStatus(), ErrorCode::VALIDATION_INVALID_CONFIG);
}

TEST_F(OutputLoopTest, DisabledRealtimeReportsOk) {
    auto loop = makeLoop();
    loop->start();
    while (loop->periodsWritten() < 1) {
        std::this_thread::yield();
    }
    loop->stop();
    EXPECT_EQ(loop->realtimeStatus(), ErrorCode::OK);
}

TEST(OutputLoopState, Names) {
    EXPECT_STREQ(toString(OutputState::Running), "running");
    EXPECT_STREQ(toString(OutputState::Halted), "halted");
}
