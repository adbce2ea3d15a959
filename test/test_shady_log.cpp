#include <gtest/gtest.h>

#include <shady_log.h>

#include <string>
#include <vector>

using namespace SHADY;

namespace {
    std::vector<std::string> captured;

    void captureSink(LogLevel level, const char *tag, const char *message) {
        captured.push_back(std::string(logLevelToString(level)) + " " + tag + ": " + message);
    }

    class ShadyLogTest : public ::testing::Test {
    protected:
        void SetUp() override {
            captured.clear();
            setLogSink(captureSink);
        }
        void TearDown() override {
            setLogSink(nullptr);
            setLogLevel(LogLevel::Info);
        }
    };
}

TEST_F(ShadyLogTest, FormatsThroughSink) {
    SHADY_LOGI("kitchen", "state update from %s to %s", "stopped", "closing");
    ASSERT_EQ(1u, captured.size());
    EXPECT_EQ("I kitchen: state update from stopped to closing", captured[0]);
}

TEST_F(ShadyLogTest, FiltersAboveLevel) {
    SHADY_LOGD("kitchen", "position: %d", 42);
    EXPECT_TRUE(captured.empty());

    setLogLevel(LogLevel::Debug);
    SHADY_LOGD("kitchen", "position: %d", 42);
    EXPECT_EQ(1u, captured.size());

    setLogLevel(LogLevel::Error);
    SHADY_LOGW("kitchen", "dropped");
    SHADY_LOGE("kitchen", "kept");
    ASSERT_EQ(2u, captured.size());
    EXPECT_EQ("E kitchen: kept", captured[1]);
}

TEST_F(ShadyLogTest, NoSinkIsSilent) {
    setLogSink(nullptr);
    SHADY_LOGE("kitchen", "nowhere");
    EXPECT_TRUE(captured.empty());
}
