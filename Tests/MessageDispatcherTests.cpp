#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "Core/Log.hpp"
#include "Core/MessageDispatcher.hpp"

class MessageDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        SetLogSink([this](const std::string& s) { logs.push_back(s); });
    }
    void TearDown() override { SetLogSink(nullptr); }

    StateStore store{ 3 };
    MessageDispatcher dispatcher{ store };
    std::vector<std::string> logs;
};

TEST_F(MessageDispatcherTest, StatusReplacesSystemStatus) {
    EXPECT_EQ(dispatcher.dispatch(R"({"type":"status","data":{"arduino_connected":true,"websocket_clients":2,"is_recording":true,"readings_count":7}})"),
              DispatchResult::Applied);
    auto s = store.snapshot();
    ASSERT_TRUE(s->system.has_value());
    EXPECT_EQ(s->system->clientCount, 2);
    EXPECT_TRUE(s->isRecording);
}

TEST_F(MessageDispatcherTest, StatusThenRecordingStopped) {
    dispatcher.dispatch(R"({"type":"status","data":{"arduino_connected":true,"websocket_clients":1,"is_recording":true,"readings_count":0}})");
    dispatcher.dispatch(R"({"type":"recording_stopped"})");

    auto s = store.snapshot();
    EXPECT_FALSE(s->isRecording);
    EXPECT_TRUE(s->system->isRecording);
}

TEST_F(MessageDispatcherTest, RecordingStartedSetsFlag) {
    dispatcher.dispatch(R"({"type":"recording_started"})");
    EXPECT_TRUE(store.snapshot()->isRecording);
}

TEST_F(MessageDispatcherTest, ReadingsAreAppendedAndBounded) {
    for (int i = 1; i <= 5; ++i) {
        const std::string raw = R"({"timestamp":"R)" + std::to_string(i) + R"(","rpm":)" + std::to_string(i * 100) + R"(,"lift_force":1.0})";
        EXPECT_EQ(dispatcher.dispatch(raw), DispatchResult::Applied);
    }
    auto s = store.snapshot();
    ASSERT_EQ(s->readings.size(), 3u);
    EXPECT_EQ(s->readings[0].timestamp, "R3");
    EXPECT_EQ(s->readings[2].timestamp, "R5");
    EXPECT_DOUBLE_EQ(s->readings[2].rpm, 500.0);
}

TEST_F(MessageDispatcherTest, ReadingsClearedKeepsStatus) {
    dispatcher.dispatch(R"({"type":"status","data":{"arduino_connected":false,"websocket_clients":1,"is_recording":true,"readings_count":9}})");
    dispatcher.dispatch(R"({"timestamp":"t","rpm":1,"lift_force":1})");
    dispatcher.dispatch(R"({"type":"readings_cleared"})");

    auto s = store.snapshot();
    EXPECT_TRUE(s->readings.empty());
    EXPECT_TRUE(s->isRecording);
    EXPECT_EQ(s->system->readingsCount, 9);
}

TEST_F(MessageDispatcherTest, PongIsCountedWithoutMutation) {
    const auto rev = store.snapshot()->revision;
    EXPECT_EQ(dispatcher.dispatch(R"({"type":"pong"})"), DispatchResult::Ignored);
    EXPECT_EQ(store.snapshot()->revision, rev);
    EXPECT_EQ(dispatcher.stats().pongs, 1u);
}

TEST_F(MessageDispatcherTest, UnknownTypeLeavesStoreUnchanged) {
    const auto rev = store.snapshot()->revision;
    EXPECT_EQ(dispatcher.dispatch(R"({"type":"firmware_update","version":"2"})"), DispatchResult::Ignored);
    EXPECT_EQ(store.snapshot()->revision, rev);
}

TEST_F(MessageDispatcherTest, MalformedFrameIsDroppedAndLogged) {
    const auto rev = store.snapshot()->revision;
    EXPECT_EQ(dispatcher.dispatch("{broken"), DispatchResult::DecodeFailed);
    EXPECT_EQ(store.snapshot()->revision, rev);

    auto st = dispatcher.stats();
    EXPECT_EQ(st.decodeFailures, 1u);
    EXPECT_FALSE(st.lastDecodeError.empty());
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("[WARN]"), std::string::npos);
}

TEST_F(MessageDispatcherTest, StatsCountEveryFrame) {
    dispatcher.dispatch(R"({"type":"recording_started"})");
    dispatcher.dispatch(R"({"type":"nope"})");
    dispatcher.dispatch("x");

    auto st = dispatcher.stats();
    EXPECT_EQ(st.received, 3u);
    EXPECT_EQ(st.applied, 1u);
    EXPECT_EQ(st.ignored, 1u);
    EXPECT_EQ(st.decodeFailures, 1u);
}
