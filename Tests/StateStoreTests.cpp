#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "Core/StateStore.hpp"

static Reading MakeReading(const std::string& ts, double rpm = 100.0) {
    Reading r;
    r.timestamp = ts;
    r.rpm = rpm;
    r.liftForce = rpm / 100.0;
    return r;
}

static SystemStatus MakeStatus(bool recording, int count = 0) {
    SystemStatus s;
    s.deviceConnected = true;
    s.clientCount = 1;
    s.isRecording = recording;
    s.readingsCount = count;
    return s;
}

TEST(StateStore, InitialSnapshot) {
    StateStore store(5);
    auto s = store.snapshot();
    EXPECT_EQ(s->connection, ConnectionStatus::Disconnected);
    EXPECT_FALSE(s->system.has_value());
    EXPECT_FALSE(s->isRecording);
    EXPECT_TRUE(s->readings.empty());
    EXPECT_EQ(s->capacity, 5u);
    EXPECT_EQ(s->revision, 0u);
    EXPECT_EQ(s->latest(), nullptr);
}

TEST(StateStore, StatusAlignsRecordingFlag) {
    StateStore store;
    store.setSystemStatus(MakeStatus(true, 42));

    auto s = store.snapshot();
    ASSERT_TRUE(s->system.has_value());
    EXPECT_TRUE(s->system->isRecording);
    EXPECT_EQ(s->system->readingsCount, 42);
    EXPECT_TRUE(s->isRecording);
}

TEST(StateStore, RecordingStoppedLeavesSystemStatusUntouched) {
    StateStore store;
    store.setSystemStatus(MakeStatus(true));
    store.setRecording(false);

    auto s = store.snapshot();
    EXPECT_FALSE(s->isRecording);
    ASSERT_TRUE(s->system.has_value());
    EXPECT_TRUE(s->system->isRecording);
}

TEST(StateStore, ClearOnlyEmptiesReadings) {
    StateStore store;
    store.setSystemStatus(MakeStatus(true, 2));
    store.addReading(MakeReading("t1"));
    store.addReading(MakeReading("t2"));
    store.clearReadings();

    auto s = store.snapshot();
    EXPECT_TRUE(s->readings.empty());
    EXPECT_TRUE(s->isRecording);
    ASSERT_TRUE(s->system.has_value());
    EXPECT_EQ(s->system->readingsCount, 2);
}

TEST(StateStore, ReadingsAreBounded) {
    StateStore store(3);
    for (int i = 1; i <= 5; ++i) store.addReading(MakeReading("R" + std::to_string(i)));

    auto s = store.snapshot();
    ASSERT_EQ(s->readings.size(), 3u);
    EXPECT_EQ(s->readings.front().timestamp, "R3");
    ASSERT_NE(s->latest(), nullptr);
    EXPECT_EQ(s->latest()->timestamp, "R5");
}

TEST(StateStore, SnapshotIsImmutableAfterMutation) {
    StateStore store;
    store.addReading(MakeReading("t1"));
    auto before = store.snapshot();

    store.addReading(MakeReading("t2"));
    store.setConnectionStatus(ConnectionStatus::Connected);
    auto after = store.snapshot();

    EXPECT_EQ(before->readings.size(), 1u);
    EXPECT_EQ(before->connection, ConnectionStatus::Disconnected);
    EXPECT_EQ(after->readings.size(), 2u);
    EXPECT_EQ(after->connection, ConnectionStatus::Connected);
    EXPECT_GT(after->revision, before->revision);
}

TEST(StateStore, SnapshotIsSharedUntilNextMutation) {
    StateStore store;
    store.addReading(MakeReading("t1"));
    auto a = store.snapshot();
    auto b = store.snapshot();
    EXPECT_EQ(a.get(), b.get());

    store.setRecording(true);
    EXPECT_NE(store.snapshot().get(), a.get());
}

TEST(StateStore, ListenersReceiveEveryMutation) {
    StateStore store;
    std::vector<StoreEvent> seen;
    store.subscribe([&](const StoreEvent& ev) { seen.push_back(ev); });

    store.setConnectionStatus(ConnectionStatus::Connecting);
    store.setSystemStatus(MakeStatus(false));
    store.setRecording(true);
    store.addReading(MakeReading("t"));
    store.clearReadings();

    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen[0].what, StoreChange::Connection);
    EXPECT_EQ(seen[1].what, StoreChange::System);
    EXPECT_EQ(seen[2].what, StoreChange::Recording);
    EXPECT_EQ(seen[3].what, StoreChange::ReadingAdded);
    EXPECT_EQ(seen[4].what, StoreChange::ReadingsCleared);
    for (std::size_t i = 0; i < seen.size(); ++i) EXPECT_EQ(seen[i].revision, i + 1);
}

TEST(StateStore, ListenerSeesCommittedState) {
    StateStore store;
    std::size_t countInListener = 0;
    store.subscribe([&](const StoreEvent&) { countInListener = store.snapshot()->readings.size(); });

    store.addReading(MakeReading("t"));
    EXPECT_EQ(countInListener, 1u);
}

TEST(StateStore, UnsubscribeStopsNotifications) {
    StateStore store;
    int calls = 0;
    auto id = store.subscribe([&](const StoreEvent&) { ++calls; });
    store.setRecording(true);
    store.unsubscribe(id);
    store.setRecording(false);
    EXPECT_EQ(calls, 1);
}

TEST(StateStore, ThrowingListenerDoesNotBreakOthers) {
    StateStore store;
    int calls = 0;
    store.subscribe([](const StoreEvent&) { throw std::runtime_error("boom"); });
    store.subscribe([&](const StoreEvent&) { ++calls; });

    EXPECT_NO_THROW(store.setRecording(true));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(store.snapshot()->isRecording);
}

TEST(StateStore, ChangeNames) {
    EXPECT_STREQ(ToString(StoreChange::ReadingAdded), "reading");
    EXPECT_STREQ(ToString(StoreChange::ReadingsCleared), "readings_cleared");
    EXPECT_STREQ(ToString(ConnectionStatus::Error), "error");
}
