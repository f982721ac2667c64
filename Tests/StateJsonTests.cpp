#include <gtest/gtest.h>
#include "utils/StateJson.hpp"

static StoreSnapshot MakeSnapshot() {
    StoreSnapshot s;
    s.connection = ConnectionStatus::Connected;
    s.capacity = 10;
    s.revision = 7;
    for (int i = 1; i <= 4; ++i) {
        Reading r;
        r.timestamp = "t" + std::to_string(i);
        r.rpm = i * 100.0;
        r.liftForce = i * 0.5;
        if (i % 2 == 0) r.extra["drag_force"] = i * 0.1;
        s.readings.push_back(r);
    }
    return s;
}

TEST(StateJson, CompactSnapshot) {
    auto s = MakeSnapshot();
    auto j = SnapshotToJson(s, false);
    EXPECT_EQ(j["connection"], "connected");
    EXPECT_TRUE(j["system"].is_null());
    EXPECT_EQ(j["count"], 4);
    EXPECT_EQ(j["capacity"], 10);
    EXPECT_EQ(j["revision"], 7);
    EXPECT_EQ(j["latest"]["timestamp"], "t4");
    EXPECT_FALSE(j.contains("readings"));
}

TEST(StateJson, VerboseSnapshotIncludesReadingsAndSystem) {
    auto s = MakeSnapshot();
    s.system = SystemStatus{ true, 2, true, 40 };
    s.isRecording = true;
    auto j = SnapshotToJson(s, true);
    ASSERT_TRUE(j["readings"].is_array());
    EXPECT_EQ(j["readings"].size(), 4u);
    EXPECT_EQ(j["system"]["arduino_connected"], true);
    EXPECT_EQ(j["system"]["websocket_clients"], 2);
    EXPECT_EQ(j["system"]["readings_count"], 40);
    EXPECT_EQ(j["is_recording"], true);
}

TEST(StateJson, EmptySnapshotHasNullLatest) {
    StoreSnapshot s;
    EXPECT_TRUE(SnapshotToJson(s, false)["latest"].is_null());
}

TEST(StateJson, ReadingsLimitKeepsNewest) {
    auto j = ReadingsToJson(MakeSnapshot(), 2);
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["timestamp"], "t3");
    EXPECT_EQ(j[1]["timestamp"], "t4");
    EXPECT_DOUBLE_EQ(j[1]["drag_force"].get<double>(), 0.4);

    EXPECT_EQ(ReadingsToJson(MakeSnapshot(), 0).size(), 4u);
    EXPECT_EQ(ReadingsToJson(MakeSnapshot(), 99).size(), 4u);
}

TEST(StateJson, SeriesSkipsReadingsWithoutField) {
    auto j = SeriesToJson(MakeSnapshot(), "drag_force", 0);
    EXPECT_EQ(j["key"], "drag_force");
    ASSERT_EQ(j["points"].size(), 2u);
    EXPECT_EQ(j["points"][0][0], "t2");
    EXPECT_DOUBLE_EQ(j["points"][1][1].get<double>(), 0.4);

    auto rpm = SeriesToJson(MakeSnapshot(), "rpm", 3);
    ASSERT_EQ(rpm["points"].size(), 3u);
    EXPECT_DOUBLE_EQ(rpm["points"][0][1].get<double>(), 200.0);
}

TEST(StateJson, StoreEventPayloads) {
    auto s = MakeSnapshot();
    auto added = StoreEventToJson(StoreEvent{ StoreChange::ReadingAdded, 8 }, s);
    EXPECT_EQ(added["type"], "reading");
    EXPECT_EQ(added["revision"], 8);
    EXPECT_EQ(added["reading"]["timestamp"], "t4");
    EXPECT_EQ(added["count"], 4);

    auto conn = StoreEventToJson(StoreEvent{ StoreChange::Connection, 9 }, s);
    EXPECT_EQ(conn["type"], "connection");
    EXPECT_EQ(conn["connection"], "connected");
}

TEST(StateJson, ConnectionInfoAndStats) {
    ConnectionInfo info;
    info.status = ConnectionStatus::Error;
    info.url = "ws://x/ws";
    info.attempts = 3;
    info.reconnectPending = true;
    auto j = ConnectionInfoToJson(info);
    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["attempts"], 3);
    EXPECT_EQ(j["reconnect_pending"], true);

    DispatchStats d;
    d.received = 5;
    d.decodeFailures = 1;
    d.lastDecodeError = "syntax error";
    auto ds = DispatchStatsToJson(d);
    EXPECT_EQ(ds["received"], 5);
    EXPECT_EQ(ds["decode_failures"], 1);
    EXPECT_EQ(ds["last_decode_error"], "syntax error");
}
