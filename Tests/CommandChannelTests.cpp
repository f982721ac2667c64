#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "Core/CommandChannel.hpp"
#include "Core/Log.hpp"
#include "FakeTransport.hpp"

using namespace std::chrono_literals;
using Kind = TransportEvent::Kind;

TEST(CommandSerialization, CommandEnvelope) {
    auto j = nlohmann::json::parse(SerializeCommand(CommandAction::StartRecording));
    EXPECT_EQ(j, (nlohmann::json{ {"type", "command"}, {"action", "start_recording"} }));

    EXPECT_EQ(nlohmann::json::parse(SerializeCommand(CommandAction::StopRecording))["action"], "stop_recording");
    EXPECT_EQ(nlohmann::json::parse(SerializeCommand(CommandAction::Clear))["action"], "clear");
    EXPECT_EQ(nlohmann::json::parse(SerializeCommand(CommandAction::GetStatus))["action"], "get_status");
}

TEST(CommandSerialization, PingIsBare) {
    auto j = nlohmann::json::parse(SerializeCommand(CommandAction::Ping));
    EXPECT_EQ(j, (nlohmann::json{ {"type", "ping"} }));
}

TEST(CommandSerialization, ParseActionNames) {
    EXPECT_EQ(ParseCommandAction("start_recording"), CommandAction::StartRecording);
    EXPECT_EQ(ParseCommandAction("  STOP_RECORDING "), CommandAction::StopRecording);
    EXPECT_EQ(ParseCommandAction("Ping"), CommandAction::Ping);
    EXPECT_FALSE(ParseCommandAction("reboot").has_value());
    EXPECT_FALSE(ParseCommandAction("").has_value());
}

class CommandChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        SetLogSink([this](const std::string& s) { logs.push_back(s); });
    }
    void TearDown() override { SetLogSink(nullptr); }

    void openConnection() {
        conn.connect();
        net.emit(io, Kind::Opened);
        Drain(io);
        logs.clear();
    }

    bool anyWarning() const {
        for (const auto& l : logs) if (l.find("[WARN]") != std::string::npos) return true;
        return false;
    }

    asio::io_context io;
    FakeNetwork net;
    StateStore store;
    MessageDispatcher dispatcher{ store };
    ConnectionManager conn{ io, ConnectionOptions{ "ws://localhost:8000/ws", 50ms }, store, dispatcher, net.factory() };
    CommandChannel commands{ conn };
    std::vector<std::string> logs;
};

TEST_F(CommandChannelTest, DroppedWhenDisconnected) {
    EXPECT_EQ(commands.startRecording(), SendResult::NotConnected);
    EXPECT_TRUE(net.sent().empty());
    EXPECT_TRUE(anyWarning());
}

TEST_F(CommandChannelTest, DroppedWhileConnecting) {
    conn.connect();
    logs.clear();
    EXPECT_EQ(commands.ping(), SendResult::NotConnected);
    EXPECT_TRUE(net.sent().empty());
    EXPECT_TRUE(anyWarning());
}

TEST_F(CommandChannelTest, DroppedWhileReconnectPending) {
    openConnection();
    net.emit(io, Kind::Closed);
    Drain(io);
    ASSERT_TRUE(conn.reconnectPending());

    EXPECT_EQ(commands.clearReadings(), SendResult::NotConnected);
    EXPECT_TRUE(net.sent().empty());
}

TEST_F(CommandChannelTest, NotQueuedForLaterDelivery) {
    EXPECT_EQ(commands.getStatus(), SendResult::NotConnected);
    openConnection();
    EXPECT_TRUE(net.sent().empty());
}

TEST_F(CommandChannelTest, SentWhenConnected) {
    openConnection();
    EXPECT_EQ(commands.startRecording(), SendResult::Sent);
    EXPECT_EQ(commands.ping(), SendResult::Sent);

    auto sent = net.sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(sent[0])["action"], "start_recording");
    EXPECT_EQ(nlohmann::json::parse(sent[1])["type"], "ping");
    EXPECT_FALSE(anyWarning());
}

TEST_F(CommandChannelTest, TransportRefusalIsReported) {
    openConnection();
    net.setRefuseSend(true);
    EXPECT_EQ(commands.stopRecording(), SendResult::TransportFailed);
    EXPECT_TRUE(anyWarning());
}

TEST_F(CommandChannelTest, TransportExceptionIsContained) {
    openConnection();
    net.setSendThrows(true);
    SendResult r = SendResult::Sent;
    EXPECT_NO_THROW(r = commands.getStatus());
    EXPECT_EQ(r, SendResult::TransportFailed);
}

TEST(CommandNames, SendResultStrings) {
    EXPECT_STREQ(ToString(SendResult::Sent), "sent");
    EXPECT_STREQ(ToString(SendResult::NotConnected), "not_connected");
    EXPECT_STREQ(ToString(SendResult::TransportFailed), "transport_failed");
}
