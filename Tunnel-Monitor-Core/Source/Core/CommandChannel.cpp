#include "Core/CommandChannel.hpp"
#include <nlohmann/json.hpp>
#include "Core/Log.hpp"
#include "Core/StringUtils.hpp"

const char* ToWireName(CommandAction a) {
    switch (a) {
    case CommandAction::StartRecording: return "start_recording";
    case CommandAction::StopRecording:  return "stop_recording";
    case CommandAction::Clear:          return "clear";
    case CommandAction::GetStatus:      return "get_status";
    case CommandAction::Ping:           return "ping";
    }
    return "unknown";
}

const char* ToString(SendResult r) {
    switch (r) {
    case SendResult::Sent:            return "sent";
    case SendResult::NotConnected:    return "not_connected";
    case SendResult::TransportFailed: return "transport_failed";
    }
    return "unknown";
}

std::optional<CommandAction> ParseCommandAction(const std::string& name) {
    const std::string n = toLower(trim(name));
    if (n == "start_recording") return CommandAction::StartRecording;
    if (n == "stop_recording")  return CommandAction::StopRecording;
    if (n == "clear")           return CommandAction::Clear;
    if (n == "get_status")      return CommandAction::GetStatus;
    if (n == "ping")            return CommandAction::Ping;
    return std::nullopt;
}

std::string SerializeCommand(CommandAction a) {
    if (a == CommandAction::Ping) return nlohmann::json{ {"type", "ping"} }.dump();
    return nlohmann::json{ {"type", "command"}, {"action", ToWireName(a)} }.dump();
}

CommandChannel::CommandChannel(ConnectionManager& conn)
    : m_conn(conn) {
}

SendResult CommandChannel::send(CommandAction a) {
    if (m_conn.status() != ConnectionStatus::Connected) {
        LOGW("[CMD] '{}' scartato: WebSocket non connesso (stato {})", ToWireName(a), ToString(m_conn.status()));
        return SendResult::NotConnected;
    }
    try {
        if (m_conn.send(SerializeCommand(a))) return SendResult::Sent;
        LOGW("[CMD] '{}' rifiutato dal trasporto", ToWireName(a));
    }
    catch (const std::exception& e) {
        LOGW("[CMD] '{}' invio fallito: {}", ToWireName(a), e.what());
    }
    return SendResult::TransportFailed;
}
