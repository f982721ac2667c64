#pragma once
#include <optional>
#include <string>
#include "Core/ConnectionManager.hpp"

enum class CommandAction {
    StartRecording,
    StopRecording,
    Clear,
    GetStatus,
    Ping
};

enum class SendResult {
    Sent,
    NotConnected,       // scartato: niente coda per un invio successivo
    TransportFailed
};

// Nome sul filo ("start_recording", ..., "ping")
const char* ToWireName(CommandAction a);
const char* ToString(SendResult r);
std::optional<CommandAction> ParseCommandAction(const std::string& name);

// {"type":"command","action":"..."} oppure {"type":"ping"}
std::string SerializeCommand(CommandAction a);

// Invio fire-and-forget dei comandi; l'esito arriva dal flusso in ingresso.
class CommandChannel {
public:
    explicit CommandChannel(ConnectionManager& conn);

    SendResult send(CommandAction a);

    SendResult startRecording() { return send(CommandAction::StartRecording); }
    SendResult stopRecording() { return send(CommandAction::StopRecording); }
    SendResult clearReadings() { return send(CommandAction::Clear); }
    SendResult getStatus() { return send(CommandAction::GetStatus); }
    SendResult ping() { return send(CommandAction::Ping); }

private:
    ConnectionManager& m_conn;
};
