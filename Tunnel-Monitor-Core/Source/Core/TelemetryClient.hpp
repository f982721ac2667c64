#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <asio.hpp>
#include "Core/CommandChannel.hpp"
#include "Core/ConnectionManager.hpp"
#include "Core/MessageDispatcher.hpp"
#include "Core/StateStore.hpp"
#include "Core/Transport/WebSocketTransport.hpp"

struct TelemetryOptions {
    std::string url = "ws://localhost:8000/ws";
    std::chrono::milliseconds reconnectInterval{ 3000 };
    std::size_t capacity = ReadingBuffer::kDefaultCapacity;
};

struct ConnectionInfo {
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::string url;
    std::uint64_t attempts = 0;
    bool reconnectPending = false;
};

// Incapsula io_context + connessione + parser + storage.
// Le API pubbliche sono thread-safe: il lavoro gira sul thread di IO interno.
class TelemetryClient {
public:
    explicit TelemetryClient(TelemetryOptions opts, TransportFactory factory = MakeWebSocketTransport);
    ~TelemetryClient();

    TelemetryClient(const TelemetryClient&) = delete;
    TelemetryClient& operator=(const TelemetryClient&) = delete;

    // Avvia il thread di IO e la prima connessione.
    // start()/stop() vanno chiamati da un solo thread di controllo.
    void start();
    // Disconnette e ferma il thread di IO
    void stop();
    [[nodiscard]] bool running() const { return m_running.load(); }

    // ---- API verso i consumatori ----
    [[nodiscard]] SnapshotPtr getSnapshot() const { return m_store.snapshot(); }
    StateStore::SubscriptionId subscribe(StateStore::Listener cb) { return m_store.subscribe(std::move(cb)); }
    void unsubscribe(StateStore::SubscriptionId id) { m_store.unsubscribe(id); }

    void connect();
    void disconnect();

    SendResult startRecording() { return sendCommand(CommandAction::StartRecording); }
    SendResult stopRecording() { return sendCommand(CommandAction::StopRecording); }
    SendResult clearReadings() { return sendCommand(CommandAction::Clear); }
    SendResult getStatus() { return sendCommand(CommandAction::GetStatus); }
    SendResult ping() { return sendCommand(CommandAction::Ping); }
    SendResult sendCommand(CommandAction a);

    ConnectionInfo connectionInfo();
    [[nodiscard]] DispatchStats dispatchStats() const { return m_dispatcher.stats(); }

    // Accesso diretto (test)
    asio::io_context& io() { return m_io; }

private:
    // Esegue fn sul thread di IO e ne attende il risultato.
    // Se il thread non è attivo (o siamo già sul thread) esegue inline.
    template <typename Fn>
    auto runOnIo(Fn&& fn) -> decltype(fn());

    TelemetryOptions m_opts;

    // ordine: io_context distrutto per ultimo
    asio::io_context m_io;
    StateStore m_store;
    MessageDispatcher m_dispatcher;
    ConnectionManager m_conn;
    CommandChannel m_commands;

    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_work;
    std::thread m_thread;
    std::atomic<std::thread::id> m_ioThreadId{};
    std::atomic<bool> m_running{ false };
};
