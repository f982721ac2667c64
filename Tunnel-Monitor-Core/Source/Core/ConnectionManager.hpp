#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <asio.hpp>
#include "Core/MessageDispatcher.hpp"
#include "Core/StateStore.hpp"
#include "Core/Transport/Transport.hpp"

struct ConnectionOptions {
    std::string url = "ws://localhost:8000/ws";
    std::chrono::milliseconds reconnectInterval{ 3000 };
};

// Ciclo di vita della connessione: Disconnected -> Connecting -> Connected,
// Error su guasto, riconnessione a intervallo fisso dopo ogni chiusura.
// Da usare solo dal thread che esegue l'io_context.
class ConnectionManager {
public:
    ConnectionManager(asio::io_context& io, ConnectionOptions opts,
                      StateStore& store, MessageDispatcher& dispatcher,
                      TransportFactory factory);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // No-op se il trasporto è già aperto o in apertura
    void connect();
    // Annulla il timer, chiude il trasporto, niente più riconnessioni automatiche
    void disconnect();

    // Scrive un frame sul trasporto aperto; false altrimenti
    bool send(const std::string& frame);

    [[nodiscard]] ConnectionStatus status() const { return m_status; }
    [[nodiscard]] bool reconnectPending() const { return m_reconnectPending; }
    [[nodiscard]] std::uint64_t connectAttempts() const { return m_attempts; }
    [[nodiscard]] const ConnectionOptions& options() const { return m_opts; }

private:
    void onTransportEvent(std::uint64_t generation, TransportEvent ev);
    void setStatus(ConnectionStatus s);
    void scheduleReconnect();
    void cancelReconnect();

    asio::io_context& m_io;
    ConnectionOptions m_opts;
    StateStore& m_store;
    MessageDispatcher& m_dispatcher;
    TransportFactory m_factory;

    std::unique_ptr<ITransport> m_transport;
    std::uint64_t m_generation{ 0 };   // scarta eventi di trasporti già sostituiti

    asio::steady_timer m_reconnectTimer;
    bool m_reconnectPending{ false };
    std::uint64_t m_timerToken{ 0 };

    ConnectionStatus m_status{ ConnectionStatus::Disconnected };
    bool m_teardown{ false };
    std::uint64_t m_attempts{ 0 };
};
