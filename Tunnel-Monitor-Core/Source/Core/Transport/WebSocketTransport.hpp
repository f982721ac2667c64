#pragma once
#include <memory>
#include <string>
#include "Core/Transport/Transport.hpp"

// Client WebSocket (RFC 6455, solo ws://) sull'io_context condiviso.
// Tutte le operazioni vanno chiamate dal thread dell'io_context.
class WebSocketTransport : public ITransport {
public:
    WebSocketTransport(asio::io_context& io, TransportEventSink sink);
    ~WebSocketTransport() override;

    void open(const std::string& url) override;
    bool send(const std::string& text) override;
    void close() override;
    [[nodiscard]] bool isOpen() const override;

    class Session;

private:
    asio::io_context& m_io;
    TransportEventSink m_sink;
    // la sessione vive finché ci sono operazioni asincrone pendenti
    std::shared_ptr<Session> m_session;
};

// Factory predefinita per ConnectionManager / TelemetryClient
std::unique_ptr<ITransport> MakeWebSocketTransport(asio::io_context& io, TransportEventSink sink);
