#include "Core/ConnectionManager.hpp"
#include <stdexcept>
#include "Core/Log.hpp"

ConnectionManager::ConnectionManager(asio::io_context& io, ConnectionOptions opts,
                                     StateStore& store, MessageDispatcher& dispatcher,
                                     TransportFactory factory)
    : m_io(io), m_opts(std::move(opts)), m_store(store), m_dispatcher(dispatcher),
      m_factory(std::move(factory)), m_reconnectTimer(io) {
}

ConnectionManager::~ConnectionManager() {
    m_teardown = true;
    cancelReconnect();
    if (m_transport) {
        ++m_generation;
        m_transport->close();
        m_transport.reset();
    }
}

void ConnectionManager::connect() {
    m_teardown = false;
    // già aperto o in apertura: nessuna seconda connessione
    if (m_transport) return;

    cancelReconnect();
    setStatus(ConnectionStatus::Connecting);
    ++m_attempts;

    const std::uint64_t gen = ++m_generation;
    try {
        m_transport = m_factory(m_io, [this, gen](TransportEvent ev) { onTransportEvent(gen, std::move(ev)); });
        if (!m_transport) throw std::runtime_error("transport factory returned null");
        m_transport->open(m_opts.url);
        LOGF("[WS] connessione a {} (tentativo {})", m_opts.url, m_attempts);
    }
    catch (const std::exception& e) {
        // apertura fallita: stesso percorso di un errore seguito da chiusura
        LOGF("[WS] apertura fallita {}: {}", m_opts.url, e.what());
        ++m_generation;
        m_transport.reset();
        setStatus(ConnectionStatus::Error);
        if (!m_teardown) scheduleReconnect();
    }
}

void ConnectionManager::disconnect() {
    m_teardown = true;
    cancelReconnect();
    if (m_transport) {
        ++m_generation;   // gli eventi residui del trasporto vengono ignorati
        m_transport->close();
        m_transport.reset();
        LOGF("[WS] disconnesso da {}", m_opts.url);
    }
    setStatus(ConnectionStatus::Disconnected);
}

bool ConnectionManager::send(const std::string& frame) {
    if (!m_transport || !m_transport->isOpen()) return false;
    return m_transport->send(frame);
}

void ConnectionManager::onTransportEvent(std::uint64_t generation, TransportEvent ev) {
    if (generation != m_generation) return;

    switch (ev.kind) {
    case TransportEvent::Kind::Opened:
        LOGF("[WS] connesso a {}", m_opts.url);
        setStatus(ConnectionStatus::Connected);
        cancelReconnect();
        break;

    case TransportEvent::Kind::Data:
        m_dispatcher.dispatch(ev.payload);
        break;

    case TransportEvent::Kind::Errored:
        // la riconnessione la programma il Closed che segue
        LOGF("[WS] errore di trasporto: {}", ev.payload);
        setStatus(ConnectionStatus::Error);
        break;

    case TransportEvent::Kind::Closed:
        LOGF("[WS] connessione chiusa");
        setStatus(ConnectionStatus::Disconnected);
        m_transport.reset();
        if (!m_teardown) scheduleReconnect();
        break;
    }
}

void ConnectionManager::setStatus(ConnectionStatus s) {
    if (m_status == s) return;
    m_status = s;
    m_store.setConnectionStatus(s);
}

void ConnectionManager::scheduleReconnect() {
    const std::uint64_t token = ++m_timerToken;
    m_reconnectPending = true;
    m_reconnectTimer.expires_after(m_opts.reconnectInterval);
    m_reconnectTimer.async_wait([this, token](const asio::error_code& ec) {
        // un handler già in coda dopo cancel() arriva con ec == success: vale il token
        if (ec || token != m_timerToken) return;
        m_reconnectPending = false;
        if (m_teardown) return;
        LOGF("[WS] tentativo di riconnessione...");
        connect();
        });
}

void ConnectionManager::cancelReconnect() {
    if (!m_reconnectPending) return;
    ++m_timerToken;
    m_reconnectPending = false;
    m_reconnectTimer.cancel();
}
