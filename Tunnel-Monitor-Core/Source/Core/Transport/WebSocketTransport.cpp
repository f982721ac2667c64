#include "Core/Transport/WebSocketTransport.hpp"
#include <deque>
#include <random>
#include <stdexcept>
#include <fmt/core.h>
#include "Core/Log.hpp"
#include "Core/Transport/WsFrame.hpp"

// ---------------------------------------------------------------------------
// Session: stato della connessione, condiviso con gli handler asincroni
// ---------------------------------------------------------------------------
class WebSocketTransport::Session : public std::enable_shared_from_this<WebSocketTransport::Session> {
public:
    Session(asio::io_context& io, TransportEventSink sink)
        : m_io(io), m_sink(std::move(sink)), m_resolver(io), m_socket(io),
          m_handshakeBuf(16 * 1024), m_rng(std::random_device{}()) {
    }

    void start(const WsUrl& url) {
        m_url = url;
        std::array<std::uint8_t, 16> nonce{};
        for (auto& b : nonce) b = randomByte();
        m_clientKey = Base64Encode(nonce.data(), nonce.size());

        m_state = State::Resolving;
        auto self = shared_from_this();
        m_resolver.async_resolve(m_url.host, m_url.port,
            [self](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
                self->onResolved(ec, results);
            });
    }

    bool sendText(const std::string& text) {
        if (m_state != State::Open) return false;
        queueWrite(EncodeClientFrame(WsOpcode::Text, text, randomMask()));
        return true;
    }

    // Chiusura chiesta dal proprietario: da qui in poi nessun evento
    void close() {
        m_silenced = true;
        if (m_state == State::Open) {
            m_state = State::Closing;
            const std::string code{ '\x03', '\xE8' };   // 1000 normal closure
            queueWrite(EncodeClientFrame(WsOpcode::Close, code, randomMask()));
            return;
        }
        if (m_state != State::Closing) finish();
    }

    bool isOpen() const { return m_state == State::Open; }

private:
    enum class State { Idle, Resolving, Connecting, Handshaking, Open, Closing, Closed };

    void onResolved(const asio::error_code& ec, const asio::ip::tcp::resolver::results_type& results) {
        if (m_state == State::Closed) return;
        if (ec) { fail(fmt::format("resolve {}: {}", m_url.host, ec.message())); return; }

        m_state = State::Connecting;
        auto self = shared_from_this();
        asio::async_connect(m_socket, results,
            [self](const asio::error_code& ec2, const asio::ip::tcp::endpoint&) {
                self->onConnected(ec2);
            });
    }

    void onConnected(const asio::error_code& ec) {
        if (m_state == State::Closed) return;
        if (ec) { fail(fmt::format("connect {}:{}: {}", m_url.host, m_url.port, ec.message())); return; }

        m_state = State::Handshaking;
        m_request = BuildHandshakeRequest(m_url, m_clientKey);
        auto self = shared_from_this();
        asio::async_write(m_socket, asio::buffer(m_request),
            [self](const asio::error_code& ec2, std::size_t) {
                if (self->m_state == State::Closed) return;
                if (ec2) { self->fail(fmt::format("handshake write: {}", ec2.message())); return; }
                asio::async_read_until(self->m_socket, self->m_handshakeBuf, "\r\n\r\n",
                    [self](const asio::error_code& ec3, std::size_t n) { self->onHandshakeRead(ec3, n); });
            });
    }

    void onHandshakeRead(const asio::error_code& ec, std::size_t n) {
        if (m_state == State::Closed) return;
        if (ec) { fail(fmt::format("handshake read: {}", ec.message())); return; }

        const auto begin = asio::buffers_begin(m_handshakeBuf.data());
        const std::string headers(begin, begin + static_cast<std::ptrdiff_t>(n));
        m_handshakeBuf.consume(n);
        // eventuali byte già arrivati oltre l'header appartengono ai frame
        m_rx.assign(asio::buffers_begin(m_handshakeBuf.data()), asio::buffers_end(m_handshakeBuf.data()));
        m_handshakeBuf.consume(m_handshakeBuf.size());

        std::string err;
        if (!ValidateHandshakeResponse(headers, m_clientKey, err)) { fail("handshake: " + err); return; }

        m_state = State::Open;
        emit({ TransportEvent::Kind::Opened, {} });
        processFrames();
        if (m_state == State::Open) doRead();
    }

    void doRead() {
        auto self = shared_from_this();
        m_socket.async_read_some(asio::buffer(m_chunk),
            [self](const asio::error_code& ec, std::size_t n) { self->onRead(ec, n); });
    }

    void onRead(const asio::error_code& ec, std::size_t n) {
        if (m_state == State::Closed) return;
        if (ec) {
            if (m_state == State::Closing || ec == asio::error::operation_aborted) finish();
            else fail(ec == asio::error::eof ? "connection closed by peer without close frame" : ec.message());
            return;
        }
        m_rx.append(m_chunk.data(), n);
        processFrames();
        if (m_state == State::Open || m_state == State::Closing) doRead();
    }

    void processFrames() {
        while (m_state == State::Open) {
            auto h = DecodeFrameHeader(reinterpret_cast<const std::uint8_t*>(m_rx.data()), m_rx.size());
            if (!h) return;
            if (h->payloadLen > kWsMaxPayload) { fail("payload too large"); return; }

            const std::size_t total = h->headerLen + static_cast<std::size_t>(h->payloadLen);
            if (m_rx.size() < total) return;

            std::string payload = m_rx.substr(h->headerLen, static_cast<std::size_t>(h->payloadLen));
            m_rx.erase(0, total);
            if (h->masked)
                for (std::size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<char>(payload[i] ^ h->mask[i % 4]);

            handleFrame(*h, std::move(payload));
        }
    }

    void handleFrame(const WsFrameHeader& h, std::string payload) {
        switch (h.opcode) {
        case WsOpcode::Text:
        case WsOpcode::Binary:
            if (m_inFragment) { fail("new data frame inside a fragmented message"); return; }
            if (h.fin) {
                if (h.opcode == WsOpcode::Text) emit({ TransportEvent::Kind::Data, std::move(payload) });
                return;
            }
            m_inFragment = true;
            m_fragmentIsText = (h.opcode == WsOpcode::Text);
            m_fragments = std::move(payload);
            return;

        case WsOpcode::Continuation:
            if (!m_inFragment) { fail("unexpected continuation frame"); return; }
            m_fragments += payload;
            if (m_fragments.size() > kWsMaxPayload) { fail("fragmented message too large"); return; }
            if (h.fin) {
                m_inFragment = false;
                if (m_fragmentIsText) emit({ TransportEvent::Kind::Data, std::move(m_fragments) });
                m_fragments.clear();
            }
            return;

        case WsOpcode::Ping:
            queueWrite(EncodeClientFrame(WsOpcode::Pong, payload, randomMask()));
            return;

        case WsOpcode::Pong:
            return;

        case WsOpcode::Close:
            // eco del codice di chiusura, poi fine sessione a scrittura completata
            m_state = State::Closing;
            queueWrite(EncodeClientFrame(WsOpcode::Close, payload.substr(0, 2), randomMask()));
            return;

        default:
            fail(fmt::format("unknown opcode 0x{:X}", h.opcode));
            return;
        }
    }

    void queueWrite(std::string frame) {
        m_outbox.push_back(std::move(frame));
        doWrite();
    }

    void doWrite() {
        if (m_writing || m_outbox.empty()) return;
        m_writing = true;
        auto self = shared_from_this();
        asio::async_write(m_socket, asio::buffer(m_outbox.front()),
            [self](const asio::error_code& ec, std::size_t) { self->onWrite(ec); });
    }

    void onWrite(const asio::error_code& ec) {
        m_writing = false;
        if (m_state == State::Closed) return;
        if (ec) {
            if (ec == asio::error::operation_aborted) finish();
            else fail(fmt::format("write: {}", ec.message()));
            return;
        }
        m_outbox.pop_front();
        if (!m_outbox.empty()) { doWrite(); return; }
        if (m_state == State::Closing) finish();
    }

    // Errore di rete/protocollo: Errored seguito da Closed
    void fail(const std::string& reason) {
        if (m_state == State::Closed) return;
        if (!m_silenced) LOGF("[WS] errore: {}", reason);
        emit({ TransportEvent::Kind::Errored, reason });
        finish();
    }

    // Chiude il socket ed emette Closed una sola volta
    void finish() {
        if (m_state == State::Closed) return;
        m_state = State::Closed;
        asio::error_code ignored;
        m_resolver.cancel();
        if (m_socket.is_open()) {
            m_socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            m_socket.close(ignored);
        }
        m_outbox.clear();
        emit({ TransportEvent::Kind::Closed, {} });
    }

    // Consegna seriale tramite l'io_context: il proprietario può distruggere
    // il trasporto dentro l'handler senza toccare la sessione in uso.
    void emit(TransportEvent ev) {
        if (m_silenced || !m_sink) return;
        asio::post(m_io, [sink = m_sink, ev = std::move(ev)]() mutable { sink(std::move(ev)); });
    }

    std::uint8_t randomByte() {
        return static_cast<std::uint8_t>(std::uniform_int_distribution<int>(0, 255)(m_rng));
    }

    std::array<std::uint8_t, 4> randomMask() {
        std::array<std::uint8_t, 4> m{};
        for (auto& b : m) b = randomByte();
        return m;
    }

    asio::io_context& m_io;
    TransportEventSink m_sink;
    asio::ip::tcp::resolver m_resolver;
    asio::ip::tcp::socket m_socket;
    asio::streambuf m_handshakeBuf;
    std::mt19937 m_rng;

    WsUrl m_url;
    std::string m_clientKey;
    std::string m_request;

    std::array<char, 4096> m_chunk{};
    std::string m_rx;
    std::string m_fragments;
    bool m_inFragment{ false };
    bool m_fragmentIsText{ false };

    std::deque<std::string> m_outbox;
    bool m_writing{ false };

    State m_state{ State::Idle };
    bool m_silenced{ false };
};

// ---------------------------------------------------------------------------
// WebSocketTransport
// ---------------------------------------------------------------------------
WebSocketTransport::WebSocketTransport(asio::io_context& io, TransportEventSink sink)
    : m_io(io), m_sink(std::move(sink)) {
}

WebSocketTransport::~WebSocketTransport() {
    if (m_session) m_session->close();
}

void WebSocketTransport::open(const std::string& url) {
    auto parsed = ParseWsUrl(url);
    if (!parsed) throw std::invalid_argument("URL WebSocket non valido: " + url);

    if (m_session) m_session->close();
    m_session = std::make_shared<Session>(m_io, m_sink);
    m_session->start(*parsed);
}

bool WebSocketTransport::send(const std::string& text) {
    return m_session && m_session->sendText(text);
}

void WebSocketTransport::close() {
    if (m_session) m_session->close();
}

bool WebSocketTransport::isOpen() const {
    return m_session && m_session->isOpen();
}

std::unique_ptr<ITransport> MakeWebSocketTransport(asio::io_context& io, TransportEventSink sink) {
    return std::make_unique<WebSocketTransport>(io, std::move(sink));
}
