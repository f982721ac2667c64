#include "Core/TelemetryClient.hpp"
#include <future>
#include "Core/Log.hpp"

TelemetryClient::TelemetryClient(TelemetryOptions opts, TransportFactory factory)
    : m_opts(std::move(opts)),
      m_store(m_opts.capacity),
      m_dispatcher(m_store),
      m_conn(m_io, ConnectionOptions{ m_opts.url, m_opts.reconnectInterval }, m_store, m_dispatcher, std::move(factory)),
      m_commands(m_conn) {
}

TelemetryClient::~TelemetryClient() { stop(); }

template <typename Fn>
auto TelemetryClient::runOnIo(Fn&& fn) -> decltype(fn()) {
    using R = decltype(fn());
    if (!m_running.load() || std::this_thread::get_id() == m_ioThreadId.load()) return fn();

    std::packaged_task<R()> task(std::forward<Fn>(fn));
    auto fut = task.get_future();
    asio::post(m_io, [&task] { task(); });
    return fut.get();
}

void TelemetryClient::start() {
    if (m_running.load()) return;

    m_io.restart();
    m_work.emplace(asio::make_work_guard(m_io));
    m_thread = std::thread([this] {
        for (;;) {
            try {
                m_io.run();
                break;
            }
            catch (const std::exception& e) {
                LOGF("[IO] eccezione nel loop: {}", e.what());
            }
        }
        });
    // id del thread pubblicato prima di m_running: runOnIo li legge in quest'ordine
    m_ioThreadId.store(m_thread.get_id());
    m_running.store(true);
    LOGF("[IO] client telemetria avviato ({}; buffer {})", m_opts.url, m_opts.capacity);

    connect();
}

void TelemetryClient::stop() {
    if (!m_running.load()) return;

    runOnIo([this] { m_conn.disconnect(); });
    m_running.store(false);

    // senza work guard run() termina quando le chiusure pendenti sono completate
    m_work.reset();
    if (m_thread.joinable()) m_thread.join();
    m_thread = std::thread();
    m_ioThreadId.store(std::thread::id());

    // task postati durante lo stop
    m_io.restart();
    m_io.poll();
    LOGF("[IO] client telemetria fermato");
}

void TelemetryClient::connect() {
    runOnIo([this] { m_conn.connect(); });
}

void TelemetryClient::disconnect() {
    runOnIo([this] { m_conn.disconnect(); });
}

SendResult TelemetryClient::sendCommand(CommandAction a) {
    return runOnIo([this, a] { return m_commands.send(a); });
}

ConnectionInfo TelemetryClient::connectionInfo() {
    return runOnIo([this] {
        ConnectionInfo info;
        info.status = m_conn.status();
        info.url = m_conn.options().url;
        info.attempts = m_conn.connectAttempts();
        info.reconnectPending = m_conn.reconnectPending();
        return info;
        });
}
