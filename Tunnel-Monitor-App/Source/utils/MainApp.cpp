#include "utils/MainApp.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/StateJson.hpp"
#include "utils/Utils.hpp"
#include "Api/ApiWiring.hpp"
#include "Core/Log.hpp"

#include <csignal>
#include <thread>

using Json = nlohmann::json;

// -----------------------------------------------------------------------------
// Costruzione/distruzione
// -----------------------------------------------------------------------------
MainApp::MainApp(std::string configPath)
    : m_configPath(std::move(configPath)) {
}

MainApp::~MainApp() {
    if (m_api) { m_api->stop(); m_api.reset(); }
    if (m_signals) cancelSignals();
    if (m_client) {
        m_client->unsubscribe(m_subscription);
        m_client->stop();
    }
}

// -----------------------------------------------------------------------------
// Caricamento config
// -----------------------------------------------------------------------------
bool MainApp::loadConfigStrict() {
    std::string cfgErr;
    AppConfig cfg;
    if (!LoadConfigStrict(cfg, cfgErr, m_configPath)) {
        LOGF("ERRORE CONFIG ({}): {}", m_configPath, cfgErr);
        return false;
    }
    std::lock_guard<std::mutex> lock(m_cfgMtx);
    m_cfg = cfg;
    return true;
}

// -----------------------------------------------------------------------------
// Thin wrappers per ApiWiring (REST)
// -----------------------------------------------------------------------------
Json MainApp::getConfigJson() {
    std::lock_guard<std::mutex> lock(m_cfgMtx);
    return ConfigToJson(m_cfg);
}

Json MainApp::getHealthJson() {
    return Json{
        {"connection", ConnectionInfoToJson(m_client->connectionInfo())},
        {"messages",   DispatchStatsToJson(m_client->dispatchStats())},
        {"events",     { {"queued", m_events.size()}, {"dropped", m_events.dropped()} }},
        {"timestamp",  NowIsoUtc()}
    };
}

Json MainApp::getStateJson(bool verbose) const {
    return SnapshotToJson(*m_client->getSnapshot(), verbose);
}

Json MainApp::getReadingsJson(std::size_t limit) const {
    return ReadingsToJson(*m_client->getSnapshot(), limit);
}

Json MainApp::getSeriesJson(const std::string& key, std::size_t limit) const {
    return SeriesToJson(*m_client->getSnapshot(), key, limit);
}

Json MainApp::connectJson() {
    m_client->connect();
    return ConnectionInfoToJson(m_client->connectionInfo());
}

Json MainApp::disconnectJson() {
    m_client->disconnect();
    return ConnectionInfoToJson(m_client->connectionInfo());
}

std::string MainApp::sendCommand(const std::string& action) {
    auto a = ParseCommandAction(action);
    if (!a) return "unknown_action";
    return ToString(m_client->sendCommand(*a));
}

// -----------------------------------------------------------------------------
// Event Bus (SSE)
// -----------------------------------------------------------------------------
void MainApp::onStoreEvent(const StoreEvent& ev) {
    // gira sul thread di IO: lo snapshot è già coerente con l'evento
    Json j = StoreEventToJson(ev, *m_client->getSnapshot());
    j["timestamp"] = NowIsoUtc();
    publishStateChange(j);
}

void MainApp::publishStateChange(const Json& ev) {
    m_events.publish(ev);
}

bool MainApp::popNextStateEventBlocking(Json& out, std::chrono::milliseconds timeout) {
    try {
        return m_events.popNext(out, timeout);
    }
    catch (const std::exception& e) {
        LOGF("[EVT] wait error: {}", e.what());
        return false;
    }
}

// l'attesa pendente tiene vivo l'io_context: va annullata prima di stop()
void MainApp::cancelSignals() {
    asio::post(m_client->io(), [s = m_signals.get()] {
        asio::error_code ec;
        s->cancel(ec);
        });
}

void MainApp::requestShutdown() {
    // segnale di uscita (consumato nel loop principale)
    m_shouldExit.store(true, std::memory_order_relaxed);
}

// -----------------------------------------------------------------------------
// run(): ciclo di vita principale dell'app
// -----------------------------------------------------------------------------
int MainApp::run() {
    if (!loadConfigStrict()) return 2;

    TelemetryOptions opts;
    {
        std::lock_guard<std::mutex> lock(m_cfgMtx);
        opts.url = m_cfg.url;
        opts.reconnectInterval = std::chrono::milliseconds(m_cfg.reconnectMs);
        opts.capacity = m_cfg.capacity;
    }
    m_client = std::make_unique<TelemetryClient>(opts);
    m_subscription = m_client->subscribe([this](const StoreEvent& ev) { onStoreEvent(ev); });

    // SIGINT / SIGTERM -> uscita ordinata (gestiti sul thread di IO)
    m_signals = std::make_unique<asio::signal_set>(m_client->io(), SIGINT, SIGTERM);
    m_signals->async_wait([this](const asio::error_code& ec, int sig) {
        if (ec) return;
        LOGF("Segnale {} ricevuto", sig);
        requestShutdown();
        });

    // prima il client: le route REST leggono lo stato tramite il thread di IO
    m_client->start();

    // Callbacks REST (wiring separato)
    if (m_cfg.api.enabled) {
        m_api = std::make_unique<ApiServer>(m_cfg.api.host, m_cfg.api.port, ApiWiring::MakeCallbacks(*this), m_cfg.api.cors);
        if (!m_api->start()) {
            LOGF("[API] server non avviato");
            m_api.reset();
            cancelSignals();
            m_client->unsubscribe(m_subscription);
            m_client->stop();
            m_signals.reset();
            return 3;
        }
    }

    if (m_api) LOGF("REST su http://{}:{}  |  Ctrl+C per uscire.", m_cfg.api.host, m_cfg.api.port);

    // Loop principale: tutto il lavoro è sui thread di IO e HTTP
    while (!m_shouldExit.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Teardown ordinato
    LOGF("Uscita in corso...");
    if (m_api) { m_api->stop(); m_api.reset(); }
    cancelSignals();
    m_client->unsubscribe(m_subscription);
    m_client->stop();
    m_signals.reset();
    return 0;
}
