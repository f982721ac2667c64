#include "ApiServer.hpp"
#include <fmt/core.h>
#include <chrono>
#include <cstring>
#include "Core/Log.hpp"
#include "utils/Utils.hpp"

using Json = nlohmann::json;

ApiServer::ApiServer(std::string host, int port, Callbacks cbs, bool enableCORS)
    : m_host(std::move(host)), m_port(port), m_cbs(std::move(cbs)), m_cors(enableCORS) {
}

ApiServer::~ApiServer() { stop(); }

bool ApiServer::start() {
    if (m_running.exchange(true)) return false;
    m_srv = std::make_unique<httplib::Server>();
    installRoutes();
    try {
        m_thr = std::thread(&ApiServer::run, this);   // <<-- può lanciare std::system_error
    }
    catch (const std::system_error& e) {
        LOGF("[API] FATAL: cannot start server thread: {}", e.what());
        m_srv.reset();
        m_running.store(false);
        return false;
    }
    return true;
}

void ApiServer::stop() {
    if (!m_running.exchange(false)) return;
    if (m_srv) m_srv->stop();
    if (m_thr.joinable()) m_thr.join();
    m_srv.reset();
}

void ApiServer::run() {
    try {
        LOGF("[API] Listening http://{}:{} (CORS: {})", m_host, m_port, m_cors ? "on" : "off");
        if (!m_srv->listen(m_host.c_str(), m_port)) {
            LOGF("[API] listen() failed or stopped");
        }
    }
    catch (const std::exception& e) {
        LOGF("[API] FATAL in server thread: {}", e.what());
    }
}

void ApiServer::setCORSHeaders(httplib::Response& res) const {
    if (!m_cors) return;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET,POST,OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void ApiServer::ok(httplib::Response& res, const Json& result) {
    res.status = 200;
    Json env = { {"ok", true}, {"result", result} };
    res.set_content(env.dump(), "application/json");
}

void ApiServer::fail(httplib::Response& res, int status, const std::string& msg) {
    res.status = status;
    Json env = { {"ok", false}, {"error", msg} };
    res.set_content(env.dump(), "application/json");
}

// ?limit=N (assente -> 0 = tutte)
bool ApiServer::readLimit(const httplib::Request& req, std::size_t& out) {
    out = 0;
    if (!req.has_param("limit")) return true;
    return toSize(req.get_param_value("limit"), out);
}

void ApiServer::installRoutes() {
    m_srv->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOGF("[HTTP] {} {} -> {}", req.method, req.path, res.status);
        });

    // 404 JSON
    m_srv->set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404) fail(res, 404, "not_found");
        setCORSHeaders(res);
        });

    // Preflight CORS
    m_srv->Options(R"(.*)", [this](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
        setCORSHeaders(res);
        });

    // GET /health
    m_srv->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        Json payload = { {"alive", true} };
        if (m_cbs.getHealthJson) {
            try { payload.update(m_cbs.getHealthJson()); }
            catch (const std::exception& e) { LOGF("[API] health: {}", e.what()); }
        }
        ok(res, payload);
        setCORSHeaders(res);
        });

    // GET /version
    m_srv->Get("/version", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getVersionJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getVersionJson());
        setCORSHeaders(res);
        });

    // GET /config
    m_srv->Get("/config", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getConfigJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getConfigJson());
        setCORSHeaders(res);
        });

    // GET /state  (supporta ?verbose=1)
    m_srv->Get("/state", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.getStateJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        try {
            const bool verbose = (req.has_param("verbose") && req.get_param_value("verbose") == "1");
            ok(res, m_cbs.getStateJson(verbose));
        }
        catch (const std::exception& e) {
            fail(res, 500, e.what());
        }
        setCORSHeaders(res);
        });

    // GET /readings?limit=N
    m_srv->Get("/readings", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.getReadingsJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        std::size_t limit = 0;
        if (!readLimit(req, limit)) { fail(res, 400, "bad_limit"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getReadingsJson(limit));
        setCORSHeaders(res);
        });

    // GET /readings/series?key=rpm&limit=N
    m_srv->Get("/readings/series", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.getSeriesJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        const std::string key = req.has_param("key") ? req.get_param_value("key") : "";
        if (key.empty()) { fail(res, 400, "missing_key"); setCORSHeaders(res); return; }
        std::size_t limit = 0;
        if (!readLimit(req, limit)) { fail(res, 400, "bad_limit"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getSeriesJson(key, limit));
        setCORSHeaders(res);
        });

    // SSE: GET /events/state
    m_srv->Get("/events/state", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.popNextStateEvent) { fail(res, 404, "not_supported"); setCORSHeaders(res); return; }

        res.set_header("Cache-Control", "no-cache, no-transform");
        res.set_header("Connection", "keep-alive");
        if (m_cors) res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("X-Accel-Buffering", "no");

        res.set_chunked_content_provider("text/event-stream",
            [this](size_t, httplib::DataSink& sink) -> bool {
                try {
                    const char* hello = ": connected\n\n";
                    sink.write(hello, std::strlen(hello));

                    if (m_cbs.getStateJson) {
                        auto snap = m_cbs.getStateJson(false);
                        std::string line = "event: snapshot\ndata: " + snap.dump() + "\n\n";
                        sink.write(line.c_str(), line.size());
                    }

                    while (m_running.load() && sink.is_writable()) {
                        Json ev;
                        if (m_cbs.popNextStateEvent(ev, /*timeoutMs*/1000)) {
                            std::string line = "event: stateChanged\ndata: " + ev.dump() + "\n\n";
                            if (!sink.write(line.c_str(), line.size())) break;
                        }
                        else {
                            const char* hb = ": heartbeat\n\n";
                            if (!sink.write(hb, std::strlen(hb))) break;
                        }
                    }
                    sink.done();
                    return true;
                }
                catch (const std::exception& e) {
                    LOGF("[SSE] provider error: {}", e.what());
                    sink.done();
                    return false;
                }
            });
        });

    // POST /connection/connect
    m_srv->Post("/connection/connect", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.connect) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.connect());
        setCORSHeaders(res);
        });

    // POST /connection/disconnect
    m_srv->Post("/connection/disconnect", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.disconnect) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.disconnect());
        setCORSHeaders(res);
        });

    // POST /command  { "action": "start_recording" | "stop_recording" | "clear" | "get_status" | "ping" }
    m_srv->Post("/command", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.sendCommand) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        std::string action;
        try {
            Json j = Json::parse(req.body);
            action = j.value("action", "");
        }
        catch (const std::exception&) {
            fail(res, 400, "bad_json"); setCORSHeaders(res); return;
        }
        if (action.empty()) { fail(res, 400, "missing_action"); setCORSHeaders(res); return; }

        const std::string outcome = m_cbs.sendCommand(action);
        if (outcome == "sent")                  ok(res, Json{ {"action", action}, {"sent", true} });
        else if (outcome == "not_connected")    fail(res, 409, "not_connected");
        else if (outcome == "transport_failed") fail(res, 502, "transport_failed");
        else                                    fail(res, 400, outcome.empty() ? "unknown_action" : outcome);
        setCORSHeaders(res);
        });

    // POST /control/shutdown  { "confirm": "SHUTDOWN" }
    m_srv->Post("/control/shutdown", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.requestShutdown) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        try {
            Json j = Json::parse(req.body);
            const std::string confirm = j.value("confirm", "");
            if (confirm != "SHUTDOWN") { fail(res, 400, "confirmation_required"); setCORSHeaders(res); return; }
        }
        catch (const std::exception&) {
            fail(res, 400, "bad_json"); setCORSHeaders(res); return;
        }
        ok(res, Json{ {"shutting_down", true} }); setCORSHeaders(res);
        m_cbs.requestShutdown();
        });

    // alias GET dal browser: /control/quit?confirm=SHUTDOWN
    m_srv->Get("/control/quit", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.requestShutdown) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        const std::string confirm = req.has_param("confirm") ? req.get_param_value("confirm") : "";
        if (confirm != "SHUTDOWN") { fail(res, 400, "confirmation_required"); setCORSHeaders(res); return; }
        ok(res, Json{ {"shutting_down", true} }); setCORSHeaders(res);
        m_cbs.requestShutdown();
        });

    // GET /__routes
    m_srv->Get("/__routes", [this](const httplib::Request&, httplib::Response& res) {
        ok(res, Json{
            {"routes", Json::array({
                "/health", "/version", "/config", "/state", "/readings", "/readings/series",
                "/events/state", "/connection/connect (POST)", "/connection/disconnect (POST)",
                "/command (POST)", "/control/shutdown (POST)", "/control/quit (GET)"
            })}
            });
        setCORSHeaders(res);
        });
}
