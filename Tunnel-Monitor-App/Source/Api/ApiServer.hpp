#pragma once
#include <string>
#include <thread>
#include <atomic>
#include <functional>
#include <memory>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <httplib.h>

class ApiServer {
public:
    using Json = nlohmann::json;

    struct Callbacks {
        // Letture
        std::function<Json()> getVersionJson;
        std::function<Json()> getConfigJson;
        std::function<Json()> getHealthJson;
        std::function<Json(bool verbose)> getStateJson;                            // /state?verbose=1
        std::function<Json(std::size_t limit)> getReadingsJson;                    // /readings?limit=N
        std::function<Json(const std::string& key, std::size_t limit)> getSeriesJson; // /readings/series
        std::function<bool(Json&, int /*timeoutMs*/)> popNextStateEvent;          // SSE

        // Connessione
        std::function<Json()> connect;
        std::function<Json()> disconnect;

        // Comandi verso il backend: "sent" | "not_connected" | "transport_failed" | "unknown_action"
        std::function<std::string(const std::string& action)> sendCommand;

        std::function<void()> requestShutdown;
    };

    ApiServer(std::string host, int port, Callbacks cbs, bool enableCORS = false);
    ~ApiServer();

    bool start();
    void stop();

private:
    void run();
    void installRoutes();

    // Envelope helpers
    void setCORSHeaders(httplib::Response& res) const;
    static void ok(httplib::Response& res, const Json& result);
    static void fail(httplib::Response& res, int status, const std::string& msg);
    static bool readLimit(const httplib::Request& req, std::size_t& out);

    std::string   m_host;
    int           m_port;
    Callbacks     m_cbs;
    bool          m_cors{ false };

    std::unique_ptr<httplib::Server> m_srv;
    std::thread       m_thr;
    std::atomic<bool> m_running{ false };
};
