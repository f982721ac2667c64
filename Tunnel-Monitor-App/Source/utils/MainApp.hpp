#pragma once
#include <string>
#include <mutex>
#include <memory>
#include <nlohmann/json.hpp>
#include <chrono>
#include <atomic>
#include <cstddef>
#include "utils/Config.hpp"
#include "utils/EventBus.hpp"
#include "Api/ApiServer.hpp"
#include "Core/TelemetryClient.hpp"

class MainApp {
public:
    explicit MainApp(std::string configPath = "Source/config.json");
    ~MainApp();
    int run();

    // ---- API (REST) ----
    nlohmann::json getConfigJson();                                 // /config
    nlohmann::json getHealthJson();                                 // /health
    [[nodiscard]] nlohmann::json getStateJson(bool verbose) const;  // /state?verbose=1
    [[nodiscard]] nlohmann::json getReadingsJson(std::size_t limit) const;
    [[nodiscard]] nlohmann::json getSeriesJson(const std::string& key, std::size_t limit) const;

    nlohmann::json connectJson();                                   // /connection/connect
    nlohmann::json disconnectJson();                                // /connection/disconnect
    std::string sendCommand(const std::string& action);             // /command

    void requestShutdown();

    // Event bus per SSE (wrappa EventBus)
    void publishStateChange(const nlohmann::json& ev);
    bool popNextStateEventBlocking(nlohmann::json& out, std::chrono::milliseconds timeout);

private:
    // ---- setup di base ----
    bool loadConfigStrict();
    void onStoreEvent(const StoreEvent& ev);
    void cancelSignals();

    // ---- stato app ----
    std::string m_configPath;
    AppConfig   m_cfg;
    std::mutex  m_cfgMtx;

    std::atomic<bool> m_shouldExit{ false };

    // componenti runtime
    std::unique_ptr<TelemetryClient> m_client;
    StateStore::SubscriptionId m_subscription{ 0 };
    std::unique_ptr<asio::signal_set> m_signals;   // sull'io_context del client

    // API
    std::unique_ptr<ApiServer> m_api;

    // Event bus (SSE)
    EventBus m_events;
};
