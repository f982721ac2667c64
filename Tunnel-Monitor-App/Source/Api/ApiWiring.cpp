#include "Api/ApiWiring.hpp"
#include "utils/MainApp.hpp"

ApiServer::Callbacks ApiWiring::MakeCallbacks(MainApp& app) {
    ApiServer::Callbacks cbs;
    cbs.getVersionJson = []() { return nlohmann::json{ {"app","Tunnel-Monitor"},{"api","1.0.0"},{"build","dev"} }; };
    cbs.getConfigJson = [&app]() { return app.getConfigJson(); };
    cbs.getHealthJson = [&app]() { return app.getHealthJson(); };
    cbs.getStateJson = [&app](bool verbose) { return app.getStateJson(verbose); };
    cbs.getReadingsJson = [&app](std::size_t limit) { return app.getReadingsJson(limit); };
    cbs.getSeriesJson = [&app](const std::string& key, std::size_t limit) { return app.getSeriesJson(key, limit); };
    cbs.popNextStateEvent = [&app](nlohmann::json& out, int timeoutMs) {
        return app.popNextStateEventBlocking(out, std::chrono::milliseconds(timeoutMs));
        };

    cbs.connect = [&app]() { return app.connectJson(); };
    cbs.disconnect = [&app]() { return app.disconnectJson(); };
    cbs.sendCommand = [&app](const std::string& action) { return app.sendCommand(action); };

    cbs.requestShutdown = [&app]() { app.requestShutdown(); };
    return cbs;
}
