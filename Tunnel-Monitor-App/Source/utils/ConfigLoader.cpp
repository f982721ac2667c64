#include "utils/ConfigLoader.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <fmt/core.h>
#include "Core/Transport/WsFrame.hpp"

using nlohmann::json;

static constexpr std::uint64_t kMaxReconnectMs = std::numeric_limits<unsigned>::max();

static bool parseConnection(AppConfig& cfg, std::string& outErr, const json& c) {
    if (!c.is_object()) { outErr = "Chiave 'connection' mancante o non oggetto."; return false; }

    if (!c.contains("url") || !c["url"].is_string()) { outErr = "Chiave 'connection.url' mancante o non stringa."; return false; }
    const std::string url = c["url"].get<std::string>();
    if (!ParseWsUrl(url)) { outErr = "'connection.url' deve essere un URL ws://host[:porta][/path]: '" + url + "'"; return false; }
    cfg.url = url;

    if (c.contains("reconnect_ms")) {
        const auto& r = c["reconnect_ms"];
        if (!r.is_number_unsigned() || r.get<std::uint64_t>() == 0 || r.get<std::uint64_t>() > kMaxReconnectMs) {
            outErr = fmt::format("'connection.reconnect_ms' deve essere un intero tra 1 e {}.", kMaxReconnectMs);
            return false;
        }
        cfg.reconnectMs = static_cast<unsigned>(r.get<std::uint64_t>());
    }
    return true;
}

static bool parseBuffer(AppConfig& cfg, std::string& outErr, const json& b) {
    if (!b.is_object()) { outErr = "Chiave 'buffer' non oggetto."; return false; }
    if (b.contains("capacity")) {
        const auto& c = b["capacity"];
        if (!c.is_number_unsigned() || c.get<std::size_t>() == 0) { outErr = "'buffer.capacity' deve essere un intero >= 1."; return false; }
        cfg.capacity = c.get<std::size_t>();
    }
    return true;
}

static bool parseApi(AppConfig& cfg, std::string& outErr, const json& a) {
    if (!a.is_object()) { outErr = "Chiave 'api' non oggetto."; return false; }

    if (a.contains("enabled")) {
        if (!a["enabled"].is_boolean()) { outErr = "'api.enabled' deve essere booleano."; return false; }
        cfg.api.enabled = a["enabled"].get<bool>();
    }
    if (a.contains("host")) {
        if (!a["host"].is_string() || a["host"].get<std::string>().empty()) { outErr = "'api.host' deve essere una stringa non vuota."; return false; }
        cfg.api.host = a["host"].get<std::string>();
    }
    if (a.contains("port")) {
        const auto& p = a["port"];
        if (!p.is_number_integer() || p.get<long long>() < 1 || p.get<long long>() > 65535) {
            outErr = "'api.port' deve essere un intero tra 1 e 65535.";
            return false;
        }
        cfg.api.port = p.get<int>();
    }
    if (a.contains("cors")) {
        if (!a["cors"].is_boolean()) { outErr = "'api.cors' deve essere booleano."; return false; }
        cfg.api.cors = a["cors"].get<bool>();
    }
    return true;
}

bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const json& j) {
    cfg = {};
    if (!j.is_object()) { outErr = "La radice del config deve essere un oggetto."; return false; }

    // connection (obbligatoria)
    if (!j.contains("connection")) { outErr = "Chiave 'connection' mancante o non oggetto."; return false; }
    if (!parseConnection(cfg, outErr, j["connection"])) return false;

    // buffer / api (opzionali)
    if (j.contains("buffer") && !parseBuffer(cfg, outErr, j["buffer"])) return false;
    if (j.contains("api") && !parseApi(cfg, outErr, j["api"])) return false;

    return true;
}

bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath) {
    try {
        std::ifstream f(configPath);
        if (!f) { outErr = "Impossibile aprire il file: " + configPath; return false; }

        json j; f >> j; // può lanciare
        return ParseConfigStrict(cfg, outErr, j);
    }
    catch (const std::exception& ex) {
        outErr = std::string("Errore di parsing JSON: ") + ex.what() + ". Ricorda: il JSON standard non supporta i commenti.";
        return false;
    }
}

json ConfigToJson(const AppConfig& cfg) {
    return json{
        {"connection", { {"url", cfg.url}, {"reconnect_ms", cfg.reconnectMs} }},
        {"buffer",     { {"capacity", cfg.capacity} }},
        {"api",        { {"enabled", cfg.api.enabled}, {"host", cfg.api.host}, {"port", cfg.api.port}, {"cors", cfg.api.cors} }}
    };
}
