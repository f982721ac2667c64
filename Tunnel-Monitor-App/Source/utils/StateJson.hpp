#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "Core/MessageDispatcher.hpp"
#include "Core/StateStore.hpp"
#include "Core/TelemetryClient.hpp"

// Proiezioni JSON dello stato per le API REST/SSE (nomi come sul filo)

nlohmann::json ReadingToJson(const Reading& r);
nlohmann::json SystemStatusToJson(const SystemStatus& s);

// verbose=false: senza l'array "readings" (resta "latest")
nlohmann::json SnapshotToJson(const StoreSnapshot& s, bool verbose);

// Ultime "limit" letture (0 = tutte), dalla più vecchia
nlohmann::json ReadingsToJson(const StoreSnapshot& s, std::size_t limit);

// Serie [timestamp, valore] di un campo numerico; le letture senza il campo sono saltate
nlohmann::json SeriesToJson(const StoreSnapshot& s, const std::string& key, std::size_t limit);

nlohmann::json ConnectionInfoToJson(const ConnectionInfo& c);
nlohmann::json DispatchStatsToJson(const DispatchStats& d);

// Payload di un evento "stateChanged" per lo stream SSE
nlohmann::json StoreEventToJson(const StoreEvent& ev, const StoreSnapshot& s);
