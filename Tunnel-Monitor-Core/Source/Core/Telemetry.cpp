#include "Core/Telemetry.hpp"

const char* ToString(ConnectionStatus s) {
    switch (s) {
    case ConnectionStatus::Connecting:   return "connecting";
    case ConnectionStatus::Connected:    return "connected";
    case ConnectionStatus::Disconnected: return "disconnected";
    case ConnectionStatus::Error:        return "error";
    }
    return "unknown";
}

std::optional<double> Reading::field(const std::string& key) const {
    if (key == "rpm") return rpm;
    if (key == "lift_force") return liftForce;
    auto it = extra.find(key);
    if (it == extra.end()) return std::nullopt;
    return it->second;
}
