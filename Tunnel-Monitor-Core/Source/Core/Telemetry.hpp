#pragma once
#include <map>
#include <optional>
#include <string>

// Stato del collegamento verso il backend
enum class ConnectionStatus {
    Connecting,
    Connected,
    Disconnected,
    Error
};

// "connecting" | "connected" | "disconnected" | "error"
const char* ToString(ConnectionStatus s);

// Stato del sistema come riportato dal backend (messaggio "status")
struct SystemStatus {
    bool deviceConnected = false;   // arduino_connected
    int  clientCount = 0;           // websocket_clients
    bool isRecording = false;       // is_recording
    int  readingsCount = 0;         // readings_count

    bool operator==(const SystemStatus& o) const {
        return deviceConnected == o.deviceConnected && clientCount == o.clientCount
            && isRecording == o.isRecording && readingsCount == o.readingsCount;
    }
    bool operator!=(const SystemStatus& o) const { return !(*this == o); }
};

// Singola lettura (timestamp ISO-8601 + grandezze misurate)
struct Reading {
    std::string timestamp;
    double rpm = 0.0;
    double liftForce = 0.0;
    std::map<std::string, double> extra;   // altri campi numerici, chiave = nome sul filo

    // Valore di un campo per nome ("rpm", "lift_force" o un campo extra)
    std::optional<double> field(const std::string& key) const;
};
