#pragma once
#include <cstddef>
#include <string>

// Server REST/SSE locale per la dashboard
struct ApiConfig {
    bool        enabled = true;
    std::string host = "127.0.0.1";
    int         port = 8765;
    bool        cors = true;
};

struct AppConfig {
    // connessione al backend
    std::string url = "ws://localhost:8000/ws";
    unsigned    reconnectMs = 3000;

    // buffer delle letture
    std::size_t capacity = 500;

    ApiConfig   api;
};
