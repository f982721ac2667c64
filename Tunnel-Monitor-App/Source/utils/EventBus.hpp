#pragma once
#include <nlohmann/json.hpp>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <chrono>
#include <cstdint>

// Coda di eventi per lo stream SSE. Oltre la capienza scarta i più vecchi.
class EventBus {
public:
    using Json = nlohmann::json;

    explicit EventBus(size_t maxEvents = kDefaultMax);

    // Pubblica un evento (thread-safe)
    void publish(const Json& ev);

    // Estrae il prossimo evento, con timeout. Ritorna false su timeout.
    bool popNext(Json& out, std::chrono::milliseconds timeout);

    // Utilities
    void clear();
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::uint64_t dropped() const;

    static constexpr size_t kDefaultMax = 1024;

private:
    mutable std::mutex m_mx;
    std::condition_variable m_cv;
    std::deque<Json> m_q;
    size_t m_max;
    std::uint64_t m_dropped{ 0 };
};
