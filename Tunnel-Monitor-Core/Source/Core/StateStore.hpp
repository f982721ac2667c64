#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "Core/ReadingBuffer.hpp"
#include "Core/Telemetry.hpp"

// Copia immutabile dello stato, condivisa tra i lettori
struct StoreSnapshot {
    ConnectionStatus connection = ConnectionStatus::Disconnected;
    std::optional<SystemStatus> system;     // assente finché non arriva un "status"
    bool isRecording = false;
    std::vector<Reading> readings;          // ordine di arrivo
    std::size_t capacity = 0;
    std::uint64_t revision = 0;             // +1 a ogni mutazione

    const Reading* latest() const { return readings.empty() ? nullptr : &readings.back(); }
};

using SnapshotPtr = std::shared_ptr<const StoreSnapshot>;

// Cosa è cambiato nell'ultima mutazione
enum class StoreChange {
    Connection,
    System,
    Recording,
    ReadingAdded,
    ReadingsCleared
};

const char* ToString(StoreChange c);

struct StoreEvent {
    StoreChange what;
    std::uint64_t revision;
};

// Storage thread-safe dello stato telemetrico.
// I listener vengono chiamati in modo sincrono dopo ogni mutazione, fuori dal lock.
class StateStore {
public:
    using Listener = std::function<void(const StoreEvent&)>;
    using SubscriptionId = std::uint64_t;

    explicit StateStore(std::size_t capacity = ReadingBuffer::kDefaultCapacity);

    void setConnectionStatus(ConnectionStatus status);
    // Sostituisce lo stato di sistema e allinea il flag di registrazione
    void setSystemStatus(const SystemStatus& status);
    void addReading(Reading reading);
    void setRecording(bool recording);
    // Svuota solo il buffer: stato di sistema e flag restano invariati
    void clearReadings();

    [[nodiscard]] SnapshotPtr snapshot() const;

    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

private:
    template <typename Fn>
    void mutate(StoreChange what, Fn&& fn);

    void notify(const StoreEvent& ev);

    mutable std::mutex m_mutex;
    ConnectionStatus m_connection{ ConnectionStatus::Disconnected };
    std::optional<SystemStatus> m_system;
    bool m_recording{ false };
    ReadingBuffer m_readings;
    std::uint64_t m_revision{ 0 };
    mutable SnapshotPtr m_cached;   // invalidata a ogni mutazione

    mutable std::mutex m_listenersMx;
    std::vector<std::pair<SubscriptionId, Listener>> m_listeners;
    SubscriptionId m_nextId{ 1 };
};
