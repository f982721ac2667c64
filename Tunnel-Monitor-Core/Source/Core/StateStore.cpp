#include "Core/StateStore.hpp"
#include <algorithm>
#include "Core/Log.hpp"

const char* ToString(StoreChange c) {
    switch (c) {
    case StoreChange::Connection:      return "connection";
    case StoreChange::System:          return "system";
    case StoreChange::Recording:       return "recording";
    case StoreChange::ReadingAdded:    return "reading";
    case StoreChange::ReadingsCleared: return "readings_cleared";
    }
    return "unknown";
}

StateStore::StateStore(std::size_t capacity)
    : m_readings(capacity) {
}

template <typename Fn>
void StateStore::mutate(StoreChange what, Fn&& fn) {
    StoreEvent ev{ what, 0 };
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        fn();
        m_cached.reset();
        ev.revision = ++m_revision;
    }
    notify(ev);
}

void StateStore::setConnectionStatus(ConnectionStatus status) {
    mutate(StoreChange::Connection, [&] { m_connection = status; });
}

void StateStore::setSystemStatus(const SystemStatus& status) {
    mutate(StoreChange::System, [&] {
        m_system = status;
        m_recording = status.isRecording;
        });
}

void StateStore::addReading(Reading reading) {
    mutate(StoreChange::ReadingAdded, [&] { m_readings.push(std::move(reading)); });
}

void StateStore::setRecording(bool recording) {
    mutate(StoreChange::Recording, [&] { m_recording = recording; });
}

void StateStore::clearReadings() {
    mutate(StoreChange::ReadingsCleared, [&] { m_readings.clear(); });
}

SnapshotPtr StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_cached) {
        auto s = std::make_shared<StoreSnapshot>();
        s->connection = m_connection;
        s->system = m_system;
        s->isRecording = m_recording;
        s->readings = m_readings.toVector();
        s->capacity = m_readings.capacity();
        s->revision = m_revision;
        m_cached = std::move(s);
    }
    return m_cached;
}

StateStore::SubscriptionId StateStore::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lk(m_listenersMx);
    const SubscriptionId id = m_nextId++;
    m_listeners.emplace_back(id, std::move(listener));
    return id;
}

void StateStore::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(m_listenersMx);
    m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
        [id](const auto& p) { return p.first == id; }), m_listeners.end());
}

void StateStore::notify(const StoreEvent& ev) {
    // copia: un listener può (dis)iscriversi durante la notifica
    std::vector<std::pair<SubscriptionId, Listener>> listeners;
    {
        std::lock_guard<std::mutex> lk(m_listenersMx);
        listeners = m_listeners;
    }
    for (auto& [id, cb] : listeners) {
        try {
            cb(ev);
        }
        catch (const std::exception& e) {
            LOGF("[STORE] listener {} ha lanciato: {}", id, e.what());
        }
    }
}
