#include "Core/MessageDispatcher.hpp"
#include "Core/Log.hpp"
#include "Core/MessageParser.hpp"

MessageDispatcher::MessageDispatcher(StateStore& store)
    : m_store(store) {
}

DispatchResult MessageDispatcher::dispatch(const std::string& raw) {
    {
        std::lock_guard<std::mutex> lk(m_mx);
        ++m_stats.received;
    }

    std::string err;
    auto msg = ParseInboundMessage(raw, &err);
    if (!msg) {
        LOGW("[MSG] frame non decodificabile ({} byte): {}", raw.size(), err);
        std::lock_guard<std::mutex> lk(m_mx);
        ++m_stats.decodeFailures;
        m_stats.lastDecodeError = err;
        return DispatchResult::DecodeFailed;
    }

    bool applied = true;
    switch (msg->kind) {
    case InboundKind::Status:           m_store.setSystemStatus(msg->status); break;
    case InboundKind::RecordingStarted: m_store.setRecording(true); break;
    case InboundKind::RecordingStopped: m_store.setRecording(false); break;
    case InboundKind::ReadingsCleared:  m_store.clearReadings(); break;
    case InboundKind::Reading:          m_store.addReading(std::move(msg->reading)); break;
    case InboundKind::Pong:
    case InboundKind::Ignored:
        applied = false;
        break;
    }

    std::lock_guard<std::mutex> lk(m_mx);
    if (msg->kind == InboundKind::Pong) ++m_stats.pongs;
    if (applied) ++m_stats.applied; else ++m_stats.ignored;
    return applied ? DispatchResult::Applied : DispatchResult::Ignored;
}

DispatchStats MessageDispatcher::stats() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_stats;
}
