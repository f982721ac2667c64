#include "Core/MessageParser.hpp"
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>

using nlohmann::json;

const char* ToString(InboundKind k) {
    switch (k) {
    case InboundKind::Status:           return "status";
    case InboundKind::RecordingStarted: return "recording_started";
    case InboundKind::RecordingStopped: return "recording_stopped";
    case InboundKind::ReadingsCleared:  return "readings_cleared";
    case InboundKind::Pong:             return "pong";
    case InboundKind::Reading:          return "reading";
    case InboundKind::Ignored:          return "ignored";
    }
    return "unknown";
}

// Conteggio intero in [0, INT_MAX]; fuori range -> status ignorato
static bool toCount(const json& v, int& out) {
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    if (v.is_number_unsigned()) {
        const auto n = v.get<std::uint64_t>();
        if (n > kMax) return false;
        out = static_cast<int>(n);
        return true;
    }
    if (v.is_number_integer()) {
        const auto n = v.get<std::int64_t>();
        if (n < 0 || static_cast<std::uint64_t>(n) > kMax) return false;
        out = static_cast<int>(n);
        return true;
    }
    return false;
}

static bool parseStatus(const json& j, SystemStatus& out) {
    auto it = j.find("data");
    if (it == j.end() || !it->is_object()) return false;
    const json& d = *it;

    const auto dev = d.find("arduino_connected");
    const auto cli = d.find("websocket_clients");
    const auto rec = d.find("is_recording");
    const auto cnt = d.find("readings_count");
    if (dev == d.end() || !dev->is_boolean()) return false;
    if (rec == d.end() || !rec->is_boolean()) return false;
    if (cli == d.end() || !toCount(*cli, out.clientCount)) return false;
    if (cnt == d.end() || !toCount(*cnt, out.readingsCount)) return false;
    out.deviceConnected = dev->get<bool>();
    out.isRecording = rec->get<bool>();
    return true;
}

static bool parseReading(const json& j, Reading& out) {
    const auto ts = j.find("timestamp");
    const auto rpm = j.find("rpm");
    const auto lift = j.find("lift_force");
    if (ts == j.end() || !ts->is_string()) return false;
    if (rpm == j.end() || !rpm->is_number()) return false;
    if (lift == j.end() || !lift->is_number()) return false;

    out.timestamp = ts->get<std::string>();
    out.rpm = rpm->get<double>();
    out.liftForce = lift->get<double>();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "rpm" || it.key() == "lift_force") continue;
        if (it.value().is_number()) out.extra[it.key()] = it.value().get<double>();
    }
    return true;
}

// "timestamp" presente e non vuoto -> è una lettura
static bool hasTimestamp(const json& j) {
    auto it = j.find("timestamp");
    return it != j.end() && it->is_string() && !it->get_ref<const std::string&>().empty();
}

std::optional<InboundMessage> ParseInboundMessage(const std::string& raw, std::string* outErr) {
    json j;
    try {
        j = json::parse(raw);
    }
    catch (const json::parse_error& e) {
        if (outErr) *outErr = e.what();
        return std::nullopt;
    }

    InboundMessage msg;
    if (!j.is_object()) return msg;   // JSON valido ma non un oggetto: ignorato

    std::string type;
    if (auto it = j.find("type"); it != j.end() && it->is_string()) type = it->get<std::string>();

    if (type == "status") {
        if (parseStatus(j, msg.status)) msg.kind = InboundKind::Status;
        return msg;
    }
    if (type == "recording_started") { msg.kind = InboundKind::RecordingStarted; return msg; }
    if (type == "recording_stopped") { msg.kind = InboundKind::RecordingStopped; return msg; }
    if (type == "readings_cleared")  { msg.kind = InboundKind::ReadingsCleared;  return msg; }
    if (type == "pong")              { msg.kind = InboundKind::Pong;             return msg; }

    // fallback: qualunque payload con timestamp (anche con un "type" estraneo)
    if (hasTimestamp(j) && parseReading(j, msg.reading)) msg.kind = InboundKind::Reading;
    return msg;
}
