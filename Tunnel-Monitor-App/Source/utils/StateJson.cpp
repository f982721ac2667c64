#include "utils/StateJson.hpp"

using Json = nlohmann::json;

Json ReadingToJson(const Reading& r) {
    Json j = { {"timestamp", r.timestamp}, {"rpm", r.rpm}, {"lift_force", r.liftForce} };
    for (const auto& [k, v] : r.extra) j[k] = v;
    return j;
}

Json SystemStatusToJson(const SystemStatus& s) {
    return Json{
        {"arduino_connected", s.deviceConnected},
        {"websocket_clients", s.clientCount},
        {"is_recording",      s.isRecording},
        {"readings_count",    s.readingsCount}
    };
}

static std::size_t firstIndex(const StoreSnapshot& s, std::size_t limit) {
    const std::size_t n = s.readings.size();
    return (limit == 0 || limit >= n) ? 0 : n - limit;
}

Json ReadingsToJson(const StoreSnapshot& s, std::size_t limit) {
    Json arr = Json::array();
    for (std::size_t i = firstIndex(s, limit); i < s.readings.size(); ++i) arr.push_back(ReadingToJson(s.readings[i]));
    return arr;
}

Json SeriesToJson(const StoreSnapshot& s, const std::string& key, std::size_t limit) {
    Json points = Json::array();
    for (std::size_t i = firstIndex(s, limit); i < s.readings.size(); ++i) {
        const Reading& r = s.readings[i];
        if (auto v = r.field(key)) points.push_back(Json::array({ r.timestamp, *v }));
    }
    return Json{ {"key", key}, {"points", points} };
}

Json SnapshotToJson(const StoreSnapshot& s, bool verbose) {
    Json out = {
        {"connection",   ToString(s.connection)},
        {"system",       s.system ? SystemStatusToJson(*s.system) : Json(nullptr)},
        {"is_recording", s.isRecording},
        {"count",        s.readings.size()},
        {"capacity",     s.capacity},
        {"revision",     s.revision},
        {"latest",       s.latest() ? ReadingToJson(*s.latest()) : Json(nullptr)}
    };
    if (verbose) out["readings"] = ReadingsToJson(s, 0);
    return out;
}

Json ConnectionInfoToJson(const ConnectionInfo& c) {
    return Json{
        {"status",            ToString(c.status)},
        {"url",               c.url},
        {"attempts",          c.attempts},
        {"reconnect_pending", c.reconnectPending}
    };
}

Json DispatchStatsToJson(const DispatchStats& d) {
    Json j = {
        {"received",        d.received},
        {"applied",         d.applied},
        {"ignored",         d.ignored},
        {"decode_failures", d.decodeFailures},
        {"pongs",           d.pongs}
    };
    if (!d.lastDecodeError.empty()) j["last_decode_error"] = d.lastDecodeError;
    return j;
}

Json StoreEventToJson(const StoreEvent& ev, const StoreSnapshot& s) {
    Json j = { {"type", ToString(ev.what)}, {"revision", ev.revision} };
    switch (ev.what) {
    case StoreChange::Connection:
        j["connection"] = ToString(s.connection);
        break;
    case StoreChange::System:
        if (s.system) j["system"] = SystemStatusToJson(*s.system);
        j["is_recording"] = s.isRecording;
        break;
    case StoreChange::Recording:
        j["is_recording"] = s.isRecording;
        break;
    case StoreChange::ReadingAdded:
        if (s.latest()) j["reading"] = ReadingToJson(*s.latest());
        j["count"] = s.readings.size();
        break;
    case StoreChange::ReadingsCleared:
        j["count"] = s.readings.size();
        break;
    }
    return j;
}
