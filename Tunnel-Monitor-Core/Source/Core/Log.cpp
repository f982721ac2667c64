#include "Core/Log.hpp"
#include <cstdio>
#include <mutex>

static std::mutex g_logMx;
static LogSink g_sink;

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lk(g_logMx);
    g_sink = std::move(sink);
}

void LogLine(const std::string& s) {
    std::lock_guard<std::mutex> lk(g_logMx);
    if (g_sink) { g_sink(s); return; }
    fmt::print(stderr, "{}\n", s);
}
