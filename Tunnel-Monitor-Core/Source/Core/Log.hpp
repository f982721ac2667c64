// Core/Log.hpp
#pragma once
#include <fmt/core.h>
#include <functional>
#include <string>

// Destinazione delle righe di log (default: stderr).
using LogSink = std::function<void(const std::string&)>;

// Sostituisce il sink corrente; passare nullptr ripristina stderr.
void SetLogSink(LogSink sink);

void LogLine(const std::string& s);

#define LOGF(...) do { LogLine(fmt::format(__VA_ARGS__)); } while(0)
#define LOGW(...) do { LogLine("[WARN] " + fmt::format(__VA_ARGS__)); } while(0)
