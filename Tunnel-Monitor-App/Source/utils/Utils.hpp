#pragma once
#include <charconv>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <string>
#include <string_view>
#include "Core/StringUtils.hpp"

// "2025-01-31T12:00:00Z"
static inline std::string NowIsoUtc() {
    using namespace std::chrono;
    const auto tt = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return buf;
}

// Intero non negativo (query string); false se non numerico
static inline bool toSize(const std::string& s, std::size_t& out) {
    const std::string t = trim(s);
    std::string_view sv(t);
    auto r = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return !t.empty() && r.ec == std::errc() && r.ptr == sv.data() + sv.size();
}
