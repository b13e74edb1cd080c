#pragma once
#include <string>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

// minuscole
static inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

// timestamp UTC "2024-05-01T12:00:00Z" per readout e stato seriale
static inline std::string NowIsoUtc() {
    const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return buf;
}
