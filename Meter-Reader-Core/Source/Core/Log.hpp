// Core/Log.hpp
#pragma once
#include <fmt/core.h>
#include <atomic>
#include <cstdio>
#include <string>

// Flag globale: LOGD scrive solo se attivo (config "log.verbose").
inline std::atomic<bool> g_logVerbose{ false };

inline void SetLogVerbose(bool on) { g_logVerbose.store(on, std::memory_order_relaxed); }
inline bool IsLogVerbose() { return g_logVerbose.load(std::memory_order_relaxed); }

// Una riga per chiamata, sempre su stderr (stdout resta per i dati).
inline void LogLine(const std::string& s) {
    std::fputs(s.c_str(), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

#define LOGF(...) do { LogLine(fmt::format(__VA_ARGS__)); } while(0)
#define LOGD(...) do { if (IsLogVerbose()) LogLine(fmt::format(__VA_ARGS__)); } while(0)
