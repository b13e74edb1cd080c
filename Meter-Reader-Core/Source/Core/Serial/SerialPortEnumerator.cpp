#include "SerialPortEnumerator.hpp"
#include <algorithm>
#include <array>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

// Prefissi dei device tty che possono ospitare una testa ottica.
// /dev/ttyS* è escluso: il kernel ne crea decine anche senza hardware.
static constexpr std::array<const char*, 3> kPrefixes = { "ttyUSB", "ttyACM", "ttyAMA" };

static bool isCandidate(const std::string& name) {
    for (const char* p : kPrefixes) {
        if (name.rfind(p, 0) == 0) return true;
    }
    return false;
}

std::vector<std::string> ListSerialPorts() {
    std::vector<std::string> result;

    std::error_code ec;
    fs::directory_iterator it("/dev", ec);
    if (ec) return result;

    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (isCandidate(name)) result.push_back(entry.path().string());
    }

    std::sort(result.begin(), result.end());
    return result;
}
