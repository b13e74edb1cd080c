#include "Core/Iec/Bcc.hpp"

std::optional<std::uint8_t> ComputeBcc(const Bytes& frame) {
    auto it = frame.begin();
    while (it != frame.end() && *it != kSoh && *it != kStx) ++it;
    if (it == frame.end()) return std::nullopt;

    BccAccumulator bcc;
    for (++it; it != frame.end(); ++it) {
        bcc.add(*it);
        if (*it == kEtx) return bcc.value();
    }
    return std::nullopt; // ETX mai arrivato
}
