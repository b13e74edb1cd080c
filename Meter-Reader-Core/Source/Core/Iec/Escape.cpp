#include "Core/Iec/Escape.hpp"

static void appendEscaped(std::string& out, std::uint8_t ch) {
    if (ch >= 0x20 && ch != '\\' && ch < 0x7f) {
        out.push_back(static_cast<char>(ch));
        return;
    }

    switch (ch) {
    case kSoh: out += "\\SOH "; return;
    case kStx: out += "\\STX "; return;
    case kEtx: out += "\\ETX "; return;
    case kAck: out += "\\ACK "; return;
    case kNak: out += "\\NAK "; return;
    case '\0': out += "\\0"; return;
    case '\a': out += "\\a"; return;
    case '\b': out += "\\b"; return;
    case '\t': out += "\\t"; return;
    case '\n': out += "\\n"; return;
    case '\v': out += "\\v"; return;
    case '\f': out += "\\f"; return;
    case '\r': out += "\\r"; return;
    case '\\': out += "\\\\"; return;
    default:
        // ottale a tre cifre (anche per 0x7f e byte con bit alto)
        out.push_back('\\');
        out.push_back(static_cast<char>('0' + ((ch >> 6) & 7)));
        out.push_back(static_cast<char>('0' + ((ch >> 3) & 7)));
        out.push_back(static_cast<char>('0' + (ch & 7)));
        return;
    }
}

std::string EscapeBytes(const Bytes& data) {
    std::string out;
    out.reserve(data.size());
    for (std::uint8_t b : data) appendEscaped(out, b);
    return out;
}

std::string EscapeBytes(std::string_view data) {
    std::string out;
    out.reserve(data.size());
    for (char c : data) appendEscaped(out, static_cast<std::uint8_t>(c));
    return out;
}
