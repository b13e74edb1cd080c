#pragma once
#include <string>
#include <string_view>
#include "Core/Iec/Protocol.hpp"

// Escape stile C per log e messaggi d'errore leggibili:
// controlli del protocollo come "\STX ", il resto come \r \n \\ o ottale.
std::string EscapeBytes(const Bytes& data);
std::string EscapeBytes(std::string_view data);
