#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "Core/Iec/Session.hpp"

// Serializzazione JSON (ADL di nlohmann). I valori restano stringhe
// decimali per non perdere la precisione del contatore.
void to_json(nlohmann::json& j, const IdentificationMessage& m);
void to_json(nlohmann::json& j, const DataSetRecord& r);
void to_json(nlohmann::json& j, const Readout& r);

// Tabella testuale per la console: "id  valore  unità"
std::string FormatReadoutTable(const Readout& r);
