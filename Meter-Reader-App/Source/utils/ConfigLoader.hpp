#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"

// Carica e valida il JSON (strict). Ritorna true se valido.
// "configPath" può essere, ad esempio, "config.json" o "/etc/meter-reader.json".
bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath);

// Stessa validazione su un documento già parsato.
bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const nlohmann::json& j);
