#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"

// Carica e valida il JSON (strict). Ritorna true se valido.
// "configPath" può essere, ad esempio, "Source/config.json" o "config.json".
bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath);

// Stessa validazione su un documento già parsato (usata anche dai test)
bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const nlohmann::json& j);

// Config effettiva, nello stesso formato del file
nlohmann::json ConfigToJson(const AppConfig& cfg);
