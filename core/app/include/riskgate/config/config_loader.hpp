#pragma once

#include "riskgate/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace riskgate {

// Reads and parses the JSON config file at `path`. Keys use camelCase and
// absent keys keep their defaults. Throws ConfigError if the file cannot be
// read, is not valid JSON, or holds a value of the wrong type or range.
EngineConfig loadEngineConfig(const std::string& path);

EngineConfig parseEngineConfig(const nlohmann::json& doc);

}  // namespace riskgate
