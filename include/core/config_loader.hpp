#pragma once
#include <string>
#include "core/config.hpp"
#include "core/traffic_analyzer.hpp"

namespace fta {

// Loads YAML at 'path', applies defaults, validates, throws on error
AppConfig LoadConfigFromYamlFile(const std::string& path);

// Same as above for an in-memory document
AppConfig LoadConfigFromYamlString(const std::string& yaml);

// Throws error if config is invalid
void ValidateOrThrow(const AppConfig& cfg);

// The part of the config the analytics worker consumes, can be re-applied between frames
AnalyzerSettings MakeAnalyzerSettings(const AppConfig& cfg);

}
