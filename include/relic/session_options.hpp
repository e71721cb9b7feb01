// EN: Typed session options read from the YAML configuration
// FR: Options de session typées lues depuis la configuration YAML

#pragma once

#include "csv/streaming_parser.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "relic/group_autofiller.hpp"
#include <string>
#include <vector>

namespace RIE {

struct SessionOptions {
    CSV::ParserConfig parser;
    bool mergeEnabled{true};
    bool autofillEnabled{true};
    AutofillOptions autofill;
    int snapshotIndent{2};
    std::string logLevel{"INFO"};
    std::string logFile;
};

// EN: Missing or mistyped keys keep their defaults
// FR: Les clés absentes ou mal typées gardent leur valeur par défaut
SessionOptions loadSessionOptions(const ConfigManager& config);

// EN: Rules for the keys read by loadSessionOptions
// FR: Règles pour les clés lues par loadSessionOptions
std::vector<ConfigManager::ValidationRule> sessionValidationRules();

} // namespace RIE
