#include "relic/session_options.hpp"
#include "infrastructure/logging/logger.hpp"

namespace RIE {

SessionOptions loadSessionOptions(const ConfigManager& config) {
    SessionOptions options;

    options.logLevel = config.get("logging", "level").asOrDefault<std::string>(options.logLevel);
    options.logFile = config.get("logging", "file").asOrDefault<std::string>(options.logFile);

    std::string delimiter = config.get("import", "delimiter").asOrDefault<std::string>(",");
    if (delimiter.size() == 1) {
        options.parser.delimiter = delimiter[0];
    } else {
        LOG_WARN("config", "import.delimiter must be a single character, keeping ','");
    }
    options.parser.strict_mode = config.get("import", "strict_mode").asOrDefault<bool>(options.parser.strict_mode);

    options.autofillEnabled = config.get("autofill", "enabled").asOrDefault<bool>(options.autofillEnabled);
    options.autofill.nightfarerDisplayGroup =
        config.get("autofill", "nightfarer_display_group").asOrDefault<bool>(options.autofill.nightfarerDisplayGroup);
    options.autofill.debuffCategory =
        config.get("autofill", "debuff_category").asOrDefault<bool>(options.autofill.debuffCategory);
    options.autofill.skipZeroGroup =
        config.get("autofill", "skip_zero_group").asOrDefault<bool>(options.autofill.skipZeroGroup);

    options.mergeEnabled = config.get("merge", "enabled").asOrDefault<bool>(options.mergeEnabled);

    options.snapshotIndent = config.get("snapshot", "indent").asOrDefault<int>(options.snapshotIndent);
    if (options.snapshotIndent < 0) {
        options.snapshotIndent = 2;
    }

    return options;
}

std::vector<ConfigManager::ValidationRule> sessionValidationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule level_rule;
    level_rule.key = "logging.level";
    level_rule.type = "string";
    level_rule.allowed_values = {"DEBUG", "INFO", "WARN", "WARNING", "ERROR"};
    level_rule.description = "Minimum log level";
    rules.push_back(level_rule);

    ConfigManager::ValidationRule file_rule;
    file_rule.key = "logging.file";
    file_rule.type = "string";
    file_rule.description = "Log file, stdout when empty";
    rules.push_back(file_rule);

    ConfigManager::ValidationRule delimiter_rule;
    delimiter_rule.key = "import.delimiter";
    delimiter_rule.type = "string";
    delimiter_rule.description = "Field delimiter of the imported table";
    rules.push_back(delimiter_rule);

    for (const char* key : {"import.strict_mode", "autofill.enabled", "autofill.nightfarer_display_group",
                            "autofill.debuff_category", "autofill.skip_zero_group", "merge.enabled"}) {
        ConfigManager::ValidationRule rule;
        rule.key = key;
        rule.type = "bool";
        rules.push_back(rule);
    }

    ConfigManager::ValidationRule indent_rule;
    indent_rule.key = "snapshot.indent";
    indent_rule.type = "int";
    indent_rule.min_value = 0;
    indent_rule.max_value = 8;
    indent_rule.description = "Indentation of saved project files";
    rules.push_back(indent_rule);

    return rules;
}

} // namespace RIE
