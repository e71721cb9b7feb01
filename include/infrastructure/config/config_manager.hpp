// EN: YAML-backed configuration for RIE: typed values grouped in sections, validation rules, env overrides.
// FR: Configuration RIE basée sur YAML : valeurs typées par sections, règles de validation, surcharges d'env.

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace RIE {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    // EN: String literals must not decay to bool inside the variant.
    // FR: Les littéraux chaîne ne doivent pas se convertir en bool dans le variant.
    ConfigValue(const char* value) : value_(std::string(value)) {}

    // EN: Get value as specific type (throws if type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    // EN: Get value as specific type or return default if type mismatch.
    // FR: Obtient la valeur comme type spécifique ou retourne défaut si type incorrect.
    template<typename T>
    T asOrDefault(const T& default_value) const;

    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;

    // EN: Keys in sorted order so dumps and saved files are stable.
    // FR: Clés triées pour que les dumps et fichiers sauvegardés soient stables.
    std::vector<std::string> keys() const;

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML et validation.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values. Keys are "section.key".
    // FR: Structure de règle de validation. Les clés sont "section.clé".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file. Existing values are replaced only on success.
    // FR: Charge la configuration depuis un fichier YAML. Les valeurs existantes ne sont remplacées qu'en cas de succès.
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string.
    // FR: Charge la configuration depuis une chaîne YAML.
    bool loadFromString(const std::string& yaml_content);

    // EN: Save current configuration to YAML file.
    // FR: Sauvegarde la configuration actuelle vers un fichier YAML.
    bool saveToFile(const std::string& filename) const;

    // EN: Apply environment variable overrides (PREFIX + LOG_LEVEL, LOG_FILE, SNAPSHOT_INDENT).
    // FR: Applique les surcharges de variables d'environnement (PREFIX + LOG_LEVEL, LOG_FILE, SNAPSHOT_INDENT).
    void loadEnvironmentOverrides(const std::string& prefix = "RIE_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);

    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données et règles de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Convert a parsed YAML document into sections (throws on malformed layout).
    // FR: Convertit un document YAML en sections (lance une exception si la structure est invalide).
    std::unordered_map<std::string, ConfigSection> buildSections(const YAML::Node& root) const;

    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references in configuration strings.
    // FR: Étend les références ${VAR} dans les chaînes de configuration.
    std::string expandVariables(const std::string& value) const;

    std::string getEnvironmentVariable(const std::string& name) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

// Template specializations
template<>
inline bool ConfigValue::as<bool>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<bool>(*value_);
}

template<>
inline int ConfigValue::as<int>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<int>(*value_);
}

template<>
inline double ConfigValue::as<double>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<double>(*value_);
}

template<>
inline std::string ConfigValue::as<std::string>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::string>(*value_);
}

template<>
inline std::vector<std::string> ConfigValue::as<std::vector<std::string>>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::vector<std::string>>(*value_);
}

} // namespace RIE
