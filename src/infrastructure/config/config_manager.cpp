// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing de configuration YAML et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace RIE {

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    if (const T* v = std::get_if<T>(&*value_)) {
        return *v;
    }
    return std::nullopt;
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        auto sections = buildSections(yaml);

        std::lock_guard<std::mutex> lock(mutex_);
        sections_ = std::move(sections);
    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }

    LOG_INFO("config", "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        auto sections = buildSections(yaml);

        std::lock_guard<std::mutex> lock(mutex_);
        sections_ = std::move(sections);
    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }

    LOG_DEBUG("config", "Configuration loaded from string");
    return true;
}

std::unordered_map<std::string, ConfigSection> ConfigManager::buildSections(const YAML::Node& root) const {
    std::unordered_map<std::string, ConfigSection> sections;
    if (root.IsNull()) {
        return sections;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("top-level YAML node must be a mapping");
    }

    // EN: Mapping sections become key/value sections, scalars land in "default".
    // FR: Les sections de type mapping deviennent des sections clé/valeur, les scalaires vont dans "default".
    for (const auto& section : root) {
        std::string section_name = section.first.as<std::string>();

        if (section.second.IsMap()) {
            ConfigSection config_section;
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
            sections[section_name] = config_section;
        } else {
            sections["default"].set(section_name, parseYamlValue(section.second));
        }
    }
    return sections;
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsNull()) {
        return ConfigValue(std::string());
    }
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }
    if (!node.IsScalar()) {
        throw std::runtime_error("nested mappings are not supported below a section");
    }

    const std::string str_val = node.as<std::string>();

    // EN: Quoted scalars always stay strings ("," must not become anything else).
    // FR: Les scalaires entre guillemets restent des chaînes.
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(str_val));
    }

    if (str_val == "true" || str_val == "false") {
        return ConfigValue(str_val == "true");
    }

    if (!str_val.empty() && str_val.find_first_not_of("+-0123456789") == std::string::npos) {
        int int_val = 0;
        if (YAML::convert<int>::decode(node, int_val)) {
            return ConfigValue(int_val);
        }
    }

    if (!str_val.empty() && str_val.find_first_of("0123456789") != std::string::npos) {
        double double_val = 0.0;
        if (YAML::convert<double>::decode(node, double_val)) {
            return ConfigValue(double_val);
        }
    }

    return ConfigValue(expandVariables(str_val));
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    try {
        YAML::Emitter emitter;
        emitter << YAML::BeginMap;

        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [section_name, _] : sections_) {
            names.push_back(section_name);
        }
        std::sort(names.begin(), names.end());

        for (const auto& section_name : names) {
            const ConfigSection& section = sections_.at(section_name);
            emitter << YAML::Key << section_name;
            emitter << YAML::Value << YAML::BeginMap;

            for (const std::string& key : section.keys()) {
                ConfigValue value = section.get(key);
                emitter << YAML::Key << key;
                emitter << YAML::Value;

                if (auto bool_val = value.tryAs<bool>()) {
                    emitter << *bool_val;
                } else if (auto int_val = value.tryAs<int>()) {
                    emitter << *int_val;
                } else if (auto double_val = value.tryAs<double>()) {
                    emitter << *double_val;
                } else if (auto str_val = value.tryAs<std::string>()) {
                    emitter << YAML::DoubleQuoted << *str_val;
                } else if (auto array_val = value.tryAs<std::vector<std::string>>()) {
                    emitter << YAML::BeginSeq;
                    for (const auto& item : *array_val) {
                        emitter << item;
                    }
                    emitter << YAML::EndSeq;
                } else {
                    emitter << YAML::Null;
                }
            }

            emitter << YAML::EndMap;
        }

        emitter << YAML::EndMap;

        std::ofstream file(filename);
        if (!file) {
            LOG_ERROR("config", "Cannot open configuration file for writing: " + filename);
            return false;
        }
        file << emitter.c_str() << '\n';
        if (!file) {
            LOG_ERROR("config", "Failed to write configuration file: " + filename);
            return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to save configuration: " + std::string(e.what()));
        return false;
    }

    LOG_INFO("config", "Configuration saved to: " + filename);
    return true;
}

void ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    LOG_DEBUG("config", "Loading environment overrides with prefix: " + prefix);

    std::string env_value = getEnvironmentVariable(prefix + "LOG_LEVEL");
    if (!env_value.empty()) {
        set("logging", "level", ConfigValue(env_value));
        LOG_INFO("config", "Environment override applied: logging.level");
    }

    env_value = getEnvironmentVariable(prefix + "LOG_FILE");
    if (!env_value.empty()) {
        set("logging", "file", ConfigValue(env_value));
        LOG_INFO("config", "Environment override applied: logging.file");
    }

    env_value = getEnvironmentVariable(prefix + "SNAPSHOT_INDENT");
    if (!env_value.empty()) {
        try {
            set("snapshot", "indent", ConfigValue(std::stoi(env_value)));
            LOG_INFO("config", "Environment override applied: snapshot.indent");
        } catch (const std::exception&) {
            LOG_WARN("config", "Ignoring non-numeric " + prefix + "SNAPSHOT_INDENT: " + env_value);
        }
    }
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value = getUnlocked(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getUnlocked(section, key);
}

ConfigValue ConfigManager::getUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::ostringstream oss;
    for (const auto& section_name : getSectionNames()) {
        ConfigSection section = getSection(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // Type validation
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + std::to_string(*rule.min_value);
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + std::to_string(*rule.max_value);
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    std::string result = value;
    std::regex var_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    std::string::size_type search_from = 0;

    while (search_from < result.size()) {
        std::string tail = result.substr(search_from);
        if (!std::regex_search(tail, match, var_regex)) {
            break;
        }
        std::string var_value = getEnvironmentVariable(match[1].str());
        size_t absolute = search_from + static_cast<size_t>(match.position());
        if (!var_value.empty()) {
            result.replace(absolute, static_cast<size_t>(match.length()), var_value);
            search_from = absolute + var_value.size();
        } else {
            // Leave unknown variables as-is
            search_from = absolute + static_cast<size_t>(match.length());
        }
    }

    return result;
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) const {
    const char* env_value = std::getenv(name.c_str());
    return env_value ? std::string(env_value) : "";
}

// Explicit template instantiations for non-specialized methods only
template std::optional<bool> ConfigValue::tryAs<bool>() const;
template std::optional<int> ConfigValue::tryAs<int>() const;
template std::optional<double> ConfigValue::tryAs<double>() const;
template std::optional<std::string> ConfigValue::tryAs<std::string>() const;
template std::optional<std::vector<std::string>> ConfigValue::tryAs<std::vector<std::string>>() const;

template bool ConfigValue::asOrDefault<bool>(const bool&) const;
template int ConfigValue::asOrDefault<int>(const int&) const;
template double ConfigValue::asOrDefault<double>(const double&) const;
template std::string ConfigValue::asOrDefault<std::string>(const std::string&) const;
template std::vector<std::string> ConfigValue::asOrDefault<std::vector<std::string>>(const std::vector<std::string>&) const;

} // namespace RIE
