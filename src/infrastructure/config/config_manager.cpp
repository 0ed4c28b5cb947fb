// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, validation and overrides.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing de configuration YAML, validation et surcharges.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/config/yaml_loader.hpp"
#include "infrastructure/logging/logger.hpp"
#include "core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace DTP {

namespace {
    std::string toUpper(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return value;
    }

    std::pair<std::string, std::string> splitConfigPath(const std::string& path) {
        size_t dot_pos = path.find('.');
        if (dot_pos == std::string::npos) {
            return {"default", path};
        }
        return {path.substr(0, dot_pos), path.substr(dot_pos + 1)};
    }

    std::vector<std::string> splitList(const std::string& raw) {
        std::vector<std::string> items;
        std::stringstream stream(raw);
        std::string item;
        while (std::getline(stream, item, ',')) {
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }
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
            return std::to_string(v);
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

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
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

void ConfigManager::loadFromFile(const std::string& filename) {
    YAML::Node root = YamlLoader::loadYamlFile(filename);
    loadFromNode(root, filename);
}

void ConfigManager::loadFromString(const std::string& yaml_content) {
    YAML::Node root = YamlLoader::loadYamlText(yaml_content);
    loadFromNode(root, "<string>");
}

// EN: Top-level keys become sections; scalar top-level values land under the "value" key.
// FR: Les clés de premier niveau deviennent des sections; les scalaires de premier niveau vont sous la clé "value".
void ConfigManager::loadFromNode(const YAML::Node& root, const std::string& origin) {
    if (root.IsNull()) {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
        LOG_WARN("config", "Configuration is empty: " + origin);
        return;
    }
    if (!root.IsMap()) {
        throw ValidationError("Configuration root must be a mapping: " + origin);
    }

    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : root) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else if (!section.second.IsNull()) {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_ = std::move(loaded);
    }
    LOG_INFO("config", "Configuration loaded from: " + origin);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                throw ValidationError("Configuration lists may only contain scalars (line " +
                                      std::to_string(item.Mark().line + 1) + ")");
            }
            array_value.push_back(item.as<std::string>());
        }
        return ConfigValue(array_value);
    }

    if (node.IsNull()) {
        return ConfigValue(std::string());
    }

    if (!node.IsScalar()) {
        throw ValidationError("Nested mappings are not supported in configuration values (line " +
                              std::to_string(node.Mark().line + 1) + ")");
    }

    const std::string& str_val = node.Scalar();

    // EN: Quoted scalars always stay strings
    // FR: Les scalaires entre guillemets restent toujours des chaînes
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(str_val));
    }

    if (str_val == "true" || str_val == "false") {
        return ConfigValue(str_val == "true");
    }

    if (str_val.find('.') == std::string::npos) {
        int int_val = 0;
        if (YAML::convert<int>::decode(node, int_val)) {
            return ConfigValue(int_val);
        }
    }

    double double_val = 0.0;
    if (YAML::convert<double>::decode(node, double_val)) {
        return ConfigValue(double_val);
    }

    return ConfigValue(expandVariables(str_val));
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::vector<ValidationRule> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules = validation_rules_;
    }

    size_t applied = 0;
    for (const auto& rule : rules) {
        auto [section, key] = splitConfigPath(rule.key);
        std::string env_name = prefix + toUpper(section) + "_" + toUpper(key);

        const char* env_value = std::getenv(env_name.c_str());
        if (!env_value) {
            continue;
        }

        set(section, key, convertForRule(env_value, rule));
        ++applied;
        LOG_INFO("config", "Environment override applied: " + rule.key + " (" + env_name + ")");
    }
    return applied;
}

ConfigValue ConfigManager::convertForRule(const std::string& raw, const ValidationRule& rule) const {
    try {
        if (rule.type == "bool") {
            if (raw == "true" || raw == "1") return ConfigValue(true);
            if (raw == "false" || raw == "0") return ConfigValue(false);
            throw ValidationError("Configuration " + rule.key + " expects a boolean, got '" + raw + "'");
        }
        if (rule.type == "int") {
            size_t consumed = 0;
            int value = std::stoi(raw, &consumed);
            if (consumed != raw.size()) {
                throw ValidationError("Configuration " + rule.key + " expects an integer, got '" + raw + "'");
            }
            return ConfigValue(value);
        }
        if (rule.type == "double") {
            size_t consumed = 0;
            double value = std::stod(raw, &consumed);
            if (consumed != raw.size()) {
                throw ValidationError("Configuration " + rule.key + " expects a number, got '" + raw + "'");
            }
            return ConfigValue(value);
        }
        if (rule.type == "array") {
            return ConfigValue(splitList(raw));
        }
    } catch (const std::invalid_argument&) {
        throw ValidationError("Configuration " + rule.key + " cannot be parsed from '" + raw + "'");
    } catch (const std::out_of_range&) {
        throw ValidationError("Configuration " + rule.key + " is out of range: '" + raw + "'");
    }
    return ConfigValue(raw);
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
    LOG_DEBUG("config", "Added " + std::to_string(rules.size()) + " validation rules");
}

void ConfigManager::addDefaultRules() {
    addValidationRules({
        {.key = "manifest.path", .type = "string",
         .description = "Path of the manifest file (.json, .yml or .yaml)"},
        {.key = "selection.default_include", .type = "array",
         .description = "Selection specs used when no --select is given"},
        {.key = "selection.default_exclude", .type = "array",
         .description = "Selection specs excluded when no --exclude is given"},
        {.key = "selection.resource_types", .type = "array",
         .allowed_values = {"model", "source", "seed", "snapshot", "test", "analysis"},
         .description = "Resource kinds kept in the final selection"},
        {.key = "logging.level", .type = "string",
         .allowed_values = {"debug", "info", "warn", "error"},
         .description = "Minimum log level"},
        {.key = "logging.file", .type = "string",
         .description = "Log file path (empty for console)"}
    });
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        auto [section_name, key_name] = splitConfigPath(rule.key);
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

ConfigValue ConfigManager::get(const std::string& key) const {
    auto [section, name] = splitConfigPath(key);
    return get(section, name);
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

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    auto [section, name] = splitConfigPath(key);
    set(section, name, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& key) const {
    auto [section, name] = splitConfigPath(key);
    return has(section, name);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::remove(const std::string& key) {
    auto [section, name] = splitConfigPath(key);
    remove(section, name);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
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
    std::vector<std::string> names = getSectionNames();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    for (const auto& section_name : names) {
        const auto& section = sections_.at(section_name);
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
    if ((rule.type == "int" || rule.type == "double") && (rule.min_value || rule.max_value)) {
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

    // EN: Allowed values apply to every element of an array
    // FR: Les valeurs autorisées s'appliquent à chaque élément d'un tableau
    if (!rule.allowed_values.empty()) {
        std::vector<std::string> candidates;
        if (auto array_val = value.tryAs<std::vector<std::string>>()) {
            candidates = *array_val;
        } else {
            candidates.push_back(value.toString());
        }

        for (const auto& candidate : candidates) {
            if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), candidate)
                == rule.allowed_values.end()) {
                error = "Configuration " + key + " must be one of: ";
                for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                    if (i > 0) error += ", ";
                    error += rule.allowed_values[i];
                }
                error += " (got '" + candidate + "')";
                return false;
            }
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    std::string result = value;
    std::regex var_regex(R"(\$\{([^}]+)\})");
    std::smatch match;

    while (std::regex_search(result, match, var_regex)) {
        const char* env_value = std::getenv(match[1].str().c_str());
        if (!env_value || std::string(env_value).empty()) {
            // Leave variable as-is if not found
            break;
        }
        result.replace(match.position(), match.length(), env_value);
    }

    return result;
}

} // namespace DTP
