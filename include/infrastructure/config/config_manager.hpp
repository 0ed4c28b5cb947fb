// EN: Project configuration for DT-Pipeline - Typed, sectioned YAML configuration with validation rules
// FR: Configuration de projet pour DT-Pipeline - Configuration YAML typée par sections avec règles de validation

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace DTP {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (const T* typed = std::get_if<T>(&*value_)) {
            return *typed;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    // EN: Try to get value as specific type (returns nullopt if empty or type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si vide ou type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* typed = std::get_if<T>(&*value_)) {
            return *typed;
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

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
    bool has(const std::string& key) const;
    void remove(const std::string& key);

    // EN: Keys in lexicographic order.
    // FR: Clés dans l'ordre lexicographique.
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing, validation rules and environment overrides.
// FR: Gestionnaire de configuration principal avec parsing YAML, règles de validation et surcharges d'environnement.
class ConfigManager {
public:
    // EN: Validation rule for one "section.key" configuration path.
    // FR: Règle de validation pour un chemin de configuration "section.clé".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from a YAML file. Throws ValidationError on unreadable or malformed input.
    // FR: Charge la configuration depuis un fichier YAML. Lance ValidationError si illisible ou malformé.
    void loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML text. Throws ValidationError on malformed input.
    // FR: Charge la configuration depuis du texte YAML. Lance ValidationError si malformé.
    void loadFromString(const std::string& yaml_content);

    // EN: Apply <prefix><SECTION>_<KEY> environment variables for every rule key.
    // FR: Applique les variables d'environnement <prefix><SECTION>_<KEY> pour chaque clé de règle.
    size_t loadEnvironmentOverrides(const std::string& prefix = "DTP_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Register the rules of the dtp_project.yml keys (manifest, selection, logging).
    // FR: Enregistre les règles des clés de dtp_project.yml (manifest, selection, logging).
    void addDefaultRules();

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    // EN: Single-key accessors take "section.key"; a key without a dot lives in the "default" section.
    // FR: Les accesseurs à clé unique prennent "section.clé"; une clé sans point vit dans la section "default".
    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& key);
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données de configuration et les règles.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void loadFromNode(const YAML::Node& root, const std::string& origin);

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Convert an environment string into the type a rule expects.
    // FR: Convertit une chaîne d'environnement dans le type attendu par une règle.
    ConfigValue convertForRule(const std::string& raw, const ValidationRule& rule) const;

    // EN: Expand ${VAR} environment references in configuration strings.
    // FR: Étend les références ${VAR} dans les chaînes de configuration.
    std::string expandVariables(const std::string& value) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    // EN: Lock-free helpers; callers hold mutex_.
    // FR: Assistants sans verrou; les appelants détiennent mutex_.
    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

#define CONFIG_GET(key) DTP::ConfigManager::getInstance().get(key)
#define CONFIG_GET_SECTION(section, key) DTP::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET(key, value) DTP::ConfigManager::getInstance().set(key, DTP::ConfigValue(value))
#define CONFIG_SET_SECTION(section, key, value) DTP::ConfigManager::getInstance().set(section, key, DTP::ConfigValue(value))

} // namespace DTP
