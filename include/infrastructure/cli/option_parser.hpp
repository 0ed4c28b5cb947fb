// EN: Option Parser for DT-Pipeline - Declarative CLI options mapped onto configuration paths
// FR: Analyseur d'Options pour DT-Pipeline - Options CLI déclaratives associées à des chemins de configuration

#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace DTP {
namespace CLI {

// EN: CLI option value types
// FR: Types de valeur des options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Boolean flag / FR: Drapeau booléen
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING,         // EN: String value / FR: Valeur chaîne
    STRING_LIST     // EN: Every following non-option token / FR: Tous les jetons suivants qui ne sont pas des options
};

// EN: CLI option value constraints
// FR: Contraintes de valeur d'option CLI
enum class CliOptionConstraint {
    NONE,           // EN: No constraints / FR: Aucune contrainte
    POSITIVE,       // EN: Must be positive (>0) / FR: Doit être positif (>0)
    ENUM_VALUES     // EN: Must be one of predefined values / FR: Doit être l'une des valeurs prédéfinies
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Invalid option provided / FR: Option invalide fournie
    MISSING_VALUE,          // EN: Required value missing / FR: Valeur requise manquante
    INVALID_VALUE,          // EN: Invalid value format / FR: Format de valeur invalide
    CONSTRAINT_VIOLATION    // EN: Value constraint violation / FR: Violation de contrainte de valeur
};

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                          // EN: Long option name (--select) / FR: Nom d'option long (--select)
    std::optional<char> short_name;                 // EN: Short option name (-s) / FR: Nom d'option court (-s)
    CliOptionType type = CliOptionType::STRING;     // EN: Option value type / FR: Type de valeur d'option
    std::string description;                        // EN: Option description for help / FR: Description d'option pour l'aide
    std::string config_path;                        // EN: Configuration path (e.g., "manifest.path") / FR: Chemin de configuration (ex: "manifest.path")
    std::optional<std::string> default_value;       // EN: Default value shown in help / FR: Valeur par défaut affichée dans l'aide
    bool hidden = false;                            // EN: Hide from help output / FR: Masquer de la sortie d'aide

    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::set<std::string> enum_values;              // EN: Valid enum values / FR: Valeurs d'énumération valides

    std::string category = "General";               // EN: Help category / FR: Catégorie d'aide
};

// EN: Parsed CLI option value
// FR: Valeur d'option CLI analysée
struct CliOptionValue {
    std::string option_name;                        // EN: Long name of the parsed option / FR: Nom long de l'option analysée
    CliOptionType type = CliOptionType::STRING;
    std::vector<std::string> raw_values;            // EN: Raw tokens from the command line / FR: Jetons bruts de la ligne de commande
    ConfigValue config_value;                       // EN: Converted value / FR: Valeur convertie
    std::string config_path;
};

// EN: CLI parsing result containing all parsed options and status
// FR: Résultat d'analyse CLI contenant toutes les options analysées et le statut
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::vector<CliOptionValue> parsed_options;     // EN: In command-line order / FR: Dans l'ordre de la ligne de commande
    std::vector<std::string> positional;            // EN: Non-option tokens (command first) / FR: Jetons hors options (commande d'abord)
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    // EN: config_path -> value, repeated list options are concatenated
    // FR: config_path -> valeur, les options liste répétées sont concaténées
    std::unordered_map<std::string, ConfigValue> overrides;

    std::string help_text;
    std::string version_text;
};

// EN: Declarative command line parser. Not thread-safe; build it once in main().
// FR: Analyseur de ligne de commande déclaratif. Non thread-safe; à construire une fois dans main().
class OptionParser {
public:
    explicit OptionParser(const std::string& program_name);
    ~OptionParser();

    OptionParser(const OptionParser&) = delete;
    OptionParser& operator=(const OptionParser&) = delete;

    // EN: Throws std::invalid_argument on empty or duplicate names
    // FR: Lance std::invalid_argument pour un nom vide ou dupliqué
    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);

    // EN: --select, --exclude, --resource-type, --manifest, --config, --output, --log-level, --help, --version
    // FR: --select, --exclude, --resource-type, --manifest, --config, --output, --log-level, --help, --version
    void addStandardOptions();

    CliParseResult parse(int argc, char* argv[]);
    CliParseResult parse(const std::vector<std::string>& arguments);

    std::string generateHelpText() const;
    std::string generateVersionText() const;

    void setHelpHeader(const std::string& header);
    void setHelpFooter(const std::string& footer);
    void setVersionInfo(const std::string& version);

    bool hasOption(const std::string& name) const;
    std::optional<CliOptionDefinition> getOptionDefinition(const std::string& name) const;

private:
    class OptionParserImpl;
    std::unique_ptr<OptionParserImpl> impl_;
};

// EN: Utility functions for option parsing
// FR: Fonctions utilitaires pour l'analyse d'options
namespace OptionParserUtils {
    std::string cliOptionTypeToString(CliOptionType type);
    std::string cliParseStatusToString(CliParseStatus status);

    ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type);

    // EN: Only INTEGER values can be ill-typed; every token is a valid string
    // FR: Seules les valeurs INTEGER peuvent être mal typées; tout jeton est une chaîne valide
    bool isValidCliType(const std::string& raw_value, CliOptionType type);
    bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                          std::string& error_message);

    std::string formatOptionHelp(const CliOptionDefinition& option);

    bool isShortOption(const std::string& arg);
    bool isLongOption(const std::string& arg);
    std::string extractOptionName(const std::string& arg);
}

} // namespace CLI
} // namespace DTP
