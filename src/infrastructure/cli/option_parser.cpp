// EN: Option Parser implementation
// FR: Implémentation de l'Analyseur d'Options

#include "infrastructure/cli/option_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace DTP {
namespace CLI {

class OptionParser::OptionParserImpl {
public:
    explicit OptionParserImpl(const std::string& program_name)
        : program_name_(program_name)
        , help_header_("DT-Pipeline resource selection tool")
        , version_("1.0.0") {
    }

    void addOption(const CliOptionDefinition& option_def) {
        if (option_def.long_name.empty()) {
            throw std::invalid_argument("Option long name cannot be empty");
        }

        if (options_by_long_name_.find(option_def.long_name) != options_by_long_name_.end()) {
            throw std::invalid_argument("Option with long name '" + option_def.long_name + "' already exists");
        }

        if (option_def.short_name && options_by_short_name_.find(*option_def.short_name) != options_by_short_name_.end()) {
            throw std::invalid_argument("Option with short name '-" + std::string(1, *option_def.short_name) + "' already exists");
        }

        option_definitions_.push_back(option_def);
        options_by_long_name_[option_def.long_name] = option_def;
        if (option_def.short_name) {
            options_by_short_name_[*option_def.short_name] = option_def;
        }
    }

    void addStandardOptions() {
        std::vector<CliOptionDefinition> standard_options = {
            {
                .long_name = "select",
                .short_name = 's',
                .type = CliOptionType::STRING_LIST,
                .description = "EN: Selection specs to include / FR: Specs de sélection à inclure",
                .config_path = "selection.default_include",
                .default_value = "*",
                .category = "Selection"
            },
            {
                .long_name = "exclude",
                .short_name = 'x',
                .type = CliOptionType::STRING_LIST,
                .description = "EN: Selection specs to exclude / FR: Specs de sélection à exclure",
                .config_path = "selection.default_exclude",
                .category = "Selection"
            },
            {
                .long_name = "resource-type",
                .type = CliOptionType::STRING_LIST,
                .description = "EN: Keep only these resource kinds / FR: Ne garder que ces types de ressources",
                .config_path = "selection.resource_types",
                .constraint = CliOptionConstraint::ENUM_VALUES,
                .enum_values = {"model", "source", "seed", "snapshot", "test", "analysis"},
                .category = "Selection"
            },
            {
                .long_name = "manifest",
                .short_name = 'm',
                .type = CliOptionType::STRING,
                .description = "EN: Manifest file (.json, .yml, .yaml) / FR: Fichier manifeste (.json, .yml, .yaml)",
                .config_path = "manifest.path",
                .default_value = "target/manifest.json",
                .category = "General"
            },
            {
                .long_name = "config",
                .short_name = 'c',
                .type = CliOptionType::STRING,
                .description = "EN: Project configuration file / FR: Fichier de configuration du projet",
                .config_path = "_config_file",
                .default_value = "dtp_project.yml",
                .category = "General"
            },
            {
                .long_name = "output",
                .short_name = 'o',
                .type = CliOptionType::STRING,
                .description = "EN: Output format (text, json) / FR: Format de sortie (text, json)",
                .config_path = "_output_format",
                .default_value = "text",
                .constraint = CliOptionConstraint::ENUM_VALUES,
                .enum_values = {"text", "json"},
                .category = "General"
            },
            {
                .long_name = "log-level",
                .type = CliOptionType::STRING,
                .description = "EN: Logging level (debug, info, warn, error) / FR: Niveau de journalisation (debug, info, warn, error)",
                .config_path = "logging.level",
                .default_value = "warn",
                .constraint = CliOptionConstraint::ENUM_VALUES,
                .enum_values = {"debug", "info", "warn", "error"},
                .category = "Logging"
            },
            {
                .long_name = "help",
                .short_name = 'h',
                .type = CliOptionType::BOOLEAN,
                .description = "EN: Show this help message / FR: Afficher ce message d'aide",
                .config_path = "_help",
                .hidden = true
            },
            {
                .long_name = "version",
                .short_name = 'V',
                .type = CliOptionType::BOOLEAN,
                .description = "EN: Show version information / FR: Afficher les informations de version",
                .config_path = "_version",
                .hidden = true
            }
        };

        for (const auto& option_def : standard_options) {
            addOption(option_def);
        }
    }

    // EN: Main parsing implementation
    // FR: Implémentation d'analyse principale
    CliParseResult parse(const std::vector<std::string>& arguments) {
        CliParseResult result;

        for (size_t i = 0; i < arguments.size(); ++i) {
            const std::string& arg = arguments[i];

            if (arg.empty()) continue;

            // EN: Check for help or version flags first
            // FR: Vérifier d'abord les drapeaux d'aide ou de version
            if (arg == "--help" || arg == "-h") {
                result.status = CliParseStatus::HELP_REQUESTED;
                result.help_text = generateHelpText();
                return result;
            }

            if (arg == "--version" || arg == "-V") {
                result.status = CliParseStatus::VERSION_REQUESTED;
                result.version_text = generateVersionText();
                return result;
            }

            if (!isOption(arg)) {
                result.positional.push_back(arg);
                continue;
            }

            parseOption(arguments, i, result);
        }

        LOG_DEBUG("cli", "Parsed " + std::to_string(result.parsed_options.size()) + " options, " +
                         std::to_string(result.positional.size()) + " positional arguments, status " +
                         OptionParserUtils::cliParseStatusToString(result.status));
        return result;
    }

    std::string generateHelpText() const {
        std::ostringstream help;

        help << help_header_ << "\n\n";
        help << "Usage: " << program_name_ << " COMMAND [OPTIONS]\n\n";
        help << "Commands:\n";
        help << "  ls         List selected resources in dependency order\n";
        help << "  packages   List the packages of the project\n";
        help << "  validate   Check the manifest and the configuration\n\n";

        // EN: Group options by category
        // FR: Grouper les options par catégorie
        std::map<std::string, std::vector<CliOptionDefinition>> options_by_category;
        for (const auto& opt : option_definitions_) {
            if (!opt.hidden) {
                options_by_category[opt.category].push_back(opt);
            }
        }

        for (const auto& [category, options] : options_by_category) {
            help << category << " Options:\n";
            for (const auto& opt : options) {
                help << OptionParserUtils::formatOptionHelp(opt) << "\n";
            }
            help << "\n";
        }

        help << "  -h, --help                  Show this help message\n";
        help << "  -V, --version               Show version information\n";
        if (!help_footer_.empty()) {
            help << "\n" << help_footer_ << "\n";
        }
        return help.str();
    }

    std::string generateVersionText() const {
        return "DT-Pipeline " + version_ + "\n";
    }

    const CliOptionDefinition* findOption(const std::string& name) const {
        auto it = options_by_long_name_.find(name);
        if (it != options_by_long_name_.end()) {
            return &it->second;
        }
        if (name.size() == 1) {
            auto short_it = options_by_short_name_.find(name[0]);
            if (short_it != options_by_short_name_.end()) {
                return &short_it->second;
            }
        }
        return nullptr;
    }

    std::string program_name_;
    std::string help_header_;
    std::string help_footer_;
    std::string version_;

private:
    static bool isOption(const std::string& arg) {
        return OptionParserUtils::isLongOption(arg) || OptionParserUtils::isShortOption(arg);
    }

    static void fail(CliParseResult& result, CliParseStatus status, const std::string& message) {
        // EN: The first failure decides the status
        // FR: Le premier échec décide du statut
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
        result.errors.push_back(message);
    }

    // EN: Parse the option at arguments[index], advancing index past consumed values
    // FR: Analyse l'option à arguments[index], en avançant index après les valeurs consommées
    void parseOption(const std::vector<std::string>& arguments, size_t& index, CliParseResult& result) {
        const std::string& arg = arguments[index];

        std::string option_name;
        std::optional<std::string> inline_value;
        if (OptionParserUtils::isLongOption(arg)) {
            option_name = arg.substr(2);
            auto equals = option_name.find('=');
            if (equals != std::string::npos) {
                inline_value = option_name.substr(equals + 1);
                option_name.erase(equals);
            }
        } else if (arg.size() == 2) {
            option_name = arg.substr(1);
        }

        const CliOptionDefinition* option_def = option_name.empty() ? nullptr : findOption(option_name);
        if (!option_def || (option_name.size() == 1 && OptionParserUtils::isLongOption(arg))) {
            fail(result, CliParseStatus::INVALID_OPTION, "Unknown option: " + arg);
            return;
        }

        CliOptionValue option_value;
        option_value.option_name = option_def->long_name;
        option_value.type = option_def->type;
        option_value.config_path = option_def->config_path;

        // EN: Boolean flags take no value
        // FR: Les drapeaux booléens ne prennent pas de valeur
        if (option_def->type == CliOptionType::BOOLEAN) {
            if (inline_value) {
                fail(result, CliParseStatus::INVALID_VALUE, "Option " + arg + " does not take a value");
                return;
            }
            option_value.raw_values = {"true"};
            option_value.config_value = ConfigValue(true);
            result.overrides[option_value.config_path] = option_value.config_value;
            result.parsed_options.push_back(std::move(option_value));
            return;
        }

        if (inline_value) {
            option_value.raw_values.push_back(*inline_value);
        } else if (option_def->type == CliOptionType::STRING_LIST) {
            while (index + 1 < arguments.size() && !isOption(arguments[index + 1])) {
                option_value.raw_values.push_back(arguments[++index]);
            }
        } else if (index + 1 < arguments.size() && !isOption(arguments[index + 1])) {
            option_value.raw_values.push_back(arguments[++index]);
        }

        if (option_value.raw_values.empty()) {
            fail(result, CliParseStatus::MISSING_VALUE, "Option " + arg + " requires a value");
            return;
        }

        for (const auto& raw : option_value.raw_values) {
            std::string validation_error;
            if (!OptionParserUtils::validateCliValue(raw, *option_def, validation_error)) {
                CliParseStatus status = OptionParserUtils::isValidCliType(raw, option_def->type)
                    ? CliParseStatus::CONSTRAINT_VIOLATION : CliParseStatus::INVALID_VALUE;
                fail(result, status, "Invalid value for option " + arg + ": " + validation_error);
                return;
            }
        }

        if (option_def->type == CliOptionType::STRING_LIST) {
            std::vector<std::string> merged;
            auto existing = result.overrides.find(option_value.config_path);
            if (existing != result.overrides.end()) {
                merged = existing->second.asOrDefault<std::vector<std::string>>({});
            }
            merged.insert(merged.end(), option_value.raw_values.begin(), option_value.raw_values.end());
            option_value.config_value = ConfigValue(option_value.raw_values);
            result.overrides[option_value.config_path] = ConfigValue(merged);
        } else {
            option_value.config_value = OptionParserUtils::parseCliValue(option_value.raw_values.front(), option_def->type);
            result.overrides[option_value.config_path] = option_value.config_value;
        }
        result.parsed_options.push_back(std::move(option_value));
    }

    std::vector<CliOptionDefinition> option_definitions_;
    std::unordered_map<std::string, CliOptionDefinition> options_by_long_name_;
    std::unordered_map<char, CliOptionDefinition> options_by_short_name_;
};

// EN: OptionParser public interface implementation
// FR: Implémentation de l'interface publique OptionParser
OptionParser::OptionParser(const std::string& program_name)
    : impl_(std::make_unique<OptionParserImpl>(program_name)) {
}

OptionParser::~OptionParser() = default;

void OptionParser::addOption(const CliOptionDefinition& option_def) {
    impl_->addOption(option_def);
}

void OptionParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& option_def : option_defs) {
        impl_->addOption(option_def);
    }
}

void OptionParser::addStandardOptions() {
    impl_->addStandardOptions();
}

CliParseResult OptionParser::parse(int argc, char* argv[]) {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return impl_->parse(arguments);
}

CliParseResult OptionParser::parse(const std::vector<std::string>& arguments) {
    return impl_->parse(arguments);
}

std::string OptionParser::generateHelpText() const {
    return impl_->generateHelpText();
}

std::string OptionParser::generateVersionText() const {
    return impl_->generateVersionText();
}

void OptionParser::setHelpHeader(const std::string& header) {
    impl_->help_header_ = header;
}

void OptionParser::setHelpFooter(const std::string& footer) {
    impl_->help_footer_ = footer;
}

void OptionParser::setVersionInfo(const std::string& version) {
    impl_->version_ = version;
}

bool OptionParser::hasOption(const std::string& name) const {
    return impl_->findOption(name) != nullptr;
}

std::optional<CliOptionDefinition> OptionParser::getOptionDefinition(const std::string& name) const {
    const CliOptionDefinition* option_def = impl_->findOption(name);
    if (!option_def) {
        return std::nullopt;
    }
    return *option_def;
}

namespace OptionParserUtils {

std::string cliOptionTypeToString(CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN:     return "boolean";
        case CliOptionType::INTEGER:     return "integer";
        case CliOptionType::STRING:      return "string";
        case CliOptionType::STRING_LIST: return "string_list";
        default:                         return "unknown";
    }
}

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS:              return "success";
        case CliParseStatus::HELP_REQUESTED:       return "help_requested";
        case CliParseStatus::VERSION_REQUESTED:    return "version_requested";
        case CliParseStatus::INVALID_OPTION:       return "invalid_option";
        case CliParseStatus::MISSING_VALUE:        return "missing_value";
        case CliParseStatus::INVALID_VALUE:        return "invalid_value";
        case CliParseStatus::CONSTRAINT_VIOLATION: return "constraint_violation";
        default:                                   return "unknown";
    }
}

ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN:
            return ConfigValue(raw_value == "true" || raw_value == "1" || raw_value == "yes");
        case CliOptionType::INTEGER:
            return ConfigValue(std::stoi(raw_value));
        case CliOptionType::STRING_LIST:
            return ConfigValue(std::vector<std::string>{raw_value});
        case CliOptionType::STRING:
        default:
            return ConfigValue(raw_value);
    }
}

bool isValidCliType(const std::string& raw_value, CliOptionType type) {
    if (type != CliOptionType::INTEGER) {
        return true;
    }
    size_t consumed = 0;
    try {
        std::stoi(raw_value, &consumed);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return consumed == raw_value.size();
}

bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                      std::string& error_message) {
    if (!isValidCliType(raw_value, definition.type)) {
        error_message = "'" + raw_value + "' is not a valid " + cliOptionTypeToString(definition.type);
        return false;
    }

    if (definition.type == CliOptionType::INTEGER) {
        int value = std::stoi(raw_value);
        if (definition.constraint == CliOptionConstraint::POSITIVE && value <= 0) {
            error_message = "'" + raw_value + "' must be positive";
            return false;
        }
    }

    if (definition.constraint == CliOptionConstraint::ENUM_VALUES &&
        definition.enum_values.find(raw_value) == definition.enum_values.end()) {
        std::string allowed;
        for (const auto& value : definition.enum_values) {
            if (!allowed.empty()) allowed += ", ";
            allowed += value;
        }
        error_message = "'" + raw_value + "' is not one of: " + allowed;
        return false;
    }

    return true;
}

std::string formatOptionHelp(const CliOptionDefinition& option) {
    std::ostringstream help;

    std::string option_names = "  ";
    if (option.short_name) {
        option_names += "-" + std::string(1, *option.short_name) + ", ";
    } else {
        option_names += "    ";
    }
    option_names += "--" + option.long_name;

    if (option.type == CliOptionType::STRING_LIST) {
        option_names += " <spec>...";
    } else if (option.type != CliOptionType::BOOLEAN) {
        option_names += " <" + cliOptionTypeToString(option.type) + ">";
    }

    size_t name_width = 30; // EN: Fixed width for option names / FR: Largeur fixe pour les noms d'options
    if (option_names.length() > name_width - 2) {
        help << option_names << "\n" << std::string(name_width, ' ') << option.description;
    } else {
        help << std::left << std::setw(static_cast<int>(name_width)) << option_names << option.description;
    }

    if (option.default_value && !option.default_value->empty()) {
        help << " (default: " << *option.default_value << ")";
    }

    return help.str();
}

bool isShortOption(const std::string& arg) {
    return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' &&
           std::isalpha(static_cast<unsigned char>(arg[1]));
}

bool isLongOption(const std::string& arg) {
    return arg.length() >= 3 && arg.compare(0, 2, "--") == 0 &&
           std::isalpha(static_cast<unsigned char>(arg[2]));
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        std::string name = arg.substr(2);
        return name.substr(0, name.find('='));
    } else if (isShortOption(arg)) {
        return arg.substr(1, 1);
    }
    return "";
}

} // namespace OptionParserUtils

} // namespace CLI
} // namespace DTP
