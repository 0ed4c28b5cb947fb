// EN: dtpctl commands implementation
// FR: Implémentation des commandes dtpctl

#include "dtpctl/commands.hpp"
#include "core/errors.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <set>

namespace DTP {
namespace Ctl {

namespace {
    const std::set<std::string> COMMANDS = {"ls", "packages", "validate"};
}

void loadConfiguration(const CLI::CliParseResult& cli) {
    auto& config = ConfigManager::getInstance();
    config.addDefaultRules();

    auto explicit_config = cli.overrides.find("_config_file");
    if (explicit_config != cli.overrides.end()) {
        config.loadFromFile(explicit_config->second.as<std::string>());
    } else if (std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
        config.loadFromFile(DEFAULT_CONFIG_FILE);
    }

    size_t applied = config.loadEnvironmentOverrides("DTP_");
    if (applied > 0) {
        LOG_DEBUG("dtpctl", "Applied " + std::to_string(applied) + " environment overrides");
    }

    for (const auto& [path, value] : cli.overrides) {
        if (!path.empty() && path.front() != '_') {
            config.set(path, value);
        }
    }

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        std::string message = "Invalid configuration:";
        for (const auto& error : errors) {
            message += "\n  " + error;
        }
        throw ValidationError(message);
    }
}

void configureLogging() {
    auto& config = ConfigManager::getInstance();
    auto& logger = Logger::getInstance();

    std::string level = config.get("logging.level").asOrDefault<std::string>("");
    if (!level.empty()) {
        logger.setLogLevel(parseLogLevel(level));
    }
    std::string file = config.get("logging.file").asOrDefault<std::string>("");
    if (!file.empty()) {
        logger.setOutputFile(file);
    }
}

Selection::SelectionQuery buildQuery() {
    auto& config = ConfigManager::getInstance();

    Selection::SelectionQuery query;
    query.include = config.get("selection.default_include").asOrDefault<std::vector<std::string>>({});
    query.exclude = config.get("selection.default_exclude").asOrDefault<std::vector<std::string>>({});
    for (const auto& kind : config.get("selection.resource_types").asOrDefault<std::vector<std::string>>({})) {
        query.resource_kinds.insert(Graph::stringToResourceKind(kind));
    }
    return query;
}

int runList(const Graph::Manifest& manifest, bool json_output, std::ostream& out) {
    Selection::NodeSelector selector(manifest.catalog);
    auto result = selector.select(manifest.graph, buildQuery());

    if (json_output) {
        out << Selection::NodeSelectorUtils::selectionResultToJson(result).dump(2) << std::endl;
    } else {
        for (const auto& id : result.execution_order) {
            out << id << "\n";
        }
    }
    return EXIT_OK;
}

int runPackages(const Graph::Manifest& manifest, bool json_output, std::ostream& out) {
    auto packages = Selection::NodeSelectorUtils::getPackageNames(manifest.graph);

    if (json_output) {
        out << nlohmann::json(packages).dump(2) << std::endl;
    } else {
        for (const auto& package : packages) {
            out << package << "\n";
        }
    }
    return EXIT_OK;
}

// EN: The manifest already passed integrity checks when loaded; configured specs must parse too
// FR: Le manifeste a déjà passé les contrôles d'intégrité au chargement; les specs configurées doivent aussi se parser
int runValidate(const Graph::Manifest& manifest, bool json_output, std::ostream& out) {
    auto query = buildQuery();
    Selection::NodeSelectorUtils::parseAll(query.include);
    Selection::NodeSelectorUtils::parseAll(query.exclude);

    if (json_output) {
        nlohmann::json j;
        j["valid"] = true;
        j["nodes"] = manifest.graph.size();
        j["edges"] = manifest.graph.edgeCount();
        out << j.dump(2) << std::endl;
    } else {
        out << "Manifest OK: " << manifest.graph.size() << " nodes, "
            << manifest.graph.edgeCount() << " edges" << std::endl;
    }
    return EXIT_OK;
}

int runDtpctl(const std::vector<std::string>& arguments, std::ostream& out, std::ostream& err) {
    auto& logger = Logger::getInstance();

    CLI::OptionParser parser("dtpctl");
    parser.addStandardOptions();
    auto cli = parser.parse(arguments);

    if (cli.status == CLI::CliParseStatus::HELP_REQUESTED) {
        out << cli.help_text;
        return EXIT_OK;
    }
    if (cli.status == CLI::CliParseStatus::VERSION_REQUESTED) {
        out << cli.version_text;
        return EXIT_OK;
    }
    if (cli.status != CLI::CliParseStatus::SUCCESS) {
        for (const auto& error : cli.errors) {
            err << "dtpctl: " << error << "\n";
        }
        err << "Try 'dtpctl --help' for more information." << std::endl;
        return EXIT_USAGE;
    }
    if (cli.positional.size() != 1 || COMMANDS.count(cli.positional.front()) == 0) {
        err << "dtpctl: expected exactly one command (ls, packages, validate)\n"
            << "Try 'dtpctl --help' for more information." << std::endl;
        return EXIT_USAGE;
    }

    const std::string& command = cli.positional.front();
    auto output = cli.overrides.find("_output_format");
    bool json_output = output != cli.overrides.end() && output->second.as<std::string>() == "json";

    try {
        loadConfiguration(cli);
        configureLogging();
        logger.setCorrelationId(logger.generateCorrelationId());

        std::string manifest_path = ConfigManager::getInstance().get("manifest.path")
                                        .asOrDefault<std::string>(DEFAULT_MANIFEST);
        LOG_INFO("dtpctl", "Running '" + command + "' on " + manifest_path);
        auto manifest = Graph::loadManifestFile(manifest_path);

        int exit_code = EXIT_OK;
        if (command == "ls") {
            exit_code = runList(manifest, json_output, out);
        } else if (command == "packages") {
            exit_code = runPackages(manifest, json_output, out);
        } else {
            exit_code = runValidate(manifest, json_output, out);
        }
        logger.flush();
        return exit_code;
    } catch (const DtpError& e) {
        LOG_ERROR("dtpctl", e.what());
        logger.flush();
        err << "dtpctl: " << e.what() << std::endl;
        return EXIT_FAILURE_DTP;
    }
}

} // namespace Ctl
} // namespace DTP
