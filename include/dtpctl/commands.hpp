// EN: dtpctl commands - Configuration loading, query building and command dispatch behind the CLI
// FR: Commandes dtpctl - Chargement de configuration, construction de requête et dispatch derrière la CLI

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "graph/manifest_loader.hpp"
#include "infrastructure/cli/option_parser.hpp"
#include "selection/node_selector.hpp"

namespace DTP {
namespace Ctl {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_DTP = 1;
constexpr int EXIT_USAGE = 2;

constexpr const char* DEFAULT_CONFIG_FILE = "dtp_project.yml";
constexpr const char* DEFAULT_MANIFEST = "target/manifest.json";

// EN: Load dtp_project.yml (or --config), then DTP_* variables, then command line overrides.
//     Paths starting with '_' are CLI-only. Throws ValidationError on bad files or rule violations.
// FR: Charge dtp_project.yml (ou --config), puis les variables DTP_*, puis les surcharges CLI.
//     Les chemins commençant par '_' sont propres à la CLI. Lance ValidationError si invalide.
void loadConfiguration(const CLI::CliParseResult& cli);

// EN: Apply logging.level and logging.file from the loaded configuration
// FR: Applique logging.level et logging.file depuis la configuration chargée
void configureLogging();

// EN: Selection query from the selection.* keys; an empty include is left for the selector to default
// FR: Requête de sélection depuis les clés selection.*; une inclusion vide est laissée au sélecteur
Selection::SelectionQuery buildQuery();

int runList(const Graph::Manifest& manifest, bool json_output, std::ostream& out);
int runPackages(const Graph::Manifest& manifest, bool json_output, std::ostream& out);
int runValidate(const Graph::Manifest& manifest, bool json_output, std::ostream& out);

// EN: Whole CLI run without argv[0]: parse, configure, load the manifest, dispatch.
//     Results go to out, diagnostics to err. Returns EXIT_OK, EXIT_FAILURE_DTP or EXIT_USAGE.
// FR: Exécution complète de la CLI sans argv[0]: analyse, configuration, manifeste, dispatch.
//     Résultats vers out, diagnostics vers err. Retourne EXIT_OK, EXIT_FAILURE_DTP ou EXIT_USAGE.
int runDtpctl(const std::vector<std::string>& arguments, std::ostream& out, std::ostream& err);

} // namespace Ctl
} // namespace DTP
