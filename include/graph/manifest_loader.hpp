// EN: Manifest Loader for DT-Pipeline - Builds the dependency graph and resource catalog from YAML or JSON
// FR: Chargeur de Manifeste pour DT-Pipeline - Construit le graphe et le catalogue depuis du YAML ou du JSON

#pragma once

#include <string>
#include <vector>

#include "graph/dependency_graph.hpp"
#include "graph/resource_catalog.hpp"

namespace DTP {
namespace Graph {

enum class ManifestFormat {
    YAML = 0,
    JSON = 1
};

// EN: One node entry as written in the manifest, before validation against the graph
// FR: Une entrée de nœud telle qu'écrite dans le manifeste, avant validation contre le graphe
struct ManifestNode {
    NodeId unique_id;
    std::string resource_type;
    NamespacePath fqn;
    std::set<std::string> tags;
    std::vector<NodeId> depends_on;
};

// EN: Loaded project: graph and catalog cover exactly the same identifiers
// FR: Projet chargé: graphe et catalogue couvrent exactement les mêmes identifiants
struct Manifest {
    DependencyGraph graph;
    InMemoryResourceCatalog catalog;
};

// EN: ".json" -> JSON, ".yml"/".yaml" -> YAML. Throws ValidationError otherwise.
// FR: ".json" -> JSON, ".yml"/".yaml" -> YAML. Lance ValidationError sinon.
ManifestFormat manifestFormatFromPath(const std::string& path);

// EN: Parse the "nodes" list only. Throws ValidationError on syntax or shape errors.
// FR: Parse uniquement la liste "nodes". Lance ValidationError sur erreur de syntaxe ou de forme.
std::vector<ManifestNode> parseManifestNodes(const std::string& text, ManifestFormat format);

// EN: Build graph and catalog from parsed entries. Throws ValidationError for bad metadata and
//     GraphIntegrityError for dangling dependencies or cycles.
// FR: Construit graphe et catalogue depuis les entrées. Lance ValidationError pour des métadonnées
//     invalides et GraphIntegrityError pour des dépendances pendantes ou des cycles.
Manifest buildManifest(const std::vector<ManifestNode>& nodes);

Manifest loadManifestText(const std::string& text, ManifestFormat format);
Manifest loadManifestFile(const std::string& path);

} // namespace Graph
} // namespace DTP
