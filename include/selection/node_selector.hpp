// EN: Node Selector for DT-Pipeline - Resolves include/exclude selection specs against the dependency graph
// FR: Sélecteur de Nœuds pour DT-Pipeline - Résout les specs d'inclusion/exclusion contre le graphe de dépendances

#pragma once

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "graph/dependency_graph.hpp"
#include "graph/resource_catalog.hpp"
#include "selection/selection_criteria.hpp"

namespace DTP {
namespace Selection {

// EN: Full selection request as issued by the CLI
// FR: Requête de sélection complète telle qu'émise par la CLI
struct SelectionQuery {
    std::vector<std::string> include;                // EN: Include specs, "*" when empty / FR: Specs d'inclusion, "*" si vide
    std::vector<std::string> exclude;                // EN: Exclude specs / FR: Specs d'exclusion
    std::set<Graph::ResourceKind> resource_kinds;    // EN: Kind filter, none when empty / FR: Filtre de type, aucun si vide
};

// EN: Selection result with execution order and statistics
// FR: Résultat de sélection avec ordre d'exécution et statistiques
struct SelectionResult {
    Graph::NodeSet selected;                         // EN: Selected node ids / FR: Ids des nœuds sélectionnés
    std::vector<Graph::NodeId> execution_order;      // EN: Dependencies first / FR: Dépendances d'abord
    size_t total_nodes = 0;                          // EN: Nodes in the graph / FR: Nœuds dans le graphe
    size_t matched_nodes = 0;                        // EN: Direct matches of the include specs / FR: Correspondances directes des inclusions
    std::chrono::milliseconds selection_time{0};     // EN: Time taken for selection / FR: Temps pris pour la sélection
};

// EN: Stateless selection engine bound to a resource catalog. Safe to share between threads
//     as long as the catalog and graphs are not mutated.
// FR: Moteur de sélection sans état lié à un catalogue. Partageable entre threads tant que le
//     catalogue et les graphes ne sont pas modifiés.
class NodeSelector {
public:
    explicit NodeSelector(const Graph::ResourceCatalog& catalog);

    // EN: Graph nodes whose metadata satisfies the criterion. Throws CatalogLookupError.
    // FR: Nœuds du graphe dont les métadonnées satisfont le critère. Lance CatalogLookupError.
    Graph::NodeSet getDirectMatches(const Graph::DependencyGraph& graph, const SelectionCriteria& criteria) const;

    // EN: Direct matches expanded with the directional closure of the criterion
    // FR: Correspondances directes étendues par la fermeture directionnelle du critère
    Graph::NodeSet getNodesFromCriteria(const Graph::DependencyGraph& graph, const SelectionCriteria& criteria) const;

    // EN: Union of the include specs minus the union of the exclude specs. Every spec is
    //     parsed before any traversal; throws InvalidSelectorError or CatalogLookupError.
    // FR: Union des inclusions moins l'union des exclusions. Chaque spec est parsée avant tout
    //     parcours; lance InvalidSelectorError ou CatalogLookupError.
    Graph::NodeSet selectNodes(const Graph::DependencyGraph& graph,
                               const std::vector<std::string>& include,
                               const std::vector<std::string>& exclude) const;

    SelectionResult select(const Graph::DependencyGraph& graph, const SelectionQuery& query) const;

private:
    // EN: Directional closure of already matched nodes
    // FR: Fermeture directionnelle de nœuds déjà trouvés
    Graph::NodeSet expand(const Graph::DependencyGraph& graph, const SelectionCriteria& criteria,
                          const Graph::NodeSet& matched) const;

    Graph::NodeSet resolve(const Graph::DependencyGraph& graph,
                           const std::vector<SelectionCriteria>& criteria,
                           Graph::NodeSet* direct_matches) const;

    const Graph::ResourceCatalog& catalog_;
};

namespace NodeSelectorUtils {
    // EN: Distinct package segments (second dot token) of every node identifier
    // FR: Segments de paquet distincts (deuxième jeton) de chaque identifiant de nœud
    std::set<std::string> getPackageNames(const Graph::DependencyGraph& graph);

    std::vector<SelectionCriteria> parseAll(const std::vector<std::string>& specs);

    nlohmann::json selectionResultToJson(const SelectionResult& result);
}

} // namespace Selection
} // namespace DTP
