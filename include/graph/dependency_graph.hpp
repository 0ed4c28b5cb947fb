// EN: Dependency Graph for DT-Pipeline - Directed resource graph with ancestor/descendant closures
// FR: Graphe de Dépendances pour DT-Pipeline - Graphe orienté de ressources avec fermetures ancêtres/descendants

#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace DTP {
namespace Graph {

// EN: Opaque unique resource key, e.g. "model.analytics.orders"
// FR: Clé de ressource unique et opaque, ex: "model.analytics.orders"
using NodeId = std::string;

// EN: Ordered node set, so that every result is deterministic
// FR: Ensemble de nœuds ordonné, afin que chaque résultat soit déterministe
using NodeSet = std::set<NodeId>;

// EN: Directed graph whose edges go from a dependency to its dependent (producer -> consumer).
//     The graph is expected to be a DAG; closures still terminate on cyclic input.
// FR: Graphe orienté dont les arêtes vont d'une dépendance vers son dépendant (producteur -> consommateur).
//     Le graphe est supposé acyclique; les fermetures terminent quand même sur une entrée cyclique.
class DependencyGraph {
public:
    DependencyGraph() = default;

    // EN: Add a node (no-op if it already exists)
    // FR: Ajoute un nœud (sans effet s'il existe déjà)
    void addNode(const NodeId& id);

    // EN: Add edge "to depends on from". Missing endpoints are added; duplicate edges are ignored.
    // FR: Ajoute l'arête "to dépend de from". Les extrémités manquantes sont ajoutées; les doublons ignorés.
    void addEdge(const NodeId& from, const NodeId& to);

    bool hasNode(const NodeId& id) const;

    // EN: All node identifiers, sorted
    // FR: Tous les identifiants de nœuds, triés
    std::vector<NodeId> nodes() const;

    size_t size() const { return successors_.size(); }
    size_t edgeCount() const { return edge_count_; }

    // EN: Direct dependencies / dependents. Throw GraphIntegrityError for unknown nodes.
    // FR: Dépendances / dépendants directs. Lancent GraphIntegrityError pour les nœuds inconnus.
    const std::vector<NodeId>& predecessors(const NodeId& id) const;
    const std::vector<NodeId>& successors(const NodeId& id) const;

    // EN: Every node with a directed path into any seed. Seeds are only included when
    //     reachable from another seed. O(V+E).
    // FR: Tout nœud ayant un chemin orienté vers une graine. Les graines ne sont incluses que
    //     si elles sont atteignables depuis une autre graine. O(V+E).
    NodeSet ancestors(const NodeSet& seeds) const;

    // EN: Every node reachable by a directed path from any seed. Same seed rule. O(V+E).
    // FR: Tout nœud atteignable par un chemin orienté depuis une graine. Même règle. O(V+E).
    NodeSet descendants(const NodeSet& seeds) const;

    // EN: Cycle detection using DFS coloring
    // FR: Détection de cycles par coloration DFS
    bool hasCycle() const;

    // EN: Each detected cycle rendered as "a -> b -> a"
    // FR: Chaque cycle détecté rendu sous la forme "a -> b -> a"
    std::vector<std::string> findCycles() const;

    // EN: Kahn's algorithm restricted to subset: dependencies first, ties broken by identifier.
    //     Throws GraphIntegrityError on unknown nodes or when the subset contains a cycle.
    // FR: Algorithme de Kahn restreint au sous-ensemble: dépendances d'abord, égalités départagées par
    //     identifiant. Lance GraphIntegrityError pour un nœud inconnu ou un cycle dans le sous-ensemble.
    std::vector<NodeId> topologicalSort(const NodeSet& subset) const;
    std::vector<NodeId> topologicalSort() const;

private:
    using AdjacencyMap = std::unordered_map<NodeId, std::vector<NodeId>>;

    NodeSet reachable(const NodeSet& seeds, const AdjacencyMap& adjacency) const;
    const std::vector<NodeId>& neighbours(const NodeId& id, const AdjacencyMap& adjacency) const;

    // EN: Forward (dependents) and reverse (dependencies) adjacency lists
    // FR: Listes d'adjacence directe (dépendants) et inverse (dépendances)
    AdjacencyMap successors_;
    AdjacencyMap predecessors_;
    size_t edge_count_ = 0;
};

} // namespace Graph
} // namespace DTP
