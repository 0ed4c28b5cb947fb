// EN: Dependency Graph implementation - BFS closures, cycle detection and topological ordering
// FR: Implémentation du Graphe de Dépendances - Fermetures BFS, détection de cycles et tri topologique

#include "graph/dependency_graph.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <queue>
#include <utility>

namespace DTP {
namespace Graph {

void DependencyGraph::addNode(const NodeId& id) {
    successors_.try_emplace(id);
    predecessors_.try_emplace(id);
}

void DependencyGraph::addEdge(const NodeId& from, const NodeId& to) {
    addNode(from);
    addNode(to);

    auto& out = successors_[from];
    if (std::find(out.begin(), out.end(), to) != out.end()) {
        return;
    }
    out.push_back(to);
    predecessors_[to].push_back(from);
    ++edge_count_;
}

bool DependencyGraph::hasNode(const NodeId& id) const {
    return successors_.find(id) != successors_.end();
}

std::vector<NodeId> DependencyGraph::nodes() const {
    std::vector<NodeId> result;
    result.reserve(successors_.size());
    for (const auto& [id, _] : successors_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

const std::vector<NodeId>& DependencyGraph::neighbours(const NodeId& id, const AdjacencyMap& adjacency) const {
    auto it = adjacency.find(id);
    if (it == adjacency.end()) {
        throw GraphIntegrityError("Unknown node in dependency graph: " + id);
    }
    return it->second;
}

const std::vector<NodeId>& DependencyGraph::predecessors(const NodeId& id) const {
    return neighbours(id, predecessors_);
}

const std::vector<NodeId>& DependencyGraph::successors(const NodeId& id) const {
    return neighbours(id, successors_);
}

// EN: Multi-source BFS; the result set doubles as the visited set, so cycles cannot loop forever
// FR: BFS multi-sources; l'ensemble résultat sert d'ensemble visité, les cycles ne bouclent donc pas
NodeSet DependencyGraph::reachable(const NodeSet& seeds, const AdjacencyMap& adjacency) const {
    NodeSet result;
    std::queue<NodeId> frontier;

    for (const auto& seed : seeds) {
        if (!hasNode(seed)) {
            throw GraphIntegrityError("Unknown node in dependency graph: " + seed);
        }
        frontier.push(seed);
    }

    while (!frontier.empty()) {
        NodeId current = std::move(frontier.front());
        frontier.pop();

        for (const auto& next : neighbours(current, adjacency)) {
            if (result.insert(next).second) {
                frontier.push(next);
            }
        }
    }

    return result;
}

NodeSet DependencyGraph::ancestors(const NodeSet& seeds) const {
    return reachable(seeds, predecessors_);
}

NodeSet DependencyGraph::descendants(const NodeSet& seeds) const {
    return reachable(seeds, successors_);
}

bool DependencyGraph::hasCycle() const {
    return !findCycles().empty();
}

// EN: Iterative DFS with coloring (0=white, 1=gray, 2=black); a gray successor closes a cycle
// FR: DFS itératif avec coloration (0=blanc, 1=gris, 2=noir); un successeur gris ferme un cycle
std::vector<std::string> DependencyGraph::findCycles() const {
    std::vector<std::string> cycles;
    std::unordered_map<NodeId, int> colors;
    for (const auto& [id, _] : successors_) {
        colors[id] = 0;
    }

    for (const auto& root : nodes()) {
        if (colors[root] != 0) {
            continue;
        }

        std::vector<std::pair<NodeId, size_t>> stack;
        std::vector<NodeId> path;
        stack.emplace_back(root, 0);
        path.push_back(root);
        colors[root] = 1;

        while (!stack.empty()) {
            auto& [node, child_index] = stack.back();
            const auto& children = successors_.at(node);

            if (child_index >= children.size()) {
                colors[node] = 2;
                stack.pop_back();
                path.pop_back();
                continue;
            }

            NodeId child = children[child_index++];
            int color = colors[child];

            if (color == 1) {
                // EN: Found cycle, extract it from path
                // FR: Cycle trouvé, l'extraire du chemin
                auto cycle_start = std::find(path.begin(), path.end(), child);
                std::string cycle_str;
                for (auto it = cycle_start; it != path.end(); ++it) {
                    if (!cycle_str.empty()) cycle_str += " -> ";
                    cycle_str += *it;
                }
                cycle_str += " -> " + child;
                cycles.push_back(cycle_str);
            } else if (color == 0) {
                colors[child] = 1;
                path.push_back(child);
                stack.emplace_back(child, 0);
            }
        }
    }

    return cycles;
}

std::vector<NodeId> DependencyGraph::topologicalSort(const NodeSet& subset) const {
    std::unordered_map<NodeId, size_t> in_degree;
    for (const auto& id : subset) {
        in_degree[id] = 0;
    }

    // EN: Calculate in-degrees counting only edges inside the subset
    // FR: Calculer les degrés entrants en ne comptant que les arêtes internes au sous-ensemble
    for (const auto& id : subset) {
        for (const auto& dependency : predecessors(id)) {
            if (subset.count(dependency)) {
                ++in_degree[id];
            }
        }
    }

    NodeSet ready;
    for (const auto& [id, degree] : in_degree) {
        if (degree == 0) {
            ready.insert(id);
        }
    }

    std::vector<NodeId> order;
    order.reserve(subset.size());
    while (!ready.empty()) {
        NodeId current = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(current);

        for (const auto& dependent : successors_.at(current)) {
            auto it = in_degree.find(dependent);
            if (it != in_degree.end() && --(it->second) == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() != subset.size()) {
        throw GraphIntegrityError("Cannot order nodes: the selection contains a dependency cycle");
    }
    return order;
}

std::vector<NodeId> DependencyGraph::topologicalSort() const {
    auto all = nodes();
    return topologicalSort(NodeSet(all.begin(), all.end()));
}

} // namespace Graph
} // namespace DTP
