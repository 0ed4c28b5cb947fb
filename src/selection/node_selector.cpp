// EN: Node Selector implementation
// FR: Implémentation du Sélecteur de Nœuds

#include "selection/node_selector.hpp"
#include "selection/node_matcher.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace DTP {
namespace Selection {

NodeSelector::NodeSelector(const Graph::ResourceCatalog& catalog) : catalog_(catalog) {}

Graph::NodeSet NodeSelector::getDirectMatches(const Graph::DependencyGraph& graph,
                                              const SelectionCriteria& criteria) const {
    Graph::NodeSet result;
    for (const auto& id : graph.nodes()) {
        const auto& metadata = catalog_.lookup(id);
        if (matches(metadata, criteria.selector_type, criteria.selector_value)) {
            result.insert(id);
        }
    }
    return result;
}

Graph::NodeSet NodeSelector::getNodesFromCriteria(const Graph::DependencyGraph& graph,
                                                  const SelectionCriteria& criteria) const {
    return expand(graph, criteria, getDirectMatches(graph, criteria));
}

Graph::NodeSet NodeSelector::expand(const Graph::DependencyGraph& graph,
                                    const SelectionCriteria& criteria,
                                    const Graph::NodeSet& matched) const {
    Graph::NodeSet result = matched;

    if (criteria.select_childrens_parents) {
        auto descendants = graph.descendants(matched);
        result.insert(descendants.begin(), descendants.end());
        auto ancestors = graph.ancestors(result);
        result.insert(ancestors.begin(), ancestors.end());
        return result;
    }

    if (criteria.select_parents) {
        auto ancestors = graph.ancestors(matched);
        result.insert(ancestors.begin(), ancestors.end());
    }
    if (criteria.select_children) {
        auto descendants = graph.descendants(matched);
        result.insert(descendants.begin(), descendants.end());
    }
    return result;
}

Graph::NodeSet NodeSelector::resolve(const Graph::DependencyGraph& graph,
                                     const std::vector<SelectionCriteria>& criteria,
                                     Graph::NodeSet* direct_matches) const {
    Graph::NodeSet result;
    for (const auto& criterion : criteria) {
        auto matched = getDirectMatches(graph, criterion);
        if (direct_matches) {
            direct_matches->insert(matched.begin(), matched.end());
        }
        auto nodes = expand(graph, criterion, matched);
        LOG_DEBUG("selector", "Spec '" + criterion.raw + "' resolved to " + std::to_string(nodes.size()) + " nodes");
        result.insert(nodes.begin(), nodes.end());
    }
    return result;
}

Graph::NodeSet NodeSelector::selectNodes(const Graph::DependencyGraph& graph,
                                         const std::vector<std::string>& include,
                                         const std::vector<std::string>& exclude) const {
    const auto include_criteria = NodeSelectorUtils::parseAll(include);
    const auto exclude_criteria = NodeSelectorUtils::parseAll(exclude);

    const auto included = resolve(graph, include_criteria, nullptr);
    const auto excluded = resolve(graph, exclude_criteria, nullptr);

    Graph::NodeSet result;
    std::set_difference(included.begin(), included.end(), excluded.begin(), excluded.end(),
                        std::inserter(result, result.end()));
    return result;
}

SelectionResult NodeSelector::select(const Graph::DependencyGraph& graph, const SelectionQuery& query) const {
    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::string> include = query.include;
    if (include.empty()) {
        include.push_back(SELECTOR_GLOB);
    }
    const auto include_criteria = NodeSelectorUtils::parseAll(include);
    const auto exclude_criteria = NodeSelectorUtils::parseAll(query.exclude);

    SelectionResult result;
    result.total_nodes = graph.size();

    Graph::NodeSet matched;
    const auto included = resolve(graph, include_criteria, &matched);
    const auto excluded = resolve(graph, exclude_criteria, nullptr);
    result.matched_nodes = matched.size();

    for (const auto& id : included) {
        if (excluded.count(id)) {
            continue;
        }
        if (!query.resource_kinds.empty() && !query.resource_kinds.count(catalog_.lookup(id).kind)) {
            continue;
        }
        result.selected.insert(id);
    }

    result.execution_order = graph.topologicalSort(result.selected);
    result.selection_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    LOG_INFO_META("selector", "Selection completed", (std::unordered_map<std::string, std::string>{
        {"total_nodes", std::to_string(result.total_nodes)},
        {"matched_nodes", std::to_string(result.matched_nodes)},
        {"selected_nodes", std::to_string(result.selected.size())},
        {"selection_time_ms", std::to_string(result.selection_time.count())}
    }));
    return result;
}

namespace NodeSelectorUtils {

std::set<std::string> getPackageNames(const Graph::DependencyGraph& graph) {
    std::set<std::string> packages;
    for (const auto& id : graph.nodes()) {
        auto first = id.find('.');
        if (first == std::string::npos) {
            continue;
        }
        auto second = id.find('.', first + 1);
        auto package = id.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
        if (!package.empty()) {
            packages.insert(package);
        }
    }
    return packages;
}

std::vector<SelectionCriteria> parseAll(const std::vector<std::string>& specs) {
    std::vector<SelectionCriteria> criteria;
    criteria.reserve(specs.size());
    for (const auto& spec : specs) {
        criteria.push_back(parseSelectionCriteria(spec));
    }
    return criteria;
}

nlohmann::json selectionResultToJson(const SelectionResult& result) {
    nlohmann::json j;
    j["selected"] = std::vector<std::string>(result.selected.begin(), result.selected.end());
    j["execution_order"] = result.execution_order;
    j["total_nodes"] = result.total_nodes;
    j["matched_nodes"] = result.matched_nodes;
    j["selected_nodes"] = result.selected.size();
    j["selection_time_ms"] = result.selection_time.count();
    return j;
}

} // namespace NodeSelectorUtils

} // namespace Selection
} // namespace DTP
