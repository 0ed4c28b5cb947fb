// EN: Node Matcher for DT-Pipeline - Decides whether one node satisfies one selector
// FR: Matcher de Nœuds pour DT-Pipeline - Décide si un nœud satisfait un sélecteur

#pragma once

#include <string>
#include <vector>

#include "graph/resource_catalog.hpp"
#include "selection/selection_criteria.hpp"

namespace DTP {
namespace Selection {

// EN: Split a selector value on '.' ("a.b.*" -> {"a", "b", "*"})
// FR: Découpe une valeur de sélecteur sur '.' ("a.b.*" -> {"a", "b", "*"})
std::vector<std::string> splitSelectorValue(const std::string& value);

// EN: True when pattern is a segment-wise prefix of path. A final "*" segment is dropped
//     first; a pattern longer than the path never matches.
// FR: Vrai si pattern est un préfixe segment par segment de path. Un segment final "*" est
//     d'abord retiré; un motif plus long que le chemin ne correspond jamais.
bool isSelectedNode(const Graph::NamespacePath& path, const std::vector<std::string>& pattern);

// EN: Prefix match against the full path or against the path without its package
// FR: Correspondance de préfixe sur le chemin complet ou sur le chemin sans son paquet
bool matchesFqn(const Graph::NamespacePath& path, const std::string& selector_value);

bool matches(const Graph::NodeMetadata& metadata, SelectorType type, const std::string& selector_value);

} // namespace Selection
} // namespace DTP
