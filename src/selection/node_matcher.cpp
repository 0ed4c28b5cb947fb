// EN: Node Matcher implementation
// FR: Implémentation du Matcher de Nœuds

#include "selection/node_matcher.hpp"

#include <algorithm>
#include <sstream>

namespace DTP {
namespace Selection {

std::vector<std::string> splitSelectorValue(const std::string& value) {
    std::vector<std::string> segments;
    std::istringstream stream(value);
    std::string segment;
    while (std::getline(stream, segment, '.')) {
        segments.push_back(segment);
    }
    // EN: getline drops a trailing empty segment ("a." -> {"a"}), keep it literal
    // FR: getline ignore un segment vide final ("a." -> {"a"}), on le garde tel quel
    if (!value.empty() && value.back() == '.') {
        segments.emplace_back();
    }
    return segments;
}

bool isSelectedNode(const Graph::NamespacePath& path, const std::vector<std::string>& pattern) {
    size_t length = pattern.size();
    if (length > 0 && pattern.back() == SELECTOR_GLOB) {
        --length;
    }
    if (length > path.size()) {
        return false;
    }
    return std::equal(pattern.begin(), pattern.begin() + length, path.begin());
}

bool matchesFqn(const Graph::NamespacePath& path, const std::string& selector_value) {
    const auto pattern = splitSelectorValue(selector_value);
    if (isSelectedNode(path, pattern)) {
        return true;
    }
    if (path.size() < 2) {
        return false;
    }
    // EN: Users may omit the package segment
    // FR: L'utilisateur peut omettre le segment de paquet
    const Graph::NamespacePath without_package(path.begin() + 1, path.end());
    return isSelectedNode(without_package, pattern);
}

bool matches(const Graph::NodeMetadata& metadata, SelectorType type, const std::string& selector_value) {
    switch (type) {
        case SelectorType::TAG:
            return metadata.tags.count(selector_value) > 0;
        case SelectorType::SOURCE:
            return metadata.kind == Graph::ResourceKind::SOURCE && matchesFqn(metadata.path, selector_value);
        case SelectorType::FQN:
        default:
            return matchesFqn(metadata.path, selector_value);
    }
}

} // namespace Selection
} // namespace DTP
