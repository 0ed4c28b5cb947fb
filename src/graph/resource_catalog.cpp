// EN: Resource Catalog implementation
// FR: Implémentation du Catalogue de Ressources

#include "graph/resource_catalog.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <utility>

namespace DTP {
namespace Graph {

std::string resourceKindToString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::MODEL:    return "model";
        case ResourceKind::SOURCE:   return "source";
        case ResourceKind::SEED:     return "seed";
        case ResourceKind::SNAPSHOT: return "snapshot";
        case ResourceKind::TEST:     return "test";
        case ResourceKind::ANALYSIS: return "analysis";
        default:                     return "unknown";
    }
}

ResourceKind stringToResourceKind(const std::string& name) {
    if (name == "model") return ResourceKind::MODEL;
    if (name == "source") return ResourceKind::SOURCE;
    if (name == "seed") return ResourceKind::SEED;
    if (name == "snapshot") return ResourceKind::SNAPSHOT;
    if (name == "test") return ResourceKind::TEST;
    if (name == "analysis") return ResourceKind::ANALYSIS;
    throw ValidationError("Unknown resource type: '" + name + "'");
}

const NodeMetadata& ResourceCatalog::lookup(const NodeId& id) const {
    const NodeMetadata* metadata = find(id);
    if (!metadata) {
        throw CatalogLookupError(id);
    }
    return *metadata;
}

void InMemoryResourceCatalog::add(const NodeId& id, NodeMetadata metadata) {
    if (metadata.path.size() < 2) {
        throw ValidationError("Node '" + id + "' has a namespace path of length " +
                              std::to_string(metadata.path.size()) + " (package and name are required)");
    }
    if (!entries_.emplace(id, std::move(metadata)).second) {
        throw ValidationError("Duplicate node identifier in catalog: " + id);
    }
}

const NodeMetadata* InMemoryResourceCatalog::find(const NodeId& id) const {
    auto it = entries_.find(id);
    return it != entries_.end() ? &it->second : nullptr;
}

std::vector<NodeId> InMemoryResourceCatalog::ids() const {
    std::vector<NodeId> result;
    result.reserve(entries_.size());
    for (const auto& [id, _] : entries_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace Graph
} // namespace DTP
