// EN: Resource Catalog for DT-Pipeline - Node metadata (namespace path, tags, kind) behind a lookup interface
// FR: Catalogue de Ressources pour DT-Pipeline - Métadonnées de nœuds (chemin, tags, type) derrière une interface

#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "graph/dependency_graph.hpp"

namespace DTP {
namespace Graph {

// EN: Namespace path: package first, then hierarchical segments, then the resource name (length >= 2)
// FR: Chemin d'espace de noms: paquet d'abord, puis segments hiérarchiques, puis le nom (longueur >= 2)
using NamespacePath = std::vector<std::string>;

// EN: Kinds of resources a project can declare
// FR: Types de ressources qu'un projet peut déclarer
enum class ResourceKind {
    MODEL = 0,
    SOURCE = 1,
    SEED = 2,
    SNAPSHOT = 3,
    TEST = 4,
    ANALYSIS = 5
};

std::string resourceKindToString(ResourceKind kind);

// EN: Parse the lower-case kind name. Throws ValidationError for unknown names.
// FR: Parse le nom de type en minuscules. Lance ValidationError pour les noms inconnus.
ResourceKind stringToResourceKind(const std::string& name);

// EN: Fixed-shape metadata record read by the selection engine
// FR: Enregistrement de métadonnées de forme fixe lu par le moteur de sélection
struct NodeMetadata {
    NamespacePath path;
    std::set<std::string> tags;
    ResourceKind kind = ResourceKind::MODEL;
};

// EN: Read-only metadata lookup consumed by the matcher and the node selector
// FR: Consultation de métadonnées en lecture seule utilisée par le matcher et le sélecteur de nœuds
class ResourceCatalog {
public:
    virtual ~ResourceCatalog() = default;

    // EN: Metadata for id, or nullptr when absent
    // FR: Métadonnées de id, ou nullptr si absent
    virtual const NodeMetadata* find(const NodeId& id) const = 0;

    // EN: Metadata for id. Throws CatalogLookupError when absent.
    // FR: Métadonnées de id. Lance CatalogLookupError si absent.
    const NodeMetadata& lookup(const NodeId& id) const;
};

// EN: Catalog backed by a hash map, filled by the manifest loader or by tests
// FR: Catalogue adossé à une table de hachage, rempli par le chargeur de manifeste ou les tests
class InMemoryResourceCatalog : public ResourceCatalog {
public:
    InMemoryResourceCatalog() = default;

    // EN: Register metadata. Throws ValidationError on duplicate id or a path shorter than 2.
    // FR: Enregistre des métadonnées. Lance ValidationError si id dupliqué ou chemin de longueur < 2.
    void add(const NodeId& id, NodeMetadata metadata);

    const NodeMetadata* find(const NodeId& id) const override;

    size_t size() const { return entries_.size(); }

    // EN: All registered identifiers, sorted
    // FR: Tous les identifiants enregistrés, triés
    std::vector<NodeId> ids() const;

private:
    std::unordered_map<NodeId, NodeMetadata> entries_;
};

} // namespace Graph
} // namespace DTP
