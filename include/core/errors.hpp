// EN: Error hierarchy for DT-Pipeline - Exceptions raised by selection, graph and configuration layers
// FR: Hiérarchie d'erreurs pour DT-Pipeline - Exceptions levées par les couches sélection, graphe et configuration

#pragma once

#include <stdexcept>
#include <string>

namespace DTP {

// EN: Base class for every error raised by DT-Pipeline
// FR: Classe de base pour toutes les erreurs levées par DT-Pipeline
class DtpError : public std::runtime_error {
public:
    explicit DtpError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Malformed selection spec (e.g. "@model+"). Carries the offending spec.
// FR: Spec de sélection malformée (ex: "@model+"). Contient la spec fautive.
class InvalidSelectorError : public DtpError {
public:
    InvalidSelectorError(const std::string& spec, const std::string& reason)
        : DtpError("Invalid selector spec '" + spec + "': " + reason), spec_(spec), reason_(reason) {}

    const std::string& spec() const { return spec_; }
    const std::string& reason() const { return reason_; }

private:
    std::string spec_;
    std::string reason_;
};

// EN: Malformed input document (YAML, JSON, manifest or configuration value)
// FR: Document d'entrée malformé (YAML, JSON, manifeste ou valeur de configuration)
class ValidationError : public DtpError {
public:
    explicit ValidationError(const std::string& message) : DtpError(message) {}
};

// EN: A graph node has no entry in the resource catalog
// FR: Un nœud du graphe n'a pas d'entrée dans le catalogue de ressources
class CatalogLookupError : public DtpError {
public:
    explicit CatalogLookupError(const std::string& node_id)
        : DtpError("Node '" + node_id + "' is missing from the resource catalog"), node_id_(node_id) {}

    const std::string& nodeId() const { return node_id_; }

private:
    std::string node_id_;
};

// EN: Structural violation of the dependency graph (cycle, dangling edge, unknown node)
// FR: Violation structurelle du graphe de dépendances (cycle, arête pendante, nœud inconnu)
class GraphIntegrityError : public DtpError {
public:
    explicit GraphIntegrityError(const std::string& message) : DtpError(message) {}
};

} // namespace DTP
