// EN: Manifest Loader implementation - YAML through yaml-cpp, JSON through nlohmann::json
// FR: Implémentation du Chargeur de Manifeste - YAML via yaml-cpp, JSON via nlohmann::json

#include "graph/manifest_loader.hpp"
#include "infrastructure/config/yaml_loader.hpp"
#include "infrastructure/logging/logger.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace DTP {
namespace Graph {

namespace {
    std::string describeEntry(size_t index, const std::string& unique_id) {
        std::string where = "manifest node #" + std::to_string(index);
        if (!unique_id.empty()) {
            where += " ('" + unique_id + "')";
        }
        return where;
    }

    // EN: YAML shape helpers
    // FR: Assistants de forme YAML
    std::string yamlString(const YAML::Node& entry, const char* key, const std::string& where) {
        const YAML::Node value = entry[key];
        if (!value || !value.IsScalar()) {
            throw ValidationError(where + ": '" + key + "' must be a string");
        }
        return value.Scalar();
    }

    std::vector<std::string> yamlStringList(const YAML::Node& entry, const char* key,
                                            const std::string& where, bool required) {
        std::vector<std::string> items;
        const YAML::Node value = entry[key];
        if (!value || value.IsNull()) {
            if (required) {
                throw ValidationError(where + ": '" + key + "' is required");
            }
            return items;
        }
        if (!value.IsSequence()) {
            throw ValidationError(where + ": '" + key + "' must be a list of strings");
        }
        for (const auto& item : value) {
            if (!item.IsScalar()) {
                throw ValidationError(where + ": '" + key + "' must be a list of strings");
            }
            items.push_back(item.Scalar());
        }
        return items;
    }

    std::vector<ManifestNode> parseYamlNodes(const std::string& text) {
        YAML::Node root = YamlLoader::loadYamlText(text);
        if (!root.IsMap() || !root["nodes"]) {
            throw ValidationError("Manifest must be a mapping with a 'nodes' list");
        }
        const YAML::Node nodes = root["nodes"];
        if (!nodes.IsSequence()) {
            throw ValidationError("Manifest 'nodes' must be a list");
        }

        std::vector<ManifestNode> result;
        size_t index = 0;
        for (const auto& entry : nodes) {
            std::string where = describeEntry(index++, "");
            if (!entry.IsMap()) {
                throw ValidationError(where + " must be a mapping");
            }

            ManifestNode node;
            node.unique_id = yamlString(entry, "unique_id", where);
            where = describeEntry(index - 1, node.unique_id);
            node.resource_type = yamlString(entry, "resource_type", where);
            node.fqn = yamlStringList(entry, "fqn", where, true);
            auto tags = yamlStringList(entry, "tags", where, false);
            node.tags.insert(tags.begin(), tags.end());
            node.depends_on = yamlStringList(entry, "depends_on", where, false);
            result.push_back(std::move(node));
        }
        return result;
    }

    // EN: JSON shape helpers
    // FR: Assistants de forme JSON
    std::string jsonString(const nlohmann::json& entry, const char* key, const std::string& where) {
        auto it = entry.find(key);
        if (it == entry.end() || !it->is_string()) {
            throw ValidationError(where + ": '" + key + "' must be a string");
        }
        return it->get<std::string>();
    }

    std::vector<std::string> jsonStringList(const nlohmann::json& entry, const char* key,
                                            const std::string& where, bool required) {
        std::vector<std::string> items;
        auto it = entry.find(key);
        if (it == entry.end() || it->is_null()) {
            if (required) {
                throw ValidationError(where + ": '" + key + "' is required");
            }
            return items;
        }
        if (!it->is_array()) {
            throw ValidationError(where + ": '" + key + "' must be a list of strings");
        }
        for (const auto& item : *it) {
            if (!item.is_string()) {
                throw ValidationError(where + ": '" + key + "' must be a list of strings");
            }
            items.push_back(item.get<std::string>());
        }
        return items;
    }

    std::vector<ManifestNode> parseJsonNodes(const std::string& text) {
        nlohmann::json root;
        try {
            root = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw ValidationError("Invalid JSON manifest: " + std::string(e.what()));
        }

        if (!root.is_object() || !root.contains("nodes")) {
            throw ValidationError("Manifest must be an object with a 'nodes' list");
        }
        const auto& nodes = root["nodes"];
        if (!nodes.is_array()) {
            throw ValidationError("Manifest 'nodes' must be a list");
        }

        std::vector<ManifestNode> result;
        result.reserve(nodes.size());
        size_t index = 0;
        for (const auto& entry : nodes) {
            std::string where = describeEntry(index++, "");
            if (!entry.is_object()) {
                throw ValidationError(where + " must be an object");
            }

            ManifestNode node;
            node.unique_id = jsonString(entry, "unique_id", where);
            where = describeEntry(index - 1, node.unique_id);
            node.resource_type = jsonString(entry, "resource_type", where);
            node.fqn = jsonStringList(entry, "fqn", where, true);
            auto tags = jsonStringList(entry, "tags", where, false);
            node.tags.insert(tags.begin(), tags.end());
            node.depends_on = jsonStringList(entry, "depends_on", where, false);
            result.push_back(std::move(node));
        }
        return result;
    }
}

ManifestFormat manifestFormatFromPath(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == ".json") return ManifestFormat::JSON;
    if (extension == ".yml" || extension == ".yaml") return ManifestFormat::YAML;
    throw ValidationError("Unsupported manifest extension '" + extension + "' for " + path +
                          " (expected .json, .yml or .yaml)");
}

std::vector<ManifestNode> parseManifestNodes(const std::string& text, ManifestFormat format) {
    return format == ManifestFormat::JSON ? parseJsonNodes(text) : parseYamlNodes(text);
}

Manifest buildManifest(const std::vector<ManifestNode>& nodes) {
    Manifest manifest;

    for (const auto& node : nodes) {
        if (node.unique_id.empty()) {
            throw ValidationError("Manifest node with an empty unique_id");
        }
        NodeMetadata metadata;
        metadata.path = node.fqn;
        metadata.tags = node.tags;
        metadata.kind = stringToResourceKind(node.resource_type);
        manifest.catalog.add(node.unique_id, std::move(metadata));
        manifest.graph.addNode(node.unique_id);
    }

    // EN: Edges go from the dependency to the node that declares it
    // FR: Les arêtes vont de la dépendance vers le nœud qui la déclare
    for (const auto& node : nodes) {
        for (const auto& dependency : node.depends_on) {
            if (!manifest.graph.hasNode(dependency)) {
                throw GraphIntegrityError("Node '" + node.unique_id + "' depends on unknown node '" +
                                          dependency + "'");
            }
            manifest.graph.addEdge(dependency, node.unique_id);
        }
    }

    auto cycles = manifest.graph.findCycles();
    if (!cycles.empty()) {
        throw GraphIntegrityError("Dependency cycle detected: " + cycles.front());
    }

    LOG_INFO_META("manifest", "Manifest loaded", (std::unordered_map<std::string, std::string>{
        {"nodes", std::to_string(manifest.graph.size())},
        {"edges", std::to_string(manifest.graph.edgeCount())}
    }));
    return manifest;
}

Manifest loadManifestText(const std::string& text, ManifestFormat format) {
    return buildManifest(parseManifestNodes(text, format));
}

Manifest loadManifestFile(const std::string& path) {
    ManifestFormat format = manifestFormatFromPath(path);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Cannot open manifest file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_DEBUG("manifest", "Reading manifest: " + path);
    return loadManifestText(buffer.str(), format);
}

} // namespace Graph
} // namespace DTP
