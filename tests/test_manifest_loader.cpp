// EN: Unit Tests for Manifest Loader - YAML and JSON manifests into graph and catalog
// FR: Tests Unitaires pour le Chargeur de Manifeste - Manifestes YAML et JSON vers graphe et catalogue

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "graph/manifest_loader.hpp"
#include "core/errors.hpp"

#include <filesystem>
#include <fstream>

using namespace DTP;
using namespace DTP::Graph;
using namespace testing;

namespace {

const char* const YAML_MANIFEST = R"(
nodes:
  - unique_id: source.shop.raw.orders
    resource_type: source
    fqn: [shop, raw, orders]
  - unique_id: model.shop.staging.orders
    resource_type: model
    fqn: [shop, staging, orders]
    tags: [staging, daily]
    depends_on: [source.shop.raw.orders]
  - unique_id: model.shop.marts.revenue
    resource_type: model
    fqn: [shop, marts, revenue]
    tags: [daily]
    depends_on: [model.shop.staging.orders]
)";

const char* const JSON_MANIFEST = R"({
  "nodes": [
    {"unique_id": "seed.shop.countries", "resource_type": "seed", "fqn": ["shop", "countries"]},
    {"unique_id": "model.shop.customers", "resource_type": "model", "fqn": ["shop", "customers"],
     "tags": ["pii"], "depends_on": ["seed.shop.countries"]}
  ]
})";

} // namespace

TEST(ManifestLoaderTest, LoadsYamlManifest) {
    auto manifest = loadManifestText(YAML_MANIFEST, ManifestFormat::YAML);

    EXPECT_EQ(manifest.graph.size(), 3u);
    EXPECT_EQ(manifest.graph.edgeCount(), 2u);
    EXPECT_EQ(manifest.catalog.size(), 3u);
    EXPECT_THAT(manifest.graph.successors("source.shop.raw.orders"), ElementsAre("model.shop.staging.orders"));

    const auto& staging = manifest.catalog.lookup("model.shop.staging.orders");
    EXPECT_THAT(staging.path, ElementsAre("shop", "staging", "orders"));
    EXPECT_THAT(staging.tags, UnorderedElementsAre("staging", "daily"));
    EXPECT_EQ(manifest.catalog.lookup("source.shop.raw.orders").kind, ResourceKind::SOURCE);
}

TEST(ManifestLoaderTest, LoadsJsonManifest) {
    auto manifest = loadManifestText(JSON_MANIFEST, ManifestFormat::JSON);

    EXPECT_EQ(manifest.graph.size(), 2u);
    EXPECT_THAT(manifest.graph.predecessors("model.shop.customers"), ElementsAre("seed.shop.countries"));
    EXPECT_EQ(manifest.catalog.lookup("seed.shop.countries").kind, ResourceKind::SEED);
    EXPECT_TRUE(manifest.catalog.lookup("seed.shop.countries").tags.empty());
}

TEST(ManifestLoaderTest, DetectsFormatFromExtension) {
    EXPECT_EQ(manifestFormatFromPath("target/manifest.json"), ManifestFormat::JSON);
    EXPECT_EQ(manifestFormatFromPath("manifest.YML"), ManifestFormat::YAML);
    EXPECT_EQ(manifestFormatFromPath("manifest.yaml"), ManifestFormat::YAML);
    EXPECT_THROW(manifestFormatFromPath("manifest.txt"), ValidationError);
    EXPECT_THROW(manifestFormatFromPath("manifest"), ValidationError);
}

TEST(ManifestLoaderTest, RejectsMissingNodesList) {
    EXPECT_THROW(loadManifestText("name: shop\n", ManifestFormat::YAML), ValidationError);
    EXPECT_THROW(loadManifestText("{\"nodes\": {}}", ManifestFormat::JSON), ValidationError);
    EXPECT_THROW(loadManifestText("[]", ManifestFormat::JSON), ValidationError);
}

TEST(ManifestLoaderTest, RejectsMalformedJson) {
    EXPECT_THROW(loadManifestText("{\"nodes\": [", ManifestFormat::JSON), ValidationError);
}

TEST(ManifestLoaderTest, MalformedYamlCarriesContext) {
    try {
        loadManifestText("nodes:\n  - unique_id: [a\n", ManifestFormat::YAML);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Syntax error near line"));
    }
}

TEST(ManifestLoaderTest, ReportsIllTypedKeys) {
    const char* manifest = R"({"nodes": [{"unique_id": "model.a.b", "resource_type": "model", "fqn": "a.b"}]})";
    try {
        loadManifestText(manifest, ManifestFormat::JSON);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_THAT(e.what(), HasSubstr("model.a.b"));
        EXPECT_THAT(e.what(), HasSubstr("'fqn'"));
    }
}

TEST(ManifestLoaderTest, RejectsUnknownResourceTypeAndShortFqn) {
    EXPECT_THROW(loadManifestText(R"({"nodes": [{"unique_id": "x.a.b", "resource_type": "macro", "fqn": ["a", "b"]}]})",
                                  ManifestFormat::JSON), ValidationError);
    EXPECT_THROW(loadManifestText(R"({"nodes": [{"unique_id": "model.a", "resource_type": "model", "fqn": ["a"]}]})",
                                  ManifestFormat::JSON), ValidationError);
}

TEST(ManifestLoaderTest, RejectsDuplicateIdentifiers) {
    const char* manifest = R"(
nodes:
  - {unique_id: model.a.b, resource_type: model, fqn: [a, b]}
  - {unique_id: model.a.b, resource_type: model, fqn: [a, b]}
)";
    EXPECT_THROW(loadManifestText(manifest, ManifestFormat::YAML), ValidationError);
}

TEST(ManifestLoaderTest, RejectsDanglingDependency) {
    const char* manifest = R"(
nodes:
  - {unique_id: model.a.b, resource_type: model, fqn: [a, b], depends_on: [model.a.missing]}
)";
    try {
        loadManifestText(manifest, ManifestFormat::YAML);
        FAIL() << "Expected GraphIntegrityError";
    } catch (const GraphIntegrityError& e) {
        EXPECT_THAT(e.what(), HasSubstr("model.a.missing"));
    }
}

TEST(ManifestLoaderTest, RejectsDependencyCycle) {
    const char* manifest = R"(
nodes:
  - {unique_id: model.a.x, resource_type: model, fqn: [a, x], depends_on: [model.a.y]}
  - {unique_id: model.a.y, resource_type: model, fqn: [a, y], depends_on: [model.a.x]}
)";
    try {
        loadManifestText(manifest, ManifestFormat::YAML);
        FAIL() << "Expected GraphIntegrityError";
    } catch (const GraphIntegrityError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Dependency cycle detected"));
    }
}

TEST(ManifestLoaderTest, LoadsManifestFile) {
    auto path = std::filesystem::temp_directory_path() / "dtp_manifest_loader_test.json";
    {
        std::ofstream file(path);
        file << JSON_MANIFEST;
    }

    auto manifest = loadManifestFile(path.string());
    EXPECT_EQ(manifest.catalog.size(), 2u);

    std::filesystem::remove(path);
    EXPECT_THROW(loadManifestFile(path.string()), ValidationError);
}
