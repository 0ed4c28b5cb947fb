#include "core/errors.hpp"
#include "graph/manifest_loader.hpp"
#include "infrastructure/logging/logger.hpp"
#include "selection/node_selector.hpp"
#include <iostream>

namespace {

const std::string MANIFEST = R"(
nodes:
  - unique_id: source.shop.raw.orders
    resource_type: source
    fqn: [shop, raw, orders]
  - unique_id: model.shop.staging.stg_orders
    resource_type: model
    fqn: [shop, staging, stg_orders]
    tags: [nightly]
    depends_on: [source.shop.raw.orders]
  - unique_id: model.shop.marts.orders_by_country
    resource_type: model
    fqn: [shop, marts, orders_by_country]
    tags: [nightly]
    depends_on: [model.shop.staging.stg_orders]
  - unique_id: model.finance.revenue
    resource_type: model
    fqn: [finance, revenue]
    depends_on: [model.shop.marts.orders_by_country]
)";

void printSelection(const DTP::Selection::NodeSelector& selector, const DTP::Graph::DependencyGraph& graph,
                    const std::vector<std::string>& include, const std::vector<std::string>& exclude = {}) {
    auto result = selector.select(graph, {.include = include, .exclude = exclude});

    std::cout << "select";
    for (const auto& spec : include) std::cout << " " << spec;
    if (!exclude.empty()) {
        std::cout << " exclude";
        for (const auto& spec : exclude) std::cout << " " << spec;
    }
    std::cout << std::endl;

    for (const auto& id : result.execution_order) {
        std::cout << "  " << id << std::endl;
    }
}

} // namespace

int main() {
    auto& logger = DTP::Logger::getInstance();
    logger.setLogLevel(DTP::LogLevel::INFO);
    logger.setCorrelationId(logger.generateCorrelationId());

    LOG_INFO("selection_example", "DT-Pipeline selection example");

    try {
        auto manifest = DTP::Graph::loadManifestText(MANIFEST, DTP::Graph::ManifestFormat::YAML);
        DTP::Selection::NodeSelector selector(manifest.catalog);

        printSelection(selector, manifest.graph, {"tag:nightly"});
        printSelection(selector, manifest.graph, {"+shop.marts"});
        printSelection(selector, manifest.graph, {"shop.staging+"}, {"finance"});
        printSelection(selector, manifest.graph, {"@source:shop.raw"});

        std::cout << "packages:";
        for (const auto& package : DTP::Selection::NodeSelectorUtils::getPackageNames(manifest.graph)) {
            std::cout << " " << package;
        }
        std::cout << std::endl;

        // Malformed specs abort the whole call
        printSelection(selector, manifest.graph, {"@shop.staging+"});
    } catch (const DTP::InvalidSelectorError& e) {
        LOG_WARN("selection_example", std::string("Rejected selector: ") + e.what());
    } catch (const DTP::DtpError& e) {
        LOG_ERROR("selection_example", e.what());
        return 1;
    }

    LOG_INFO("selection_example", "Selection example completed");
    logger.flush();
    return 0;
}
