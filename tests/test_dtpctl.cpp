// EN: Unit Tests for dtpctl - Exit codes, configuration precedence and command dispatch
// FR: Tests Unitaires pour dtpctl - Codes de sortie, précédence de configuration et dispatch des commandes

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "dtpctl/commands.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace DTP;
using namespace testing;

namespace {

const std::string MANIFEST = std::string(DTP_SOURCE_DIR) + "/examples/manifest.yml";

std::vector<std::string> outputLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace

// EN: Test fixture: fresh configuration, captured logs and a scratch project file
// FR: Fixture de test: configuration neuve, logs capturés et fichier de projet temporaire
class DtpctlTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::getInstance().reset();
        auto& logger = Logger::getInstance();
        logger.setConsoleStream(log_);
        logger.setLogLevel(LogLevel::WARN);

        project_file_ = std::filesystem::temp_directory_path() / "dtpctl_test_project.yml";
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        auto& logger = Logger::getInstance();
        logger.resetConsoleStream();
        logger.setLogLevel(LogLevel::INFO);

        unsetenv("DTP_MANIFEST_PATH");
        unsetenv("DTP_SELECTION_DEFAULT_INCLUDE");
        std::filesystem::remove(project_file_);
    }

    void writeProject(const std::string& yaml) {
        std::ofstream file(project_file_);
        file << yaml;
    }

    int run(const std::vector<std::string>& arguments) {
        out_.str("");
        err_.str("");
        return Ctl::runDtpctl(arguments, out_, err_);
    }

    std::filesystem::path project_file_;
    std::ostringstream out_;
    std::ostringstream err_;
    std::ostringstream log_;
};

TEST_F(DtpctlTest, ListPrintsEveryNodeInDependencyOrder) {
    EXPECT_EQ(run({"ls", "-m", MANIFEST}), Ctl::EXIT_OK);

    EXPECT_THAT(outputLines(out_.str()), ElementsAre(
        "seed.shop.country_codes",
        "source.shop.raw.orders",
        "model.shop.staging.stg_orders",
        "model.shop.marts.orders_by_country",
        "model.finance.revenue",
        "test.shop.not_null_orders_by_country"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(DtpctlTest, ListAppliesSelectExcludeAndResourceType) {
    EXPECT_EQ(run({"ls", "-m", MANIFEST, "-s", "tag:nightly"}), Ctl::EXIT_OK);
    EXPECT_THAT(outputLines(out_.str()),
                ElementsAre("model.shop.staging.stg_orders", "model.shop.marts.orders_by_country"));

    ConfigManager::getInstance().reset();
    EXPECT_EQ(run({"ls", "-m", MANIFEST, "-s", "source:shop.raw+", "-x", "finance", "--resource-type", "model"}),
              Ctl::EXIT_OK);
    EXPECT_THAT(outputLines(out_.str()),
                ElementsAre("model.shop.staging.stg_orders", "model.shop.marts.orders_by_country"));
}

TEST_F(DtpctlTest, JsonOutputIsSelectionResult) {
    EXPECT_EQ(run({"ls", "-m", MANIFEST, "--output", "json", "-s", "+finance.revenue"}), Ctl::EXIT_OK);

    auto json = nlohmann::json::parse(out_.str());
    EXPECT_EQ(json["selected_nodes"], 5);
    EXPECT_EQ(json["matched_nodes"], 1);
    EXPECT_EQ(json["total_nodes"], 6);
    EXPECT_EQ(json["execution_order"].back(), "model.finance.revenue");
}

TEST_F(DtpctlTest, PackagesAndValidateCommands) {
    EXPECT_EQ(run({"packages", "-m", MANIFEST}), Ctl::EXIT_OK);
    EXPECT_THAT(outputLines(out_.str()), ElementsAre("finance", "shop"));

    ConfigManager::getInstance().reset();
    EXPECT_EQ(run({"validate", "-m", MANIFEST}), Ctl::EXIT_OK);
    EXPECT_EQ(out_.str(), "Manifest OK: 6 nodes, 5 edges\n");
}

TEST_F(DtpctlTest, EmptyDefaultIncludeSelectsEverything) {
    writeProject("manifest:\n  path: " + MANIFEST + "\nselection:\n  default_include: []\n");

    EXPECT_EQ(run({"ls", "-c", project_file_.string()}), Ctl::EXIT_OK);
    EXPECT_EQ(outputLines(out_.str()).size(), 6u);
    EXPECT_TRUE(Ctl::buildQuery().include.empty());
}

TEST_F(DtpctlTest, CommandLineOverridesConfigFile) {
    writeProject("manifest:\n  path: /nonexistent/manifest.yml\n"
                 "selection:\n  default_include: [\"tag:nightly\"]\n");

    EXPECT_EQ(run({"ls", "-c", project_file_.string(), "-m", MANIFEST}), Ctl::EXIT_OK);
    EXPECT_EQ(outputLines(out_.str()).size(), 2u);

    ConfigManager::getInstance().reset();
    EXPECT_EQ(run({"ls", "-c", project_file_.string(), "-m", MANIFEST, "-s", "finance"}), Ctl::EXIT_OK);
    EXPECT_THAT(outputLines(out_.str()), ElementsAre("model.finance.revenue"));
}

TEST_F(DtpctlTest, EnvironmentOverridesConfigFileButNotCommandLine) {
    writeProject("manifest:\n  path: /nonexistent/manifest.yml\n");
    setenv("DTP_MANIFEST_PATH", MANIFEST.c_str(), 1);
    setenv("DTP_SELECTION_DEFAULT_INCLUDE", "finance,shop.country_codes", 1);

    EXPECT_EQ(run({"ls", "-c", project_file_.string()}), Ctl::EXIT_OK);
    EXPECT_THAT(outputLines(out_.str()), ElementsAre("model.finance.revenue", "seed.shop.country_codes"));

    ConfigManager::getInstance().reset();
    EXPECT_EQ(run({"ls", "-c", project_file_.string(), "-s", "tag:nightly"}), Ctl::EXIT_OK);
    EXPECT_EQ(outputLines(out_.str()).size(), 2u);
}

TEST_F(DtpctlTest, UsageErrorsExitWithTwo) {
    EXPECT_EQ(run({}), Ctl::EXIT_USAGE);
    EXPECT_THAT(err_.str(), HasSubstr("expected exactly one command"));

    EXPECT_EQ(run({"deploy"}), Ctl::EXIT_USAGE);
    EXPECT_EQ(run({"ls", "packages"}), Ctl::EXIT_USAGE);
    EXPECT_EQ(run({"ls", "--bogus"}), Ctl::EXIT_USAGE);
    EXPECT_EQ(run({"ls", "--output", "xml"}), Ctl::EXIT_USAGE);
    EXPECT_THAT(err_.str(), HasSubstr("Try 'dtpctl --help'"));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(DtpctlTest, HelpAndVersionExitWithZero) {
    EXPECT_EQ(run({"--help"}), Ctl::EXIT_OK);
    EXPECT_THAT(out_.str(), HasSubstr("Usage: dtpctl COMMAND [OPTIONS]"));

    EXPECT_EQ(run({"-V"}), Ctl::EXIT_OK);
    EXPECT_THAT(out_.str(), StartsWith("DT-Pipeline "));
}

TEST_F(DtpctlTest, PipelineErrorsExitWithOne) {
    EXPECT_EQ(run({"ls", "-m", "/nonexistent/manifest.yml"}), Ctl::EXIT_FAILURE_DTP);
    EXPECT_THAT(err_.str(), HasSubstr("dtpctl: Cannot open manifest file"));

    ConfigManager::getInstance().reset();
    EXPECT_EQ(run({"ls", "-m", MANIFEST, "-s", "@shop.staging+"}), Ctl::EXIT_FAILURE_DTP);
    EXPECT_THAT(err_.str(), HasSubstr("Invalid selector spec '@shop.staging+'"));
    EXPECT_THAT(log_.str(), HasSubstr("\"level\":\"ERROR\""));

    ConfigManager::getInstance().reset();
    EXPECT_EQ(run({"ls", "-c", "/nonexistent/dtp_project.yml"}), Ctl::EXIT_FAILURE_DTP);
}

TEST_F(DtpctlTest, NonUtf8SpecsStillReachTheExitCode) {
    EXPECT_EQ(run({"ls", "-m", MANIFEST, "-s", "@caf\xe9+"}), Ctl::EXIT_FAILURE_DTP);
    EXPECT_THAT(err_.str(), HasSubstr("dtpctl: Invalid selector spec"));

    ConfigManager::getInstance().reset();
    EXPECT_EQ(run({"ls", "-m", MANIFEST, "--log-level", "debug", "-s", "caf\xe9"}), Ctl::EXIT_OK);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_THAT(log_.str(), HasSubstr("resolved to 0 nodes"));
}
