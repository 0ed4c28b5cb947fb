// EN: Unit Tests for ConfigManager - dtp_project.yml parsing, rules and environment overrides
// FR: Tests Unitaires pour ConfigManager - Parsing de dtp_project.yml, règles et surcharges d'environnement

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "infrastructure/config/config_manager.hpp"
#include "core/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace DTP;
using namespace testing;

namespace {

const std::string PROJECT_YAML = R"(
manifest:
  path: target/manifest.json
selection:
  default_include: ["tag:nightly", "+orders"]
  default_exclude: []
  resource_types: [model, seed]
logging:
  level: info
  file: ""
limits:
  max_nodes: 5000
  ratio: 0.75
  strict: true
  owner: "${DTP_TEST_OWNER}"
)";

} // namespace

// EN: Test fixture resetting the singleton around each test
// FR: Fixture de test remettant le singleton à zéro autour de chaque test
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("DTP_MANIFEST_PATH");
        unsetenv("DTP_SELECTION_DEFAULT_EXCLUDE");
        unsetenv("DTP_LIMITS_MAX_NODES");
        unsetenv("DTP_TEST_OWNER");
    }

    ConfigManager& config() { return ConfigManager::getInstance(); }
};

TEST_F(ConfigManagerTest, SetAndGetValues) {
    config().set("database", "port", ConfigValue(5432));
    config().set("manifest.path", "target/manifest.yml");
    config().set("flag", true);

    EXPECT_EQ(config().get("database", "port").as<int>(), 5432);
    EXPECT_EQ(config().get("database.port").as<int>(), 5432);
    EXPECT_EQ(config().get("manifest", "path").as<std::string>(), "target/manifest.yml");
    EXPECT_TRUE(config().get("default", "flag").as<bool>());
    EXPECT_TRUE(config().has("manifest.path"));
    EXPECT_FALSE(config().has("manifest.missing"));
    EXPECT_FALSE(config().get("nothing.here").isValid());

    config().remove("manifest.path");
    EXPECT_FALSE(config().has("manifest", "path"));
}

TEST_F(ConfigManagerTest, ConfigValueConversions) {
    ConfigValue int_value(42);
    ConfigValue list_value(std::vector<std::string>{"a", "b"});
    ConfigValue empty;

    EXPECT_EQ(int_value.as<int>(), 42);
    EXPECT_FALSE(int_value.tryAs<std::string>().has_value());
    EXPECT_EQ(int_value.asOrDefault<std::string>("fallback"), "fallback");
    EXPECT_THROW(int_value.as<bool>(), std::runtime_error);
    EXPECT_THROW(empty.as<int>(), std::runtime_error);
    EXPECT_EQ(list_value.toString(), "[a, b]");
    EXPECT_EQ(empty.toString(), "<empty>");
}

TEST_F(ConfigManagerTest, LoadsProjectFile) {
    setenv("DTP_TEST_OWNER", "data-team", 1);
    config().loadFromString(PROJECT_YAML);

    EXPECT_EQ(config().get("manifest.path").as<std::string>(), "target/manifest.json");
    EXPECT_THAT(config().get("selection.default_include").as<std::vector<std::string>>(),
                ElementsAre("tag:nightly", "+orders"));
    EXPECT_TRUE(config().get("selection.default_exclude").as<std::vector<std::string>>().empty());
    EXPECT_EQ(config().get("logging.file").as<std::string>(), "");
    EXPECT_EQ(config().get("limits.max_nodes").as<int>(), 5000);
    EXPECT_DOUBLE_EQ(config().get("limits.ratio").as<double>(), 0.75);
    EXPECT_TRUE(config().get("limits.strict").as<bool>());
    EXPECT_EQ(config().get("limits.owner").as<std::string>(), "data-team");
    EXPECT_THAT(config().getSectionNames(), ElementsAre("limits", "logging", "manifest", "selection"));
}

TEST_F(ConfigManagerTest, QuotedScalarsStayStrings) {
    config().loadFromString("values:\n  version: \"1\"\n  enabled: 'true'\n");

    EXPECT_EQ(config().get("values.version").as<std::string>(), "1");
    EXPECT_EQ(config().get("values.enabled").as<std::string>(), "true");
}

TEST_F(ConfigManagerTest, MalformedYamlRaisesContextualError) {
    try {
        config().loadFromString("manifest:\n  path: [oops\n");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Syntax error near line"));
        EXPECT_THAT(e.what(), HasSubstr("Raw Error:"));
    }
}

TEST_F(ConfigManagerTest, RejectsNonMappingRootAndNestedMaps) {
    EXPECT_THROW(config().loadFromString("- a\n- b\n"), ValidationError);
    EXPECT_THROW(config().loadFromString("selection:\n  nested:\n    key: value\n"), ValidationError);
}

TEST_F(ConfigManagerTest, EmptyDocumentClearsConfiguration) {
    config().set("manifest.path", "x.json");
    config().loadFromString("");
    EXPECT_FALSE(config().has("manifest.path"));
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "dtp_project_test.yml";
    {
        std::ofstream file(path);
        file << "manifest:\n  path: other.yml\n";
    }

    config().loadFromFile(path.string());
    EXPECT_EQ(config().get("manifest.path").as<std::string>(), "other.yml");

    std::filesystem::remove(path);
    EXPECT_THROW(config().loadFromFile(path.string()), ValidationError);
}

TEST_F(ConfigManagerTest, DefaultRulesValidateProjectFile) {
    config().addDefaultRules();
    config().loadFromString(PROJECT_YAML);

    std::vector<std::string> errors;
    EXPECT_TRUE(config().validate(errors)) << (errors.empty() ? "" : errors.front());
}

TEST_F(ConfigManagerTest, DefaultRulesRejectBadValues) {
    config().addDefaultRules();
    config().loadFromString("logging:\n  level: loud\nselection:\n  resource_types: [model, macro]\n  default_include: x\n");

    std::vector<std::string> errors;
    EXPECT_FALSE(config().validate(errors));
    EXPECT_EQ(errors.size(), 3u);
    EXPECT_THAT(errors, Contains(HasSubstr("logging.level")));
    EXPECT_THAT(errors, Contains(HasSubstr("macro")));
    EXPECT_THAT(errors, Contains(HasSubstr("selection.default_include must be an array")));
}

TEST_F(ConfigManagerTest, CustomRulesCheckTypeAndRange) {
    config().addValidationRules({
        {.key = "limits.max_nodes", .type = "int", .required = true, .min_value = 1, .max_value = 1000},
        {.key = "limits.name", .type = "string", .required = true}
    });
    config().set("limits.max_nodes", 5000);

    std::vector<std::string> errors;
    EXPECT_FALSE(config().validate(errors));
    EXPECT_THAT(errors, ElementsAre(HasSubstr("<="), HasSubstr("Required configuration missing: limits.name")));
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFollowRules) {
    config().addDefaultRules();
    config().addValidationRules({{.key = "limits.max_nodes", .type = "int"}});
    config().loadFromString(PROJECT_YAML);

    setenv("DTP_MANIFEST_PATH", "env/manifest.yml", 1);
    setenv("DTP_SELECTION_DEFAULT_EXCLUDE", "tag:slow,Y.*", 1);
    setenv("DTP_LIMITS_MAX_NODES", "12", 1);

    EXPECT_EQ(config().loadEnvironmentOverrides("DTP_"), 3u);
    EXPECT_EQ(config().get("manifest.path").as<std::string>(), "env/manifest.yml");
    EXPECT_THAT(config().get("selection.default_exclude").as<std::vector<std::string>>(),
                ElementsAre("tag:slow", "Y.*"));
    EXPECT_EQ(config().get("limits.max_nodes").as<int>(), 12);
}

TEST_F(ConfigManagerTest, EnvironmentOverrideWithBadIntegerThrows) {
    config().addValidationRules({{.key = "limits.max_nodes", .type = "int"}});
    setenv("DTP_LIMITS_MAX_NODES", "many", 1);
    EXPECT_THROW(config().loadEnvironmentOverrides(), ValidationError);
}

TEST_F(ConfigManagerTest, DumpListsSectionsInOrder) {
    config().set("b.key", "two");
    config().set("a.key", 1);

    EXPECT_EQ(config().dump(), "[a]\n  key = 1\n\n[b]\n  key = two\n\n");
}
