// EN: Unit Tests for Option Parser - Declarative CLI options for dtpctl
// FR: Tests Unitaires pour l'Analyseur d'Options - Options CLI déclaratives pour dtpctl

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "infrastructure/cli/option_parser.hpp"

#include <memory>

using namespace DTP;
using namespace DTP::CLI;
using namespace testing;

// EN: Test fixture with the standard dtpctl options
// FR: Fixture de test avec les options standard de dtpctl
class OptionParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        parser_ = std::make_unique<OptionParser>("dtpctl");
        parser_->addStandardOptions();
    }

    std::vector<std::string> list(const CliParseResult& result, const std::string& path) {
        return result.overrides.at(path).as<std::vector<std::string>>();
    }

    std::unique_ptr<OptionParser> parser_;
};

TEST_F(OptionParserTest, AddStandardOptions_ShouldRegisterLongAndShortNames) {
    EXPECT_TRUE(parser_->hasOption("select"));
    EXPECT_TRUE(parser_->hasOption("s"));
    EXPECT_TRUE(parser_->hasOption("resource-type"));
    EXPECT_FALSE(parser_->hasOption("threads"));

    auto definition = parser_->getOptionDefinition("x");
    ASSERT_TRUE(definition.has_value());
    EXPECT_EQ(definition->long_name, "exclude");
    EXPECT_EQ(definition->type, CliOptionType::STRING_LIST);
}

TEST_F(OptionParserTest, AddOption_DuplicateNames_ShouldThrow) {
    EXPECT_THROW(parser_->addOption({.long_name = "select"}), std::invalid_argument);
    EXPECT_THROW(parser_->addOption({.long_name = "other", .short_name = 's'}), std::invalid_argument);
    EXPECT_THROW(parser_->addOption({.long_name = ""}), std::invalid_argument);
}

TEST_F(OptionParserTest, Parse_EmptyArgs_ShouldSucceed) {
    auto result = parser_->parse(std::vector<std::string>{});
    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_TRUE(result.positional.empty());
    EXPECT_TRUE(result.overrides.empty());
}

TEST_F(OptionParserTest, Parse_CommandAndSelectSpecs_ShouldConsumeFollowingTokens) {
    auto result = parser_->parse({"ls", "--select", "tag:nightly", "+orders+", "@X.c", "-x", "Y.*"});

    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_THAT(result.positional, ElementsAre("ls"));
    EXPECT_THAT(list(result, "selection.default_include"), ElementsAre("tag:nightly", "+orders+", "@X.c"));
    EXPECT_THAT(list(result, "selection.default_exclude"), ElementsAre("Y.*"));
}

TEST_F(OptionParserTest, Parse_RepeatedListOption_ShouldConcatenate) {
    auto result = parser_->parse({"ls", "-s", "a", "--exclude", "b", "-s", "c", "d"});

    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_THAT(list(result, "selection.default_include"), ElementsAre("a", "c", "d"));
    EXPECT_EQ(result.parsed_options.size(), 3u);
    EXPECT_THAT(result.parsed_options[2].raw_values, ElementsAre("c", "d"));
}

TEST_F(OptionParserTest, Parse_StringOptions_ShouldMapToConfigPaths) {
    auto result = parser_->parse({"validate", "-m", "target/manifest.yml", "--output=json", "--log-level", "debug"});

    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.overrides.at("manifest.path").as<std::string>(), "target/manifest.yml");
    EXPECT_EQ(result.overrides.at("_output_format").as<std::string>(), "json");
    EXPECT_EQ(result.overrides.at("logging.level").as<std::string>(), "debug");
}

TEST_F(OptionParserTest, Parse_HelpFlag_ShouldReturnHelp) {
    auto result = parser_->parse({"ls", "--bogus", "-h"});

    EXPECT_EQ(result.status, CliParseStatus::HELP_REQUESTED);
    EXPECT_THAT(result.help_text, HasSubstr("Usage: dtpctl COMMAND [OPTIONS]"));
    EXPECT_THAT(result.help_text, HasSubstr("--select"));
    EXPECT_THAT(result.help_text, HasSubstr("Selection Options:"));
}

TEST_F(OptionParserTest, Parse_VersionFlag_ShouldReturnVersion) {
    parser_->setVersionInfo("2.1.0");
    auto result = parser_->parse({"-V"});

    EXPECT_EQ(result.status, CliParseStatus::VERSION_REQUESTED);
    EXPECT_EQ(result.version_text, "DT-Pipeline 2.1.0\n");
}

TEST_F(OptionParserTest, Parse_UnknownOption_ShouldFail) {
    auto result = parser_->parse({"ls", "--threads", "4"});

    EXPECT_EQ(result.status, CliParseStatus::INVALID_OPTION);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_THAT(result.errors.front(), HasSubstr("--threads"));
}

TEST_F(OptionParserTest, Parse_MissingValue_ShouldFail) {
    EXPECT_EQ(parser_->parse({"ls", "--select"}).status, CliParseStatus::MISSING_VALUE);
    EXPECT_EQ(parser_->parse({"ls", "-s", "-x", "a"}).status, CliParseStatus::MISSING_VALUE);
    EXPECT_EQ(parser_->parse({"ls", "--manifest"}).status, CliParseStatus::MISSING_VALUE);
}

TEST_F(OptionParserTest, Parse_EnumViolation_ShouldFail) {
    auto result = parser_->parse({"ls", "--output", "yaml"});
    EXPECT_EQ(result.status, CliParseStatus::CONSTRAINT_VIOLATION);
    EXPECT_THAT(result.errors.front(), HasSubstr("json, text"));

    EXPECT_EQ(parser_->parse({"ls", "--resource-type", "model", "macro"}).status,
              CliParseStatus::CONSTRAINT_VIOLATION);
}

TEST_F(OptionParserTest, Parse_FirstErrorDecidesStatus) {
    auto result = parser_->parse({"--output", "xml", "--nope"});
    EXPECT_EQ(result.status, CliParseStatus::CONSTRAINT_VIOLATION);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(OptionParserTest, Parse_IntegerAndBooleanOptions) {
    parser_->addOptions({
        {.long_name = "max-nodes", .type = CliOptionType::INTEGER, .config_path = "limits.max_nodes",
         .constraint = CliOptionConstraint::POSITIVE},
        {.long_name = "strict", .type = CliOptionType::BOOLEAN, .config_path = "limits.strict"}
    });

    auto result = parser_->parse({"ls", "--max-nodes", "25", "--strict"});
    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_EQ(result.overrides.at("limits.max_nodes").as<int>(), 25);
    EXPECT_TRUE(result.overrides.at("limits.strict").as<bool>());

    EXPECT_EQ(parser_->parse({"--max-nodes", "2x"}).status, CliParseStatus::INVALID_VALUE);
    EXPECT_EQ(parser_->parse({"--max-nodes", "0"}).status, CliParseStatus::CONSTRAINT_VIOLATION);
    EXPECT_EQ(parser_->parse({"--strict=yes"}).status, CliParseStatus::INVALID_VALUE);
}

TEST_F(OptionParserTest, Parse_ArgcArgv_ShouldSkipProgramName) {
    const char* argv[] = {"dtpctl", "packages", "-o", "text"};
    auto result = parser_->parse(4, const_cast<char**>(argv));

    EXPECT_EQ(result.status, CliParseStatus::SUCCESS);
    EXPECT_THAT(result.positional, ElementsAre("packages"));
}

TEST(OptionParserUtilsTest, RecognizesOptionTokens) {
    EXPECT_TRUE(OptionParserUtils::isLongOption("--select"));
    EXPECT_TRUE(OptionParserUtils::isShortOption("-s"));
    EXPECT_FALSE(OptionParserUtils::isShortOption("+orders"));
    EXPECT_FALSE(OptionParserUtils::isShortOption("-1"));
    EXPECT_FALSE(OptionParserUtils::isLongOption("--"));
    EXPECT_FALSE(OptionParserUtils::isLongOption("@X.c"));
    EXPECT_EQ(OptionParserUtils::extractOptionName("--output=json"), "output");
    EXPECT_EQ(OptionParserUtils::extractOptionName("-x"), "x");
}

TEST(OptionParserUtilsTest, FormatsOptionHelp) {
    CliOptionDefinition definition{
        .long_name = "manifest",
        .short_name = 'm',
        .type = CliOptionType::STRING,
        .description = "Manifest file",
        .default_value = "target/manifest.json"
    };

    auto help = OptionParserUtils::formatOptionHelp(definition);
    EXPECT_THAT(help, StartsWith("  -m, --manifest <string>"));
    EXPECT_THAT(help, EndsWith("Manifest file (default: target/manifest.json)"));
}
