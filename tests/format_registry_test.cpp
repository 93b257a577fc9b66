#include "format_registry.hpp"
#include "json_parser.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace transtree;

class FormatRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { register_builtin_formats(registry_); }

    FormatRegistry registry_;
};

TEST_F(FormatRegistryTest, BuiltinTranslationFormats) {
    const std::vector<std::string> expected{".arb", ".csv", ".ini", ".json", ".resx", ".toml", ".tsv"};
    EXPECT_EQ(registry_.supported_extensions(), expected);
    EXPECT_TRUE(registry_.supports(".JSON"));
    EXPECT_TRUE(registry_.supports(".Toml"));
    EXPECT_FALSE(registry_.supports(".yaml"));
}

TEST_F(FormatRegistryTest, CreatesParserForExtension) {
    const auto parser = registry_.create_parser(".Arb", ParserSettings{});
    ASSERT_NE(parser, nullptr);
    EXPECT_TRUE(parser->can_handle_extension(".arb"));
    EXPECT_EQ(parser->text_format(), TextFormat::Arb);
}

TEST_F(FormatRegistryTest, PassesSettingsToParser) {
    ParserSettings settings;
    settings.text_format = TextFormat::None;
    const auto parser = registry_.create_parser(".json", settings);
    ASSERT_NE(parser, nullptr);
    EXPECT_EQ(parser->text_format(), TextFormat::None);
}

TEST_F(FormatRegistryTest, UnknownExtension) {
    EXPECT_EQ(registry_.create_parser(".yaml", ParserSettings{}), nullptr);
    EXPECT_EQ(registry_.create_parser("", ParserSettings{}), nullptr);
    EXPECT_EQ(registry_.create_config_parser(".json", ParserSettings{}), nullptr);
}

TEST_F(FormatRegistryTest, ConfigParsers) {
    for (const char* extension : {".cfg", ".jsoncfg", ".arbcfg", ".resxcfg", ".tomlcfg"}) {
        EXPECT_NE(registry_.create_config_parser(extension, ParserSettings{}), nullptr) << extension;
    }
}

TEST_F(FormatRegistryTest, KeyValueFormats) {
    const auto ini = registry_.create_parser(".ini", ParserSettings{});
    ASSERT_NE(ini, nullptr);
    EXPECT_TRUE(ini->can_handle_extension(".INI"));
    EXPECT_EQ(ini->text_format(), TextFormat::None);

    const auto toml = registry_.create_parser(".toml", ParserSettings{});
    ASSERT_NE(toml, nullptr);
    EXPECT_TRUE(toml->can_handle_extension(".toml"));

    const auto cfg = registry_.create_config_parser(".cfg", ParserSettings{});
    ASSERT_NE(cfg, nullptr);
    EXPECT_TRUE(cfg->can_handle_extension(".ini"));
}

TEST_F(FormatRegistryTest, FirstRegistrationWins) {
    int calls = 0;
    const bool added = registry_.register_parser(".json", [&](const ParserSettings& settings) -> std::unique_ptr<TranslationParser> {
        ++calls;
        return std::make_unique<JsonParser>(settings);
    });
    EXPECT_FALSE(added);
    EXPECT_NE(registry_.create_parser(".json", ParserSettings{}), nullptr);
    EXPECT_EQ(calls, 0);
}

TEST_F(FormatRegistryTest, RegistersCustomExtension) {
    EXPECT_TRUE(registry_.register_parser(".JSON5", [](const ParserSettings& settings) -> std::unique_ptr<TranslationParser> {
        return std::make_unique<JsonParser>(settings);
    }));
    EXPECT_TRUE(registry_.supports(".json5"));
}

TEST_F(FormatRegistryTest, ClearRemovesEverything) {
    registry_.clear();
    EXPECT_TRUE(registry_.supported_extensions().empty());
    EXPECT_EQ(registry_.create_config_parser(".cfg", ParserSettings{}), nullptr);
}

TEST(FormatRegistryGlobal, StartsEmptyUntilRegistered) {
    auto& registry = FormatRegistry::global();
    registry.clear();
    EXPECT_FALSE(registry.supports(".json"));
    register_builtin_formats(registry);
    EXPECT_TRUE(registry.supports(".json"));
    registry.clear();
}
