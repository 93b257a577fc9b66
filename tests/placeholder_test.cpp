#include "placeholder.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace transtree;

// ============================================================================
// Template detection
// ============================================================================

struct TemplateCase {
    const char* text;
    TextFormat format;
    bool expected;
};

class TemplateDetectionTest : public ::testing::TestWithParam<TemplateCase> {};

TEST_P(TemplateDetectionTest, Classifies) {
    const auto& c = GetParam();
    EXPECT_EQ(string_has_parameters(c.text, c.format), c.expected)
        << "text: \"" << c.text << "\" format: " << to_string(c.format);
}

// Malformed syntax (unmatched or unclosed braces) classifies as plain text.
INSTANTIATE_TEST_SUITE_P(
    SingleBraces,
    TemplateDetectionTest,
    ::testing::Values(
        TemplateCase{"{}", TextFormat::None, false},
        TemplateCase{"{abc}", TextFormat::None, false},
        TemplateCase{"a { b } c", TextFormat::BackslashEscaping, false},
        TemplateCase{"{ }", TextFormat::BackslashEscaping, false},
        TemplateCase{"{}", TextFormat::Arb, true},
        TemplateCase{"{abc}", TextFormat::Arb, true},
        TemplateCase{"a { b } c", TextFormat::Arb, true},
        TemplateCase{"} {", TextFormat::Arb, false},
        TemplateCase{"{ }", TextFormat::Arb, true},
        TemplateCase{"{}", TextFormat::DotNet, true},
        TemplateCase{"{abc}", TextFormat::DotNet, true},
        TemplateCase{"} {", TextFormat::DotNet, false},
        TemplateCase{"{name}", TextFormat::ArbNoEscaping, true}
    )
);

INSTANTIATE_TEST_SUITE_P(
    DoubledBraces,
    TemplateDetectionTest,
    ::testing::Values(
        TemplateCase{"{{}}", TextFormat::None, false},
        TemplateCase{"{{ { } }}", TextFormat::BackslashEscaping, false},
        TemplateCase{"{{}}", TextFormat::Arb, true},
        TemplateCase{"{{abc}}", TextFormat::Arb, true},
        TemplateCase{"{{ { } }}", TextFormat::Arb, true},
        TemplateCase{"{{}}", TextFormat::DotNet, false},
        TemplateCase{"{{abc}}", TextFormat::DotNet, false},
        TemplateCase{"a {{ b }} c", TextFormat::DotNet, false},
        TemplateCase{"{{ { } }}", TextFormat::DotNet, true},
        TemplateCase{"a { {{b}} } c", TextFormat::DotNet, true},
        TemplateCase{"{{", TextFormat::DotNet, false},
        TemplateCase{"}}", TextFormat::DotNet, false}
    )
);

INSTANTIATE_TEST_SUITE_P(
    QuotedLiterals,
    TemplateDetectionTest,
    ::testing::Values(
        TemplateCase{"'{abc}'", TextFormat::None, false},
        TemplateCase{"'{abc}'", TextFormat::Arb, false},
        TemplateCase{"a '{ b }' c", TextFormat::Arb, false},
        TemplateCase{"a { 'b' } c", TextFormat::Arb, true},
        TemplateCase{"'{abc}'", TextFormat::DotNet, true},
        TemplateCase{"a '{ b }' c", TextFormat::DotNet, true},
        TemplateCase{"''{abc}''", TextFormat::Arb, true},
        TemplateCase{"a '{ '' }' c", TextFormat::Arb, false},
        TemplateCase{"a { '' } c", TextFormat::Arb, true},
        TemplateCase{"a '{ '' }' c", TextFormat::DotNet, true},
        TemplateCase{"'{abc}'", TextFormat::ArbNoEscaping, true}
    )
);

INSTANTIATE_TEST_SUITE_P(
    Mixed,
    TemplateDetectionTest,
    ::testing::Values(
        TemplateCase{"a { '}' } c", TextFormat::Arb, true},
        TemplateCase{"a { '{' } c", TextFormat::Arb, true},
        TemplateCase{"a '}' { b } c", TextFormat::Arb, true},
        TemplateCase{"a '{' { b } c", TextFormat::Arb, true},
        TemplateCase{"'{ { } }'", TextFormat::Arb, false},
        TemplateCase{"abc", TextFormat::Arb, false},
        TemplateCase{"", TextFormat::Arb, false},
        TemplateCase{"{", TextFormat::Arb, false},
        TemplateCase{"}", TextFormat::Arb, false},
        TemplateCase{"a { '}' } c", TextFormat::DotNet, true},
        TemplateCase{"a '}' { b } c", TextFormat::DotNet, false},
        TemplateCase{"'{ {a} }'", TextFormat::DotNet, true},
        TemplateCase{"abc", TextFormat::DotNet, false},
        TemplateCase{"", TextFormat::DotNet, false},
        TemplateCase{"{", TextFormat::DotNet, false},
        TemplateCase{"}", TextFormat::DotNet, false}
    )
);

// ============================================================================
// Text format names
// ============================================================================

TEST(TextFormatNames, RoundTripsCanonicalNames) {
    for (auto format : {TextFormat::None, TextFormat::BackslashEscaping, TextFormat::Arb,
                        TextFormat::ArbNoEscaping, TextFormat::DotNet}) {
        const auto parsed = text_format_from_string(to_string(format));
        ASSERT_TRUE(parsed.has_value()) << to_string(format);
        EXPECT_EQ(*parsed, format);
    }
}

TEST(TextFormatNames, AcceptsAliasesAndCase) {
    EXPECT_EQ(text_format_from_string(" DotNet "), TextFormat::DotNet);
    EXPECT_EQ(text_format_from_string("BackslashEscaping"), TextFormat::BackslashEscaping);
    EXPECT_EQ(text_format_from_string("ArbNoEscaping"), TextFormat::ArbNoEscaping);
    EXPECT_FALSE(text_format_from_string("icu").has_value());
}

TEST(PlaceholderSyntaxRules, PerFormat) {
    EXPECT_FALSE(placeholder_syntax(TextFormat::None).braces);
    EXPECT_TRUE(placeholder_syntax(TextFormat::Arb).quoted_literals);
    EXPECT_FALSE(placeholder_syntax(TextFormat::ArbNoEscaping).quoted_literals);
    EXPECT_TRUE(placeholder_syntax(TextFormat::DotNet).doubled_braces);
    EXPECT_FALSE(placeholder_syntax(TextFormat::DotNet).quoted_literals);
}

// ============================================================================
// Placeholder definitions
// ============================================================================

TEST(PlaceholderDefinition, ReadsKnownAndCustomProperties) {
    const auto definition = nlohmann::ordered_json::parse(R"({
        "type": "DateTime",
        "format": "yMd",
        "example": "11/10/2021",
        "isCustomDateFormat": "false",
        "optionalParameters": { "decimalDigits": "2", "ignored": 5 }
    })");

    const Placeholder placeholder = parse_placeholder("date", definition);
    EXPECT_EQ(placeholder.name, "date");
    EXPECT_EQ(placeholder.type, "DateTime");
    EXPECT_EQ(placeholder.format, "yMd");
    EXPECT_EQ(placeholder.example, "11/10/2021");
    ASSERT_EQ(placeholder.properties.count("isCustomDateFormat"), 1u);
    EXPECT_EQ(placeholder.properties.at("isCustomDateFormat"), "false");
    ASSERT_EQ(placeholder.optional_parameters.size(), 1u);
    EXPECT_EQ(placeholder.optional_parameters.at("decimalDigits"), "2");
}

TEST(PlaceholderDefinition, NonObjectYieldsBareName) {
    const Placeholder placeholder = parse_placeholder("count", nlohmann::ordered_json("int"));
    EXPECT_EQ(placeholder.name, "count");
    EXPECT_FALSE(placeholder.type.has_value());
    EXPECT_TRUE(placeholder.properties.empty());
}
