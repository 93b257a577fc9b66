#include "parse_error.hpp"
#include "translation.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace transtree;

TEST(TranslationEntry, LiteralAccessors) {
    const auto entry = TranslationEntry::literal("Line\nbreak", "Line\\nbreak");
    ASSERT_NE(entry.text(), nullptr);
    EXPECT_EQ(*entry.text(), "Line\nbreak");
    ASSERT_NE(entry.escaped_text(), nullptr);
    EXPECT_EQ(*entry.escaped_text(), "Line\\nbreak");
    EXPECT_EQ(entry.reference(), nullptr);
    EXPECT_FALSE(entry.is_reference());
}

TEST(TranslationEntry, ReferenceHasNoText) {
    const auto entry = TranslationEntry::reference_to("other.key");
    EXPECT_TRUE(entry.is_reference());
    EXPECT_EQ(entry.text(), nullptr);
    EXPECT_EQ(entry.escaped_text(), nullptr);
    ASSERT_NE(entry.reference(), nullptr);
    EXPECT_EQ(*entry.reference(), "other.key");
}

TEST(Translation, AddAndFind) {
    Translation translation("de");
    translation.add("hello", TranslationEntry::literal("Hallo"));
    EXPECT_EQ(translation.locale, "de");
    EXPECT_EQ(translation.size(), 1u);
    EXPECT_TRUE(translation.contains("hello"));
    // keys are case-sensitive
    EXPECT_FALSE(translation.contains("Hello"));
    ASSERT_NE(translation.find("hello"), nullptr);
    EXPECT_EQ(translation.find("missing"), nullptr);
}

TEST(Translation, FindIgnoringCase) {
    Translation translation;
    translation.add("Menu.Open", TranslationEntry::literal("Open"));
    translation.add("menu.close", TranslationEntry::literal("Close"));

    ASSERT_NE(translation.find_ignoring_case("menu.open"), nullptr);
    EXPECT_EQ(*translation.find_ignoring_case("MENU.OPEN")->text(), "Open");
    EXPECT_EQ(*translation.find_ignoring_case("menu.close")->text(), "Close");
    EXPECT_EQ(translation.find_ignoring_case("menu.save"), nullptr);
}

TEST(Translation, DuplicateKeyLeavesOriginalUnchanged) {
    Translation translation;
    translation.add("a", TranslationEntry::literal("x"));

    try {
        translation.add("a", TranslationEntry::literal("y"));
        FAIL() << "expected DuplicateKeyError";
    } catch (const DuplicateKeyError& ex) {
        EXPECT_EQ(ex.key(), "a");
        EXPECT_EQ(std::string(ex.what()), "Duplicate key 'a' specified in the translation file");
    }

    EXPECT_EQ(translation.size(), 1u);
    EXPECT_EQ(*translation.find("a")->text(), "x");
}

TEST(Translation, SameContent) {
    Translation a;
    Translation b;
    a.add("k", TranslationEntry::literal("v"));
    b.add("k", TranslationEntry::literal("v"));
    EXPECT_TRUE(same_content(a, b));

    b.find("k")->templated = true;
    EXPECT_FALSE(same_content(a, b));

    Translation c;
    c.add("k", TranslationEntry::reference_to("v"));
    EXPECT_FALSE(same_content(a, c));
}
