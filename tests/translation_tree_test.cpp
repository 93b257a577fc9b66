#include "parse_error.hpp"
#include "translation_tree.hpp"

#include <gtest/gtest.h>

#include <utility>

using namespace transtree;

// ============================================================================
// Node navigation
// ============================================================================

TEST(TranslationTree, MakeThenFindIsCaseInsensitive) {
    TranslationTree tree;
    TreeNode* made = tree.make_node("a.b.c");
    ASSERT_NE(made, nullptr);
    EXPECT_EQ(tree.find_node("A.B.C"), made);
    EXPECT_EQ(made->name(), "c");
}

TEST(TranslationTree, MakeNodeReusesExistingNodes) {
    TranslationTree tree;
    TreeNode* first = tree.make_node("Menu.File");
    TreeNode* second = tree.make_node("menu.file");
    EXPECT_EQ(first, second);
    EXPECT_EQ(tree.root().children().size(), 1u);
    // stored names keep the casing of their first creation
    EXPECT_EQ(tree.find_node("menu")->name(), "Menu");
}

TEST(TranslationTree, EmptyPathIsAbsent) {
    TranslationTree tree;
    EXPECT_EQ(tree.find_node(""), nullptr);
    EXPECT_EQ(tree.make_node(""), nullptr);
}

TEST(TranslationTree, EmptySegmentCreatesNothing) {
    TranslationTree tree;
    EXPECT_EQ(tree.make_node("a..b"), nullptr);
    EXPECT_EQ(tree.make_node(".a"), nullptr);
    EXPECT_EQ(tree.make_node("a."), nullptr);
    EXPECT_TRUE(tree.root().children().empty());
}

TEST(TranslationTree, FindMissingPath) {
    TranslationTree tree;
    tree.make_node("a.b");
    EXPECT_EQ(tree.find_node("a.c"), nullptr);
    EXPECT_EQ(tree.find_node("a.b.c"), nullptr);
    EXPECT_NE(tree.find_node("a"), nullptr);
}

// ============================================================================
// Leaves
// ============================================================================

TEST(TranslationTree, AddEntryPlacesLeafUnderGroup) {
    TranslationTree tree;
    tree.add_entry("menu.file.Open", false);
    tree.add_entry("title", true);

    const TreeNode* file = tree.find_node("menu.file");
    ASSERT_NE(file, nullptr);
    const TreeLeaf* open = file->find_leaf("open");
    ASSERT_NE(open, nullptr);
    EXPECT_EQ(open->key, "Open");
    EXPECT_FALSE(open->templated);

    const TreeLeaf* title = tree.root().find_leaf("TITLE");
    ASSERT_NE(title, nullptr);
    EXPECT_TRUE(title->templated);
    EXPECT_EQ(tree.leaf_count(), 2u);
}

TEST(TranslationTree, DuplicateLeafThrows) {
    TranslationTree tree;
    tree.add_entry("a.b", false);
    EXPECT_THROW(tree.add_entry("A.B", true), DuplicateKeyError);
    EXPECT_FALSE(tree.find_node("a")->find_leaf("b")->templated);
}

TEST(TranslationTree, InvalidKeyThrows) {
    TranslationTree tree;
    EXPECT_THROW(tree.add_entry("", false), ParserError);
    EXPECT_THROW(tree.add_entry("a..b", false), ParserError);
    EXPECT_THROW(tree.add_entry("a.", false), ParserError);
}

TEST(TranslationTree, BuildFromTranslation) {
    Translation translation;
    translation.add("greeting", TranslationEntry::literal("hi"));
    auto& templated = translation.add("nested.welcome", TranslationEntry::literal("Hello {name}"));
    templated.templated = true;
    translation.add("nested.alias", TranslationEntry::reference_to("greeting"));

    const TranslationTree tree = build_translation_tree(translation);
    EXPECT_EQ(tree.leaf_count(), 3u);
    const TreeNode* nested = tree.find_node("nested");
    ASSERT_NE(nested, nullptr);
    EXPECT_TRUE(nested->find_leaf("welcome")->templated);
    EXPECT_NE(nested->find_leaf("alias"), nullptr);
}

TEST(TranslationTree, IsMovable) {
    TranslationTree tree;
    tree.add_entry("x.y", false);
    TranslationTree moved = std::move(tree);
    EXPECT_NE(moved.find_node("x"), nullptr);
}
