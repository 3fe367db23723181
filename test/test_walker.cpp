#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "walker.hpp"
#include "output.hpp"
#include "error_handling.hpp"

using namespace Twcss;

// Test fixture providing a small forest:
//   .a { x: 1; .b { y: 2; } }
//   /*c*/
class WalkerTest : public ::testing::Test {
protected:
    AstNodes forest;
    std::vector<std::string> visited;

    void SetUp() override {
        RuleObj b = TWCSS_MEMORY_NEW(Rule, ".b", AstNodes{
            TWCSS_MEMORY_NEW(Declaration, "y", "2") });
        RuleObj a = TWCSS_MEMORY_NEW(Rule, ".a", AstNodes{
            TWCSS_MEMORY_NEW(Declaration, "x", "1"), b });
        forest.push_back(a);
        forest.push_back(TWCSS_MEMORY_NEW(Comment, "c"));
    }

    // Short label of a node for order checks
    static std::string label(AstNode* node) {
        if (Rule* rule = node->getRule()) return rule->selector();
        if (Declaration* decl = node->getDeclaration()) return decl->property();
        return "/*" + node->getComment()->value() + "*/";
    }
};

TEST_F(WalkerTest, VisitsAllNodesInPreOrder) {
    bool completed = walk(forest, [&](AstNode* node, WalkUtils&) {
        visited.push_back(label(node));
        return WALK_CONTINUE;
    });
    EXPECT_TRUE(completed);
    std::vector<std::string> expected = { ".a", "x", ".b", "y", "/*c*/" };
    EXPECT_EQ(visited, expected);
}

TEST_F(WalkerTest, SkipDoesNotDescend) {
    walk(forest, [&](AstNode* node, WalkUtils&) {
        visited.push_back(label(node));
        return label(node) == ".b" ? WALK_SKIP : WALK_CONTINUE;
    });
    std::vector<std::string> expected = { ".a", "x", ".b", "/*c*/" };
    EXPECT_EQ(visited, expected);
}

TEST_F(WalkerTest, StopTerminatesAncestorsToo) {
    bool completed = walk(forest, [&](AstNode* node, WalkUtils&) {
        visited.push_back(label(node));
        return label(node) == "y" ? WALK_STOP : WALK_CONTINUE;
    });
    EXPECT_FALSE(completed);
    std::vector<std::string> expected = { ".a", "x", ".b", "y" };
    EXPECT_EQ(visited, expected);
}

TEST_F(WalkerTest, StopOnThirdVisitOfTenNodes) {
    AstNodes nodes;
    for (int i = 0; i < 10; i++) {
        nodes.push_back(TWCSS_MEMORY_NEW(Declaration,
            "p" + std::to_string(i), "v"));
    }
    size_t visits = 0;
    walk(nodes, [&](AstNode*, WalkUtils&) {
        visits += 1;
        return visits == 3 ? WALK_STOP : WALK_CONTINUE;
    });
    EXPECT_EQ(visits, 3u);
}

TEST_F(WalkerTest, ReplaceWithTwoDeclarations) {
    walk(forest, [&](AstNode* node, WalkUtils& utils) {
        visited.push_back(label(node));
        if (label(node) == "x") {
            utils.replaceWith(AstNodes{
                TWCSS_MEMORY_NEW(Declaration, "x1", "a"),
                TWCSS_MEMORY_NEW(Declaration, "x2", "b") });
        }
        return WALK_CONTINUE;
    });
    std::vector<std::string> expected = {
        ".a", "x", "x1", "x2", ".b", "y", "/*c*/" };
    EXPECT_EQ(visited, expected);

    std::string css = toCss(forest);
    EXPECT_NE(css.find("  x1: a;\n  x2: b;\n"), std::string::npos) << css;
    EXPECT_EQ(css.find("x: 1;"), std::string::npos) << css;
}

TEST_F(WalkerTest, ReplaceWithEmptyDeletes) {
    walk(forest, [&](AstNode* node, WalkUtils& utils) {
        if (node->isComment()) utils.replaceWith(AstNodes());
        return WALK_CONTINUE;
    });
    ASSERT_EQ(forest.size(), 1u);
    EXPECT_TRUE(forest[0]->isRule());
}

TEST_F(WalkerTest, ReplacedRuleChildrenAreNotVisited) {
    walk(forest, [&](AstNode* node, WalkUtils& utils) {
        visited.push_back(label(node));
        if (label(node) == ".b") {
            utils.replaceWith(TWCSS_MEMORY_NEW(Comment, "gone"));
        }
        return WALK_CONTINUE;
    });
    std::vector<std::string> expected = {
        ".a", "x", ".b", "/*gone*/", "/*c*/" };
    EXPECT_EQ(visited, expected);
}

TEST_F(WalkerTest, InsertedRuleIsDescended) {
    walk(forest, [&](AstNode* node, WalkUtils& utils) {
        visited.push_back(label(node));
        if (node->isComment()) {
            utils.replaceWith(TWCSS_MEMORY_NEW(Rule, ".new", AstNodes{
                TWCSS_MEMORY_NEW(Declaration, "z", "3") }));
        }
        return WALK_CONTINUE;
    });
    std::vector<std::string> expected = {
        ".a", "x", ".b", "y", "/*c*/", ".new", "z" };
    EXPECT_EQ(visited, expected);
}

TEST_F(WalkerTest, SecondReplaceOverridesFirst) {
    walk(forest, [&](AstNode* node, WalkUtils& utils) {
        if (node->isComment() && node->getComment()->value() == "c") {
            utils.replaceWith(AstNodes{
                TWCSS_MEMORY_NEW(Comment, "first"),
                TWCSS_MEMORY_NEW(Comment, "first2") });
            utils.replaceWith(TWCSS_MEMORY_NEW(Comment, "second"));
        }
        return WALK_CONTINUE;
    });
    ASSERT_EQ(forest.size(), 2u);
    ASSERT_TRUE(forest[1]->isComment());
    EXPECT_EQ(forest[1]->getComment()->value(), "second");
}

TEST_F(WalkerTest, ReplaceThenStopAppliesReplacement) {
    bool completed = walk(forest, [&](AstNode* node, WalkUtils& utils) {
        if (label(node) == "x") {
            utils.replaceWith(TWCSS_MEMORY_NEW(Declaration, "w", "9"));
            return WALK_STOP;
        }
        return WALK_CONTINUE;
    });
    EXPECT_FALSE(completed);
    Rule* a = forest[0]->getRule();
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->size(), 2u);
    EXPECT_EQ(a->nodes()[0]->getDeclaration()->property(), "w");
}

TEST_F(WalkerTest, VisitedNodeOutlivesReplacement) {
    walk(forest, [&](AstNode* node, WalkUtils& utils) {
        if (node->isComment() && node->getComment()->value() == "c") {
            utils.replaceWith(AstNodes());
            // still safe to touch after being detached
            visited.push_back(label(node));
        }
        return WALK_CONTINUE;
    });
    ASSERT_EQ(visited.size(), 1u);
    EXPECT_EQ(visited[0], "/*c*/");
}

TEST_F(WalkerTest, DeepNestingThrows) {
    RuleObj root = TWCSS_MEMORY_NEW(Rule, ".r", AstNodes());
    RuleObj current = root;
    for (int i = 0; i < TWCSS_MAX_NESTING + 10; i++) {
        RuleObj child = TWCSS_MEMORY_NEW(Rule, ".r", AstNodes());
        current->append(child);
        current = child;
    }
    AstNodes nodes{ root };
    EXPECT_THROW(walk(nodes, [](AstNode*, WalkUtils&) {
        return WALK_CONTINUE;
    }), Exception::RecursionLimitError);
}
