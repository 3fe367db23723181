#include <gtest/gtest.h>
#include <string>

#include "ast_nodes.hpp"
#include "location.hpp"
#include "mapping.hpp"

using namespace Twcss;

// Counts visits per kind to check the dispatch
class KindCounter : public AstVisitor<int> {
public:
    int visitRule(Rule*) override { return 1; }
    int visitDeclaration(Declaration*) override { return 2; }
    int visitComment(Comment*) override { return 3; }
};

TEST(AstNodesTest, DeclarationStartsNotImportant) {
    DeclarationObj decl = TWCSS_MEMORY_NEW(Declaration, "color", "red");
    EXPECT_FALSE(decl->important());
    EXPECT_TRUE(decl->hasValue());
    EXPECT_EQ(decl->property(), "color");
    EXPECT_EQ(decl->value(), "red");
    decl->important(true);
    EXPECT_TRUE(decl->important());
}

TEST(AstNodesTest, DeclarationWithoutValue) {
    DeclarationObj decl = TWCSS_MEMORY_NEW(Declaration, "color");
    EXPECT_FALSE(decl->hasValue());
    EXPECT_FALSE(decl->important());
    decl->value("blue");
    EXPECT_TRUE(decl->hasValue());
    EXPECT_EQ(decl->value(), "blue");
    decl->clearValue();
    EXPECT_FALSE(decl->hasValue());
    EXPECT_EQ(decl->to_string(), "color: <none>");
}

TEST(AstNodesTest, KindAndDowncasts) {
    AstNodeObj rule = TWCSS_MEMORY_NEW(Rule, ".a", AstNodes());
    AstNodeObj decl = TWCSS_MEMORY_NEW(Declaration, "color", "red");
    AstNodeObj comment = TWCSS_MEMORY_NEW(Comment, "note");

    EXPECT_EQ(rule->kind(), TWCSS_NODE_RULE);
    EXPECT_EQ(decl->kind(), TWCSS_NODE_DECLARATION);
    EXPECT_EQ(comment->kind(), TWCSS_NODE_COMMENT);

    EXPECT_NE(rule->getRule(), nullptr);
    EXPECT_EQ(rule->getDeclaration(), nullptr);
    EXPECT_EQ(rule->getComment(), nullptr);
    EXPECT_NE(decl->getDeclaration(), nullptr);
    EXPECT_EQ(decl->getRule(), nullptr);
    EXPECT_NE(comment->getComment(), nullptr);
    EXPECT_EQ(comment->getDeclaration(), nullptr);

    EXPECT_TRUE(rule->isRule());
    EXPECT_TRUE(decl->isDeclaration());
    EXPECT_TRUE(comment->isComment());
}

TEST(AstNodesTest, MappingsDefaultEmpty) {
    RuleObj rule = TWCSS_MEMORY_NEW(Rule, ".a", AstNodes());
    EXPECT_TRUE(rule->mappings().empty());

    Mappings mappings;
    mappings.push_back(Mapping::fromSource(
        Range(Location(3, 4), Location(3, 9))));
    CommentObj comment = TWCSS_MEMORY_NEW(Comment, "x", mappings);
    ASSERT_EQ(comment->mappings().size(), 1u);
    EXPECT_TRUE(comment->mappings()[0].hasSource);
    EXPECT_FALSE(comment->mappings()[0].hasDestination);
    EXPECT_EQ(comment->mappings()[0].source.start, Location(3, 4));
    EXPECT_EQ(comment->mappings()[0].source.end, Location(3, 9));
}

TEST(AstNodesTest, AtRuleDetection) {
    RuleObj at = TWCSS_MEMORY_NEW(Rule, "@media print", AstNodes());
    RuleObj qualified = TWCSS_MEMORY_NEW(Rule, ".btn:hover", AstNodes());
    RuleObj blank = TWCSS_MEMORY_NEW(Rule, "", AstNodes());
    EXPECT_TRUE(at->isAtRule());
    EXPECT_FALSE(qualified->isAtRule());
    EXPECT_FALSE(blank->isAtRule());
}

TEST(AstNodesTest, ChildrenKeepOrder) {
    RuleObj rule = TWCSS_MEMORY_NEW(Rule, ".a", AstNodes());
    EXPECT_TRUE(rule->empty());
    rule->append(TWCSS_MEMORY_NEW(Declaration, "a", "1"));
    rule->append(TWCSS_MEMORY_NEW(Comment, "between"));
    rule->append(TWCSS_MEMORY_NEW(Declaration, "b", "2"));
    ASSERT_EQ(rule->size(), 3u);
    EXPECT_EQ(rule->nodes()[0]->getDeclaration()->property(), "a");
    EXPECT_TRUE(rule->nodes()[1]->isComment());
    EXPECT_EQ(rule->nodes()[2]->getDeclaration()->property(), "b");
}

TEST(AstNodesTest, VisitorDispatch) {
    KindCounter counter;
    AstNodeObj rule = TWCSS_MEMORY_NEW(Rule, ".a", AstNodes());
    AstNodeObj decl = TWCSS_MEMORY_NEW(Declaration, "color", "red");
    AstNodeObj comment = TWCSS_MEMORY_NEW(Comment, "note");
    EXPECT_EQ(rule->accept(counter), 1);
    EXPECT_EQ(decl->accept(counter), 2);
    EXPECT_EQ(comment->accept(counter), 3);
}

TEST(AstNodesTest, SharedOwnership) {
    AstNodeObj decl = TWCSS_MEMORY_NEW(Declaration, "color", "red");
    EXPECT_EQ(decl->getRefCount(), 1u);
    {
        RuleObj rule = TWCSS_MEMORY_NEW(Rule, ".a", AstNodes{ decl });
        EXPECT_EQ(decl->getRefCount(), 2u);
    }
    EXPECT_EQ(decl->getRefCount(), 1u);
}

TEST(LocationTest, OrderingAndFormat) {
    EXPECT_EQ(Location().line, 1u);
    EXPECT_EQ(Location().column, 0u);
    EXPECT_LT(Location(1, 9), Location(2, 0));
    EXPECT_LT(Location(2, 1), Location(2, 3));
    EXPECT_EQ(Location(4, 2).to_string(), "4:2");
    EXPECT_TRUE(Range::at(Location(2, 2)).empty());
    EXPECT_FALSE(Range(Location(2, 2), Location(2, 5)).empty());
}
