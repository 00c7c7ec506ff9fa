// Unit tests for style resolution: nearest styled ancestor, per-category overlays, entry order.

#include <gtest/gtest.h>

#include "core/style.h"
#include "core/token_types.h"

using namespace rubric;
using rubric::style::Style;
using rubric::style::StyleRecord;
using rubric::style::StyleSpec;

class StyleTest : public ::testing::Test {
protected:
    tokens::TokenTypeTree tree_;

    static StyleSpec Fg(const char* hex) {
        StyleSpec s;
        s.fg = std::string(hex);
        return s;
    }
};

TEST_F(StyleTest, RootIsAlwaysStyled) {
    Style style(tree_);
    EXPECT_TRUE(style.StylesToken(tokens::kRoot));
    ASSERT_EQ(style.Entries().size(), 1u);
    EXPECT_EQ(style.Entries()[0].type, tokens::kRoot);
    EXPECT_EQ(style.StyleForToken(tree_.Keyword()), StyleRecord{});
}

TEST_F(StyleTest, NearestStyledAncestorWins) {
    Style style(tree_);
    style.Define(tree_.Find("Literal"), Fg("111111"));
    style.Define(tree_.Find("Literal.String"), Fg("222222"));

    const tokens::TokenType doc = tree_.StringDoc();
    EXPECT_FALSE(style.StylesToken(doc));
    EXPECT_EQ(style.EffectiveType(doc), tree_.Find("Literal.String"));
    EXPECT_EQ(style.StyleForToken(doc).color, "222222");
    EXPECT_EQ(style.StyleForToken(tree_.Find("Literal.Number")).color, "111111");
}

TEST_F(StyleTest, SiblingStylesDoNotLeak) {
    Style style(tree_);
    style.Define(tree_.Find("Name.Function"), Fg("0000FF"));
    EXPECT_EQ(style.EffectiveType(tree_.Find("Name.Class")), tokens::kRoot);
    EXPECT_TRUE(style.StyleForToken(tree_.Find("Name.Class")).color.empty());
}

TEST_F(StyleTest, ChildSpecOverlaysParentRecord) {
    Style style(tree_);
    StyleSpec kw = Fg("008000");
    kw.bold = true;
    style.Define(tree_.Keyword(), kw);

    StyleSpec type;
    type.fg = std::string("B00040");
    type.bold = false;
    style.Define(tree_.Find("Keyword.Type"), type);

    StyleSpec pseudo;
    pseudo.italic = true;
    style.Define(tree_.Find("Keyword.Pseudo"), pseudo);

    const StyleRecord& t = style.StyleForToken(tree_.Find("Keyword.Type"));
    EXPECT_EQ(t.color, "B00040");
    EXPECT_FALSE(t.bold);

    const StyleRecord& p = style.StyleForToken(tree_.Find("Keyword.Pseudo"));
    EXPECT_EQ(p.color, "008000");
    EXPECT_TRUE(p.bold);
    EXPECT_TRUE(p.italic);
}

TEST_F(StyleTest, NoInheritStartsFromEmptyRecord) {
    Style style(tree_);
    StyleSpec comment = Fg("3D7B7B");
    comment.italic = true;
    style.Define(tree_.Comment(), comment);

    StyleSpec preproc;
    preproc.underline = true;
    preproc.inherit = false;
    style.Define(tree_.Find("Comment.Preproc"), preproc);

    const StyleRecord& r = style.StyleForToken(tree_.Find("Comment.Preproc"));
    EXPECT_TRUE(r.color.empty());
    EXPECT_FALSE(r.italic);
    EXPECT_TRUE(r.underline);
}

TEST_F(StyleTest, RedefiningParentUpdatesDescendants) {
    Style style(tree_);
    style.Define(tree_.Find("Literal.String.Doc"), StyleSpec{});
    style.Define(tree_.Find("Literal.String"), Fg("BA2121"));
    EXPECT_EQ(style.StyleForToken(tree_.StringDoc()).color, "BA2121");
}

TEST_F(StyleTest, EntriesFollowCategoryOrder) {
    Style style(tree_);
    style.Define(tree_.Find("Name.Function"), Fg("0000FF"));
    style.Define(tree_.Keyword(), Fg("008000"));

    const auto& entries = style.Entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].type, tokens::kRoot);
    EXPECT_EQ(entries[1].type, tree_.Keyword());
    EXPECT_EQ(entries[2].type, tree_.Find("Name.Function"));
}

TEST_F(StyleTest, CategoriesInternedAfterConstructionResolve) {
    Style style(tree_);
    style.Define(tree_.Name(), Fg("19177C"));
    const tokens::TokenType late = tree_.Intern("Name.Custom.Thing");
    EXPECT_EQ(style.EffectiveType(late), tree_.Name());
    EXPECT_EQ(style.StyleForToken(late).color, "19177C");
}
