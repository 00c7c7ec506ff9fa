// Unit tests for RTF color table construction and the document header.

#include <gtest/gtest.h>

#include "core/style.h"
#include "core/token_types.h"
#include "io/formats/rtf.h"

#include <string>

using namespace formats::rtf;
using rubric::style::Style;
using rubric::style::StyleSpec;
using rubric::tokens::TokenTypeTree;

class RtfColorTableTest : public ::testing::Test {
protected:
    TokenTypeTree tree_;
    Style style_{tree_};
    ColorTable table_;
    std::string err_;

    void Define(const char* category, const char* fg, const char* bg = nullptr, const char* border = nullptr) {
        StyleSpec s;
        if (fg) s.fg = std::string(fg);
        if (bg) s.bg = std::string(bg);
        if (border) s.border = std::string(border);
        style_.Define(tree_.Intern(category), s);
    }
};

// ============================================================================
// Collection order and deduplication
// ============================================================================

TEST_F(RtfColorTableTest, EmptyStyleHasNoColors) {
    ASSERT_TRUE(BuildColorTable(style_, {}, table_, err_)) << err_;
    EXPECT_TRUE(table_.entries.empty());
}

TEST_F(RtfColorTableTest, AssignsIndicesInCategoryOrder) {
    // Defined out of order; enumeration follows category ids (Keyword before Name).
    Define("Name", "0000FF");
    Define("Keyword", "FF0000");

    ASSERT_TRUE(BuildColorTable(style_, {}, table_, err_)) << err_;
    ASSERT_EQ(table_.entries.size(), 2u);
    EXPECT_EQ(table_.IndexOf("FF0000"), 1);
    EXPECT_EQ(table_.IndexOf("0000FF"), 2);
    EXPECT_EQ(table_.entries[0].index, 1);
    EXPECT_EQ(table_.entries[0].r, 255);
    EXPECT_EQ(table_.entries[1].b, 255);
}

TEST_F(RtfColorTableTest, ColorThenBackgroundThenBorder) {
    Define("Error", "111111", "222222", "333333");
    ASSERT_TRUE(BuildColorTable(style_, {}, table_, err_)) << err_;
    EXPECT_EQ(table_.IndexOf("111111"), 1);
    EXPECT_EQ(table_.IndexOf("222222"), 2);
    EXPECT_EQ(table_.IndexOf("333333"), 3);
}

TEST_F(RtfColorTableTest, RepeatedColorsShareOneEntry) {
    Define("Keyword", "008000");
    Define("Name.Builtin", "008000");
    Define("Literal.String.Other", "008000", "008000");
    ASSERT_TRUE(BuildColorTable(style_, {}, table_, err_)) << err_;
    ASSERT_EQ(table_.entries.size(), 1u);
    EXPECT_EQ(table_.IndexOf("008000"), 1);
}

TEST_F(RtfColorTableTest, InheritedColorsAreCollectedOnce) {
    Define("Comment", "3D7B7B");
    Define("Comment.Single", nullptr, "F0F0F0");
    ASSERT_TRUE(BuildColorTable(style_, {}, table_, err_)) << err_;
    // Comment.Single resolves to color 3D7B7B + bg F0F0F0.
    ASSERT_EQ(table_.entries.size(), 2u);
    EXPECT_EQ(table_.IndexOf("F0F0F0"), 2);
}

TEST_F(RtfColorTableTest, BuildIsDeterministic) {
    Define("Keyword", "008000");
    Define("Name.Function", "0000FF");
    Define("Comment", "3D7B7B", "FFFFFF");

    ColorTable a, b;
    ASSERT_TRUE(BuildColorTable(style_, {}, a, err_));
    ASSERT_TRUE(BuildColorTable(style_, {}, b, err_));
    ASSERT_EQ(a.entries.size(), b.entries.size());
    for (std::size_t i = 0; i < a.entries.size(); ++i)
        EXPECT_EQ(a.entries[i].hex, b.entries[i].hex);
}

TEST_F(RtfColorTableTest, MissingColorIndexIsZero) {
    ASSERT_TRUE(BuildColorTable(style_, {}, table_, err_));
    EXPECT_EQ(table_.IndexOf("ABCDEF"), 0);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(RtfColorTableTest, RejectsNonSixDigitColors) {
    Define("Keyword", "F00");
    ErrorCode code = ErrorCode::None;
    EXPECT_FALSE(BuildColorTable(style_, {}, table_, err_, &code));
    EXPECT_EQ(code, ErrorCode::InvalidColorFormat);
    EXPECT_EQ(err_, "Invalid color format for Token.Keyword: 'F00' (expected 6 hex digits).");
}

TEST_F(RtfColorTableTest, RejectsHashPrefixedColors) {
    Define("Name", "#0000FF");
    ErrorCode code = ErrorCode::None;
    EXPECT_FALSE(BuildColorTable(style_, {}, table_, err_, &code));
    EXPECT_EQ(code, ErrorCode::InvalidColorFormat);
}

TEST_F(RtfColorTableTest, RejectsNonHexDigits) {
    Define("Name", "00GG00");
    EXPECT_FALSE(BuildColorTable(style_, {}, table_, err_));
    EXPECT_NE(err_.find("'00GG00'"), std::string::npos);
}

// ============================================================================
// Line-number color
// ============================================================================

TEST_F(RtfColorTableTest, LineNumberColorTakesIndexOne) {
    Define("Keyword", "FF0000");
    ExportOptions opts;
    opts.line_numbers = true;
    opts.line_number_color = "808080";
    ASSERT_TRUE(BuildColorTable(style_, opts, table_, err_)) << err_;
    EXPECT_EQ(table_.IndexOf("808080"), 1);
    EXPECT_EQ(table_.IndexOf("FF0000"), 2);
}

TEST_F(RtfColorTableTest, LineNumberColorFallsBackToStyleThenBlack) {
    ExportOptions opts;
    opts.line_numbers = true;

    ASSERT_TRUE(BuildColorTable(style_, opts, table_, err_)) << err_;
    EXPECT_EQ(table_.IndexOf("000000"), 1);

    style_.line_number_color = "999999";
    ASSERT_TRUE(BuildColorTable(style_, opts, table_, err_)) << err_;
    EXPECT_EQ(table_.IndexOf("999999"), 1);
    EXPECT_EQ(table_.entries.size(), 1u);
}

TEST_F(RtfColorTableTest, LineNumberColorSharedWithStyle) {
    Define("Keyword", "FF0000");
    Define("Comment", "808080");
    ExportOptions opts;
    opts.line_numbers = true;
    opts.line_number_color = "808080";
    ASSERT_TRUE(BuildColorTable(style_, opts, table_, err_)) << err_;
    EXPECT_EQ(table_.entries.size(), 2u);
    EXPECT_EQ(table_.IndexOf("808080"), 1);
}

TEST_F(RtfColorTableTest, LineNumberColorIgnoredWithoutNumbering) {
    ExportOptions opts;
    opts.line_number_color = "808080";
    ASSERT_TRUE(BuildColorTable(style_, opts, table_, err_)) << err_;
    EXPECT_TRUE(table_.entries.empty());
}

// ============================================================================
// Header
// ============================================================================

TEST_F(RtfColorTableTest, HeaderListsColorsInIndexOrder) {
    Define("Keyword", "FF0000");
    Define("Name", "0000FF");
    ASSERT_TRUE(BuildColorTable(style_, {}, table_, err_));

    std::string out;
    WriteHeader({}, table_, out);
    EXPECT_EQ(out,
              "{\\rtf1\\ansi\\uc0\\deff0{\\fonttbl{\\f0\\fmodern\\fprq1\\fcharset0;}}"
              "{\\colortbl;\\red255\\green0\\blue0;\\red0\\green0\\blue255;}\\f0 ");
}

TEST_F(RtfColorTableTest, HeaderCarriesFontAndSize) {
    ExportOptions opts;
    opts.font_family = "Fira{Code}";
    opts.font_size = 24;

    std::string out;
    WriteHeader(opts, table_, out);
    EXPECT_EQ(out,
              "{\\rtf1\\ansi\\uc0\\deff0{\\fonttbl{\\f0\\fmodern\\fprq1\\fcharset0 Fira\\{Code\\};}}"
              "{\\colortbl;}\\f0 \\fs24 ");
}
