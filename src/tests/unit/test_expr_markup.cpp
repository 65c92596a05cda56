// File: tests/unit/test_expr_markup.cpp
// Purpose: Verify the presentation markup mapping and its MathML serialisation.
// Key invariants: Division and power become fraction and superscript; the
//                 comparison and logical operators use mathematical glyphs.
// Ownership/Lifetime: Tests own markup trees and output strings.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "frontends/math/Frontend.hpp"
#include "frontends/math/MathMLWriter.hpp"
#include "frontends/math/Markup.hpp"

#include <string>
#include <utility>

using namespace mathexpr::frontends::math;
using mathexpr::support::MathMLOptions;

namespace
{

MarkupElement markupOf(std::string_view text)
{
    auto markup = generateMarkup(text);
    EXPECT_TRUE(markup) << text;
    if (!markup)
        return MarkupElement::row({});
    return std::move(markup.value());
}

MarkupElement mi(const char *name)
{
    return MarkupElement::leaf(MarkupKind::Identifier, name);
}

MarkupElement mn(const char *digits)
{
    return MarkupElement::leaf(MarkupKind::Number, digits);
}

MarkupElement mo(const char *glyph)
{
    return MarkupElement::leaf(MarkupKind::Operator, glyph);
}

MathMLOptions bare()
{
    MathMLOptions options;
    options.wrapInMath = false;
    return options;
}

} // namespace

TEST(ExprMarkup, DivisionBecomesFraction)
{
    const auto markup = markupOf("a / b");
    EXPECT_EQ(markup.kind, MarkupKind::Fraction);
    ASSERT_EQ(markup.children.size(), 2u);
    EXPECT_EQ(markup.children[0], mi("a"));
    EXPECT_EQ(markup.children[1], mi("b"));
}

TEST(ExprMarkup, PowerBecomesSuperscript)
{
    const auto markup = markupOf("x ^ 2");
    EXPECT_EQ(markup, MarkupElement::superscript(mi("x"), mn("2")));
}

TEST(ExprMarkup, ComparisonAndLogicGlyphs)
{
    struct Case
    {
        const char *input;
        const char *glyph;
    };
    const Case cases[] = {
        {"a == b", "\xE2\x89\xA1"}, {"a != b", "\xE2\x89\xA0"}, {"a <= b", "\xE2\x89\xA4"},
        {"a >= b", "\xE2\x89\xA5"}, {"a && b", "\xE2\x88\xA7"}, {"a || b", "\xE2\x88\xA8"},
    };
    for (const auto &c : cases)
    {
        EXPECT_EQ(markupOf(c.input), MarkupElement::row({mi("a"), mo(c.glyph), mi("b")}))
            << c.input;
    }
}

TEST(ExprMarkup, OtherOperatorsKeepSpelling)
{
    for (const char *op : {"+", "-", "*", "=", "<", ">"})
    {
        const std::string input = std::string("a ") + op + " b";
        EXPECT_EQ(markupOf(input), MarkupElement::row({mi("a"), mo(op), mi("b")})) << input;
    }
}

TEST(ExprMarkup, UnaryRowsFollowPlacement)
{
    EXPECT_EQ(markupOf("-x"), MarkupElement::row({mo("-"), mi("x")}));
    EXPECT_EQ(markupOf("i++"), MarkupElement::row({mi("i"), mo("++")}));
}

TEST(ExprMarkup, PrimariesDelegate)
{
    EXPECT_EQ(markupOf("(7)"), mn("7"));
    EXPECT_EQ(markupOf("f(x, 1)"), MarkupElement::row({mi("f"), mi("x"), mn("1")}));
    EXPECT_EQ(markupOf("[1, y]"),
              MarkupElement::row({mo("["), mn("1"), mo(","), mi("y"), mo("]")}));
}

TEST(ExprMarkup, NestedFractionInsideRow)
{
    const auto markup = markupOf("1 + a / b");
    const auto expected =
        MarkupElement::row({mn("1"), mo("+"), MarkupElement::fraction(mi("a"), mi("b"))});
    EXPECT_EQ(markup, expected);
}

TEST(ExprMarkup, WriterEmitsCompactMathML)
{
    const auto markup = markupOf("a / b");
    EXPECT_EQ(writeMathML(markup),
              "<math xmlns=\"http://www.w3.org/1998/Math/MathML\">"
              "<mfrac><mi>a</mi><mi>b</mi></mfrac></math>");
    EXPECT_EQ(writeMathML(markup, bare()), "<mfrac><mi>a</mi><mi>b</mi></mfrac>");
}

TEST(ExprMarkup, WriterEscapesOperators)
{
    EXPECT_EQ(writeMathML(markupOf("a < b"), bare()),
              "<mrow><mi>a</mi><mo>&lt;</mo><mi>b</mi></mrow>");
    EXPECT_EQ(escapeXml("&<>\"'"), "&amp;&lt;&gt;&quot;&apos;");
}

TEST(ExprMarkup, WriterPrettyPrints)
{
    MathMLOptions options;
    options.pretty = true;
    const std::string expected = "<math xmlns=\"http://www.w3.org/1998/Math/MathML\">\n"
                                 "  <msup>\n"
                                 "    <mi>x</mi>\n"
                                 "    <mn>2</mn>\n"
                                 "  </msup>\n"
                                 "</math>\n";
    EXPECT_EQ(writeMathML(markupOf("x^2"), options), expected);
}

TEST(ExprMarkup, GenerateMathMLPropagatesErrors)
{
    auto text = generateMathML("(a");
    ASSERT_FALSE(text);
    EXPECT_EQ(text.error().code, mathexpr::support::ErrorCode::UnterminatedStructure);
}

TEST(ExprMarkup, TagsPerKind)
{
    EXPECT_EQ(markupTag(MarkupKind::Row), "mrow");
    EXPECT_EQ(markupTag(MarkupKind::Fraction), "mfrac");
    EXPECT_EQ(markupTag(MarkupKind::Superscript), "msup");
    EXPECT_EQ(markupTag(MarkupKind::Number), "mn");
    EXPECT_EQ(markupTag(MarkupKind::Identifier), "mi");
    EXPECT_EQ(markupTag(MarkupKind::Operator), "mo");
    EXPECT_TRUE(mo("+").isLeaf());
    EXPECT_FALSE(MarkupElement::row({}).isLeaf());
}
