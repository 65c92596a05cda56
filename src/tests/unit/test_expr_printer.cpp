// File: tests/unit/test_expr_printer.cpp
// Purpose: Verify the canonical string renderer and the debug tree dump.
// Key invariants: Canonical strings depend only on tree shape; reparsing a
//                 tree's source text reproduces the same string.
// Ownership/Lifetime: Tests own parsed trees and strings.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "frontends/math/AstPrinter.hpp"
#include "frontends/math/Frontend.hpp"
#include "frontends/math/Parser.hpp"

#include <string>

using namespace mathexpr::frontends::math;

TEST(ExprPrinter, CanonicalForms)
{
    struct Case
    {
        const char *input;
        const char *expected;
    };
    const Case cases[] = {
        {"a && b || !c", "binExp(binExp(a, &&, b), ||, unExp(!, c))"},
        {"f(x, [1, 2]) >= 3", "binExp(f(x, [1, 2]), >=, 3)"},
        {"y = m * x + b", "binExp(y, =, binExp(binExp(m, *, x), +, b))"},
        {"(n)--", "unExp(n, --)"},
        {"a / (b - c)", "binExp(a, /, binExp(b, -, c))"},
    };
    for (const auto &c : cases)
    {
        auto text = generateString(c.input);
        ASSERT_TRUE(text) << c.input;
        EXPECT_EQ(text.value(), c.expected) << c.input;
    }
}

TEST(ExprPrinter, RenderingIsRepeatable)
{
    auto root = parseExpression("x ^ 2 + [a, b]");
    ASSERT_TRUE(root);
    const std::string first = toCanonicalString(root.value());
    EXPECT_EQ(toCanonicalString(root.value()), first);
    EXPECT_EQ(dumpAst(root.value()), dumpAst(root.value()));
}

TEST(ExprPrinter, DumpListsKindsAndSpans)
{
    auto root = parseExpression("2 + 3 * 4");
    ASSERT_TRUE(root);
    const std::string expected = "BinaryExpression (+) [0, 9)\n"
                                 "  NumberLiteral 2 [0, 1)\n"
                                 "  BinaryExpression (*) [4, 9)\n"
                                 "    NumberLiteral 3 [4, 5)\n"
                                 "    NumberLiteral 4 [8, 9)\n";
    EXPECT_EQ(dumpAst(root.value()), expected);
}

TEST(ExprPrinter, DumpCoversEveryPrimary)
{
    auto root = parseExpression("-f((x), [1])");
    ASSERT_TRUE(root);
    const std::string expected = "UnaryExpression (-, prefix) [0, 12)\n"
                                 "  FunctionCall \"f\" [1, 12)\n"
                                 "    GroupedExpression [3, 6)\n"
                                 "      Identifier \"x\" [4, 5)\n"
                                 "    ArrayExpression [8, 11)\n"
                                 "      NumberLiteral 1 [9, 10)\n";
    EXPECT_EQ(dumpAst(root.value()), expected);
}

TEST(ExprPrinter, GenerateStringPropagatesErrors)
{
    auto text = generateString("1 +");
    ASSERT_FALSE(text);
    EXPECT_EQ(text.error().loc.offset, 3u);
}
