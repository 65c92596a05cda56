//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Markup.cpp
/// @brief Expression tree to presentation markup mapping.
///
//===----------------------------------------------------------------------===//

#include "frontends/math/Markup.hpp"

#include <utility>

namespace mathexpr::frontends::math
{

std::string_view markupTag(MarkupKind kind)
{
    switch (kind)
    {
        case MarkupKind::Row:
            return "mrow";
        case MarkupKind::Fraction:
            return "mfrac";
        case MarkupKind::Superscript:
            return "msup";
        case MarkupKind::Number:
            return "mn";
        case MarkupKind::Identifier:
            return "mi";
        case MarkupKind::Operator:
            return "mo";
    }
    return "mrow";
}

MarkupElement MarkupElement::leaf(MarkupKind kind, std::string text)
{
    return MarkupElement{kind, std::move(text), {}};
}

MarkupElement MarkupElement::row(std::vector<MarkupElement> children)
{
    return MarkupElement{MarkupKind::Row, {}, std::move(children)};
}

MarkupElement MarkupElement::fraction(MarkupElement numerator, MarkupElement denominator)
{
    std::vector<MarkupElement> children;
    children.reserve(2);
    children.push_back(std::move(numerator));
    children.push_back(std::move(denominator));
    return MarkupElement{MarkupKind::Fraction, {}, std::move(children)};
}

MarkupElement MarkupElement::superscript(MarkupElement base, MarkupElement exponent)
{
    std::vector<MarkupElement> children;
    children.reserve(2);
    children.push_back(std::move(base));
    children.push_back(std::move(exponent));
    return MarkupElement{MarkupKind::Superscript, {}, std::move(children)};
}

bool operator==(const MarkupElement &lhs, const MarkupElement &rhs)
{
    return lhs.kind == rhs.kind && lhs.text == rhs.text && lhs.children == rhs.children;
}

std::string_view operatorGlyph(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Eq:
            return "\xE2\x89\xA1"; // U+2261 IDENTICAL TO
        case BinaryOp::Ne:
            return "\xE2\x89\xA0"; // U+2260 NOT EQUAL TO
        case BinaryOp::Le:
            return "\xE2\x89\xA4"; // U+2264 LESS-THAN OR EQUAL TO
        case BinaryOp::Ge:
            return "\xE2\x89\xA5"; // U+2265 GREATER-THAN OR EQUAL TO
        case BinaryOp::And:
            return "\xE2\x88\xA7"; // U+2227 LOGICAL AND
        case BinaryOp::Or:
            return "\xE2\x88\xA8"; // U+2228 LOGICAL OR
        default:
            return spelling(op);
    }
}

namespace
{

MarkupElement glyph(std::string_view text)
{
    return MarkupElement::leaf(MarkupKind::Operator, std::string(text));
}

MarkupElement build(const ExprNode &expr);

MarkupElement buildBinary(const BinaryExpression &b)
{
    switch (b.op.node)
    {
        case BinaryOp::Div:
            return MarkupElement::fraction(build(*b.left), build(*b.right));
        case BinaryOp::Pow:
            return MarkupElement::superscript(build(*b.left), build(*b.right));
        default:
            break;
    }
    std::vector<MarkupElement> row;
    row.reserve(3);
    row.push_back(build(*b.left));
    row.push_back(glyph(operatorGlyph(b.op.node)));
    row.push_back(build(*b.right));
    return MarkupElement::row(std::move(row));
}

MarkupElement buildUnary(const UnaryExpression &u)
{
    std::vector<MarkupElement> row;
    row.reserve(2);
    if (u.isPrefix)
    {
        row.push_back(glyph(spelling(u.op.node)));
        row.push_back(build(*u.operand));
    }
    else
    {
        row.push_back(build(*u.operand));
        row.push_back(glyph(spelling(u.op.node)));
    }
    return MarkupElement::row(std::move(row));
}

MarkupElement buildPrimary(const PrimaryExpression &primary)
{
    return std::visit(
        Overload{
            [](const GroupedExpression &g) { return build(*g.inner); },
            [](const ArrayExpression &a)
            {
                std::vector<MarkupElement> row;
                row.push_back(glyph("["));
                for (std::size_t i = 0; i < a.elements.size(); ++i)
                {
                    if (i != 0)
                        row.push_back(glyph(","));
                    row.push_back(build(*a.elements[i]));
                }
                row.push_back(glyph("]"));
                return MarkupElement::row(std::move(row));
            },
            [](const FunctionCall &call)
            {
                std::vector<MarkupElement> row;
                row.reserve(call.args.size() + 1);
                row.push_back(MarkupElement::leaf(MarkupKind::Identifier, call.name.node.name));
                for (const auto &arg : call.args)
                    row.push_back(build(*arg));
                return MarkupElement::row(std::move(row));
            },
            [](const NumberLiteral &n)
            { return MarkupElement::leaf(MarkupKind::Number, std::to_string(n.value)); },
            [](const Identifier &id) { return MarkupElement::leaf(MarkupKind::Identifier, id.name); },
        },
        primary);
}

MarkupElement build(const ExprNode &expr)
{
    return std::visit(Overload{
                          [](const UnaryExpression &u) { return buildUnary(u); },
                          [](const BinaryExpression &b) { return buildBinary(b); },
                          [](const PrimaryExpression &p) { return buildPrimary(p); },
                      },
                      expr.node.value);
}

} // namespace

MarkupElement buildMarkup(const ExprNode &root)
{
    return build(root);
}

} // namespace mathexpr::frontends::math
