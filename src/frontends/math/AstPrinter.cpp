//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implements the canonical string renderer and the debug dump.
///
//===----------------------------------------------------------------------===//

#include "frontends/math/AstPrinter.hpp"

#include <sstream>

namespace mathexpr::frontends::math
{

namespace
{

// ---------------------------------------------------------------------------
// Canonical form
// ---------------------------------------------------------------------------

void writeCanonical(const ExprNode &expr, std::ostream &os);

void writeList(const std::vector<ExprPtr> &items, std::ostream &os)
{
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i != 0)
            os << ", ";
        writeCanonical(*items[i], os);
    }
}

void writeCanonical(const ExprNode &expr, std::ostream &os)
{
    std::visit(
        Overload{
            [&](const UnaryExpression &u)
            {
                os << "unExp(";
                if (u.isPrefix)
                {
                    os << spelling(u.op.node) << ", ";
                    writeCanonical(*u.operand, os);
                }
                else
                {
                    writeCanonical(*u.operand, os);
                    os << ", " << spelling(u.op.node);
                }
                os << ')';
            },
            [&](const BinaryExpression &b)
            {
                os << "binExp(";
                writeCanonical(*b.left, os);
                os << ", " << spelling(b.op.node) << ", ";
                writeCanonical(*b.right, os);
                os << ')';
            },
            [&](const PrimaryExpression &primary)
            {
                std::visit(Overload{
                               [&](const GroupedExpression &g) { writeCanonical(*g.inner, os); },
                               [&](const ArrayExpression &a)
                               {
                                   os << '[';
                                   writeList(a.elements, os);
                                   os << ']';
                               },
                               [&](const FunctionCall &call)
                               {
                                   os << call.name.node.name << '(';
                                   writeList(call.args, os);
                                   os << ')';
                               },
                               [&](const NumberLiteral &n) { os << n.value; },
                               [&](const Identifier &id) { os << id.name; },
                           },
                           primary);
            },
        },
        expr.node.value);
}

// ---------------------------------------------------------------------------
// Debug dump
// ---------------------------------------------------------------------------

struct Printer
{
    std::ostream &os;
    int indent = 0;

    void line(const std::string &text, Span span)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << " [" << span.start << ", " << span.end << ")\n";
    }
};

void dumpExpr(const ExprNode &expr, Printer &p);

void dumpChildren(const std::vector<ExprPtr> &items, Printer &p)
{
    ++p.indent;
    for (const auto &item : items)
        dumpExpr(*item, p);
    --p.indent;
}

void dumpExpr(const ExprNode &expr, Printer &p)
{
    std::visit(
        Overload{
            [&](const UnaryExpression &u)
            {
                p.line(std::string("UnaryExpression (") + std::string(spelling(u.op.node)) + ", " +
                           (u.isPrefix ? "prefix" : "postfix") + ")",
                       expr.span);
                ++p.indent;
                dumpExpr(*u.operand, p);
                --p.indent;
            },
            [&](const BinaryExpression &b)
            {
                p.line("BinaryExpression (" + std::string(spelling(b.op.node)) + ")", expr.span);
                ++p.indent;
                dumpExpr(*b.left, p);
                dumpExpr(*b.right, p);
                --p.indent;
            },
            [&](const PrimaryExpression &primary)
            {
                std::visit(Overload{
                               [&](const GroupedExpression &g)
                               {
                                   p.line("GroupedExpression", expr.span);
                                   ++p.indent;
                                   dumpExpr(*g.inner, p);
                                   --p.indent;
                               },
                               [&](const ArrayExpression &a)
                               {
                                   p.line("ArrayExpression", expr.span);
                                   dumpChildren(a.elements, p);
                               },
                               [&](const FunctionCall &call)
                               {
                                   p.line("FunctionCall \"" + call.name.node.name + "\"",
                                          expr.span);
                                   dumpChildren(call.args, p);
                               },
                               [&](const NumberLiteral &n)
                               { p.line("NumberLiteral " + std::to_string(n.value), expr.span); },
                               [&](const Identifier &id)
                               { p.line("Identifier \"" + id.name + "\"", expr.span); },
                           },
                           primary);
            },
        },
        expr.node.value);
}

} // namespace

std::string toCanonicalString(const ExprNode &root)
{
    std::ostringstream os;
    writeCanonical(root, os);
    return os.str();
}

std::string dumpAst(const ExprNode &root)
{
    std::ostringstream os;
    Printer p{os};
    dumpExpr(root, p);
    return os.str();
}

} // namespace mathexpr::frontends::math
