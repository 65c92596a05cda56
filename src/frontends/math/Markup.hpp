//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Markup.hpp
/// @brief Presentation markup tree built from an expression tree.
///
/// @details The markup tree is the hand-off format for a display layer.  It
/// has six element kinds, mirroring the MathML presentation elements they
/// serialise to:
///
/// | Kind        | MathML    | Payload                         |
/// |-------------|-----------|---------------------------------|
/// | Row         | `mrow`    | children in reading order       |
/// | Fraction    | `mfrac`   | numerator, denominator          |
/// | Superscript | `msup`    | base, exponent                  |
/// | Number      | `mn`      | decimal text                    |
/// | Identifier  | `mi`      | symbol name                     |
/// | Operator    | `mo`      | glyph (UTF-8)                   |
///
/// Comparison and logical operators are mapped onto their mathematical
/// glyphs (`==` becomes U+2261, `&&` becomes U+2227 and so on); every other
/// operator keeps its source spelling.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/math/AST.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mathexpr::frontends::math
{

/// @brief Element kinds of the presentation markup tree.
enum class MarkupKind
{
    Row,
    Fraction,
    Superscript,
    Number,
    Identifier,
    Operator,
};

/// @brief MathML tag name for @p kind, e.g. "mfrac".
std::string_view markupTag(MarkupKind kind);

/// @brief One presentation element.
///
/// Leaves (Number, Identifier, Operator) carry text and no children;
/// Fraction and Superscript carry exactly two children; Row carries any
/// number of children.
struct MarkupElement
{
    MarkupKind kind;
    std::string text;
    std::vector<MarkupElement> children;

    [[nodiscard]] bool isLeaf() const noexcept
    {
        return kind == MarkupKind::Number || kind == MarkupKind::Identifier ||
               kind == MarkupKind::Operator;
    }

    static MarkupElement leaf(MarkupKind kind, std::string text);
    static MarkupElement row(std::vector<MarkupElement> children);
    static MarkupElement fraction(MarkupElement numerator, MarkupElement denominator);
    static MarkupElement superscript(MarkupElement base, MarkupElement exponent);
};

bool operator==(const MarkupElement &lhs, const MarkupElement &rhs);

/// @brief Display glyph for a binary operator.
std::string_view operatorGlyph(BinaryOp op);

/// @brief Map the tree rooted at @p root onto presentation markup.
/// @details Total over every well-formed tree.
MarkupElement buildMarkup(const ExprNode &root);

} // namespace mathexpr::frontends::math
